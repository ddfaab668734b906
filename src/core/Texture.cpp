#include "Texture.h"
#include "ImageDecoder.h"
#include "MemoryAllocator.h"
#include "CommandBufferUtils.h"
#include "Barriers.h"
#include <SDL3/SDL_log.h>

std::optional<vk::raii::ImageView> createImageView2D(const vk::raii::Device& device, vk::Image image,
                                                     vk::Format format, vk::ImageAspectFlags aspect) {
    const vk::ImageViewCreateInfo viewInfo{{}, image, vk::ImageViewType::e2D, format, {},
                                           vk::ImageSubresourceRange{aspect, 0, 1, 0, 1}};

    try {
        return vk::raii::ImageView(device, viewInfo);
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "createImageView2D: %s", e.what());
        return std::nullopt;
    }
}

vk::ImageCreateInfo Texture::sampledImageInfo(uint32_t width, uint32_t height, vk::Format format) {
    return vk::ImageCreateInfo{}
        .setImageType(vk::ImageType::e2D)
        .setFormat(format)
        .setExtent({width, height, 1})
        .setMipLevels(1)
        .setArrayLayers(1)
        .setUsage(vk::ImageUsageFlagBits::eTransferDst | vk::ImageUsageFlagBits::eSampled);
}

std::optional<Texture> Texture::upload(const MemoryAllocator& memory, const vk::raii::Device& device,
                                       const DecodedImage& pixels, vk::Format format) {
    if (!pixels.valid()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Texture: refusing to upload %ux%u image with %zu bytes",
            pixels.width, pixels.height, pixels.byteSize());
        return std::nullopt;
    }

    VmaBuffer staging;
    auto result = memory.createBufferWithData(pixels.pixels.data(), pixels.pixels.size(), 1,
                                              vk::BufferUsageFlagBits::eTransferSrc,
                                              MemoryPolicy::CpuToGpu, staging);
    if (result != AllocationResult::Success) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Texture: staging buffer failed: %s",
            MemoryTypes::toString(result));
        return std::nullopt;
    }

    Texture texture;
    result = memory.createImage(sampledImageInfo(pixels.width, pixels.height, format),
                                MemoryPolicy::GpuOnly, texture.image_);
    if (result != AllocationResult::Success) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Texture: image allocation failed: %s",
            MemoryTypes::toString(result));
        return std::nullopt;
    }

    CommandScope cmd(memory.device(), memory.uploadPool(), memory.uploadQueue());
    if (!cmd.begin()) {
        return std::nullopt;
    }
    Barriers::copyBufferToImage(cmd.get(), staging.handle(), texture.image_.handle(),
                                pixels.width, pixels.height);
    if (!cmd.end()) {
        return std::nullopt;
    }

    texture.view_ = createImageView2D(device, texture.image_.handle(), format);
    if (!texture.view_) {
        return std::nullopt;
    }

    texture.extent_ = vk::Extent2D{pixels.width, pixels.height};
    texture.format_ = format;
    return texture;
}
