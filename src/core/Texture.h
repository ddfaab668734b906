#pragma once

#include "VmaResources.h"
#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <optional>

class MemoryAllocator;
struct DecodedImage;

// 2D single-mip view over an image
std::optional<vk::raii::ImageView> createImageView2D(const vk::raii::Device& device, vk::Image image,
                                                     vk::Format format,
                                                     vk::ImageAspectFlags aspect = vk::ImageAspectFlagBits::eColor);

/**
 * Texture - GPU-only sampled image with its view
 *
 * Pixels reach the image through a CPU-to-GPU staging buffer and a one-time
 * command that leaves the image in SHADER_READ_ONLY_OPTIMAL. Samplers are
 * owned by the asset managers, one per manager.
 */
class Texture {
public:
    Texture() = default;

    Texture(Texture&&) = default;
    Texture& operator=(Texture&&) = default;
    Texture(const Texture&) = delete;
    Texture& operator=(const Texture&) = delete;

    static std::optional<Texture> upload(const MemoryAllocator& memory, const vk::raii::Device& device,
                                         const DecodedImage& pixels,
                                         vk::Format format = vk::Format::eR8G8B8A8Srgb);

    // Single mip, optimal tiling, exclusive, filled by one transfer then sampled
    static vk::ImageCreateInfo sampledImageInfo(uint32_t width, uint32_t height, vk::Format format);

    vk::Image image() const { return image_.handle(); }
    vk::ImageView view() const { return view_ ? **view_ : vk::ImageView{}; }
    vk::Extent2D extent() const { return extent_; }
    vk::Format format() const { return format_; }

private:
    VmaImage image_;
    std::optional<vk::raii::ImageView> view_;
    vk::Extent2D extent_{0, 0};
    vk::Format format_ = vk::Format::eUndefined;
};
