#include "SpriteAssetManager.h"
#include "MemoryAllocator.h"
#include "Samplers.h"
#include "DescriptorSetLayoutBuilder.h"
#include "DescriptorWriter.h"
#include <SDL3/SDL_log.h>

SpriteAssetManager::SpriteAssetManager(uint32_t maxSprites)
    : maxSprites_(maxSprites == 0 ? DEFAULT_MAX_SPRITES : maxSprites) {}

SpriteAssetManager::~SpriteAssetManager() {
    onDeviceLost();
}

bool SpriteAssetManager::onDeviceReady(const vk::raii::Device& device, const MemoryAllocator& memory) {
    device_ = &device;
    memory_ = &memory;

    auto layoutBuilder = DescriptorSetLayoutBuilder::material();

    if (!Samplers::create(device, SamplerKind::Sprite, sampler_)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SpriteAssetManager: Failed to create sampler");
        return false;
    }

    layout_ = layoutBuilder.build(device);
    if (!layout_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SpriteAssetManager: Failed to create material layout");
        return false;
    }

    pool_ = createDescriptorPool(device, layoutBuilder, maxSprites_);
    if (!pool_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SpriteAssetManager: Failed to create descriptor pool");
        return false;
    }

    cache_.onDeviceReady(*this);
    return true;
}

void SpriteAssetManager::onDeviceLost() {
    // Sets go back to the pool before the pool itself is destroyed
    if (cache_.hasDevice()) {
        cache_.onDeviceLost();
    }
    pool_.reset();
    layout_.reset();
    sampler_.reset();
    device_ = nullptr;
    memory_ = nullptr;
}

bool SpriteAssetManager::load(const AssetId& id, const std::string& path) {
    return cache_.load(id, [&path]() { return ImageDecoder::loadFromFile(path); });
}

std::optional<glm::vec2> SpriteAssetManager::size(const AssetId& id) const {
    const DecodedImage* image = cache_.source(id);
    if (!image) return std::nullopt;
    return glm::vec2(static_cast<float>(image->width), static_cast<float>(image->height));
}

std::optional<SpriteGpuResource> SpriteAssetManager::upload(const AssetId& id, const DecodedImage& image) {
    if (!device_ || !memory_ || !pool_) {
        return std::nullopt;
    }

    if (cache_.readyCount() >= maxSprites_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "SpriteAssetManager: '%s' exceeds the %u sprite descriptor budget", id.c_str(), maxSprites_);
        return std::nullopt;
    }

    auto texture = Texture::upload(*memory_, *device_, image, vk::Format::eR8G8B8A8Srgb);
    if (!texture) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SpriteAssetManager: Texture upload failed for '%s'", id.c_str());
        return std::nullopt;
    }

    SpriteGpuResource resource;
    resource.size = glm::vec2(static_cast<float>(image.width), static_cast<float>(image.height));
    resource.texture = std::move(*texture);
    resource.descriptorSet = allocateDescriptorSet(*device_, *pool_, *layout_);
    if (!resource.descriptorSet) {
        return std::nullopt;
    }

    DescriptorWriter()
        .sampledImage(BINDING_MATERIAL_TEXTURE, **sampler_, resource.texture.view())
        .update(*device_, resource.set());

    SDL_LogVerbose(SDL_LOG_CATEGORY_APPLICATION, "SpriteAssetManager: '%s' ready (%ux%u)",
        id.c_str(), image.width, image.height);
    return resource;
}
