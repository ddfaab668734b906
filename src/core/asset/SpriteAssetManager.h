#pragma once

#include "AssetCache.h"
#include "ImageDecoder.h"
#include "Texture.h"
#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <glm/glm.hpp>
#include <optional>
#include <string>

class MemoryAllocator;

// GPU half of a sprite: texture plus its material set (set 1 of the sprite pass)
struct SpriteGpuResource {
    glm::vec2 size{0.0f};
    Texture texture;
    std::optional<vk::raii::DescriptorSet> descriptorSet;

    vk::DescriptorSet set() const { return descriptorSet ? **descriptorSet : vk::DescriptorSet{}; }
};

/**
 * SpriteAssetManager - Decoded images and their per-device GPU resources
 *
 * Owns the sampler, material layout and descriptor pool that every sprite
 * shares. They live exactly as long as the device; the decoded images live
 * as long as the manager.
 */
class SpriteAssetManager : public IAssetUploader<DecodedImage, SpriteGpuResource> {
public:
    static constexpr uint32_t DEFAULT_MAX_SPRITES = 2048;

    explicit SpriteAssetManager(uint32_t maxSprites = DEFAULT_MAX_SPRITES);
    ~SpriteAssetManager() override;

    SpriteAssetManager(const SpriteAssetManager&) = delete;
    SpriteAssetManager& operator=(const SpriteAssetManager&) = delete;

    // Creates shared objects, then replays every decoded sprite
    bool onDeviceReady(const vk::raii::Device& device, const MemoryAllocator& memory);
    void onDeviceLost();

    bool load(const AssetId& id, const std::string& path);

    const SpriteGpuResource* get(const AssetId& id) const { return cache_.get(id); }
    AssetState state(const AssetId& id) const { return cache_.state(id); }
    bool isReady(const AssetId& id) const { return cache_.state(id) == AssetState::Ready; }

    // Pixel size, known as soon as the image is decoded
    std::optional<glm::vec2> size(const AssetId& id) const;

    size_t readyCount() const { return cache_.readyCount(); }

    vk::DescriptorSetLayout materialLayout() const { return layout_ ? **layout_ : vk::DescriptorSetLayout{}; }

    std::optional<SpriteGpuResource> upload(const AssetId& id, const DecodedImage& image) override;

private:
    uint32_t maxSprites_;
    AssetCache<DecodedImage, SpriteGpuResource> cache_{"SpriteAssetManager"};

    const vk::raii::Device* device_ = nullptr;
    const MemoryAllocator* memory_ = nullptr;

    std::optional<vk::raii::Sampler> sampler_;
    std::optional<vk::raii::DescriptorSetLayout> layout_;
    std::optional<vk::raii::DescriptorPool> pool_;
};
