#pragma once

#include "AssetCache.h"
#include "ModelDecoder.h"
#include "Texture.h"
#include "VmaResources.h"
#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <optional>
#include <string>
#include <vector>

class MemoryAllocator;

struct MeshGpuResource {
    VmaBuffer vertexBuffer;
    VmaBuffer indexBuffer;
    uint32_t indexCount = 0;

    // Empty when the mesh shares the default white material
    std::optional<Texture> texture;
    std::optional<vk::raii::DescriptorSet> ownMaterial;
    vk::DescriptorSet material;
};

struct ModelGpuResource {
    std::vector<MeshGpuResource> meshes;
};

/**
 * ModelAssetManager - glTF models and their per-device GPU resources
 *
 * Vertex and index data go to GPU-only buffers through staging. Meshes with
 * a base-color texture get their own material set; the rest share a 1x1
 * white material owned here.
 */
class ModelAssetManager : public IAssetUploader<DecodedModel, ModelGpuResource> {
public:
    static constexpr uint32_t DEFAULT_MAX_MATERIALS = 512;

    explicit ModelAssetManager(uint32_t maxMaterials = DEFAULT_MAX_MATERIALS);
    ~ModelAssetManager() override;

    ModelAssetManager(const ModelAssetManager&) = delete;
    ModelAssetManager& operator=(const ModelAssetManager&) = delete;

    bool onDeviceReady(const vk::raii::Device& device, const MemoryAllocator& memory);
    void onDeviceLost();

    bool load(const AssetId& id, const std::string& path);

    const ModelGpuResource* get(const AssetId& id) const { return cache_.get(id); }
    AssetState state(const AssetId& id) const { return cache_.state(id); }
    size_t readyCount() const { return cache_.readyCount(); }

    vk::DescriptorSetLayout materialLayout() const { return layout_ ? **layout_ : vk::DescriptorSetLayout{}; }

    std::optional<ModelGpuResource> upload(const AssetId& id, const DecodedModel& model) override;

private:
    bool createDefaultMaterial();
    std::optional<vk::raii::DescriptorSet> createMaterialSet(vk::ImageView view);

    uint32_t maxMaterials_;
    AssetCache<DecodedModel, ModelGpuResource> cache_{"ModelAssetManager"};

    const vk::raii::Device* device_ = nullptr;
    const MemoryAllocator* memory_ = nullptr;

    std::optional<vk::raii::Sampler> sampler_;
    std::optional<vk::raii::DescriptorSetLayout> layout_;
    std::optional<vk::raii::DescriptorPool> pool_;

    std::optional<Texture> whiteTexture_;
    std::optional<vk::raii::DescriptorSet> whiteMaterial_;
};
