#include "ModelAssetManager.h"
#include "MemoryAllocator.h"
#include "Samplers.h"
#include "DescriptorSetLayoutBuilder.h"
#include "DescriptorWriter.h"
#include <SDL3/SDL_log.h>

ModelAssetManager::ModelAssetManager(uint32_t maxMaterials)
    : maxMaterials_(maxMaterials == 0 ? DEFAULT_MAX_MATERIALS : maxMaterials) {}

ModelAssetManager::~ModelAssetManager() {
    onDeviceLost();
}

bool ModelAssetManager::onDeviceReady(const vk::raii::Device& device, const MemoryAllocator& memory) {
    device_ = &device;
    memory_ = &memory;

    auto layoutBuilder = DescriptorSetLayoutBuilder::material();

    if (!Samplers::create(device, SamplerKind::Material, sampler_)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelAssetManager: Failed to create sampler");
        return false;
    }

    layout_ = layoutBuilder.build(device);
    if (!layout_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelAssetManager: Failed to create material layout");
        return false;
    }

    // One extra set for the shared white material
    pool_ = createDescriptorPool(device, layoutBuilder, maxMaterials_ + 1);
    if (!pool_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelAssetManager: Failed to create descriptor pool");
        return false;
    }

    if (!createDefaultMaterial()) {
        return false;
    }

    cache_.onDeviceReady(*this);
    return true;
}

void ModelAssetManager::onDeviceLost() {
    if (cache_.hasDevice()) {
        cache_.onDeviceLost();
    }
    whiteMaterial_.reset();
    whiteTexture_.reset();
    pool_.reset();
    layout_.reset();
    sampler_.reset();
    device_ = nullptr;
    memory_ = nullptr;
}

bool ModelAssetManager::load(const AssetId& id, const std::string& path) {
    return cache_.load(id, [&path]() { return ModelDecoder::load(path); });
}

bool ModelAssetManager::createDefaultMaterial() {
    whiteTexture_ = Texture::upload(*memory_, *device_, DecodedImage::solidColor(255, 255, 255, 255),
                                    vk::Format::eR8G8B8A8Unorm);
    if (!whiteTexture_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelAssetManager: Failed to create default texture");
        return false;
    }

    whiteMaterial_ = createMaterialSet(whiteTexture_->view());
    if (!whiteMaterial_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelAssetManager: Failed to create default material");
        return false;
    }
    return true;
}

std::optional<vk::raii::DescriptorSet> ModelAssetManager::createMaterialSet(vk::ImageView view) {
    auto set = allocateDescriptorSet(*device_, *pool_, *layout_);
    if (!set) {
        return std::nullopt;
    }
    DescriptorWriter()
        .sampledImage(BINDING_MATERIAL_TEXTURE, **sampler_, view)
        .update(*device_, **set);
    return set;
}

std::optional<ModelGpuResource> ModelAssetManager::upload(const AssetId& id, const DecodedModel& model) {
    if (!device_ || !memory_ || !pool_ || !whiteMaterial_) {
        return std::nullopt;
    }

    ModelGpuResource resource;
    resource.meshes.reserve(model.meshes.size());

    for (const auto& mesh : model.meshes) {
        MeshGpuResource gpuMesh;

        auto result = memory_->createBufferWithData(mesh.vertices.data(), mesh.vertices.size(), sizeof(ModelVertex),
                                                    vk::BufferUsageFlagBits::eVertexBuffer,
                                                    MemoryPolicy::GpuOnly, gpuMesh.vertexBuffer);
        if (result != AllocationResult::Success) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelAssetManager: Vertex buffer for '%s' failed: %s",
                id.c_str(), MemoryTypes::toString(result));
            return std::nullopt;
        }

        result = memory_->createBufferWithData(mesh.indices.data(), mesh.indices.size(), sizeof(uint32_t),
                                               vk::BufferUsageFlagBits::eIndexBuffer,
                                               MemoryPolicy::GpuOnly, gpuMesh.indexBuffer);
        if (result != AllocationResult::Success) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelAssetManager: Index buffer for '%s' failed: %s",
                id.c_str(), MemoryTypes::toString(result));
            return std::nullopt;
        }
        gpuMesh.indexCount = static_cast<uint32_t>(mesh.indices.size());

        if (mesh.baseColor) {
            gpuMesh.texture = Texture::upload(*memory_, *device_, *mesh.baseColor, vk::Format::eR8G8B8A8Srgb);
            if (gpuMesh.texture) {
                gpuMesh.ownMaterial = createMaterialSet(gpuMesh.texture->view());
            }
            if (!gpuMesh.ownMaterial) {
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "ModelAssetManager: '%s' base color unavailable, using default material", id.c_str());
                gpuMesh.texture.reset();
            }
        }
        gpuMesh.material = gpuMesh.ownMaterial ? **gpuMesh.ownMaterial : **whiteMaterial_;

        resource.meshes.push_back(std::move(gpuMesh));
    }

    SDL_LogVerbose(SDL_LOG_CATEGORY_APPLICATION, "ModelAssetManager: '%s' ready (%zu meshes)",
        id.c_str(), resource.meshes.size());
    return resource;
}
