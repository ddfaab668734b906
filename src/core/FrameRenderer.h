#pragma once

#include "FrameResult.h"
#include "FrameSync.h"
#include "InstanceBuffer.h"
#include "RenderQueue.h"
#include "EngineConfig.h"
#include "ModelPass.h"
#include "PostProcessPass.h"
#include "SpritePass.h"
#include <vulkan/vulkan.hpp>
#include <memory>
#include <string>
#include <vector>

class VulkanContext;
class SpriteAssetManager;
class ModelAssetManager;

// Per-frame counters, logged verbosely and read by the benchmark scene
struct FrameStats {
    uint32_t spriteInstances = 0;
    uint32_t spriteDraws = 0;
    uint32_t modelInstances = 0;
    uint32_t modelDraws = 0;
    uint32_t droppedCommands = 0;
};

/**
 * FrameRenderer - Records and submits one frame per render() call
 *
 * Owns the passes, the frame sync set and the per-pass instance buffers.
 * All three passes are recorded into the slot's single command buffer:
 * model -> post-process -> sprites.
 *
 * Lifetime follows the device: init() after the asset managers have had
 * onDeviceReady, destroy() before they get onDeviceLost.
 */
class FrameRenderer {
public:
    FrameRenderer() = default;
    ~FrameRenderer();

    FrameRenderer(const FrameRenderer&) = delete;
    FrameRenderer& operator=(const FrameRenderer&) = delete;

    bool init(VulkanContext& context, const SpriteAssetManager& sprites, const ModelAssetManager& models,
              const RendererConfig& config, const std::string& shaderDir, float scaleFactor);
    void destroy();

    // Swapchain was recreated; the device is idle
    bool onSwapchainRecreated(float scaleFactor);

    FrameResult render(const RenderQueue& queue);

    // Set by acquire or present when the swapchain no longer matches the surface
    bool swapchainNeedsRecreation() const { return recreateSwapchain_; }

    const FrameStats& lastStats() const { return stats_; }
    const FrameSlots& slots() const { return sync_.slots(); }

    static FrameResult toFrameResult(vk::Result result);

    // For failures after a successful acquire: never a recoverable result
    static FrameResult toFatalFrameResult(vk::Result result);

private:
    PassContext makePassContext() const;
    FrameResult acquire(uint32_t& imageIndex);
    AllocationResult prepareSprites(vk::CommandBuffer cmd, uint32_t slot, const RenderQueue& queue);
    AllocationResult prepareModels(vk::CommandBuffer cmd, uint32_t slot, const RenderQueue& queue);
    FrameResult submitAndPresent(vk::CommandBuffer cmd, uint32_t imageIndex);

    VulkanContext* context_ = nullptr;
    const SpriteAssetManager* sprites_ = nullptr;
    const ModelAssetManager* models_ = nullptr;
    float scaleFactor_ = 1.0f;
    bool recreateSwapchain_ = false;

    FrameSync sync_;
    InstanceBuffer spriteInstances_{"SpriteInstances", sizeof(SpriteInstance)};
    InstanceBuffer modelInstances_{"ModelInstances", sizeof(ModelInstance)};

    // Declaration order is recording order; post samples the model pass
    std::unique_ptr<ModelPass> modelPass_;
    std::unique_ptr<PostProcessPass> postPass_;
    std::unique_ptr<SpritePass> spritePass_;

    // Reused every frame
    std::vector<SpriteInstance> spriteRecords_;
    std::vector<vk::DescriptorSet> spriteKeys_;
    std::vector<ModelInstance> modelRecords_;
    std::vector<const ModelGpuResource*> modelKeys_;

    FrameStats stats_;
};
