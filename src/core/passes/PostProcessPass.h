#pragma once

#include "IRenderPass.h"
#include "InstanceRecords.h"
#include "VmaResources.h"
#include <optional>
#include <string>
#include <vector>

class ModelPass;

/**
 * PostProcessPass - Scene color to the swapchain image
 *
 * A single fullscreen triangle samples ModelPass's scene color and applies
 * exposure and vignette. The swapchain image is fully overwritten, so its
 * previous contents are discarded.
 *
 * The scene color view changes on resize; ModelPass must be resized first.
 */
class PostProcessPass : public IRenderPass {
public:
    PostProcessPass(std::string shaderDir, const ModelPass& scene, float exposure, float vignette);
    ~PostProcessPass() override;

    const char* name() const override { return "PostProcessPass"; }

    bool onDeviceReady(const PassContext& context) override;
    void onDeviceLost() override;
    bool onResized(const PassContext& context) override;
    void record(vk::CommandBuffer cmd, const FrameInfo& frame) override;

private:
    bool createFramebuffers(const PassContext& context);
    bool writeDescriptors();

    std::string shaderDir_;
    const ModelPass& scene_;
    PostUniforms uniforms_;
    const vk::raii::Device* device_ = nullptr;
    vk::Extent2D extent_{0, 0};

    std::optional<vk::raii::RenderPass> renderPass_;
    std::vector<vk::raii::Framebuffer> framebuffers_;

    std::optional<vk::raii::Sampler> sampler_;
    std::optional<vk::raii::DescriptorSetLayout> layout_;
    std::optional<vk::raii::DescriptorPool> pool_;
    std::optional<vk::raii::DescriptorSet> set_;
    VmaBuffer uniformBuffer_;

    std::optional<vk::raii::PipelineLayout> pipelineLayout_;
    std::optional<vk::raii::Pipeline> pipeline_;
};
