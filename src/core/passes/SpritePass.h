#pragma once

#include "IRenderPass.h"
#include "InstanceRecords.h"
#include "DrawBatcher.h"
#include "VmaResources.h"
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * SpritePass - 2D sprites composited over the post-processed image
 *
 * Loads the swapchain image as-is and leaves it in PRESENT_SRC. One indexed
 * instanced draw of the unit quad per batch; each batch binds its sprite's
 * material set at set 1.
 */
class SpritePass : public IRenderPass {
public:
    // Material layout comes from SpriteAssetManager, which outlives the pass's device objects
    SpritePass(std::string shaderDir, vk::DescriptorSetLayout materialLayout);
    ~SpritePass() override;

    const char* name() const override { return "SpritePass"; }

    bool onDeviceReady(const PassContext& context) override;
    void onDeviceLost() override;
    bool onResized(const PassContext& context) override;
    void record(vk::CommandBuffer cmd, const FrameInfo& frame) override;

    void setFrameData(vk::Buffer instanceBuffer, std::vector<DrawBatch<vk::DescriptorSet>> batches);

    uint32_t lastDrawCount() const { return lastDrawCount_; }

private:
    bool createScreenUniforms(const PassContext& context);
    bool createFramebuffers(const PassContext& context);
    void writeScreenUniforms(const PassContext& context);
    bool createPipeline();
    bool createQuadBuffers(const PassContext& context);

    std::string shaderDir_;
    vk::DescriptorSetLayout materialLayout_;
    const vk::raii::Device* device_ = nullptr;
    vk::Extent2D extent_{0, 0};

    std::optional<vk::raii::RenderPass> renderPass_;
    std::vector<vk::raii::Framebuffer> framebuffers_;

    std::optional<vk::raii::DescriptorSetLayout> screenLayout_;
    std::optional<vk::raii::DescriptorPool> screenPool_;
    std::optional<vk::raii::DescriptorSet> screenSet_;
    VmaBuffer screenBuffer_;  // Persistently mapped

    std::optional<vk::raii::PipelineLayout> pipelineLayout_;
    std::optional<vk::raii::Pipeline> pipeline_;

    VmaBuffer quadVertices_;
    VmaBuffer quadIndices_;

    vk::Buffer instanceBuffer_;
    std::vector<DrawBatch<vk::DescriptorSet>> batches_;
    uint32_t lastDrawCount_ = 0;
};
