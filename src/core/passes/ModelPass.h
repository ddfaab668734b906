#pragma once

#include "IRenderPass.h"
#include "InstanceRecords.h"
#include "DrawBatcher.h"
#include "VmaResources.h"
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <vector>

struct ModelGpuResource;

/**
 * ModelPass - Instanced glTF meshes into the offscreen scene color
 *
 * Owns the scene color (sampled by PostProcessPass) and depth attachments,
 * both recreated on resize. The pass runs every frame so the scene color is
 * always cleared and left in SHADER_READ_ONLY_OPTIMAL, even with no models.
 *
 * Set 0 is a per-slot camera UBO; set 1 is the mesh material.
 */
class ModelPass : public IRenderPass {
public:
    static constexpr vk::Format SCENE_COLOR_FORMAT = vk::Format::eR8G8B8A8Unorm;
    static constexpr vk::Format DEPTH_FORMAT = vk::Format::eD32Sfloat;

    ModelPass(std::string shaderDir, vk::DescriptorSetLayout materialLayout, const glm::vec4& clearColor);
    ~ModelPass() override;

    const char* name() const override { return "ModelPass"; }

    bool onDeviceReady(const PassContext& context) override;
    void onDeviceLost() override;
    bool onResized(const PassContext& context) override;
    void record(vk::CommandBuffer cmd, const FrameInfo& frame) override;

    void setFrameData(vk::Buffer instanceBuffer,
                      std::vector<DrawBatch<const ModelGpuResource*>> batches,
                      const glm::mat4& viewProjection);

    vk::ImageView sceneColorView() const { return sceneColorView_ ? **sceneColorView_ : vk::ImageView{}; }
    uint32_t lastDrawCount() const { return lastDrawCount_; }

private:
    struct CameraSlot {
        VmaBuffer buffer;  // Persistently mapped
        std::optional<vk::raii::DescriptorSet> set;
    };

    bool createTargets(const PassContext& context);
    void destroyTargets();
    bool createCameraSlots(const PassContext& context);
    bool createPipeline();

    std::string shaderDir_;
    vk::DescriptorSetLayout materialLayout_;
    glm::vec4 clearColor_;
    const vk::raii::Device* device_ = nullptr;
    vk::Extent2D extent_{0, 0};

    std::optional<vk::raii::RenderPass> renderPass_;

    VmaImage sceneColor_;
    std::optional<vk::raii::ImageView> sceneColorView_;
    VmaImage depth_;
    std::optional<vk::raii::ImageView> depthView_;
    std::optional<vk::raii::Framebuffer> framebuffer_;

    std::optional<vk::raii::DescriptorSetLayout> cameraLayout_;
    std::optional<vk::raii::DescriptorPool> cameraPool_;
    std::vector<CameraSlot> cameraSlots_;

    std::optional<vk::raii::PipelineLayout> pipelineLayout_;
    std::optional<vk::raii::Pipeline> pipeline_;

    vk::Buffer instanceBuffer_;
    std::vector<DrawBatch<const ModelGpuResource*>> batches_;
    glm::mat4 viewProjection_{1.0f};
    uint32_t lastDrawCount_ = 0;
};
