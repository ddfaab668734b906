#pragma once

#include "VertexInputBuilder.h"
#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <initializer_list>
#include <optional>
#include <string>

/**
 * GraphicsPipelineFactory - Builds the renderer's three kinds of pipeline
 *
 * Every pipeline draws a triangle list with fill mode, no culling, one color
 * attachment and dynamic viewport and scissor. The preset picks depth and
 * blending; the pass supplies shaders, vertex input and layout.
 *
 *   GraphicsPipelineFactory(device)
 *       .applyPreset(GraphicsPipelineFactory::Preset::Sprite2D)
 *       .setShaders(shaderDir, "sprite")   // sprite.vert.spv + sprite.frag.spv
 *       .setRenderPass(renderPass)
 *       .setPipelineLayout(layout)
 *       .setVertexInput(vertexInput)
 *       .build(pipeline_);
 */
class GraphicsPipelineFactory {
public:
    enum class BlendMode {
        None,   // Opaque
        Alpha   // Color SRC_ALPHA / ONE_MINUS_SRC_ALPHA, alpha ONE / ONE_MINUS_SRC_ALPHA
    };

    enum class Preset {
        Default,         // Depth test and write, LESS_OR_EQUAL, alpha blended
        FullscreenQuad,  // No vertex input, no depth, opaque
        Sprite2D         // No depth, alpha blended
    };

    struct PresetState {
        bool depthTest = true;
        bool depthWrite = true;
        BlendMode blend = BlendMode::Alpha;
        bool vertexInput = true;
    };

    explicit GraphicsPipelineFactory(const vk::raii::Device& device) : device_(&device) {}

    GraphicsPipelineFactory& applyPreset(Preset preset) {
        state_ = presetState(preset);
        return *this;
    }

    // Loads <shaderDir>/<name>.vert.spv and <shaderDir>/<name>.frag.spv
    GraphicsPipelineFactory& setShaders(const std::string& shaderDir, const std::string& name) {
        vertPath_ = shaderDir + "/" + name + ".vert.spv";
        fragPath_ = shaderDir + "/" + name + ".frag.spv";
        return *this;
    }

    GraphicsPipelineFactory& setRenderPass(vk::RenderPass renderPass) {
        renderPass_ = renderPass;
        return *this;
    }

    GraphicsPipelineFactory& setPipelineLayout(vk::PipelineLayout layout) {
        layout_ = layout;
        return *this;
    }

    GraphicsPipelineFactory& setVertexInput(const VertexInputBuilder& vertexInput) {
        vertexInput_ = vertexInput;
        return *this;
    }

    bool build(std::optional<vk::raii::Pipeline>& outPipeline) const;

    // Set indices follow list order: frame-global set 0, material set 1
    static bool createLayout(const vk::raii::Device& device,
                             std::initializer_list<vk::DescriptorSetLayout> setLayouts,
                             std::optional<vk::raii::PipelineLayout>& outLayout);

    static PresetState presetState(Preset preset);
    static vk::PipelineColorBlendAttachmentState blendAttachment(BlendMode mode);

private:
    const vk::raii::Device* device_;
    PresetState state_;
    std::string vertPath_;
    std::string fragPath_;
    vk::RenderPass renderPass_;
    vk::PipelineLayout layout_;
    VertexInputBuilder vertexInput_;
};
