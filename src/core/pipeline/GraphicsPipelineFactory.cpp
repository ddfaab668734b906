#include "GraphicsPipelineFactory.h"
#include "ShaderLoader.h"
#include <SDL3/SDL_log.h>
#include <array>
#include <vector>

GraphicsPipelineFactory::PresetState GraphicsPipelineFactory::presetState(Preset preset) {
    PresetState state;
    switch (preset) {
        case Preset::Default:
            break;
        case Preset::FullscreenQuad:
            state.depthTest = false;
            state.depthWrite = false;
            state.blend = BlendMode::None;
            state.vertexInput = false;
            break;
        case Preset::Sprite2D:
            state.depthTest = false;
            state.depthWrite = false;
            break;
    }
    return state;
}

vk::PipelineColorBlendAttachmentState GraphicsPipelineFactory::blendAttachment(BlendMode mode) {
    auto attachment = vk::PipelineColorBlendAttachmentState{}
        .setColorWriteMask(vk::ColorComponentFlagBits::eR | vk::ColorComponentFlagBits::eG |
                           vk::ColorComponentFlagBits::eB | vk::ColorComponentFlagBits::eA);
    if (mode == BlendMode::None) {
        return attachment.setBlendEnable(false);
    }

    return attachment
        .setBlendEnable(true)
        .setSrcColorBlendFactor(vk::BlendFactor::eSrcAlpha)
        .setDstColorBlendFactor(vk::BlendFactor::eOneMinusSrcAlpha)
        .setColorBlendOp(vk::BlendOp::eAdd)
        .setSrcAlphaBlendFactor(vk::BlendFactor::eOne)
        .setDstAlphaBlendFactor(vk::BlendFactor::eOneMinusSrcAlpha)
        .setAlphaBlendOp(vk::BlendOp::eAdd);
}

bool GraphicsPipelineFactory::createLayout(const vk::raii::Device& device,
                                           std::initializer_list<vk::DescriptorSetLayout> setLayouts,
                                           std::optional<vk::raii::PipelineLayout>& outLayout) {
    std::vector<vk::DescriptorSetLayout> layouts(setLayouts);
    try {
        outLayout.emplace(device, vk::PipelineLayoutCreateInfo{}.setSetLayouts(layouts));
        return true;
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "GraphicsPipelineFactory: Failed to create pipeline layout: %s", e.what());
        return false;
    }
}

bool GraphicsPipelineFactory::build(std::optional<vk::raii::Pipeline>& outPipeline) const {
    if (!renderPass_ || !layout_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "GraphicsPipelineFactory: %s needs a render pass and a layout", vertPath_.c_str());
        return false;
    }

    auto vertModule = ShaderLoader::loadShaderModule(*device_, vertPath_);
    auto fragModule = ShaderLoader::loadShaderModule(*device_, fragPath_);
    if (!vertModule || !fragModule) {
        return false;
    }

    const std::array<vk::PipelineShaderStageCreateInfo, 2> stages = {
        vk::PipelineShaderStageCreateInfo{{}, vk::ShaderStageFlagBits::eVertex, **vertModule, "main"},
        vk::PipelineShaderStageCreateInfo{{}, vk::ShaderStageFlagBits::eFragment, **fragModule, "main"}
    };

    // The fullscreen triangle is generated from gl_VertexIndex
    auto vertexInput = vk::PipelineVertexInputStateCreateInfo{};
    if (state_.vertexInput) {
        vertexInput
            .setVertexBindingDescriptions(vertexInput_.getBindings())
            .setVertexAttributeDescriptions(vertexInput_.getAttributes());
    }

    const auto inputAssembly = vk::PipelineInputAssemblyStateCreateInfo{}
        .setTopology(vk::PrimitiveTopology::eTriangleList);

    const auto viewport = vk::PipelineViewportStateCreateInfo{}
        .setViewportCount(1)
        .setScissorCount(1);

    const auto rasterization = vk::PipelineRasterizationStateCreateInfo{}
        .setPolygonMode(vk::PolygonMode::eFill)
        .setCullMode(vk::CullModeFlagBits::eNone)
        .setFrontFace(vk::FrontFace::eCounterClockwise)
        .setLineWidth(1.0f);

    const auto multisample = vk::PipelineMultisampleStateCreateInfo{}
        .setRasterizationSamples(vk::SampleCountFlagBits::e1);

    const auto depthStencil = vk::PipelineDepthStencilStateCreateInfo{}
        .setDepthTestEnable(state_.depthTest)
        .setDepthWriteEnable(state_.depthWrite)
        .setDepthCompareOp(vk::CompareOp::eLessOrEqual);

    const auto attachment = blendAttachment(state_.blend);
    const auto colorBlend = vk::PipelineColorBlendStateCreateInfo{}.setAttachments(attachment);

    const std::array<vk::DynamicState, 2> dynamicStates = {vk::DynamicState::eViewport, vk::DynamicState::eScissor};
    const auto dynamic = vk::PipelineDynamicStateCreateInfo{}.setDynamicStates(dynamicStates);

    const auto pipelineInfo = vk::GraphicsPipelineCreateInfo{}
        .setStages(stages)
        .setPVertexInputState(&vertexInput)
        .setPInputAssemblyState(&inputAssembly)
        .setPViewportState(&viewport)
        .setPRasterizationState(&rasterization)
        .setPMultisampleState(&multisample)
        .setPDepthStencilState(&depthStencil)
        .setPColorBlendState(&colorBlend)
        .setPDynamicState(&dynamic)
        .setLayout(layout_)
        .setRenderPass(renderPass_)
        .setSubpass(0);

    try {
        outPipeline.emplace(*device_, nullptr, pipelineInfo);
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "GraphicsPipelineFactory: Failed to create pipeline for %s: %s", vertPath_.c_str(), e.what());
        return false;
    }
    return true;
}
