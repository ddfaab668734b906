#pragma once

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <SDL3/SDL_log.h>
#include <optional>
#include <vector>

// ============================================================================
// RenderPasses - the three single-subpass render passes of a frame
// ============================================================================
//
//   scene  offscreen color (cleared, sampled afterwards) + transient depth
//   post   swapchain color, fully overwritten by the fullscreen triangle
//   sprite swapchain color, loaded, drawn over and handed to present
//
// Each consumes the color writes of the pass before it in the same command buffer.

namespace RenderPasses {

struct Attachment {
    vk::Format format;
    vk::AttachmentLoadOp load;
    vk::AttachmentStoreOp store;
    vk::ImageLayout initialLayout;
    vk::ImageLayout finalLayout;
};

inline vk::AttachmentDescription describe(const Attachment& a) {
    return vk::AttachmentDescription{{}, a.format, vk::SampleCountFlagBits::e1,
        a.load, a.store, vk::AttachmentLoadOp::eDontCare, vk::AttachmentStoreOp::eDontCare,
        a.initialLayout, a.finalLayout};
}

inline Attachment sceneColor(vk::Format format) {
    return {format, vk::AttachmentLoadOp::eClear, vk::AttachmentStoreOp::eStore,
            vk::ImageLayout::eUndefined, vk::ImageLayout::eShaderReadOnlyOptimal};
}

inline Attachment sceneDepth(vk::Format format) {
    return {format, vk::AttachmentLoadOp::eClear, vk::AttachmentStoreOp::eDontCare,
            vk::ImageLayout::eUndefined, vk::ImageLayout::eDepthStencilAttachmentOptimal};
}

inline Attachment postColor(vk::Format swapchainFormat) {
    return {swapchainFormat, vk::AttachmentLoadOp::eDontCare, vk::AttachmentStoreOp::eStore,
            vk::ImageLayout::eUndefined, vk::ImageLayout::eColorAttachmentOptimal};
}

inline Attachment spriteColor(vk::Format swapchainFormat) {
    return {swapchainFormat, vk::AttachmentLoadOp::eLoad, vk::AttachmentStoreOp::eStore,
            vk::ImageLayout::eColorAttachmentOptimal, vk::ImageLayout::ePresentSrcKHR};
}

/**
 * Dependency from whatever ran before the pass. The scene depth image is
 * shared by every frame slot, so with depth the source scope also covers the
 * previous frame's late depth writes before this frame's clear.
 */
inline vk::SubpassDependency externalDependency(bool hasDepth) {
    vk::PipelineStageFlags srcStages = vk::PipelineStageFlagBits::eColorAttachmentOutput;
    vk::PipelineStageFlags dstStages = vk::PipelineStageFlagBits::eColorAttachmentOutput;
    vk::AccessFlags srcAccess = vk::AccessFlagBits::eColorAttachmentWrite;
    vk::AccessFlags dstAccess = vk::AccessFlagBits::eColorAttachmentRead | vk::AccessFlagBits::eColorAttachmentWrite;
    if (hasDepth) {
        srcStages |= vk::PipelineStageFlagBits::eEarlyFragmentTests | vk::PipelineStageFlagBits::eLateFragmentTests;
        dstStages |= vk::PipelineStageFlagBits::eEarlyFragmentTests | vk::PipelineStageFlagBits::eLateFragmentTests;
        srcAccess |= vk::AccessFlagBits::eDepthStencilAttachmentWrite;
        dstAccess |= vk::AccessFlagBits::eDepthStencilAttachmentRead | vk::AccessFlagBits::eDepthStencilAttachmentWrite;
    }
    return vk::SubpassDependency{VK_SUBPASS_EXTERNAL, 0, srcStages, dstStages, srcAccess, dstAccess};
}

// One color attachment at index 0, optional depth at index 1
inline bool create(const vk::raii::Device& device, const Attachment& color, const std::optional<Attachment>& depth,
                   bool sampledAfter, std::optional<vk::raii::RenderPass>& out) {
    std::vector<vk::AttachmentDescription> attachments{describe(color)};
    const vk::AttachmentReference colorRef{0, vk::ImageLayout::eColorAttachmentOptimal};
    const vk::AttachmentReference depthRef{1, vk::ImageLayout::eDepthStencilAttachmentOptimal};

    auto subpass = vk::SubpassDescription{}
        .setPipelineBindPoint(vk::PipelineBindPoint::eGraphics)
        .setColorAttachments(colorRef);

    if (depth) {
        attachments.push_back(describe(*depth));
        subpass.setPDepthStencilAttachment(&depthRef);
    }

    std::vector<vk::SubpassDependency> dependencies{externalDependency(depth.has_value())};
    if (sampledAfter) {
        dependencies.emplace_back(0, VK_SUBPASS_EXTERNAL,
            vk::PipelineStageFlagBits::eColorAttachmentOutput, vk::PipelineStageFlagBits::eFragmentShader,
            vk::AccessFlagBits::eColorAttachmentWrite, vk::AccessFlagBits::eShaderRead);
    }

    try {
        out.emplace(device, vk::RenderPassCreateInfo{}
            .setAttachments(attachments)
            .setSubpasses(subpass)
            .setDependencies(dependencies));
        return true;
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "RenderPasses: Failed to create render pass: %s", e.what());
        return false;
    }
}

inline bool createScene(const vk::raii::Device& device, vk::Format colorFormat, vk::Format depthFormat,
                        std::optional<vk::raii::RenderPass>& out) {
    return create(device, sceneColor(colorFormat), sceneDepth(depthFormat), true, out);
}

inline bool createPost(const vk::raii::Device& device, vk::Format swapchainFormat,
                       std::optional<vk::raii::RenderPass>& out) {
    return create(device, postColor(swapchainFormat), std::nullopt, false, out);
}

inline bool createSprite(const vk::raii::Device& device, vk::Format swapchainFormat,
                         std::optional<vk::raii::RenderPass>& out) {
    return create(device, spriteColor(swapchainFormat), std::nullopt, false, out);
}

}
