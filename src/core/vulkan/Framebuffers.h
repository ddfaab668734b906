#pragma once

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <optional>
#include <vector>
#include <SDL3/SDL_log.h>

// Framebuffers for the render passes; single layer, sized to the drawable
namespace Framebuffers {

inline bool create(const vk::raii::Device& device, vk::RenderPass renderPass, vk::Extent2D extent,
                   const std::vector<vk::ImageView>& attachments,
                   std::optional<vk::raii::Framebuffer>& out) {
    try {
        out.emplace(device, vk::FramebufferCreateInfo{}
            .setRenderPass(renderPass)
            .setAttachments(attachments)
            .setWidth(extent.width)
            .setHeight(extent.height)
            .setLayers(1));
        return true;
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Framebuffers: Failed to create %ux%u framebuffer: %s",
            extent.width, extent.height, e.what());
        return false;
    }
}

/**
 * One framebuffer per swapchain image view, in image index order. Either
 * every framebuffer is created or out is left empty.
 */
inline bool createPerImage(const vk::raii::Device& device, vk::RenderPass renderPass, vk::Extent2D extent,
                           const std::vector<vk::ImageView>& imageViews,
                           std::vector<vk::raii::Framebuffer>& out) {
    std::vector<vk::raii::Framebuffer> framebuffers;
    framebuffers.reserve(imageViews.size());
    for (vk::ImageView view : imageViews) {
        std::optional<vk::raii::Framebuffer> framebuffer;
        if (!create(device, renderPass, extent, {view}, framebuffer)) {
            return false;
        }
        framebuffers.push_back(std::move(*framebuffer));
    }
    out = std::move(framebuffers);
    return true;
}

}
