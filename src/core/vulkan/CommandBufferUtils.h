#pragma once

#include <vulkan/vulkan.hpp>
#include <SDL3/SDL_log.h>
#include <array>
#include <cstdint>
#include <initializer_list>
#include <vector>

// ============================================================================
// CommandScope - blocking one-shot submission on the upload queue
// ============================================================================
//
//   CommandScope cmd(device, uploadPool, uploadQueue);
//   if (!cmd.begin()) return false;
//   cmd.get().copyBuffer(...);
//   if (!cmd.end()) return false;   // the copy has completed here
//
// Texture and static-buffer uploads go through this; per-frame work never does.

class CommandScope {
public:
    CommandScope(vk::Device device, vk::CommandPool pool, vk::Queue queue)
        : device_(device), pool_(pool), queue_(queue) {}

    ~CommandScope() {
        if (cmd_) device_.freeCommandBuffers(pool_, cmd_);
    }

    CommandScope(const CommandScope&) = delete;
    CommandScope& operator=(const CommandScope&) = delete;

    bool begin() {
        try {
            cmd_ = device_.allocateCommandBuffers({pool_, vk::CommandBufferLevel::ePrimary, 1}).front();
            cmd_.begin({vk::CommandBufferUsageFlagBits::eOneTimeSubmit});
            return true;
        } catch (const vk::SystemError& e) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "CommandScope: begin failed: %s", e.what());
            return false;
        }
    }

    // Submits with a private fence and blocks until it signals
    bool end() {
        if (!cmd_) return false;

        vk::Fence fence;
        bool completed = false;
        try {
            cmd_.end();
            fence = device_.createFence({});
            queue_.submit(vk::SubmitInfo{}.setCommandBuffers(cmd_), fence);
            completed = device_.waitForFences(fence, vk::True, UINT64_MAX) == vk::Result::eSuccess;
            if (!completed) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "CommandScope: upload fence wait did not complete");
            }
        } catch (const vk::SystemError& e) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "CommandScope: submit failed: %s", e.what());
        }
        if (fence) device_.destroyFence(fence);
        return completed;
    }

    vk::CommandBuffer get() const { return cmd_; }

private:
    vk::Device device_;
    vk::CommandPool pool_;
    vk::Queue queue_;
    vk::CommandBuffer cmd_;
};

// ============================================================================
// RenderPassScope - inline render pass over the full extent, ended on scope exit
// ============================================================================
//
//   RenderPassScope scope(cmd, renderPass, framebuffer, extent,
//                         {RenderPassScope::color(0.1f, 0.1f, 0.1f), RenderPassScope::depthOne()});
//
// One clear value per attachment with LOAD_OP_CLEAR, in attachment order.

class RenderPassScope {
public:
    RenderPassScope(vk::CommandBuffer cmd, vk::RenderPass renderPass, vk::Framebuffer framebuffer,
                    vk::Extent2D extent, std::initializer_list<vk::ClearValue> clears = {})
        : cmd_(cmd) {
        std::vector<vk::ClearValue> clearValues(clears);
        cmd_.beginRenderPass(vk::RenderPassBeginInfo{}
            .setRenderPass(renderPass)
            .setFramebuffer(framebuffer)
            .setRenderArea(vk::Rect2D{{0, 0}, extent})
            .setClearValues(clearValues), vk::SubpassContents::eInline);
    }

    ~RenderPassScope() { cmd_.endRenderPass(); }

    RenderPassScope(const RenderPassScope&) = delete;
    RenderPassScope& operator=(const RenderPassScope&) = delete;

    static vk::ClearValue color(float r, float g, float b, float a = 1.0f) {
        return vk::ClearColorValue{std::array<float, 4>{r, g, b, a}};
    }

    static vk::ClearValue depthOne() {
        return vk::ClearDepthStencilValue{1.0f, 0};
    }

private:
    vk::CommandBuffer cmd_;
};

// Viewport and scissor are dynamic in every pipeline; both cover the whole target
inline void setViewportAndScissor(vk::CommandBuffer cmd, vk::Extent2D extent) {
    cmd.setViewport(0, vk::Viewport{0.0f, 0.0f,
        static_cast<float>(extent.width), static_cast<float>(extent.height), 0.0f, 1.0f});
    cmd.setScissor(0, vk::Rect2D{{0, 0}, extent});
}
