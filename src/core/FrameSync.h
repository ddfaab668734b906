#pragma once

// ============================================================================
// FrameSync.h - Per-slot fences and semaphores plus images-in-flight tracking
// ============================================================================
//
// Usage:
//   FrameSync sync;
//   if (!sync.init(device, FrameSlots::MAX_FRAMES_IN_FLIGHT, imageCount)) return false;
//
//   // In render loop:
//   sync.waitForCurrentFrame();
//   ... acquire with sync.currentImageAvailable() ...
//   sync.waitForImage(imageIndex);
//   sync.resetCurrentFence();
//   ... submit signalling sync.currentRenderFinished() and sync.currentFence() ...
//   sync.markSubmitted();
//   sync.advance();

#include "FrameBuffered.h"
#include "FrameSlots.h"
#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <optional>

struct FrameSyncPrimitives {
    std::optional<vk::raii::Semaphore> imageAvailable;
    std::optional<vk::raii::Semaphore> renderFinished;
    std::optional<vk::raii::Fence> inFlightFence;  // Created signaled
};

class FrameSync {
public:
    FrameSync() = default;

    FrameSync(const FrameSync&) = delete;
    FrameSync& operator=(const FrameSync&) = delete;

    bool init(const vk::raii::Device& device, uint32_t frameCount, uint32_t imageCount);
    void destroy();

    uint32_t currentIndex() const { return slots_.current(); }
    uint32_t frameCount() const { return frames_.frameCount(); }
    const FrameSlots& slots() const { return slots_; }

    // Blocks on the current slot's fence if that slot is still in flight
    vk::Result waitForCurrentFrame();

    // Blocks on whichever other slot last rendered imageIndex, then claims it
    vk::Result waitForImage(uint32_t imageIndex);

    void resetCurrentFence();
    void markSubmitted();
    void advance();

    // Swapchain recreated: new image count, no image is owned
    void resizeImages(uint32_t imageCount);

    // Caller has waited for device idle
    void markIdle();

    vk::Semaphore currentImageAvailable() const { return **frames_.current().imageAvailable; }
    vk::Semaphore currentRenderFinished() const { return **frames_.current().renderFinished; }
    vk::Fence currentFence() const { return **frames_.current().inFlightFence; }

private:
    vk::Result waitSlot(uint32_t slot);

    const vk::raii::Device* device_ = nullptr;
    FrameBuffered<FrameSyncPrimitives> frames_;
    FrameSlots slots_;
};
