#include "FrameSync.h"
#include <SDL3/SDL_log.h>

bool FrameSync::init(const vk::raii::Device& device, uint32_t frameCount, uint32_t imageCount) {
    if (frameCount == 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameSync::init: frameCount must be > 0");
        return false;
    }

    destroy();
    device_ = &device;

    bool ok = true;
    frames_.resize(frameCount, [&device, &ok](uint32_t i) -> FrameSyncPrimitives {
        FrameSyncPrimitives primitives;
        try {
            primitives.imageAvailable.emplace(device, vk::SemaphoreCreateInfo{});
            primitives.renderFinished.emplace(device, vk::SemaphoreCreateInfo{});
            // Signaled so the first wait on each slot returns immediately
            primitives.inFlightFence.emplace(device,
                vk::FenceCreateInfo{}.setFlags(vk::FenceCreateFlagBits::eSignaled));
        } catch (const vk::SystemError& e) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                "FrameSync::init: failed to create primitives for frame %u: %s", i, e.what());
            ok = false;
        }
        return primitives;
    });

    if (!ok) {
        destroy();
        return false;
    }

    slots_ = FrameSlots(frameCount);
    slots_.resizeImages(imageCount);

    SDL_Log("FrameSync: initialized with %u frames in flight, %u swapchain images", frameCount, imageCount);
    return true;
}

void FrameSync::destroy() {
    frames_.clear();
    slots_ = FrameSlots();
    device_ = nullptr;
}

vk::Result FrameSync::waitSlot(uint32_t slot) {
    if (!slots_.needsWait(slot)) {
        return vk::Result::eSuccess;
    }

    vk::Fence fence = **frames_.at(slot).inFlightFence;
    vk::Result result = vk::Result::eSuccess;
    try {
        result = device_->waitForFences(fence, vk::True, UINT64_MAX);
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameSync: fence wait for slot %u failed: %s", slot, e.what());
        return static_cast<vk::Result>(e.code().value());
    }

    if (result == vk::Result::eSuccess) {
        slots_.markCompleted(slot);
    }
    return result;
}

vk::Result FrameSync::waitForCurrentFrame() {
    return waitSlot(slots_.current());
}

vk::Result FrameSync::waitForImage(uint32_t imageIndex) {
    auto owner = slots_.slotOwningImage(imageIndex);
    if (owner && *owner != slots_.current()) {
        vk::Result result = waitSlot(*owner);
        if (result != vk::Result::eSuccess) {
            return result;
        }
    }
    slots_.claimImage(imageIndex);
    return vk::Result::eSuccess;
}

void FrameSync::resetCurrentFence() {
    device_->resetFences(currentFence());
}

void FrameSync::markSubmitted() {
    slots_.markSubmitted();
}

void FrameSync::advance() {
    slots_.advance();
    frames_.advance();
}

void FrameSync::resizeImages(uint32_t imageCount) {
    slots_.resizeImages(imageCount);
}

void FrameSync::markIdle() {
    slots_.markIdle();
}
