#pragma once

#include "FrameBuffered.h"
#include <cstdint>
#include <optional>
#include <vector>

/**
 * FrameSlots - In-flight accounting for frame slots and swapchain images
 *
 * Holds no Vulkan objects. FrameSync drives it alongside the real fences so
 * the bound "submitted but not yet waited <= slot count" is checked in one
 * place, and so it can be tested without a device.
 */
class FrameSlots {
public:
    static constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 2;

    explicit FrameSlots(uint32_t slotCount = MAX_FRAMES_IN_FLIGHT);

    uint32_t current() const { return slots_.currentIndex(); }
    uint32_t slotCount() const { return slots_.frameCount(); }

    // Slot was submitted and its fence has not been waited since
    bool needsWait(uint32_t slot) const;

    void markSubmitted();
    void markCompleted(uint32_t slot);
    void advance();

    uint32_t inFlightCount() const;

    // Swapchain image ownership; recreation forgets every owner
    void resizeImages(uint32_t imageCount);
    std::optional<uint32_t> slotOwningImage(uint32_t imageIndex) const;
    void claimImage(uint32_t imageIndex);
    uint32_t imageCount() const { return static_cast<uint32_t>(imageOwners_.size()); }

    // Device idle: nothing is in flight anymore. The cursor stays where it is,
    // FrameSync advances its primitives in step with it
    void markIdle();

private:
    struct SlotState {
        bool inFlight = false;
    };

    FrameBuffered<SlotState> slots_;
    std::vector<std::optional<uint32_t>> imageOwners_;
};
