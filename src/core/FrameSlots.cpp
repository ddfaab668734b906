#include "FrameSlots.h"
#include <SDL3/SDL_log.h>

FrameSlots::FrameSlots(uint32_t slotCount) {
    if (slotCount == 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "FrameSlots: slot count 0 requested, using 1");
        slotCount = 1;
    }
    slots_.resize(slotCount, [](uint32_t) { return SlotState{}; });
}

bool FrameSlots::needsWait(uint32_t slot) const {
    if (slot >= slots_.frameCount()) {
        return false;
    }
    return slots_.at(slot).inFlight;
}

void FrameSlots::markSubmitted() {
    slots_.current().inFlight = true;
}

void FrameSlots::markCompleted(uint32_t slot) {
    if (slot < slots_.frameCount()) {
        slots_.at(slot).inFlight = false;
    }
}

void FrameSlots::advance() {
    slots_.advance();
}

uint32_t FrameSlots::inFlightCount() const {
    uint32_t count = 0;
    slots_.forEach([&count](uint32_t, const SlotState& state) {
        if (state.inFlight) {
            ++count;
        }
    });
    return count;
}

void FrameSlots::resizeImages(uint32_t imageCount) {
    imageOwners_.assign(imageCount, std::nullopt);
}

std::optional<uint32_t> FrameSlots::slotOwningImage(uint32_t imageIndex) const {
    if (imageIndex >= imageOwners_.size()) {
        return std::nullopt;
    }
    return imageOwners_[imageIndex];
}

void FrameSlots::claimImage(uint32_t imageIndex) {
    if (imageIndex >= imageOwners_.size()) {
        imageOwners_.resize(imageIndex + 1);
    }
    imageOwners_[imageIndex] = current();
}

void FrameSlots::markIdle() {
    slots_.forEach([](uint32_t, SlotState& state) { state.inFlight = false; });
}
