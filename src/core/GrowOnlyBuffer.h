#pragma once

#include "FrameBuffered.h"
#include "InstanceCapacity.h"
#include "MemoryTypes.h"
#include <algorithm>
#include <optional>
#include <vector>

/**
 * GrowOnlyBuffer<Buffer> - The live buffer of a grow-only resource plus
 * per-slot retire lists
 *
 * reserve() allocates the replacement before anything is released; when the
 * allocation fails the live buffer and its capacity are left as they were.
 * A replaced buffer is parked on the slot that last recorded a read of it
 * and destroyed by release(slot), which the caller makes after that slot's
 * fence wait. A replaced buffer that no slot has read is destroyed at once.
 *
 * Buffer is any movable owner (VmaBuffer in InstanceBuffer).
 */
template<typename Buffer>
class GrowOnlyBuffer {
public:
    void init(uint32_t slotCount) {
        current_.reset();
        capacity_ = 0;
        lastUsedSlot_.reset();
        retired_.resize(slotCount, [](uint32_t) { return std::vector<Buffer>{}; });
    }

    void clear() {
        retired_.clear();
        current_.reset();
        capacity_ = 0;
        lastUsedSlot_.reset();
    }

    // allocate(capacity, Buffer& out) -> AllocationResult
    template<typename Allocate>
    AllocationResult reserve(uint32_t required, Allocate&& allocate) {
        uint32_t newCapacity = nextInstanceCapacity(capacity_, std::max(required, 1u));
        if (current_ && newCapacity == capacity_) {
            return AllocationResult::Success;
        }

        Buffer replacement;
        AllocationResult result = allocate(newCapacity, replacement);
        if (result != AllocationResult::Success) {
            return result;
        }

        if (current_ && lastUsedSlot_ && !retired_.empty()) {
            retired_.at(*lastUsedSlot_).push_back(std::move(*current_));
        }
        current_ = std::move(replacement);
        capacity_ = newCapacity;
        lastUsedSlot_.reset();
        return AllocationResult::Success;
    }

    // The slot's command buffer now reads the live buffer
    void markUsed(uint32_t slot) { lastUsedSlot_ = slot; }

    // Returns how many retired buffers were destroyed
    size_t release(uint32_t slot) {
        if (retired_.empty()) {
            return 0;
        }
        auto& retired = retired_.at(slot);
        size_t released = retired.size();
        retired.clear();
        return released;
    }

    Buffer* current() { return current_ ? &*current_ : nullptr; }
    const Buffer* current() const { return current_ ? &*current_ : nullptr; }
    uint32_t capacity() const { return capacity_; }
    size_t retiredCount(uint32_t slot) const { return retired_.empty() ? 0 : retired_.at(slot).size(); }

private:
    std::optional<Buffer> current_;
    uint32_t capacity_ = 0;
    std::optional<uint32_t> lastUsedSlot_;
    FrameBuffered<std::vector<Buffer>> retired_;
};
