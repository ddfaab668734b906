#pragma once

#include <cstdint>
#include <functional>
#include <vector>

/**
 * FrameBuffered<T> - A ring of T, one element per frame slot
 *
 * FrameSlots, FrameSync and InstanceBuffer each keep their per-slot state in
 * one of these. The cursor moves with advance() once per submitted frame;
 * at() wraps, so a slot index taken from FrameSlots is always valid.
 *
 *   auto staging = FrameBuffered<VmaBuffer>::create(2, [&](uint32_t slot) { return makeStaging(slot); });
 *   write(staging.current());
 *   staging.advance();
 */
template<typename T>
class FrameBuffered {
public:
    using Generator = std::function<T(uint32_t)>;

    FrameBuffered() = default;
    explicit FrameBuffered(uint32_t frameCount) : ring_(frameCount) {}

    static FrameBuffered create(uint32_t frameCount, const Generator& generator) {
        FrameBuffered ring;
        ring.resize(frameCount, generator);
        return ring;
    }

    // Rebuilds every element and rewinds the cursor
    void resize(uint32_t frameCount, const Generator& generator) {
        std::vector<T> rebuilt;
        rebuilt.reserve(frameCount);
        for (uint32_t slot = 0; slot < frameCount; ++slot) {
            rebuilt.push_back(generator(slot));
        }
        ring_ = std::move(rebuilt);
        cursor_ = 0;
    }

    void clear() {
        ring_.clear();
        cursor_ = 0;
    }

    void advance() {
        if (!ring_.empty()) cursor_ = (cursor_ + 1) % frameCount();
    }

    uint32_t frameCount() const { return static_cast<uint32_t>(ring_.size()); }
    uint32_t currentIndex() const { return cursor_; }
    bool empty() const { return ring_.empty(); }

    T& current() { return ring_[cursor_]; }
    const T& current() const { return ring_[cursor_]; }

    T& at(uint32_t slot) { return ring_[slot % frameCount()]; }
    const T& at(uint32_t slot) const { return ring_[slot % frameCount()]; }

    // func(slotIndex, element)
    template<typename Func>
    void forEach(Func&& func) {
        for (uint32_t slot = 0; slot < frameCount(); ++slot) func(slot, ring_[slot]);
    }

    template<typename Func>
    void forEach(Func&& func) const {
        for (uint32_t slot = 0; slot < frameCount(); ++slot) func(slot, ring_[slot]);
    }

    typename std::vector<T>::iterator begin() { return ring_.begin(); }
    typename std::vector<T>::iterator end() { return ring_.end(); }
    typename std::vector<T>::const_iterator begin() const { return ring_.begin(); }
    typename std::vector<T>::const_iterator end() const { return ring_.end(); }

private:
    std::vector<T> ring_;
    uint32_t cursor_ = 0;
};
