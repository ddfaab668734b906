#pragma once

#include "FrameBuffered.h"
#include "GrowOnlyBuffer.h"
#include "MemoryTypes.h"
#include "VmaResources.h"
#include <vulkan/vulkan.hpp>
#include <string>

class MemoryAllocator;

/**
 * InstanceBuffer - Device-local per-instance vertex data, grow-only
 *
 * Each frame slot owns a persistently mapped staging buffer. upload() writes
 * the frame's records there and records a copy into the device buffer,
 * bracketed by vertex-input <-> transfer barriers.
 *
 * The device buffer lives in a GrowOnlyBuffer: growth allocates the
 * replacement first and parks the old buffer on the slot that last read it
 * until releaseRetired() runs after that slot's fence wait.
 */
class InstanceBuffer {
public:
    InstanceBuffer(std::string name, vk::DeviceSize stride);

    InstanceBuffer(const InstanceBuffer&) = delete;
    InstanceBuffer& operator=(const InstanceBuffer&) = delete;

    bool init(const MemoryAllocator& memory, uint32_t frameCount);
    void destroy();

    // Call after the slot's fence wait
    void releaseRetired(uint32_t slot);

    // Stages count records for this slot and records the copy into cmd
    AllocationResult upload(vk::CommandBuffer cmd, uint32_t slot, const void* records, uint32_t count);

    vk::Buffer buffer() const { return device_.current() ? device_.current()->handle() : vk::Buffer{}; }

private:
    struct SlotStaging {
        VmaBuffer staging;
        uint32_t capacity = 0;
    };

    AllocationResult reserve(uint32_t count);
    AllocationResult ensureStaging(SlotStaging& slot, uint32_t count);

    std::string name_;
    vk::DeviceSize stride_;
    const MemoryAllocator* memory_ = nullptr;

    GrowOnlyBuffer<VmaBuffer> device_;
    FrameBuffered<SlotStaging> slots_;
};
