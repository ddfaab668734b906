#include "InstanceBuffer.h"
#include "InstanceCapacity.h"
#include "MemoryAllocator.h"
#include "Barriers.h"
#include <SDL3/SDL_log.h>

InstanceBuffer::InstanceBuffer(std::string name, vk::DeviceSize stride)
    : name_(std::move(name)), stride_(stride) {}

bool InstanceBuffer::init(const MemoryAllocator& memory, uint32_t frameCount) {
    memory_ = &memory;
    device_.init(frameCount);
    slots_.resize(frameCount, [](uint32_t) { return SlotStaging{}; });

    auto result = reserve(MIN_INSTANCE_CAPACITY);
    if (result != AllocationResult::Success) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s: initial allocation failed: %s",
            name_.c_str(), MemoryTypes::toString(result));
        return false;
    }
    return true;
}

void InstanceBuffer::destroy() {
    slots_.clear();
    device_.clear();
    memory_ = nullptr;
}

void InstanceBuffer::releaseRetired(uint32_t slot) {
    size_t released = device_.release(slot);
    if (released > 0) {
        SDL_LogVerbose(SDL_LOG_CATEGORY_APPLICATION, "%s: released %zu retired buffers (slot %u)",
            name_.c_str(), released, slot);
    }
}

AllocationResult InstanceBuffer::reserve(uint32_t count) {
    const uint32_t before = device_.capacity();
    auto result = device_.reserve(count, [this](uint32_t capacity, VmaBuffer& out) {
        return memory_->createBuffer(stride_ * capacity,
                                     vk::BufferUsageFlagBits::eVertexBuffer | vk::BufferUsageFlagBits::eTransferDst,
                                     MemoryPolicy::GpuOnly, out);
    });
    if (result == AllocationResult::Success && device_.capacity() != before) {
        SDL_Log("%s: capacity %u -> %u records", name_.c_str(), before, device_.capacity());
    }
    return result;
}

AllocationResult InstanceBuffer::ensureStaging(SlotStaging& slot, uint32_t count) {
    if (slot.staging && slot.capacity >= count) {
        return AllocationResult::Success;
    }

    // The slot's previous submission has been waited, its staging is idle
    uint32_t newCapacity = std::max(device_.capacity(), count);
    VmaBuffer staging;
    auto result = memory_->createPersistentBuffer(stride_ * newCapacity, vk::BufferUsageFlagBits::eTransferSrc,
                                                  MemoryPolicy::CpuToGpu, staging);
    if (result != AllocationResult::Success) {
        return result;
    }
    slot.staging = std::move(staging);
    slot.capacity = newCapacity;
    return AllocationResult::Success;
}

AllocationResult InstanceBuffer::upload(vk::CommandBuffer cmd, uint32_t slot, const void* records, uint32_t count) {
    if (count == 0) {
        return AllocationResult::Success;
    }

    auto result = reserve(count);
    if (result != AllocationResult::Success) {
        return result;
    }

    auto& slotStaging = slots_.at(slot);
    result = ensureStaging(slotStaging, count);
    if (result != AllocationResult::Success) {
        return result;
    }

    const size_t bytes = static_cast<size_t>(stride_) * count;
    {
        ScopedMapping mapping(slotStaging.staging);
        if (!mapping || !mapping.write(static_cast<const char*>(records), bytes)) {
            return AllocationResult::MapFailed;
        }
    }

    Barriers::vertexInputToTransfer(cmd);
    cmd.copyBuffer(slotStaging.staging.handle(), buffer(),
                   vk::BufferCopy{}.setSize(static_cast<vk::DeviceSize>(bytes)));
    Barriers::transferToVertexInput(cmd);

    device_.markUsed(slot);
    return AllocationResult::Success;
}
