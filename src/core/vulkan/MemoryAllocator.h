#pragma once

#include "MemoryTypes.h"
#include "VmaResources.h"
#include <vulkan/vulkan.hpp>
#include <vk_mem_alloc.h>
#include <optional>

/**
 * MemoryAllocator - Creates buffers and images under a MemoryPolicy
 *
 * Memory type selection is done here with MemoryTypes::findMemoryType; VMA
 * only sub-allocates from the single type that was chosen. Every failure is
 * reported as an AllocationResult and leaves nothing half-created behind.
 *
 * GPU-only buffers that are created with data go through a CPU-to-GPU
 * staging buffer and a one-time command on the upload queue.
 */
class MemoryAllocator {
public:
    MemoryAllocator() = default;

    MemoryAllocator(const MemoryAllocator&) = delete;
    MemoryAllocator& operator=(const MemoryAllocator&) = delete;

    void init(VmaAllocator allocator, vk::Device device, vk::PhysicalDevice physicalDevice,
              vk::CommandPool uploadPool, vk::Queue uploadQueue);
    void reset();

    bool isReady() const { return allocator_ != VK_NULL_HANDLE; }

    std::optional<uint32_t> findMemoryType(uint32_t typeBits, MemoryPolicy policy) const;

    AllocationResult createBuffer(VkDeviceSize size, vk::BufferUsageFlags usage,
                                  MemoryPolicy policy, VmaBuffer& out) const;

    AllocationResult createImage(const vk::ImageCreateInfo& imageInfo,
                                 MemoryPolicy policy, VmaImage& out) const;

    /**
     * Buffer of max(count, 1) * stride bytes. When data is non-null its first
     * count * stride bytes are copied in: through a ScopedMapping for
     * host-visible policies, through staging for GpuOnly.
     */
    AllocationResult createBufferWithData(const void* data, size_t count, size_t stride,
                                          vk::BufferUsageFlags usage, MemoryPolicy policy,
                                          VmaBuffer& out) const;

    // Host-visible buffer left mapped until it is destroyed
    AllocationResult createPersistentBuffer(VkDeviceSize size, vk::BufferUsageFlags usage,
                                            MemoryPolicy policy, VmaBuffer& out) const;

    vk::Device device() const { return device_; }
    vk::CommandPool uploadPool() const { return uploadPool_; }
    vk::Queue uploadQueue() const { return uploadQueue_; }

private:
    VmaAllocator allocator_ = VK_NULL_HANDLE;
    vk::Device device_;
    vk::CommandPool uploadPool_;
    vk::Queue uploadQueue_;
    VkPhysicalDeviceMemoryProperties memoryProperties_{};
};
