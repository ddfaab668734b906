#pragma once

// ============================================================================
// VmaResources.h - RAII owners for VMA-allocated buffers and images
// ============================================================================
// Each object owns exactly one (handle, allocation) pair. The deleter unmaps
// a still-mapped allocation before freeing handle and memory together.

#include "MemoryTypes.h"
#include <vulkan/vulkan.hpp>
#include <vk_mem_alloc.h>
#include <SDL3/SDL_log.h>
#include <cstring>
#include <memory>

// ============================================================================
// VmaBufferDeleter - Deleter for VMA-allocated buffers
// ============================================================================

struct VmaBufferDeleter {
    VmaAllocator allocator = VK_NULL_HANDLE;
    VmaAllocation allocation = VK_NULL_HANDLE;
    VkDeviceSize size = 0;
    bool hostVisible = false;
    mutable void* mappedData = nullptr;

    using pointer = VkBuffer;

    void operator()(VkBuffer buffer) const noexcept {
        if (buffer != VK_NULL_HANDLE && allocator != VK_NULL_HANDLE) {
            if (mappedData != nullptr && allocation != VK_NULL_HANDLE) {
                vmaUnmapMemory(allocator, allocation);
                mappedData = nullptr;
            }
            vmaDestroyBuffer(allocator, buffer, allocation);
        }
    }
};

using UniqueVmaBuffer = std::unique_ptr<std::remove_pointer_t<VkBuffer>, VmaBufferDeleter>;

// ============================================================================
// VmaBuffer - RAII wrapper for VkBuffer + VmaAllocation
// ============================================================================

class VmaBuffer : public UniqueVmaBuffer {
public:
    using UniqueVmaBuffer::UniqueVmaBuffer;

    VmaBuffer() = default;

    VmaBuffer(UniqueVmaBuffer&& other) noexcept
        : UniqueVmaBuffer(std::move(other)) {}

    static VmaBuffer fromRaw(VmaAllocator allocator, VkBuffer buffer, VmaAllocation allocation,
                             VkDeviceSize size, bool hostVisible) {
        return VmaBuffer(UniqueVmaBuffer(buffer, VmaBufferDeleter{allocator, allocation, size, hostVisible, nullptr}));
    }

    VkDeviceSize size() const { return get_deleter().size; }
    bool isMapped() const { return get_deleter().mappedData != nullptr; }

    vk::Buffer handle() const { return vk::Buffer(get()); }

    // Maps the allocation. GPU-only buffers are never mapped.
    void* map() {
        auto& deleter = get_deleter();
        if (!get() || deleter.allocation == VK_NULL_HANDLE) {
            return nullptr;
        }
        if (!deleter.hostVisible) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                "VmaBuffer: refusing to map a GPU-only buffer");
            return nullptr;
        }
        if (deleter.mappedData) {
            return deleter.mappedData;
        }
        void* data = nullptr;
        if (vmaMapMemory(deleter.allocator, deleter.allocation, &data) != VK_SUCCESS) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VmaBuffer: vmaMapMemory failed");
            return nullptr;
        }
        deleter.mappedData = data;
        return data;
    }

    void unmap() {
        auto& deleter = get_deleter();
        if (deleter.mappedData == nullptr || deleter.allocation == VK_NULL_HANDLE) {
            return;
        }
        vmaUnmapMemory(deleter.allocator, deleter.allocation);
        deleter.mappedData = nullptr;
    }

    // Pointer of a buffer left mapped for its whole lifetime (null otherwise)
    void* mappedData() const { return get_deleter().mappedData; }
};

// ============================================================================
// VmaImageDeleter / VmaImage - RAII wrapper for VkImage + VmaAllocation
// ============================================================================

struct VmaImageDeleter {
    VmaAllocator allocator = VK_NULL_HANDLE;
    VmaAllocation allocation = VK_NULL_HANDLE;
    VkDeviceSize size = 0;

    using pointer = VkImage;

    void operator()(VkImage image) const noexcept {
        if (image != VK_NULL_HANDLE && allocator != VK_NULL_HANDLE) {
            vmaDestroyImage(allocator, image, allocation);
        }
    }
};

using UniqueVmaImage = std::unique_ptr<std::remove_pointer_t<VkImage>, VmaImageDeleter>;

class VmaImage : public UniqueVmaImage {
public:
    using UniqueVmaImage::UniqueVmaImage;

    VmaImage() = default;

    VmaImage(UniqueVmaImage&& other) noexcept
        : UniqueVmaImage(std::move(other)) {}

    static VmaImage fromRaw(VmaAllocator allocator, VkImage image, VmaAllocation allocation,
                            VkDeviceSize size) {
        return VmaImage(UniqueVmaImage(image, VmaImageDeleter{allocator, allocation, size}));
    }

    vk::Image handle() const { return vk::Image(get()); }
};

// ============================================================================
// ScopedMapping - mapped view of a host-visible buffer, unmapped on scope exit
// ============================================================================
//
// Usage:
//   ScopedMapping mapping(stagingBuffer);
//   if (!mapping) return false;
//   mapping.write(vertices.data(), vertices.size());
//
// A buffer that was already mapped (persistently) stays mapped afterwards.

class ScopedMapping {
public:
    explicit ScopedMapping(VmaBuffer& buffer)
        : buffer_(&buffer), wasMapped_(buffer.isMapped()) {
        data_ = buffer.map();
    }

    ~ScopedMapping() {
        if (data_ && !wasMapped_) {
            buffer_->unmap();
        }
    }

    ScopedMapping(const ScopedMapping&) = delete;
    ScopedMapping& operator=(const ScopedMapping&) = delete;
    ScopedMapping(ScopedMapping&&) = delete;
    ScopedMapping& operator=(ScopedMapping&&) = delete;

    explicit operator bool() const { return data_ != nullptr; }
    void* data() const { return data_; }

    // Copies count elements starting at byteOffset; false if it would overrun
    template<typename T>
    bool write(const T* src, size_t count, VkDeviceSize byteOffset = 0) {
        const VkDeviceSize bytes = static_cast<VkDeviceSize>(sizeof(T) * count);
        if (!data_ || byteOffset + bytes > buffer_->size()) {
            return false;
        }
        std::memcpy(static_cast<char*>(data_) + byteOffset, src, static_cast<size_t>(bytes));
        return true;
    }

private:
    VmaBuffer* buffer_;
    void* data_ = nullptr;
    bool wasMapped_;
};
