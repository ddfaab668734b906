// VMA implementation lives in this translation unit only
#define VMA_IMPLEMENTATION
#include <vk_mem_alloc.h>

#include "MemoryAllocator.h"
#include "CommandBufferUtils.h"
#include "Barriers.h"
#include <SDL3/SDL_log.h>
#include <algorithm>

void MemoryAllocator::init(VmaAllocator allocator, vk::Device device, vk::PhysicalDevice physicalDevice,
                           vk::CommandPool uploadPool, vk::Queue uploadQueue) {
    allocator_ = allocator;
    device_ = device;
    uploadPool_ = uploadPool;
    uploadQueue_ = uploadQueue;
    memoryProperties_ = static_cast<VkPhysicalDeviceMemoryProperties>(physicalDevice.getMemoryProperties());
}

void MemoryAllocator::reset() {
    allocator_ = VK_NULL_HANDLE;
    device_ = nullptr;
    uploadPool_ = nullptr;
    uploadQueue_ = nullptr;
    memoryProperties_ = {};
}

std::optional<uint32_t> MemoryAllocator::findMemoryType(uint32_t typeBits, MemoryPolicy policy) const {
    return MemoryTypes::findMemoryType(memoryProperties_, typeBits, MemoryTypes::requiredFlags(policy));
}

AllocationResult MemoryAllocator::createBuffer(VkDeviceSize size, vk::BufferUsageFlags usage,
                                               MemoryPolicy policy, VmaBuffer& out) const {
    auto bufferInfo = vk::BufferCreateInfo{}
        .setSize(size)
        .setUsage(usage)
        .setSharingMode(vk::SharingMode::eExclusive);

    vk::Buffer buffer;
    try {
        buffer = device_.createBuffer(bufferInfo);
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "MemoryAllocator: createBuffer failed: %s", e.what());
        return AllocationResult::CreateFailed;
    }

    auto requirements = device_.getBufferMemoryRequirements(buffer);
    auto typeIndex = findMemoryType(requirements.memoryTypeBits, policy);
    if (!typeIndex) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "MemoryAllocator: no memory type for %s buffer (type bits 0x%x)",
            MemoryTypes::toString(policy), requirements.memoryTypeBits);
        device_.destroyBuffer(buffer);
        return AllocationResult::NoSuitableMemoryType;
    }

    VmaAllocationCreateInfo allocInfo{};
    allocInfo.requiredFlags = MemoryTypes::requiredFlags(policy);
    allocInfo.memoryTypeBits = 1u << *typeIndex;

    VmaAllocation allocation = VK_NULL_HANDLE;
    VkBuffer rawBuffer = static_cast<VkBuffer>(buffer);
    if (vmaAllocateMemoryForBuffer(allocator_, rawBuffer, &allocInfo, &allocation, nullptr) != VK_SUCCESS) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "MemoryAllocator: allocation of %llu bytes failed (type %u)",
            static_cast<unsigned long long>(requirements.size), *typeIndex);
        device_.destroyBuffer(buffer);
        return AllocationResult::AllocateFailed;
    }

    if (vmaBindBufferMemory(allocator_, allocation, rawBuffer) != VK_SUCCESS) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "MemoryAllocator: bind buffer memory failed");
        vmaFreeMemory(allocator_, allocation);
        device_.destroyBuffer(buffer);
        return AllocationResult::BindFailed;
    }

    out = VmaBuffer::fromRaw(allocator_, rawBuffer, allocation, size, MemoryTypes::isHostVisible(policy));
    return AllocationResult::Success;
}

AllocationResult MemoryAllocator::createImage(const vk::ImageCreateInfo& imageInfo,
                                              MemoryPolicy policy, VmaImage& out) const {
    vk::Image image;
    try {
        image = device_.createImage(imageInfo);
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "MemoryAllocator: createImage failed: %s", e.what());
        return AllocationResult::CreateFailed;
    }

    auto requirements = device_.getImageMemoryRequirements(image);
    auto typeIndex = findMemoryType(requirements.memoryTypeBits, policy);
    if (!typeIndex) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "MemoryAllocator: no memory type for %s image (type bits 0x%x)",
            MemoryTypes::toString(policy), requirements.memoryTypeBits);
        device_.destroyImage(image);
        return AllocationResult::NoSuitableMemoryType;
    }

    VmaAllocationCreateInfo allocInfo{};
    allocInfo.requiredFlags = MemoryTypes::requiredFlags(policy);
    allocInfo.memoryTypeBits = 1u << *typeIndex;

    VmaAllocation allocation = VK_NULL_HANDLE;
    VkImage rawImage = static_cast<VkImage>(image);
    if (vmaAllocateMemoryForImage(allocator_, rawImage, &allocInfo, &allocation, nullptr) != VK_SUCCESS) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "MemoryAllocator: image allocation of %llu bytes failed (type %u)",
            static_cast<unsigned long long>(requirements.size), *typeIndex);
        device_.destroyImage(image);
        return AllocationResult::AllocateFailed;
    }

    if (vmaBindImageMemory(allocator_, allocation, rawImage) != VK_SUCCESS) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "MemoryAllocator: bind image memory failed");
        vmaFreeMemory(allocator_, allocation);
        device_.destroyImage(image);
        return AllocationResult::BindFailed;
    }

    out = VmaImage::fromRaw(allocator_, rawImage, allocation, requirements.size);
    return AllocationResult::Success;
}

AllocationResult MemoryAllocator::createBufferWithData(const void* data, size_t count, size_t stride,
                                                       vk::BufferUsageFlags usage, MemoryPolicy policy,
                                                       VmaBuffer& out) const {
    const VkDeviceSize size = static_cast<VkDeviceSize>(std::max<size_t>(count, 1) * stride);
    const VkDeviceSize dataSize = static_cast<VkDeviceSize>(count * stride);

    if (MemoryTypes::isHostVisible(policy)) {
        VmaBuffer buffer;
        auto result = createBuffer(size, usage, policy, buffer);
        if (result != AllocationResult::Success) {
            return result;
        }
        if (data && dataSize > 0) {
            ScopedMapping mapping(buffer);
            if (!mapping || !mapping.write(static_cast<const char*>(data), static_cast<size_t>(dataSize))) {
                return AllocationResult::MapFailed;
            }
        }
        out = std::move(buffer);
        return AllocationResult::Success;
    }

    VmaBuffer buffer;
    auto result = createBuffer(size, usage | vk::BufferUsageFlagBits::eTransferDst, policy, buffer);
    if (result != AllocationResult::Success) {
        return result;
    }

    if (data && dataSize > 0) {
        VmaBuffer staging;
        result = createBufferWithData(data, count, stride, vk::BufferUsageFlagBits::eTransferSrc,
                                      MemoryPolicy::CpuToGpu, staging);
        if (result != AllocationResult::Success) {
            return result;
        }

        CommandScope cmd(device_, uploadPool_, uploadQueue_);
        if (!cmd.begin()) {
            return AllocationResult::CreateFailed;
        }
        cmd.get().copyBuffer(staging.handle(), buffer.handle(),
                             vk::BufferCopy{}.setSize(dataSize));
        Barriers::transferToShaderRead(cmd.get());
        if (!cmd.end()) {
            return AllocationResult::CreateFailed;
        }
    }

    out = std::move(buffer);
    return AllocationResult::Success;
}

AllocationResult MemoryAllocator::createPersistentBuffer(VkDeviceSize size, vk::BufferUsageFlags usage,
                                                         MemoryPolicy policy, VmaBuffer& out) const {
    if (!MemoryTypes::isHostVisible(policy)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "MemoryAllocator: persistent mapping requested for a GpuOnly buffer");
        return AllocationResult::MapFailed;
    }

    VmaBuffer buffer;
    auto result = createBuffer(size, usage, policy, buffer);
    if (result != AllocationResult::Success) {
        return result;
    }
    if (!buffer.map()) {
        return AllocationResult::MapFailed;
    }
    out = std::move(buffer);
    return AllocationResult::Success;
}
