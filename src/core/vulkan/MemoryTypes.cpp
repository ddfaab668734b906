#include "MemoryTypes.h"

namespace MemoryTypes {

VkMemoryPropertyFlags requiredFlags(MemoryPolicy policy) {
    switch (policy) {
        case MemoryPolicy::GpuOnly:
            return VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT;
        case MemoryPolicy::CpuToGpu:
            return VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;
        case MemoryPolicy::GpuToCpu:
            return VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_CACHED_BIT;
    }
    return 0;
}

bool isHostVisible(MemoryPolicy policy) {
    return policy != MemoryPolicy::GpuOnly;
}

std::optional<uint32_t> findMemoryType(const VkPhysicalDeviceMemoryProperties& properties,
                                       uint32_t typeBits,
                                       VkMemoryPropertyFlags required) {
    for (uint32_t i = 0; i < properties.memoryTypeCount && i < VK_MAX_MEMORY_TYPES; ++i) {
        if ((typeBits & (1u << i)) == 0) {
            continue;
        }
        if ((properties.memoryTypes[i].propertyFlags & required) == required) {
            return i;
        }
    }
    return std::nullopt;
}

const char* toString(MemoryPolicy policy) {
    switch (policy) {
        case MemoryPolicy::GpuOnly: return "GpuOnly";
        case MemoryPolicy::CpuToGpu: return "CpuToGpu";
        case MemoryPolicy::GpuToCpu: return "GpuToCpu";
    }
    return "Unknown";
}

const char* toString(AllocationResult result) {
    switch (result) {
        case AllocationResult::Success: return "Success";
        case AllocationResult::NoSuitableMemoryType: return "NoSuitableMemoryType";
        case AllocationResult::CreateFailed: return "CreateFailed";
        case AllocationResult::AllocateFailed: return "AllocateFailed";
        case AllocationResult::BindFailed: return "BindFailed";
        case AllocationResult::MapFailed: return "MapFailed";
    }
    return "Unknown";
}

} // namespace MemoryTypes
