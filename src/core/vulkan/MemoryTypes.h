#pragma once

#include <vulkan/vulkan.h>
#include <cstdint>
#include <optional>

// ============================================================================
// MemoryTypes - Memory policy tags and memory type selection
// ============================================================================
//
// Pure functions over VkPhysicalDeviceMemoryProperties. Nothing here touches
// a device, so the selection rules are unit tested without a GPU.

enum class MemoryPolicy : uint8_t {
    GpuOnly,   // DEVICE_LOCAL, never mapped
    CpuToGpu,  // HOST_VISIBLE | HOST_COHERENT, upload path
    GpuToCpu   // HOST_VISIBLE | HOST_CACHED, readback path
};

enum class AllocationResult : uint8_t {
    Success,
    NoSuitableMemoryType,
    CreateFailed,
    AllocateFailed,
    BindFailed,
    MapFailed
};

namespace MemoryTypes {

// Property flags a memory type must carry to satisfy the policy
VkMemoryPropertyFlags requiredFlags(MemoryPolicy policy);

// True when allocations under this policy may be mapped by the host
bool isHostVisible(MemoryPolicy policy);

/**
 * Returns the lowest memory type index whose bit is set in typeBits and whose
 * property flags contain every bit of required. Indices are scanned in
 * ascending order, so callers get the first valid type, not a ranked "best".
 */
std::optional<uint32_t> findMemoryType(const VkPhysicalDeviceMemoryProperties& properties,
                                       uint32_t typeBits,
                                       VkMemoryPropertyFlags required);

const char* toString(MemoryPolicy policy);
const char* toString(AllocationResult result);

} // namespace MemoryTypes
