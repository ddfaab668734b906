#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>

// Instance buffers start at this many records and only ever grow
constexpr uint32_t MIN_INSTANCE_CAPACITY = 16;

// Values above 2^31 have no uint32_t power of two and come back unchanged
inline uint32_t nextPowerOfTwo(uint32_t value) {
    if (value <= 1) {
        return 1;
    }
    if (value > (1u << 31)) {
        return value;
    }
    uint32_t result = 1;
    while (result < value) {
        result <<= 1;
    }
    return result;
}

/**
 * Capacity after a frame that needs `required` records. Returns `current`
 * when it already fits; otherwise max(MIN_INSTANCE_CAPACITY, nextPowerOfTwo(required)).
 */
inline uint32_t nextInstanceCapacity(uint32_t current, uint32_t required) {
    if (required <= current) {
        return current;
    }
    return std::max(MIN_INSTANCE_CAPACITY, nextPowerOfTwo(required));
}
