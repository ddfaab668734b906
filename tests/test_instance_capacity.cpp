#include <doctest/doctest.h>
#include "InstanceCapacity.h"
#include <cstdint>

TEST_SUITE("InstanceCapacity") {
    TEST_CASE("nextPowerOfTwo") {
        CHECK(nextPowerOfTwo(0) == 1);
        CHECK(nextPowerOfTwo(1) == 1);
        CHECK(nextPowerOfTwo(2) == 2);
        CHECK(nextPowerOfTwo(3) == 4);
        CHECK(nextPowerOfTwo(1000) == 1024);
        CHECK(nextPowerOfTwo(1024) == 1024);
        CHECK(nextPowerOfTwo(1025) == 2048);
    }

    TEST_CASE("nextPowerOfTwo terminates at the top of the range") {
        CHECK(nextPowerOfTwo(1u << 31) == (1u << 31));
        CHECK(nextPowerOfTwo((1u << 30) + 1) == (1u << 31));
        CHECK(nextPowerOfTwo((1u << 31) + 1) == (1u << 31) + 1);
        CHECK(nextPowerOfTwo(UINT32_MAX) == UINT32_MAX);
        CHECK(nextInstanceCapacity(64, UINT32_MAX) == UINT32_MAX);
    }

    TEST_CASE("first frame starts at the minimum capacity") {
        CHECK(nextInstanceCapacity(0, 1) == MIN_INSTANCE_CAPACITY);
        CHECK(nextInstanceCapacity(0, MIN_INSTANCE_CAPACITY) == MIN_INSTANCE_CAPACITY);
    }

    TEST_CASE("capacity is kept while the frame fits") {
        CHECK(nextInstanceCapacity(64, 0) == 64);
        CHECK(nextInstanceCapacity(64, 10) == 64);
        CHECK(nextInstanceCapacity(64, 64) == 64);
    }

    TEST_CASE("capacity grows to the next power of two") {
        CHECK(nextInstanceCapacity(16, 17) == 32);
        CHECK(nextInstanceCapacity(16, 10000) == 16384);
    }

    TEST_CASE("capacity never shrinks across frames") {
        uint32_t capacity = 0;
        for (uint32_t required : {5u, 300u, 2u, 40u, 0u, 300u}) {
            uint32_t next = nextInstanceCapacity(capacity, required);
            CHECK(next >= capacity);
            CHECK(next >= required);
            capacity = next;
        }
        CHECK(capacity == 512);
    }
}
