#include <doctest/doctest.h>
#include "MemoryTypes.h"
#include <initializer_list>

static VkPhysicalDeviceMemoryProperties makeProperties(std::initializer_list<VkMemoryPropertyFlags> types) {
    VkPhysicalDeviceMemoryProperties props{};
    for (VkMemoryPropertyFlags flags : types) {
        props.memoryTypes[props.memoryTypeCount].propertyFlags = flags;
        props.memoryTypes[props.memoryTypeCount].heapIndex = 0;
        ++props.memoryTypeCount;
    }
    props.memoryHeapCount = 1;
    return props;
}

constexpr VkMemoryPropertyFlags DEVICE_LOCAL = VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT;
constexpr VkMemoryPropertyFlags HOST_VISIBLE = VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT;
constexpr VkMemoryPropertyFlags HOST_COHERENT = VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;
constexpr VkMemoryPropertyFlags HOST_CACHED = VK_MEMORY_PROPERTY_HOST_CACHED_BIT;

TEST_SUITE("MemoryTypes") {
    TEST_CASE("policies map to the expected property flags") {
        CHECK(MemoryTypes::requiredFlags(MemoryPolicy::GpuOnly) == DEVICE_LOCAL);
        CHECK(MemoryTypes::requiredFlags(MemoryPolicy::CpuToGpu) == (HOST_VISIBLE | HOST_COHERENT));
        CHECK(MemoryTypes::requiredFlags(MemoryPolicy::GpuToCpu) == (HOST_VISIBLE | HOST_CACHED));
    }

    TEST_CASE("only host policies are mappable") {
        CHECK_FALSE(MemoryTypes::isHostVisible(MemoryPolicy::GpuOnly));
        CHECK(MemoryTypes::isHostVisible(MemoryPolicy::CpuToGpu));
        CHECK(MemoryTypes::isHostVisible(MemoryPolicy::GpuToCpu));
    }

    TEST_CASE("findMemoryType returns the lowest allowed index with every required flag") {
        auto props = makeProperties({
            DEVICE_LOCAL,
            HOST_VISIBLE | HOST_COHERENT,
            DEVICE_LOCAL | HOST_VISIBLE | HOST_COHERENT,
            HOST_VISIBLE | HOST_COHERENT | HOST_CACHED,
        });

        auto upload = MemoryTypes::findMemoryType(props, 0b1111, HOST_VISIBLE | HOST_COHERENT);
        REQUIRE(upload.has_value());
        CHECK(*upload == 1);

        // Type 1 masked out: next candidate is 2
        auto masked = MemoryTypes::findMemoryType(props, 0b1100, HOST_VISIBLE | HOST_COHERENT);
        REQUIRE(masked.has_value());
        CHECK(*masked == 2);

        auto readback = MemoryTypes::findMemoryType(props, 0b1111, HOST_VISIBLE | HOST_CACHED);
        REQUIRE(readback.has_value());
        CHECK(*readback == 3);
    }

    TEST_CASE("findMemoryType takes the first valid type, not the best one") {
        // Index 0 carries extra flags but still satisfies DEVICE_LOCAL
        auto props = makeProperties({DEVICE_LOCAL | HOST_VISIBLE, DEVICE_LOCAL});
        auto index = MemoryTypes::findMemoryType(props, 0b11, DEVICE_LOCAL);
        REQUIRE(index.has_value());
        CHECK(*index == 0);
    }

    TEST_CASE("findMemoryType reports no match") {
        auto props = makeProperties({DEVICE_LOCAL, DEVICE_LOCAL});
        CHECK_FALSE(MemoryTypes::findMemoryType(props, 0b11, HOST_VISIBLE | HOST_COHERENT).has_value());
        CHECK_FALSE(MemoryTypes::findMemoryType(props, 0, DEVICE_LOCAL).has_value());
    }

    TEST_CASE("type bits beyond memoryTypeCount are ignored") {
        auto props = makeProperties({DEVICE_LOCAL});
        CHECK_FALSE(MemoryTypes::findMemoryType(props, 0b10, DEVICE_LOCAL).has_value());
    }
}
