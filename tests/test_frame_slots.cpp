#include <doctest/doctest.h>
#include "FrameBuffered.h"
#include "FrameSlots.h"
#include "FrameRenderer.h"
#include <string>

// Mirrors the order FrameSync drives the slots in: wait, claim, submit, advance
static void simulateFrame(FrameSlots& slots, uint32_t imageIndex) {
    uint32_t slot = slots.current();
    if (slots.needsWait(slot)) {
        slots.markCompleted(slot);
    }
    auto owner = slots.slotOwningImage(imageIndex);
    if (owner && *owner != slot && slots.needsWait(*owner)) {
        slots.markCompleted(*owner);
    }
    slots.claimImage(imageIndex);
    slots.markSubmitted();
    slots.advance();
}

TEST_SUITE("FrameBuffered") {
    TEST_CASE("create fills every slot from the generator") {
        auto buffered = FrameBuffered<std::string>::create(3, [](uint32_t i) {
            return "slot" + std::to_string(i);
        });
        CHECK(buffered.frameCount() == 3);
        CHECK(buffered.current() == "slot0");
        CHECK(buffered.at(2) == "slot2");
    }

    TEST_CASE("advance wraps around") {
        FrameBuffered<int> buffered(2);
        CHECK(buffered.currentIndex() == 0);
        buffered.advance();
        CHECK(buffered.currentIndex() == 1);
        buffered.advance();
        CHECK(buffered.currentIndex() == 0);
    }

    TEST_CASE("at wraps out-of-range indices") {
        auto buffered = FrameBuffered<int>::create(2, [](uint32_t i) { return static_cast<int>(i) * 10; });
        CHECK(buffered.at(3) == 10);
    }

    TEST_CASE("forEach visits every slot with its index") {
        FrameBuffered<int> buffered(3);
        buffered.forEach([](uint32_t i, int& value) { value = static_cast<int>(i) + 1; });
        int sum = 0;
        for (int value : buffered) sum += value;
        CHECK(sum == 6);
    }

    TEST_CASE("clear empties the ring") {
        FrameBuffered<int> buffered(2);
        buffered.clear();
        CHECK(buffered.empty());
        CHECK(buffered.frameCount() == 0);
    }
}

TEST_SUITE("FrameSlots") {
    TEST_CASE("default slot count is two") {
        FrameSlots slots;
        CHECK(slots.slotCount() == FrameSlots::MAX_FRAMES_IN_FLIGHT);
        CHECK(slots.current() == 0);
        CHECK(slots.inFlightCount() == 0);
    }

    TEST_CASE("zero slots is clamped to one") {
        FrameSlots slots(0);
        CHECK(slots.slotCount() == 1);
    }

    TEST_CASE("a submitted slot needs a wait before reuse") {
        FrameSlots slots;
        slots.markSubmitted();
        CHECK(slots.needsWait(0));
        CHECK_FALSE(slots.needsWait(1));
        slots.advance();
        CHECK(slots.current() == 1);

        slots.markCompleted(0);
        CHECK_FALSE(slots.needsWait(0));
    }

    TEST_CASE("frames in flight never exceed the slot count") {
        FrameSlots slots;
        slots.resizeImages(3);
        for (uint32_t frame = 0; frame < 50; ++frame) {
            simulateFrame(slots, frame % 3);
            CHECK(slots.inFlightCount() <= slots.slotCount());
        }
        CHECK(slots.inFlightCount() == 2);
    }

    TEST_CASE("claimed images remember their slot") {
        FrameSlots slots;
        slots.resizeImages(3);
        CHECK_FALSE(slots.slotOwningImage(1).has_value());

        slots.claimImage(1);
        REQUIRE(slots.slotOwningImage(1).has_value());
        CHECK(*slots.slotOwningImage(1) == 0);

        slots.advance();
        slots.claimImage(1);
        CHECK(*slots.slotOwningImage(1) == 1);
    }

    TEST_CASE("resizing images forgets every owner") {
        FrameSlots slots;
        slots.resizeImages(2);
        slots.claimImage(0);
        slots.resizeImages(4);
        CHECK(slots.imageCount() == 4);
        CHECK_FALSE(slots.slotOwningImage(0).has_value());
        CHECK_FALSE(slots.slotOwningImage(7).has_value());
    }

    TEST_CASE("device idle clears in-flight state and keeps the cursor") {
        FrameSlots slots;
        slots.resizeImages(2);
        simulateFrame(slots, 0);
        simulateFrame(slots, 1);
        simulateFrame(slots, 0);
        CHECK(slots.inFlightCount() == 2);
        CHECK(slots.current() == 1);

        slots.markIdle();
        CHECK(slots.inFlightCount() == 0);
        CHECK_FALSE(slots.needsWait(0));
        CHECK_FALSE(slots.needsWait(1));
        CHECK(slots.current() == 1);
        CHECK(slots.imageCount() == 2);
    }
}

TEST_SUITE("FrameResult") {
    TEST_CASE("vulkan results map onto frame results") {
        CHECK(FrameRenderer::toFrameResult(vk::Result::eSuccess) == FrameResult::Success);
        CHECK(FrameRenderer::toFrameResult(vk::Result::eErrorDeviceLost) == FrameResult::DeviceLost);
        CHECK(FrameRenderer::toFrameResult(vk::Result::eErrorSurfaceLostKHR) == FrameResult::SurfaceLost);
        CHECK(FrameRenderer::toFrameResult(vk::Result::eErrorOutOfDateKHR) == FrameResult::SwapchainOutOfDate);
        CHECK(FrameRenderer::toFrameResult(vk::Result::eErrorOutOfDeviceMemory) == FrameResult::SubmitFailed);
    }

    TEST_CASE("failures after acquire always end the renderer") {
        for (vk::Result result : {vk::Result::eErrorDeviceLost, vk::Result::eErrorSurfaceLostKHR,
                                  vk::Result::eErrorOutOfDateKHR, vk::Result::eTimeout,
                                  vk::Result::eErrorOutOfHostMemory}) {
            CHECK(isFatal(FrameRenderer::toFatalFrameResult(result)));
        }
        CHECK(FrameRenderer::toFatalFrameResult(vk::Result::eErrorDeviceLost) == FrameResult::DeviceLost);
    }

    TEST_CASE("skips and out-of-date swapchains are recoverable") {
        CHECK_FALSE(isFatal(FrameResult::Skipped));
        CHECK_FALSE(isFatal(FrameResult::SwapchainOutOfDate));
        CHECK(isFatal(FrameResult::AllocationFailed));
    }
}
