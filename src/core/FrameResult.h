#pragma once

#include <cstdint>

// Outcome of one FrameRenderer::render call
enum class FrameResult : uint8_t {
    Success,
    Skipped,             // Nothing submitted (zero-size drawable, no swapchain)
    SwapchainOutOfDate,  // Acquire said OUT_OF_DATE; recreate before the next frame
    SurfaceLost,
    DeviceLost,
    AcquireFailed,
    SubmitFailed,
    AllocationFailed     // Instance buffer growth failed
};

inline const char* toString(FrameResult result) {
    switch (result) {
        case FrameResult::Success: return "Success";
        case FrameResult::Skipped: return "Skipped";
        case FrameResult::SwapchainOutOfDate: return "SwapchainOutOfDate";
        case FrameResult::SurfaceLost: return "SurfaceLost";
        case FrameResult::DeviceLost: return "DeviceLost";
        case FrameResult::AcquireFailed: return "AcquireFailed";
        case FrameResult::SubmitFailed: return "SubmitFailed";
        case FrameResult::AllocationFailed: return "AllocationFailed";
    }
    return "Unknown";
}

// Results after which the renderer cannot continue
inline bool isFatal(FrameResult result) {
    return result == FrameResult::DeviceLost ||
           result == FrameResult::SurfaceLost ||
           result == FrameResult::SubmitFailed ||
           result == FrameResult::AllocationFailed;
}
