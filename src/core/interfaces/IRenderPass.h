#pragma once

// ============================================================================
// IRenderPass.h - Lifecycle and recording contract shared by every pass
// ============================================================================
//
// A pass owns one render pass, one pipeline and one pipeline layout (set 0
// frame-global, set 1 per-asset material). Device-bound objects exist
// between onDeviceReady and onDeviceLost. onResized rebuilds size-dependent
// attachments, framebuffers and uniforms, never pipelines.

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <cstdint>
#include <vector>

class MemoryAllocator;

struct PassContext {
    const vk::raii::Device* device = nullptr;
    const MemoryAllocator* memory = nullptr;
    vk::Format swapchainFormat = vk::Format::eUndefined;
    vk::Extent2D extent{0, 0};
    const std::vector<vk::ImageView>* swapchainViews = nullptr;
    float scaleFactor = 1.0f;
    uint32_t frameCount = 0;
};

struct FrameInfo {
    uint32_t slot = 0;        // Frame-in-flight slot
    uint32_t imageIndex = 0;  // Acquired swapchain image
};

class IRenderPass {
public:
    virtual ~IRenderPass() = default;

    virtual const char* name() const = 0;

    virtual bool onDeviceReady(const PassContext& context) = 0;
    virtual void onDeviceLost() = 0;
    virtual bool onResized(const PassContext& context) = 0;

    // Records the whole pass; cmd is in the recording state
    virtual void record(vk::CommandBuffer cmd, const FrameInfo& frame) = 0;
};
