#pragma once

#include "IRenderBackend.h"
#include "FrameRenderer.h"
#include "SpriteAssetManager.h"
#include "ModelAssetManager.h"
#include "VulkanContext.h"
#include <memory>

enum class BackendState : uint8_t {
    NoWindow,
    Initializing,
    Ready
};

inline const char* toString(BackendState state) {
    switch (state) {
        case BackendState::NoWindow: return "NoWindow";
        case BackendState::Initializing: return "Initializing";
        case BackendState::Ready: return "Ready";
    }
    return "Unknown";
}

/**
 * GpuResourceManager - Vulkan render backend
 *
 * Owns the device context and everything that depends on it. Device-ready
 * order: context -> asset managers (replaying decoded assets) -> passes.
 * Device-lost runs the reverse after waiting for the device to go idle.
 *
 * Swapchain recreation is deferred to the start of update() and skipped
 * while the drawable has zero area.
 */
class GpuResourceManager : public IRenderBackend {
public:
    explicit GpuResourceManager(const EngineConfig& config);
    ~GpuResourceManager() override;

    GpuResourceManager(const GpuResourceManager&) = delete;
    GpuResourceManager& operator=(const GpuResourceManager&) = delete;

    bool onWindowReady(SDL_Window* window) override;
    void onWindowLost() override;
    void onWindowResized(uint32_t width, uint32_t height, float scaleFactor) override;
    FrameResult update(RenderQueue& queue) override;

    bool isReady() const override { return state_ == BackendState::Ready; }
    BackendState state() const { return state_; }

    bool loadSprite(const AssetId& id, const std::string& path) override;
    bool loadModel(const AssetId& id, const std::string& path) override;
    AssetState spriteState(const AssetId& id) const override { return sprites_.state(id); }
    AssetState modelState(const AssetId& id) const override { return models_.state(id); }
    bool isSpriteReady(const AssetId& id) const override { return sprites_.isReady(id); }
    std::optional<glm::vec2> spriteSize(const AssetId& id) const override { return sprites_.size(id); }

    const FrameStats& lastStats() const { return renderer_.lastStats(); }

private:
    void serviceLoads(RenderQueue& queue);
    FrameResult recreateSwapchain();
    void teardown();

    EngineConfig config_;
    BackendState state_ = BackendState::NoWindow;
    SDL_Window* window_ = nullptr;

    // Destroyed bottom-up: renderer, then assets, then the context
    std::unique_ptr<VulkanContext> context_;
    SpriteAssetManager sprites_;
    ModelAssetManager models_;
    FrameRenderer renderer_;

    bool resizePending_ = false;
    uint32_t width_ = 0;
    uint32_t height_ = 0;
    float scaleFactor_ = 1.0f;
};
