#include "GpuResourceManager.h"
#include <SDL3/SDL_log.h>

GpuResourceManager::GpuResourceManager(const EngineConfig& config)
    : config_(config)
    , sprites_(config.renderer.maxSprites) {}

GpuResourceManager::~GpuResourceManager() {
    onWindowLost();
}

bool GpuResourceManager::onWindowReady(SDL_Window* window) {
    if (state_ != BackendState::NoWindow) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "GpuResourceManager: onWindowReady while %s, ignored",
            toString(state_));
        return state_ == BackendState::Ready;
    }

    state_ = BackendState::Initializing;
    window_ = window;

    int pixelWidth = 0;
    int pixelHeight = 0;
    SDL_GetWindowSizeInPixels(window, &pixelWidth, &pixelHeight);
    width_ = static_cast<uint32_t>(pixelWidth);
    height_ = static_cast<uint32_t>(pixelHeight);
    scaleFactor_ = SDL_GetWindowDisplayScale(window);
    if (scaleFactor_ <= 0.0f) {
        scaleFactor_ = 1.0f;
    }

    context_ = std::make_unique<VulkanContext>();
    if (!context_->init(window, config_.renderer, FrameSlots::MAX_FRAMES_IN_FLIGHT)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "GpuResourceManager: Vulkan context creation failed");
        teardown();
        return false;
    }

    if (!sprites_.onDeviceReady(context_->getRaiiDevice(), context_->memory()) ||
        !models_.onDeviceReady(context_->getRaiiDevice(), context_->memory())) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "GpuResourceManager: Asset managers failed to initialize");
        teardown();
        return false;
    }

    if (!renderer_.init(*context_, sprites_, models_, config_.renderer, config_.assets.shaderDir, scaleFactor_)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "GpuResourceManager: Frame renderer failed to initialize");
        teardown();
        return false;
    }

    resizePending_ = false;
    state_ = BackendState::Ready;
    SDL_Log("GpuResourceManager: ready, %zu sprites and %zu models resident",
        sprites_.readyCount(), models_.readyCount());
    return true;
}

void GpuResourceManager::onWindowLost() {
    if (state_ == BackendState::NoWindow) {
        return;
    }
    SDL_Log("GpuResourceManager: window lost, releasing device resources");
    teardown();
}

void GpuResourceManager::teardown() {
    if (context_) {
        context_->waitIdle();
    }
    renderer_.destroy();
    models_.onDeviceLost();
    sprites_.onDeviceLost();
    if (context_) {
        context_->shutdown();
        context_.reset();
    }
    window_ = nullptr;
    resizePending_ = false;
    state_ = BackendState::NoWindow;
}

void GpuResourceManager::onWindowResized(uint32_t width, uint32_t height, float scaleFactor) {
    width_ = width;
    height_ = height;
    if (scaleFactor > 0.0f) {
        scaleFactor_ = scaleFactor;
    }
    resizePending_ = true;
}

bool GpuResourceManager::loadSprite(const AssetId& id, const std::string& path) {
    return sprites_.load(id, path);
}

bool GpuResourceManager::loadModel(const AssetId& id, const std::string& path) {
    return models_.load(id, path);
}

void GpuResourceManager::serviceLoads(RenderQueue& queue) {
    for (const auto& request : queue.spriteLoads) {
        if (!sprites_.load(request.id, request.path)) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "GpuResourceManager: sprite '%s' not loaded",
                request.id.c_str());
        }
    }
    for (const auto& request : queue.modelLoads) {
        if (!models_.load(request.id, request.path)) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "GpuResourceManager: model '%s' not loaded",
                request.id.c_str());
        }
    }
    queue.spriteLoads.clear();
    queue.modelLoads.clear();
}

FrameResult GpuResourceManager::recreateSwapchain() {
    if (width_ == 0 || height_ == 0) {
        return FrameResult::Skipped;
    }

    if (!context_->recreateSwapchain()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "GpuResourceManager: Swapchain recreation failed");
        return FrameResult::SurfaceLost;
    }

    vk::Extent2D extent = context_->getSwapchainExtent();
    if (extent.width == 0 || extent.height == 0) {
        return FrameResult::Skipped;
    }

    if (!renderer_.onSwapchainRecreated(scaleFactor_)) {
        return FrameResult::AllocationFailed;
    }
    resizePending_ = false;
    SDL_Log("GpuResourceManager: swapchain recreated at %ux%u (scale %.2f)",
        extent.width, extent.height, scaleFactor_);
    return FrameResult::Success;
}

FrameResult GpuResourceManager::update(RenderQueue& queue) {
    serviceLoads(queue);

    if (state_ != BackendState::Ready) {
        return FrameResult::Skipped;
    }

    if (resizePending_ || renderer_.swapchainNeedsRecreation()) {
        FrameResult result = recreateSwapchain();
        if (result != FrameResult::Success) {
            return result;
        }
    }

    if (config_.renderer.sortByAsset) {
        queue.sortByAsset();
    }
    return renderer_.render(queue);
}

std::unique_ptr<IRenderBackend> createRenderBackend(BackendType type, const EngineConfig& config) {
    switch (type) {
        case BackendType::Vulkan:
            return std::make_unique<GpuResourceManager>(config);
    }
    return nullptr;
}
