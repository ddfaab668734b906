#pragma once

#include "AssetCache.h"
#include "AssetId.h"
#include "EngineConfig.h"
#include "FrameResult.h"
#include "RenderQueue.h"
#include <SDL3/SDL.h>
#include <glm/glm.hpp>
#include <memory>
#include <optional>
#include <string>

/**
 * Interface between the window shell and a rendering backend.
 *
 * The shell forwards window lifecycle events and calls update() once per
 * loop iteration. Asset loads may be issued in any state: decoded sources
 * are kept and uploaded once a device exists.
 */
class IRenderBackend {
public:
    virtual ~IRenderBackend() = default;

    // Creates every device-bound object; false means the backend is unusable
    virtual bool onWindowReady(SDL_Window* window) = 0;
    virtual void onWindowLost() = 0;

    // Physical pixels; applied at the next frame boundary
    virtual void onWindowResized(uint32_t width, uint32_t height, float scaleFactor) = 0;

    // Services the queue's load requests, then renders its commands
    virtual FrameResult update(RenderQueue& queue) = 0;

    virtual bool isReady() const = 0;

    virtual bool loadSprite(const AssetId& id, const std::string& path) = 0;
    virtual bool loadModel(const AssetId& id, const std::string& path) = 0;
    virtual AssetState spriteState(const AssetId& id) const = 0;
    virtual AssetState modelState(const AssetId& id) const = 0;
    virtual bool isSpriteReady(const AssetId& id) const = 0;
    virtual std::optional<glm::vec2> spriteSize(const AssetId& id) const = 0;
};

enum class BackendType {
    Vulkan
};

std::unique_ptr<IRenderBackend> createRenderBackend(BackendType type, const EngineConfig& config);
