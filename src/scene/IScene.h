#pragma once

#include "EngineConfig.h"
#include <glm/glm.hpp>
#include <memory>

class IRenderBackend;
struct RenderQueue;

struct SceneContext {
    const IRenderBackend& backend;
    glm::vec2 windowSize{0.0f};  // Logical pixels
    float deltaTime = 0.0f;      // Seconds
};

/**
 * A scene fills the render queue once per frame. It never touches GPU
 * objects: load requests and draw commands go through the queue, readiness
 * is read back from the backend.
 */
class IScene {
public:
    virtual ~IScene() = default;

    virtual const char* name() const = 0;
    virtual void update(const SceneContext& context, RenderQueue& queue) = 0;
};

// nullptr for an unknown scene name
std::unique_ptr<IScene> createScene(const SceneConfig& config);
