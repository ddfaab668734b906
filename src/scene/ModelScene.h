#pragma once

#include "IScene.h"
#include "AssetBundle.h"
#include <glm/glm.hpp>

/**
 * ModelScene - Configured glTF models turning in front of a fixed camera
 *
 * Configured sprites are drawn as a 2D overlay in the top-left corner, on
 * top of the post-processed scene.
 */
class ModelScene : public IScene {
public:
    explicit ModelScene(const SceneConfig& config);

    const char* name() const override { return "model"; }
    void update(const SceneContext& context, RenderQueue& queue) override;

    // Perspective projection with the Vulkan clip-space Y flip
    static glm::mat4 viewProjection(float aspect);

private:
    AssetBundle bundle_;
    float time_ = 0.0f;
};
