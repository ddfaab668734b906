#pragma once

#include "IScene.h"
#include "AssetBundle.h"
#include "Transform2D.h"

/**
 * SpriteScene - Every configured sprite in a row across the window centre
 *
 * Sprites are laid out by their decoded pixel size, each spinning slowly
 * with a pulsing opacity. The first sprite doubles as a loading logo until
 * the whole bundle is resident.
 */
class SpriteScene : public IScene {
public:
    explicit SpriteScene(const SceneConfig& config);

    const char* name() const override { return "sprites"; }
    void update(const SceneContext& context, RenderQueue& queue) override;

    // Left-to-right positions centred on the origin, spacing in pixels
    static std::vector<glm::vec2> layoutRow(const std::vector<glm::vec2>& sizes, float spacing);

private:
    AssetBundle bundle_;
    float time_ = 0.0f;
};
