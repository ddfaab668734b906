#pragma once

#include "IScene.h"
#include "AssetBundle.h"
#include "Transform2D.h"
#include <random>
#include <vector>

struct BenchmarkSprite {
    Transform2D transform;
    glm::vec2 velocity{0.0f};  // Logical pixels per second
};

/**
 * BenchmarkScene - Thousands of one sprite bouncing around the window
 *
 * Sprites are spawned from the scene's own std::mt19937, seeded from the
 * config, so a given seed always produces the same run.
 */
class BenchmarkScene : public IScene {
public:
    static constexpr float MAX_SPEED = 2000.0f;
    static constexpr float BOUNCE_HALF_SIZE = 32.0f;

    explicit BenchmarkScene(const SceneConfig& config);

    const char* name() const override { return "benchmark"; }
    void update(const SceneContext& context, RenderQueue& queue) override;

    const std::vector<BenchmarkSprite>& sprites() const { return sprites_; }

    // Uniform position inside bounds (centred), scale 0.5-2, any rotation and opacity
    static BenchmarkSprite spawn(std::mt19937& rng, const glm::vec2& bounds);
    static std::vector<BenchmarkSprite> spawnMany(std::mt19937& rng, uint32_t count, const glm::vec2& bounds);

    // Moves by velocity * dt and reflects the velocity off the window edges
    static void step(BenchmarkSprite& sprite, float deltaTime, const glm::vec2& windowSize);

private:
    AssetBundle bundle_;
    AssetId sprite_;
    uint32_t count_;
    std::mt19937 rng_;
    std::vector<BenchmarkSprite> sprites_;

    float statsTimer_ = 0.0f;
    uint32_t statsFrames_ = 0;
};
