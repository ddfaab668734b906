#include "BenchmarkScene.h"
#include "IRenderBackend.h"
#include "RenderQueue.h"
#include <SDL3/SDL_log.h>
#include <glm/gtc/constants.hpp>

BenchmarkScene::BenchmarkScene(const SceneConfig& config)
    : bundle_(config.sprites, {})
    , count_(config.spriteCount)
    , rng_(config.seed) {
    if (!config.sprites.empty()) {
        // The last configured sprite is the one that bounces; earlier ones are loading art
        sprite_ = AssetId(config.sprites.back().first);
    }
}

BenchmarkSprite BenchmarkScene::spawn(std::mt19937& rng, const glm::vec2& bounds) {
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    auto range = [&](float lo, float hi) { return lo + (hi - lo) * unit(rng); };

    BenchmarkSprite sprite;
    sprite.transform.position = glm::vec2(range(-bounds.x * 0.5f, bounds.x * 0.5f),
                                          range(-bounds.y * 0.5f, bounds.y * 0.5f));
    sprite.transform.scale = glm::vec2(range(0.5f, 2.0f));
    sprite.transform.rotation = range(0.0f, glm::two_pi<float>());
    sprite.transform.alpha = unit(rng);
    sprite.velocity = glm::vec2(range(-MAX_SPEED, MAX_SPEED), range(-MAX_SPEED, MAX_SPEED));
    return sprite;
}

std::vector<BenchmarkSprite> BenchmarkScene::spawnMany(std::mt19937& rng, uint32_t count, const glm::vec2& bounds) {
    std::vector<BenchmarkSprite> sprites;
    sprites.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        sprites.push_back(spawn(rng, bounds));
    }
    return sprites;
}

void BenchmarkScene::step(BenchmarkSprite& sprite, float deltaTime, const glm::vec2& windowSize) {
    sprite.transform.position += sprite.velocity * deltaTime;

    // Window-space position with the origin at the bottom-left corner
    const glm::vec2 screen = sprite.transform.position + windowSize * 0.5f;
    if (screen.x < BOUNCE_HALF_SIZE || screen.x > windowSize.x - BOUNCE_HALF_SIZE) {
        sprite.velocity.x = -sprite.velocity.x;
    }
    if (screen.y < BOUNCE_HALF_SIZE || screen.y > windowSize.y - BOUNCE_HALF_SIZE) {
        sprite.velocity.y = -sprite.velocity.y;
    }
}

void BenchmarkScene::update(const SceneContext& context, RenderQueue& queue) {
    bundle_.request(queue);
    if (sprite_.empty()) return;

    if (!bundle_.isReady(context.backend)) {
        const auto& first = bundle_.sprites().front();
        queue.drawSprite(AssetId(first.first), Transform2D{}.toMatrix());
        return;
    }

    if (sprites_.empty() && count_ > 0) {
        sprites_ = spawnMany(rng_, count_, context.windowSize);
        SDL_Log("BenchmarkScene: spawned %u sprites", count_);
    }

    for (auto& sprite : sprites_) {
        step(sprite, context.deltaTime, context.windowSize);
        queue.drawSprite(sprite_, sprite.transform.toMatrix(), sprite.transform.alpha);
    }

    statsTimer_ += context.deltaTime;
    ++statsFrames_;
    if (statsTimer_ >= 1.0f) {
        SDL_Log("BenchmarkScene: %u sprites at %.1f fps", count_, static_cast<float>(statsFrames_) / statsTimer_);
        statsTimer_ = 0.0f;
        statsFrames_ = 0;
    }
}
