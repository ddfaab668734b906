#include "SpriteScene.h"
#include "IRenderBackend.h"
#include "RenderQueue.h"
#include <cmath>

namespace {
constexpr float SPACING = 32.0f;
constexpr float SPIN_SPEED = 0.5f;  // Radians per second
}

SpriteScene::SpriteScene(const SceneConfig& config)
    : bundle_(config.sprites, {}) {}

std::vector<glm::vec2> SpriteScene::layoutRow(const std::vector<glm::vec2>& sizes, float spacing) {
    std::vector<glm::vec2> positions;
    if (sizes.empty()) return positions;

    float total = spacing * static_cast<float>(sizes.size() - 1);
    for (const auto& size : sizes) {
        total += size.x;
    }

    float x = -total * 0.5f;
    for (const auto& size : sizes) {
        positions.emplace_back(x + size.x * 0.5f, 0.0f);
        x += size.x + spacing;
    }
    return positions;
}

void SpriteScene::update(const SceneContext& context, RenderQueue& queue) {
    bundle_.request(queue);
    time_ += context.deltaTime;

    const auto& sprites = bundle_.sprites();
    if (sprites.empty()) return;

    if (!bundle_.isReady(context.backend)) {
        // Loading: the logo alone, as soon as it is resident
        Transform2D logo;
        logo.alpha = 0.5f + 0.5f * std::sin(time_ * 4.0f);
        queue.drawSprite(AssetId(sprites.front().first), logo.toMatrix(), logo.alpha);
        return;
    }

    std::vector<glm::vec2> sizes;
    sizes.reserve(sprites.size());
    for (const auto& [id, path] : sprites) {
        sizes.push_back(context.backend.spriteSize(AssetId(id)).value_or(glm::vec2(0.0f)));
    }

    auto positions = layoutRow(sizes, SPACING);
    for (size_t i = 0; i < sprites.size(); ++i) {
        Transform2D transform;
        transform.position = positions[i];
        transform.rotation = time_ * SPIN_SPEED * (i % 2 == 0 ? 1.0f : -1.0f);
        transform.alpha = 0.75f + 0.25f * std::cos(time_ + static_cast<float>(i));
        queue.drawSprite(AssetId(sprites[i].first), transform.toMatrix(), transform.alpha);
    }
}
