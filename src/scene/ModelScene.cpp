#include "ModelScene.h"
#include "IRenderBackend.h"
#include "RenderQueue.h"
#include "Transform2D.h"
#include <glm/gtc/matrix_transform.hpp>

namespace {
constexpr float MODEL_SPACING = 2.0f;
constexpr float TURN_SPEED = 0.6f;  // Radians per second
constexpr float OVERLAY_MARGIN = 16.0f;
}

ModelScene::ModelScene(const SceneConfig& config)
    : bundle_(config.sprites, config.models) {}

glm::mat4 ModelScene::viewProjection(float aspect) {
    glm::mat4 projection = glm::perspective(glm::radians(45.0f), aspect, 0.1f, 100.0f);
    projection[1][1] *= -1.0f;
    glm::mat4 view = glm::lookAt(glm::vec3(0.0f, 1.5f, 5.0f), glm::vec3(0.0f, 0.5f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f));
    return projection * view;
}

void ModelScene::update(const SceneContext& context, RenderQueue& queue) {
    bundle_.request(queue);
    time_ += context.deltaTime;

    const float aspect = context.windowSize.y > 0.0f ? context.windowSize.x / context.windowSize.y : 1.0f;
    queue.viewProjection = viewProjection(aspect);

    const auto& models = bundle_.models();
    const float firstX = -0.5f * MODEL_SPACING * static_cast<float>(models.empty() ? 0 : models.size() - 1);
    for (size_t i = 0; i < models.size(); ++i) {
        glm::mat4 transform = glm::translate(glm::mat4(1.0f),
            glm::vec3(firstX + MODEL_SPACING * static_cast<float>(i), 0.0f, 0.0f));
        transform = glm::rotate(transform, time_ * TURN_SPEED, glm::vec3(0.0f, 1.0f, 0.0f));
        queue.drawModel(AssetId(models[i].first), transform);
    }

    // Overlay, anchored to the top-left corner by each sprite's own size
    glm::vec2 cursor(-context.windowSize.x * 0.5f + OVERLAY_MARGIN, context.windowSize.y * 0.5f - OVERLAY_MARGIN);
    for (const auto& [id, path] : bundle_.sprites()) {
        auto size = context.backend.spriteSize(AssetId(id));
        if (!size) continue;

        Transform2D transform;
        transform.scale = glm::vec2(0.5f);
        transform.position = cursor + glm::vec2(size->x, -size->y) * 0.25f;
        queue.drawSprite(AssetId(id), transform.toMatrix(), 0.9f);
        cursor.x += size->x * 0.5f + OVERLAY_MARGIN;
    }
}
