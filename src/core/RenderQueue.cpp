#include "RenderQueue.h"
#include <algorithm>

void RenderQueue::sortByAsset() {
    std::stable_sort(sprites.begin(), sprites.end(),
        [](const SpriteRenderCommand& a, const SpriteRenderCommand& b) { return a.asset < b.asset; });
    std::stable_sort(models.begin(), models.end(),
        [](const ModelRenderCommand& a, const ModelRenderCommand& b) { return a.asset < b.asset; });
}

void RenderQueue::clearCommands() {
    sprites.clear();
    models.clear();
}

void RenderQueue::clear() {
    clearCommands();
    spriteLoads.clear();
    modelLoads.clear();
    viewProjection = glm::mat4(1.0f);
}
