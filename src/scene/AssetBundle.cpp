#include "AssetBundle.h"
#include "IRenderBackend.h"
#include "RenderQueue.h"

AssetBundle::AssetBundle(AssetList sprites, AssetList models)
    : sprites_(std::move(sprites)), models_(std::move(models)) {}

void AssetBundle::request(RenderQueue& queue) {
    if (requested_) return;
    for (const auto& [id, path] : sprites_) {
        queue.loadSprite(AssetId(id), path);
    }
    for (const auto& [id, path] : models_) {
        queue.loadModel(AssetId(id), path);
    }
    requested_ = true;
}

bool AssetBundle::isReady(const IRenderBackend& backend) const {
    return requested_ && readyCount(backend) == size();
}

size_t AssetBundle::readyCount(const IRenderBackend& backend) const {
    size_t ready = 0;
    for (const auto& [id, path] : sprites_) {
        if (backend.spriteState(AssetId(id)) == AssetState::Ready) ++ready;
    }
    for (const auto& [id, path] : models_) {
        if (backend.modelState(AssetId(id)) == AssetState::Ready) ++ready;
    }
    return ready;
}
