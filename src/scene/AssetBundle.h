#pragma once

#include "AssetId.h"
#include "EngineConfig.h"
#include <string>
#include <utility>
#include <vector>

class IRenderBackend;
struct RenderQueue;

/**
 * AssetBundle - A scene's sprites and models, requested together
 *
 * request() queues every load exactly once. The loads are serviced by the
 * backend's next update(), so readiness can only change after that.
 */
class AssetBundle {
public:
    AssetBundle() = default;
    AssetBundle(AssetList sprites, AssetList models);

    void request(RenderQueue& queue);
    bool isRequested() const { return requested_; }

    // Every sprite and model has its GPU resource
    bool isReady(const IRenderBackend& backend) const;
    size_t readyCount(const IRenderBackend& backend) const;
    size_t size() const { return sprites_.size() + models_.size(); }

    const AssetList& sprites() const { return sprites_; }
    const AssetList& models() const { return models_; }

private:
    AssetList sprites_;
    AssetList models_;
    bool requested_ = false;
};
