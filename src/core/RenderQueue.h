#pragma once

#include "AssetId.h"
#include <glm/glm.hpp>
#include <string>
#include <vector>

// transform is column-major and maps the sprite's local pixel space to
// window space (origin at the window centre, +Y up, logical pixels)
struct SpriteRenderCommand {
    glm::mat3 transform{1.0f};
    float alpha = 1.0f;
    AssetId asset;
};

struct ModelRenderCommand {
    glm::mat4 transform{1.0f};
    float alpha = 1.0f;
    AssetId asset;
};

struct AssetLoadRequest {
    AssetId id;
    std::string path;
};

/**
 * RenderQueue - Everything a scene hands the renderer for one frame
 *
 * Commands are rebuilt every frame. Load requests are drained by the
 * renderer before the frame's commands are resolved.
 */
struct RenderQueue {
    std::vector<SpriteRenderCommand> sprites;
    std::vector<ModelRenderCommand> models;
    std::vector<AssetLoadRequest> spriteLoads;
    std::vector<AssetLoadRequest> modelLoads;
    glm::mat4 viewProjection{1.0f};

    void drawSprite(const AssetId& asset, const glm::mat3& transform, float alpha = 1.0f) {
        sprites.push_back(SpriteRenderCommand{transform, alpha, asset});
    }

    void drawModel(const AssetId& asset, const glm::mat4& transform, float alpha = 1.0f) {
        models.push_back(ModelRenderCommand{transform, alpha, asset});
    }

    void loadSprite(const AssetId& id, const std::string& path) { spriteLoads.push_back({id, path}); }
    void loadModel(const AssetId& id, const std::string& path) { modelLoads.push_back({id, path}); }

    // Stable sort of both command lists by asset id; draw order within one
    // asset is kept
    void sortByAsset();

    void clearCommands();
    void clear();

    bool empty() const { return sprites.empty() && models.empty(); }
};
