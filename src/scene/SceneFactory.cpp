#include "IScene.h"
#include "SpriteScene.h"
#include "BenchmarkScene.h"
#include "ModelScene.h"
#include <SDL3/SDL_log.h>

std::unique_ptr<IScene> createScene(const SceneConfig& config) {
    if (config.name == "sprites") {
        return std::make_unique<SpriteScene>(config);
    }
    if (config.name == "benchmark") {
        return std::make_unique<BenchmarkScene>(config);
    }
    if (config.name == "model") {
        return std::make_unique<ModelScene>(config);
    }
    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "createScene: unknown scene '%s'", config.name.c_str());
    return nullptr;
}
