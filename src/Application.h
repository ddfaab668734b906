#pragma once

#include <SDL3/SDL.h>
#include <memory>
#include "EngineConfig.h"
#include "IRenderBackend.h"
#include "IScene.h"
#include "RenderQueue.h"

class Application {
public:
    explicit Application(const EngineConfig& config);
    ~Application() = default;

    bool init();

    // Returns the process exit status
    int run();
    void shutdown();

private:
    void processEvents();
    void notifyResized();
    bool restoreWindow();
    glm::vec2 logicalWindowSize() const;

    EngineConfig config;
    SDL_Window* window = nullptr;
    std::unique_ptr<IRenderBackend> backend;
    std::unique_ptr<IScene> scene;
    RenderQueue queue;

    bool running = false;
    bool suspended = false;  // Window surface released while in the background
    int exitCode = 0;
};
