#include "Application.h"

Application::Application(const EngineConfig& config)
    : config(config) {}

bool Application::init() {
    if (!SDL_Init(SDL_INIT_VIDEO)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to initialize SDL: %s", SDL_GetError());
        return false;
    }

    window = SDL_CreateWindow(config.window.title.c_str(), config.window.width, config.window.height,
                              SDL_WINDOW_VULKAN | SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY);
    if (!window) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create window: %s", SDL_GetError());
        SDL_Quit();
        return false;
    }

    scene = createScene(config.scene);
    if (!scene) {
        shutdown();
        return false;
    }

    backend = createRenderBackend(BackendType::Vulkan, config);
    if (!backend || !backend->onWindowReady(window)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to initialize renderer");
        shutdown();
        return false;
    }

    SDL_Log("Application: scene '%s' ready", scene->name());
    return true;
}

int Application::run() {
    running = true;
    Uint64 lastTicks = SDL_GetTicksNS();

    while (running) {
        processEvents();
        if (!running) break;

        Uint64 now = SDL_GetTicksNS();
        float deltaTime = static_cast<float>(now - lastTicks) / 1'000'000'000.0f;
        lastTicks = now;

        SceneContext context{*backend, logicalWindowSize(), deltaTime};
        scene->update(context, queue);

        FrameResult result = backend->update(queue);
        queue.clearCommands();

        if (isFatal(result)) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Application: frame failed (%s), stopping", toString(result));
            exitCode = 1;
            running = false;
        } else if (suspended || result == FrameResult::Skipped) {
            // Nothing presented, nothing to pace against
            SDL_Delay(16);
        }
    }
    return exitCode;
}

void Application::shutdown() {
    scene.reset();
    if (backend) {
        backend->onWindowLost();
        backend.reset();
    }

    if (window) {
        SDL_DestroyWindow(window);
        window = nullptr;
    }

    SDL_Quit();
}

glm::vec2 Application::logicalWindowSize() const {
    int width = 0;
    int height = 0;
    SDL_GetWindowSize(window, &width, &height);
    return glm::vec2(static_cast<float>(width), static_cast<float>(height));
}

void Application::notifyResized() {
    int pixelWidth = 0;
    int pixelHeight = 0;
    SDL_GetWindowSizeInPixels(window, &pixelWidth, &pixelHeight);
    backend->onWindowResized(static_cast<uint32_t>(pixelWidth), static_cast<uint32_t>(pixelHeight),
                             SDL_GetWindowDisplayScale(window));
}

bool Application::restoreWindow() {
    if (!suspended) return true;
    suspended = false;
    if (!backend->onWindowReady(window)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Application: renderer failed to come back, stopping");
        exitCode = 1;
        running = false;
        return false;
    }
    return true;
}

void Application::processEvents() {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
            case SDL_EVENT_QUIT:
            case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
                running = false;
                break;
            case SDL_EVENT_WINDOW_RESIZED:
            case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
            case SDL_EVENT_WINDOW_DISPLAY_SCALE_CHANGED:
                notifyResized();
                break;
            case SDL_EVENT_DID_ENTER_BACKGROUND:
                if (!suspended) {
                    backend->onWindowLost();
                    suspended = true;
                }
                break;
            case SDL_EVENT_WILL_ENTER_FOREGROUND:
                restoreWindow();
                break;
            case SDL_EVENT_KEY_DOWN:
                if (event.key.scancode == SDL_SCANCODE_ESCAPE) {
                    running = false;
                }
                else if (event.key.scancode == SDL_SCANCODE_F5) {
                    // Full device-lost / device-ready cycle; assets come back from their decoded sources
                    SDL_Log("Application: recreating renderer");
                    backend->onWindowLost();
                    suspended = true;
                    restoreWindow();
                }
                break;
            default:
                break;
        }
    }
}
