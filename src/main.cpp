#include "Application.h"
#include "EngineConfig.h"
#include <SDL3/SDL.h>
#include <filesystem>
#include <string>
#include <system_error>

static void printUsage(const char* progName) {
    SDL_Log("Usage: %s [options]", progName);
    SDL_Log("");
    SDL_Log("Options:");
    SDL_Log("  --config <path>     JSON configuration (default: %s when present)", EngineConfig::DEFAULT_PATH);
    SDL_Log("  --scene <name>      sprites, benchmark or model");
    SDL_Log("  --sprites <count>   Sprite count for the benchmark scene");
    SDL_Log("  --seed <value>      Benchmark RNG seed");
    SDL_Log("  --fifo              Force FIFO presentation (vsync)");
    SDL_Log("  --verbose, -v       Per-frame diagnostics");
    SDL_Log("  --help, -h          Show this message");
    SDL_Log("");
    SDL_Log("Keys: Escape quits, F5 recreates the renderer");
}

int main(int argc, char* argv[]) {
    CommandLineOptions options = CommandLineOptions::parse(argc, argv);

    if (options.help) {
        printUsage(argv[0]);
        return 0;
    }
    if (!options.errors.empty()) {
        for (const auto& error : options.errors) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s", error.c_str());
        }
        printUsage(argv[0]);
        return 1;
    }

    if (options.verbose) {
        SDL_SetLogPriority(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_VERBOSE);
    }

    EngineConfig config;
    if (options.configPath) {
        config = EngineConfig::loadFromJson(*options.configPath);
    } else if (std::error_code ec; std::filesystem::exists(EngineConfig::DEFAULT_PATH, ec)) {
        config = EngineConfig::loadFromJson(EngineConfig::DEFAULT_PATH);
    }
    options.applyTo(config);

    Application app(config);
    if (!app.init()) {
        return 1;
    }

    int status = app.run();
    app.shutdown();
    return status;
}
