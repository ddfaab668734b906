#include "EngineConfig.h"
#include <nlohmann/json.hpp>
#include <SDL3/SDL_log.h>
#include <fstream>
#include <limits>

// Ordered so asset lists keep the file's order
using json = nlohmann::ordered_json;

const char* toString(PresentMode mode) {
    switch (mode) {
        case PresentMode::Mailbox: return "mailbox";
        case PresentMode::Fifo: return "fifo";
    }
    return "unknown";
}

namespace {

AssetList readAssetList(const json& j) {
    AssetList list;
    if (!j.is_object()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "EngineConfig: asset list must be an object of id: path");
        return list;
    }
    for (const auto& [id, path] : j.items()) {
        if (path.is_string()) {
            list.emplace_back(id, path.get<std::string>());
        } else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "EngineConfig: ignoring non-string path for '%s'", id.c_str());
        }
    }
    return list;
}

glm::vec4 readColor(const json& j, const glm::vec4& fallback) {
    if (!j.is_array() || j.size() < 3) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "EngineConfig: clearColor must be [r, g, b] or [r, g, b, a]");
        return fallback;
    }
    glm::vec4 color = fallback;
    for (size_t i = 0; i < j.size() && i < 4; ++i) {
        color[static_cast<glm::length_t>(i)] = j[i].get<float>();
    }
    return color;
}

std::optional<uint32_t> parseUnsigned(const std::string& text) {
    try {
        size_t consumed = 0;
        unsigned long value = std::stoul(text, &consumed);
        if (consumed != text.size() || value > std::numeric_limits<uint32_t>::max()) {
            return std::nullopt;
        }
        return static_cast<uint32_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}

EngineConfig EngineConfig::loadFromJson(const std::string& jsonPath) {
    std::ifstream file(jsonPath);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "EngineConfig: Failed to open config file: %s", jsonPath.c_str());
        return EngineConfig{};
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    SDL_Log("EngineConfig: Loading %s", jsonPath.c_str());
    return loadFromJsonString(content);
}

EngineConfig EngineConfig::loadFromJsonString(const std::string& jsonString) {
    EngineConfig config;

    try {
        json j = json::parse(jsonString);

        if (j.contains("window")) {
            const auto& window = j["window"];
            config.window.title = window.value("title", config.window.title);
            config.window.width = window.value("width", config.window.width);
            config.window.height = window.value("height", config.window.height);
        }

        if (j.contains("renderer")) {
            const auto& renderer = j["renderer"];
            std::string mode = renderer.value("presentMode", std::string(toString(config.renderer.presentMode)));
            if (mode == "fifo") {
                config.renderer.presentMode = PresentMode::Fifo;
            } else if (mode == "mailbox") {
                config.renderer.presentMode = PresentMode::Mailbox;
            } else {
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "EngineConfig: Unknown presentMode '%s'", mode.c_str());
            }
            if (renderer.contains("validation")) {
                config.renderer.validation = renderer["validation"].get<bool>();
            }
            if (renderer.contains("clearColor")) {
                config.renderer.clearColor = readColor(renderer["clearColor"], config.renderer.clearColor);
            }
            config.renderer.maxSprites = renderer.value("maxSprites", config.renderer.maxSprites);
            config.renderer.sortByAsset = renderer.value("sortByAsset", config.renderer.sortByAsset);
            config.renderer.exposure = renderer.value("exposure", config.renderer.exposure);
            config.renderer.vignette = renderer.value("vignette", config.renderer.vignette);
        }

        if (j.contains("assets")) {
            config.assets.shaderDir = j["assets"].value("shaderDir", config.assets.shaderDir);
        }

        if (j.contains("scene")) {
            const auto& scene = j["scene"];
            config.scene.name = scene.value("name", config.scene.name);
            config.scene.spriteCount = scene.value("spriteCount", config.scene.spriteCount);
            config.scene.seed = scene.value("seed", config.scene.seed);
            if (scene.contains("sprites")) {
                config.scene.sprites = readAssetList(scene["sprites"]);
            }
            if (scene.contains("models")) {
                config.scene.models = readAssetList(scene["models"]);
            }
        }
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "EngineConfig: JSON parse error: %s", e.what());
        return EngineConfig{};
    }

    return config;
}

CommandLineOptions CommandLineOptions::parse(int argc, const char* const* argv) {
    CommandLineOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--fifo") {
            options.fifo = true;
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--config" && hasValue) {
            options.configPath = argv[++i];
        } else if (arg == "--scene" && hasValue) {
            options.scene = argv[++i];
        } else if ((arg == "--sprites" || arg == "--seed") && hasValue) {
            std::string value = argv[++i];
            auto number = parseUnsigned(value);
            if (!number) {
                options.errors.push_back(arg + " expects an unsigned integer, got '" + value + "'");
            } else if (arg == "--sprites") {
                options.spriteCount = number;
            } else {
                options.seed = number;
            }
        } else {
            options.errors.push_back("unknown or incomplete option '" + arg + "'");
        }
    }

    return options;
}

void CommandLineOptions::applyTo(EngineConfig& config) const {
    if (scene) config.scene.name = *scene;
    if (spriteCount) config.scene.spriteCount = *spriteCount;
    if (seed) config.scene.seed = *seed;
    if (fifo) config.renderer.presentMode = PresentMode::Fifo;
}
