#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class PresentMode {
    Mailbox,  // Falls back to FIFO when the surface lacks it
    Fifo
};

const char* toString(PresentMode mode);

struct WindowConfig {
    std::string title = "Kiln";
    int width = 1280;
    int height = 720;
};

struct RendererConfig {
    PresentMode presentMode = PresentMode::Mailbox;
    std::optional<bool> validation;  // nullopt: on in debug builds only
    glm::vec4 clearColor{0.08f, 0.08f, 0.1f, 1.0f};
    uint32_t maxSprites = 2048;
    bool sortByAsset = true;
    float exposure = 1.0f;
    float vignette = 0.25f;
};

struct AssetConfig {
    std::string shaderDir = "shaders";
};

// id -> path, kept in file order
using AssetList = std::vector<std::pair<std::string, std::string>>;

struct SceneConfig {
    std::string name = "sprites";  // "sprites", "benchmark" or "model"
    uint32_t spriteCount = 1000;
    uint32_t seed = 42;
    AssetList sprites;
    AssetList models;
};

struct EngineConfig {
    WindowConfig window;
    RendererConfig renderer;
    AssetConfig assets;
    SceneConfig scene;

    static constexpr const char* DEFAULT_PATH = "config/kiln.json";

    // Defaults for any key that is missing, unknown keys are ignored.
    // Parse errors are logged and leave the defaults in place.
    static EngineConfig loadFromJson(const std::string& jsonPath);
    static EngineConfig loadFromJsonString(const std::string& jsonString);
};

struct CommandLineOptions {
    std::optional<std::string> configPath;
    std::optional<std::string> scene;
    std::optional<uint32_t> spriteCount;
    std::optional<uint32_t> seed;
    bool fifo = false;
    bool verbose = false;
    bool help = false;
    std::vector<std::string> errors;

    static CommandLineOptions parse(int argc, const char* const* argv);

    // Flags win over the file
    void applyTo(EngineConfig& config) const;
};
