#include "ShaderLoader.h"
#include <SDL3/SDL_log.h>
#include <cstring>
#include <fstream>
#include <iterator>

namespace ShaderLoader {

std::optional<std::vector<uint32_t>> readSpirv(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ShaderLoader: Cannot open %s", path.c_str());
        return std::nullopt;
    }

    std::vector<char> bytes{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (bytes.empty() || bytes.size() % sizeof(uint32_t) != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ShaderLoader: %s is not SPIR-V (%zu bytes)",
            path.c_str(), bytes.size());
        return std::nullopt;
    }

    std::vector<uint32_t> words(bytes.size() / sizeof(uint32_t));
    std::memcpy(words.data(), bytes.data(), bytes.size());
    return words;
}

std::optional<vk::raii::ShaderModule> loadShaderModule(const vk::raii::Device& device, const std::string& path) {
    auto words = readSpirv(path);
    if (!words) {
        return std::nullopt;
    }

    try {
        return vk::raii::ShaderModule(device, vk::ShaderModuleCreateInfo{}.setCode(*words));
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ShaderLoader: %s rejected by the driver: %s",
            path.c_str(), e.what());
        return std::nullopt;
    }
}

}
