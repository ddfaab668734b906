#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#include "ImageDecoder.h"
#include <SDL3/SDL_log.h>
#include <climits>
#include <cstring>
#include <memory>

DecodedImage DecodedImage::solidColor(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    DecodedImage image;
    image.width = 1;
    image.height = 1;
    image.pixels = {r, g, b, a};
    return image;
}

namespace ImageDecoder {

namespace {

std::optional<DecodedImage> takePixels(stbi_uc* pixels, int width, int height, const std::string& label) {
    if (!pixels) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ImageDecoder: Failed to decode %s: %s",
            label.c_str(), stbi_failure_reason());
        return std::nullopt;
    }

    std::unique_ptr<stbi_uc, decltype(&stbi_image_free)> owned(pixels, &stbi_image_free);

    if (width <= 0 || height <= 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ImageDecoder: %s has empty dimensions", label.c_str());
        return std::nullopt;
    }

    DecodedImage image;
    image.width = static_cast<uint32_t>(width);
    image.height = static_cast<uint32_t>(height);
    image.pixels.resize(static_cast<size_t>(width) * height * 4);
    std::memcpy(image.pixels.data(), owned.get(), image.pixels.size());

    SDL_LogVerbose(SDL_LOG_CATEGORY_APPLICATION, "ImageDecoder: %s decoded (%dx%d)", label.c_str(), width, height);
    return image;
}

}

std::optional<DecodedImage> loadFromFile(const std::string& path) {
    int width = 0;
    int height = 0;
    int channels = 0;
    stbi_uc* pixels = stbi_load(path.c_str(), &width, &height, &channels, STBI_rgb_alpha);
    return takePixels(pixels, width, height, path);
}

std::optional<DecodedImage> loadFromMemory(const uint8_t* data, size_t size, const std::string& label) {
    if (!data || size == 0 || size > static_cast<size_t>(INT_MAX)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ImageDecoder: %s has no usable bytes", label.c_str());
        return std::nullopt;
    }

    int width = 0;
    int height = 0;
    int channels = 0;
    stbi_uc* pixels = stbi_load_from_memory(data, static_cast<int>(size), &width, &height, &channels, STBI_rgb_alpha);
    return takePixels(pixels, width, height, label);
}

}
