#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * DecodedImage - CPU-side RGBA8 pixels, tightly packed rows
 */
struct DecodedImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels;

    size_t byteSize() const { return pixels.size(); }
    bool valid() const {
        return width > 0 && height > 0 && pixels.size() == static_cast<size_t>(width) * height * 4;
    }

    static DecodedImage solidColor(uint8_t r, uint8_t g, uint8_t b, uint8_t a);
};

// stb_image decoding; every format is expanded to 4 channels
namespace ImageDecoder {

std::optional<DecodedImage> loadFromFile(const std::string& path);

// label only appears in log messages
std::optional<DecodedImage> loadFromMemory(const uint8_t* data, size_t size, const std::string& label);

}
