#include <doctest/doctest.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include "AssetCache.h"
#include "ImageDecoder.h"
#include <filesystem>
#include <string>
#include <vector>

namespace {

std::vector<uint8_t> checkerboard(int width, int height, int channels) {
    std::vector<uint8_t> pixels(static_cast<size_t>(width) * height * channels);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            uint8_t value = ((x / 8 + y / 8) % 2 == 0) ? 255 : 0;
            for (int c = 0; c < channels; ++c) {
                pixels[(static_cast<size_t>(y) * width + x) * channels + c] = value;
            }
        }
    }
    return pixels;
}

void appendBytes(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    auto* bytes = static_cast<uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

std::vector<uint8_t> encodePng(int width, int height, int channels) {
    auto pixels = checkerboard(width, height, channels);
    std::vector<uint8_t> png;
    REQUIRE(stbi_write_png_to_func(appendBytes, &png, width, height, channels, pixels.data(), width * channels) != 0);
    return png;
}

std::filesystem::path writePng(const std::string& name, int width, int height, int channels) {
    auto dir = std::filesystem::temp_directory_path() / "kiln_image_decoder";
    std::filesystem::create_directories(dir);
    auto path = dir / name;
    auto pixels = checkerboard(width, height, channels);
    REQUIRE(stbi_write_png(path.string().c_str(), width, height, channels, pixels.data(), width * channels) != 0);
    return path;
}

// Stands in for a texture: records the extent it was created with
struct FakeTexture {
    uint32_t width = 0;
    uint32_t height = 0;
};

class FakeTextureUploader : public IAssetUploader<DecodedImage, FakeTexture> {
public:
    std::optional<FakeTexture> upload(const AssetId& id, const DecodedImage& image) override {
        uploaded.push_back(id.name);
        if (!image.valid()) {
            return std::nullopt;
        }
        return FakeTexture{image.width, image.height};
    }

    std::vector<std::string> uploaded;
};

}

TEST_SUITE("ImageDecoder") {
    TEST_CASE("logo and hero files decode at their pixel size") {
        auto logoPath = writePng("logo.png", 128, 64, 4);
        auto heroPath = writePng("hero.png", 64, 64, 4);

        auto logo = ImageDecoder::loadFromFile(logoPath.string());
        REQUIRE(logo.has_value());
        CHECK(logo->width == 128);
        CHECK(logo->height == 64);
        CHECK(logo->byteSize() == 128u * 64u * 4u);
        CHECK(logo->valid());

        auto hero = ImageDecoder::loadFromFile(heroPath.string());
        REQUIRE(hero.has_value());
        CHECK(hero->width == 64);
        CHECK(hero->height == 64);
    }

    TEST_CASE("three-channel images are expanded to RGBA") {
        auto png = encodePng(16, 8, 3);
        REQUIRE_FALSE(png.empty());

        auto image = ImageDecoder::loadFromMemory(png.data(), png.size(), "rgb");
        REQUIRE(image.has_value());
        CHECK(image->pixels.size() == 16u * 8u * 4u);
        // Top-left texel is white and opaque
        CHECK(image->pixels[0] == 255);
        CHECK(image->pixels[3] == 255);
        // Texel (8, 0) is black
        CHECK(image->pixels[8 * 4] == 0);
    }

    TEST_CASE("missing files fail") {
        CHECK_FALSE(ImageDecoder::loadFromFile("/nonexistent/kiln/missing.png").has_value());
    }

    TEST_CASE("garbage bytes fail") {
        std::vector<uint8_t> garbage{0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07};
        CHECK_FALSE(ImageDecoder::loadFromMemory(garbage.data(), garbage.size(), "garbage").has_value());
        CHECK_FALSE(ImageDecoder::loadFromMemory(nullptr, 0, "empty").has_value());
    }

    TEST_CASE("solidColor is a single valid texel") {
        auto white = DecodedImage::solidColor(255, 255, 255, 255);
        CHECK(white.width == 1);
        CHECK(white.height == 1);
        CHECK(white.valid());
        CHECK(white.pixels == std::vector<uint8_t>{255, 255, 255, 255});
    }

    TEST_CASE("an image with mismatched pixel storage is not valid") {
        DecodedImage image;
        image.width = 2;
        image.height = 2;
        image.pixels.resize(4);
        CHECK_FALSE(image.valid());
        CHECK_FALSE(DecodedImage{}.valid());
    }

    TEST_CASE("decoded files become ready sprites with their pixel size") {
        auto logoPath = writePng("cache_logo.png", 128, 64, 4);
        auto heroPath = writePng("cache_hero.png", 64, 64, 3);

        AssetCache<DecodedImage, FakeTexture> cache("Sprites");
        const AssetId logo("logo");
        const AssetId hero("hero");

        CHECK(cache.load(logo, [&]() { return ImageDecoder::loadFromFile(logoPath.string()); }));
        CHECK(cache.load(hero, [&]() { return ImageDecoder::loadFromFile(heroPath.string()); }));
        CHECK(cache.state(logo) == AssetState::Pending);
        CHECK(cache.state(hero) == AssetState::Pending);
        CHECK(cache.get(logo) == nullptr);

        FakeTextureUploader uploader;
        CHECK(cache.onDeviceReady(uploader) == 2);
        CHECK(uploader.uploaded == std::vector<std::string>{"logo", "hero"});

        CHECK(cache.state(logo) == AssetState::Ready);
        CHECK(cache.state(hero) == AssetState::Ready);
        const FakeTexture* logoTexture = cache.get(logo);
        const FakeTexture* heroTexture = cache.get(hero);
        REQUIRE(logoTexture != nullptr);
        REQUIRE(heroTexture != nullptr);
        CHECK(logoTexture->width == 128);
        CHECK(logoTexture->height == 64);
        CHECK(heroTexture->width == 64);
        CHECK(heroTexture->height == 64);
    }

    TEST_CASE("a missing file never reaches the cache") {
        AssetCache<DecodedImage, FakeTexture> cache("Sprites");
        FakeTextureUploader uploader;
        cache.onDeviceReady(uploader);

        CHECK_FALSE(cache.load(AssetId("ghost"), []() { return ImageDecoder::loadFromFile("/nonexistent/kiln/ghost.png"); }));
        CHECK(cache.state(AssetId("ghost")) == AssetState::Unrequested);
        CHECK(uploader.uploaded.empty());
    }
}
