#include <doctest/doctest.h>
#include "ShaderLoader.h"
#include <filesystem>
#include <fstream>

namespace {

std::string writeBytes(const std::string& name, const std::vector<char>& bytes) {
    auto dir = std::filesystem::temp_directory_path() / "kiln_shader_loader";
    std::filesystem::create_directories(dir);
    auto path = (dir / name).string();
    std::ofstream out(path, std::ios::binary);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return path;
}

}

TEST_SUITE("ShaderLoader") {
    TEST_CASE("missing file yields nullopt") {
        CHECK_FALSE(ShaderLoader::readSpirv("/nonexistent/kiln/sprite.vert.spv").has_value());
    }

    TEST_CASE("empty file is rejected") {
        auto path = writeBytes("empty.spv", {});
        CHECK_FALSE(ShaderLoader::readSpirv(path).has_value());
    }

    TEST_CASE("size that is not a whole number of words is rejected") {
        auto path = writeBytes("odd.spv", {0x03, 0x02, 0x23, 0x07, 0x01});
        CHECK_FALSE(ShaderLoader::readSpirv(path).has_value());
    }

    TEST_CASE("words keep file byte order") {
        // SPIR-V magic 0x07230203, little endian, followed by one zero word
        auto path = writeBytes("magic.spv", {0x03, 0x02, 0x23, 0x07, 0x00, 0x00, 0x00, 0x00});
        auto words = ShaderLoader::readSpirv(path);
        REQUIRE(words.has_value());
        REQUIRE(words->size() == 2);
        CHECK((*words)[0] == 0x07230203u);
        CHECK((*words)[1] == 0u);
    }
}
