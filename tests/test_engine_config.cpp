#include <doctest/doctest.h>
#include "EngineConfig.h"
#include <string>
#include <vector>

namespace {

CommandLineOptions parseArgs(std::vector<const char*> args) {
    args.insert(args.begin(), "kiln");
    return CommandLineOptions::parse(static_cast<int>(args.size()), args.data());
}

}

TEST_SUITE("EngineConfig") {
    TEST_CASE("empty object keeps every default") {
        EngineConfig config = EngineConfig::loadFromJsonString("{}");
        EngineConfig defaults;
        CHECK(config.window.width == defaults.window.width);
        CHECK(config.window.title == "Kiln");
        CHECK(config.renderer.presentMode == PresentMode::Mailbox);
        CHECK_FALSE(config.renderer.validation.has_value());
        CHECK(config.scene.name == "sprites");
        CHECK(config.assets.shaderDir == "shaders");
    }

    TEST_CASE("values from every section are read") {
        EngineConfig config = EngineConfig::loadFromJsonString(R"({
            "window": {"title": "Bench", "width": 640, "height": 480},
            "renderer": {
                "presentMode": "fifo",
                "validation": true,
                "clearColor": [0.5, 0.25, 0.0],
                "maxSprites": 4096,
                "sortByAsset": false,
                "exposure": 1.5,
                "vignette": 0.0
            },
            "assets": {"shaderDir": "build/shaders"},
            "scene": {"name": "benchmark", "spriteCount": 5000, "seed": 7}
        })");

        CHECK(config.window.title == "Bench");
        CHECK(config.window.width == 640);
        CHECK(config.window.height == 480);
        CHECK(config.renderer.presentMode == PresentMode::Fifo);
        REQUIRE(config.renderer.validation.has_value());
        CHECK(*config.renderer.validation);
        CHECK(config.renderer.clearColor.r == doctest::Approx(0.5f));
        CHECK(config.renderer.clearColor.g == doctest::Approx(0.25f));
        // Alpha not given: default kept
        CHECK(config.renderer.clearColor.a == doctest::Approx(1.0f));
        CHECK(config.renderer.maxSprites == 4096);
        CHECK_FALSE(config.renderer.sortByAsset);
        CHECK(config.renderer.exposure == doctest::Approx(1.5f));
        CHECK(config.renderer.vignette == doctest::Approx(0.0f));
        CHECK(config.assets.shaderDir == "build/shaders");
        CHECK(config.scene.name == "benchmark");
        CHECK(config.scene.spriteCount == 5000);
        CHECK(config.scene.seed == 7);
    }

    TEST_CASE("asset lists keep file order") {
        EngineConfig config = EngineConfig::loadFromJsonString(R"({
            "scene": {
                "sprites": {"zebra": "z.png", "apple": "a.png", "mango": "m.png"},
                "models": {"cube": "cube.gltf"}
            }
        })");
        REQUIRE(config.scene.sprites.size() == 3);
        CHECK(config.scene.sprites[0].first == "zebra");
        CHECK(config.scene.sprites[1].first == "apple");
        CHECK(config.scene.sprites[2].second == "m.png");
        REQUIRE(config.scene.models.size() == 1);
        CHECK(config.scene.models[0].second == "cube.gltf");
    }

    TEST_CASE("non-string asset paths are skipped") {
        EngineConfig config = EngineConfig::loadFromJsonString(R"({
            "scene": {"sprites": {"logo": "logo.png", "bad": 3}}
        })");
        REQUIRE(config.scene.sprites.size() == 1);
        CHECK(config.scene.sprites[0].first == "logo");
    }

    TEST_CASE("unknown present mode keeps the default") {
        EngineConfig config = EngineConfig::loadFromJsonString(R"({"renderer": {"presentMode": "immediate"}})");
        CHECK(config.renderer.presentMode == PresentMode::Mailbox);
    }

    TEST_CASE("parse errors fall back to defaults") {
        EngineConfig config = EngineConfig::loadFromJsonString("{ \"window\": ");
        CHECK(config.window.width == EngineConfig{}.window.width);

        // Type errors are reported the same way
        EngineConfig typed = EngineConfig::loadFromJsonString(R"({"window": {"width": "wide"}})");
        CHECK(typed.window.width == EngineConfig{}.window.width);
    }

    TEST_CASE("missing file falls back to defaults") {
        EngineConfig config = EngineConfig::loadFromJson("/nonexistent/kiln/config.json");
        CHECK(config.scene.name == "sprites");
    }

    TEST_CASE("present mode names") {
        CHECK(std::string(toString(PresentMode::Mailbox)) == "mailbox");
        CHECK(std::string(toString(PresentMode::Fifo)) == "fifo");
    }
}

TEST_SUITE("CommandLineOptions") {
    TEST_CASE("no arguments") {
        auto options = parseArgs({});
        CHECK_FALSE(options.help);
        CHECK_FALSE(options.configPath.has_value());
        CHECK(options.errors.empty());
    }

    TEST_CASE("every option is recognised") {
        auto options = parseArgs({"--config", "my.json", "--scene", "benchmark", "--sprites", "20000",
                                  "--seed", "9", "--fifo", "-v", "-h"});
        CHECK(options.errors.empty());
        CHECK(*options.configPath == "my.json");
        CHECK(*options.scene == "benchmark");
        CHECK(*options.spriteCount == 20000);
        CHECK(*options.seed == 9);
        CHECK(options.fifo);
        CHECK(options.verbose);
        CHECK(options.help);
    }

    TEST_CASE("bad values and unknown options are collected as errors") {
        auto options = parseArgs({"--sprites", "many", "--frobnicate", "--seed", "-1", "--scene"});
        CHECK(options.errors.size() == 4);
        CHECK_FALSE(options.spriteCount.has_value());
        CHECK_FALSE(options.seed.has_value());
        CHECK_FALSE(options.scene.has_value());
    }

    TEST_CASE("flags override the file") {
        EngineConfig config;
        config.scene.name = "sprites";
        config.scene.spriteCount = 10;

        auto options = parseArgs({"--scene", "model", "--sprites", "500", "--fifo"});
        options.applyTo(config);
        CHECK(config.scene.name == "model");
        CHECK(config.scene.spriteCount == 500);
        CHECK(config.renderer.presentMode == PresentMode::Fifo);
        // Untouched by absent flags
        CHECK(config.scene.seed == EngineConfig{}.scene.seed);
    }
}
