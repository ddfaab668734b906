#include <doctest/doctest.h>
#include "AssetBundle.h"
#include "BenchmarkScene.h"
#include "IRenderBackend.h"
#include "IScene.h"
#include "ModelScene.h"
#include "RenderQueue.h"
#include "SpriteScene.h"
#include <cmath>
#include <map>

namespace {

// Backend without a device: every requested asset becomes ready when the
// test says so, sprite sizes come from a table
class FakeBackend : public IRenderBackend {
public:
    bool onWindowReady(SDL_Window*) override { return true; }
    void onWindowLost() override {}
    void onWindowResized(uint32_t, uint32_t, float) override {}

    FrameResult update(RenderQueue& queue) override {
        for (const auto& load : queue.spriteLoads) loadSprite(load.id, load.path);
        for (const auto& load : queue.modelLoads) loadModel(load.id, load.path);
        queue.spriteLoads.clear();
        queue.modelLoads.clear();
        return FrameResult::Success;
    }

    bool isReady() const override { return true; }

    bool loadSprite(const AssetId& id, const std::string&) override {
        sprites[id.name] = readyOnLoad ? AssetState::Ready : AssetState::Pending;
        return true;
    }

    bool loadModel(const AssetId& id, const std::string&) override {
        models[id.name] = readyOnLoad ? AssetState::Ready : AssetState::Pending;
        return true;
    }

    AssetState spriteState(const AssetId& id) const override { return stateIn(sprites, id); }
    AssetState modelState(const AssetId& id) const override { return stateIn(models, id); }
    bool isSpriteReady(const AssetId& id) const override { return spriteState(id) == AssetState::Ready; }

    std::optional<glm::vec2> spriteSize(const AssetId& id) const override {
        auto it = sizes.find(id.name);
        if (it == sizes.end() || !isSpriteReady(id)) return std::nullopt;
        return it->second;
    }

    bool readyOnLoad = true;
    std::map<std::string, AssetState> sprites;
    std::map<std::string, AssetState> models;
    std::map<std::string, glm::vec2> sizes;

private:
    static AssetState stateIn(const std::map<std::string, AssetState>& states, const AssetId& id) {
        auto it = states.find(id.name);
        return it != states.end() ? it->second : AssetState::Unrequested;
    }
};

SceneConfig twoSprites() {
    SceneConfig config;
    config.sprites = {{"logo", "assets/logo.png"}, {"hero", "assets/hero.png"}};
    return config;
}

}

TEST_SUITE("AssetBundle") {
    TEST_CASE("request queues every load exactly once") {
        AssetBundle bundle({{"logo", "logo.png"}}, {{"cube", "cube.gltf"}});
        RenderQueue queue;
        bundle.request(queue);
        bundle.request(queue);

        CHECK(bundle.isRequested());
        REQUIRE(queue.spriteLoads.size() == 1);
        CHECK(queue.spriteLoads[0].id == AssetId("logo"));
        CHECK(queue.spriteLoads[0].path == "logo.png");
        REQUIRE(queue.modelLoads.size() == 1);
        CHECK(queue.modelLoads[0].id == AssetId("cube"));
    }

    TEST_CASE("ready only after the backend has serviced every load") {
        FakeBackend backend;
        AssetBundle bundle({{"logo", "logo.png"}}, {{"cube", "cube.gltf"}});
        CHECK_FALSE(bundle.isReady(backend));

        RenderQueue queue;
        bundle.request(queue);
        CHECK_FALSE(bundle.isReady(backend));
        CHECK(bundle.readyCount(backend) == 0);

        backend.update(queue);
        CHECK(bundle.isReady(backend));
        CHECK(bundle.readyCount(backend) == bundle.size());
    }

    TEST_CASE("pending assets keep the bundle loading") {
        FakeBackend backend;
        backend.readyOnLoad = false;
        AssetBundle bundle({{"logo", "logo.png"}, {"hero", "hero.png"}}, {});
        RenderQueue queue;
        bundle.request(queue);
        backend.update(queue);

        CHECK_FALSE(bundle.isReady(backend));
        backend.sprites["logo"] = AssetState::Ready;
        CHECK(bundle.readyCount(backend) == 1);
        CHECK_FALSE(bundle.isReady(backend));
    }
}

TEST_SUITE("SpriteScene") {
    TEST_CASE("layoutRow centres the row on the origin") {
        auto positions = SpriteScene::layoutRow({{100.0f, 50.0f}, {60.0f, 60.0f}}, 20.0f);
        REQUIRE(positions.size() == 2);
        // Total width 180: first centre at -90 + 50, second at -90 + 120 + 30
        CHECK(positions[0].x == doctest::Approx(-40.0f));
        CHECK(positions[1].x == doctest::Approx(60.0f));
        CHECK(positions[0].y == doctest::Approx(0.0f));
        CHECK(SpriteScene::layoutRow({}, 10.0f).empty());
    }

    TEST_CASE("only the logo is drawn while loading") {
        FakeBackend backend;
        backend.readyOnLoad = false;
        SpriteScene scene(twoSprites());
        RenderQueue queue;

        scene.update(SceneContext{backend, {800.0f, 600.0f}, 0.016f}, queue);
        CHECK(queue.spriteLoads.size() == 2);
        REQUIRE(queue.sprites.size() == 1);
        CHECK(queue.sprites[0].asset == AssetId("logo"));
    }

    TEST_CASE("every sprite is drawn once the bundle is ready") {
        FakeBackend backend;
        backend.sizes["logo"] = glm::vec2(128.0f, 64.0f);
        backend.sizes["hero"] = glm::vec2(64.0f, 64.0f);
        SpriteScene scene(twoSprites());
        RenderQueue queue;

        scene.update(SceneContext{backend, {800.0f, 600.0f}, 0.016f}, queue);
        backend.update(queue);
        queue.clearCommands();

        scene.update(SceneContext{backend, {800.0f, 600.0f}, 0.016f}, queue);
        REQUIRE(queue.sprites.size() == 2);
        CHECK(queue.sprites[0].asset == AssetId("logo"));
        CHECK(queue.sprites[1].asset == AssetId("hero"));
        CHECK(queue.spriteLoads.empty());
    }
}

TEST_SUITE("BenchmarkScene") {
    TEST_CASE("the same seed spawns the same sprites") {
        std::mt19937 a(42);
        std::mt19937 b(42);
        auto first = BenchmarkScene::spawnMany(a, 100, {800.0f, 600.0f});
        auto second = BenchmarkScene::spawnMany(b, 100, {800.0f, 600.0f});
        REQUIRE(first.size() == 100);
        for (size_t i = 0; i < first.size(); ++i) {
            CHECK(first[i].transform.position == second[i].transform.position);
            CHECK(first[i].velocity == second[i].velocity);
        }
    }

    TEST_CASE("spawned sprites stay inside their ranges") {
        std::mt19937 rng(7);
        for (const auto& sprite : BenchmarkScene::spawnMany(rng, 500, {800.0f, 600.0f})) {
            CHECK(std::abs(sprite.transform.position.x) <= 400.0f);
            CHECK(std::abs(sprite.transform.position.y) <= 300.0f);
            CHECK(sprite.transform.scale.x >= 0.5f);
            CHECK(sprite.transform.scale.x <= 2.0f);
            CHECK(sprite.transform.alpha >= 0.0f);
            CHECK(sprite.transform.alpha <= 1.0f);
            CHECK(std::abs(sprite.velocity.x) <= BenchmarkScene::MAX_SPEED);
        }
    }

    TEST_CASE("step moves by velocity and bounces off the edges") {
        BenchmarkSprite sprite;
        sprite.velocity = glm::vec2(100.0f, 0.0f);
        BenchmarkScene::step(sprite, 0.5f, {800.0f, 600.0f});
        CHECK(sprite.transform.position.x == doctest::Approx(50.0f));
        CHECK(sprite.velocity.x == doctest::Approx(100.0f));

        // Past the right edge margin: x velocity flips, y is untouched
        sprite.transform.position = glm::vec2(390.0f, 0.0f);
        sprite.velocity = glm::vec2(100.0f, 20.0f);
        BenchmarkScene::step(sprite, 0.01f, {800.0f, 600.0f});
        CHECK(sprite.velocity.x == doctest::Approx(-100.0f));
        CHECK(sprite.velocity.y == doctest::Approx(20.0f));

        sprite.transform.position = glm::vec2(0.0f, -295.0f);
        sprite.velocity = glm::vec2(0.0f, -50.0f);
        BenchmarkScene::step(sprite, 0.01f, {800.0f, 600.0f});
        CHECK(sprite.velocity.y == doctest::Approx(50.0f));
    }

    TEST_CASE("sprites spawn once the bundle is ready and draw the last configured sprite") {
        FakeBackend backend;
        SceneConfig config = twoSprites();
        config.spriteCount = 25;
        BenchmarkScene scene(config);
        RenderQueue queue;

        scene.update(SceneContext{backend, {800.0f, 600.0f}, 0.016f}, queue);
        CHECK(scene.sprites().empty());
        REQUIRE(queue.sprites.size() == 1);
        CHECK(queue.sprites[0].asset == AssetId("logo"));

        backend.update(queue);
        queue.clearCommands();
        scene.update(SceneContext{backend, {800.0f, 600.0f}, 0.016f}, queue);
        CHECK(scene.sprites().size() == 25);
        REQUIRE(queue.sprites.size() == 25);
        CHECK(queue.sprites.back().asset == AssetId("hero"));
    }
}

TEST_SUITE("ModelScene") {
    TEST_CASE("viewProjection flips clip-space Y") {
        glm::mat4 vp = ModelScene::viewProjection(16.0f / 9.0f);
        // A point above the look-at target lands in the upper half (negative Y in Vulkan clip space)
        glm::vec4 clip = vp * glm::vec4(0.0f, 1.5f, 0.0f, 1.0f);
        CHECK(clip.w > 0.0f);
        CHECK(clip.y / clip.w < 0.0f);
    }

    TEST_CASE("models are drawn with the camera set on the queue") {
        FakeBackend backend;
        SceneConfig config;
        config.name = "model";
        config.models = {{"cube", "assets/cube.gltf"}, {"teapot", "assets/teapot.gltf"}};
        ModelScene scene(config);
        RenderQueue queue;

        scene.update(SceneContext{backend, {1280.0f, 720.0f}, 0.016f}, queue);
        CHECK(queue.modelLoads.size() == 2);
        REQUIRE(queue.models.size() == 2);
        CHECK(queue.viewProjection != glm::mat4(1.0f));
        // Spaced symmetrically about the origin
        CHECK(queue.models[0].transform[3].x == doctest::Approx(-queue.models[1].transform[3].x));
    }
}

TEST_SUITE("SceneFactory") {
    TEST_CASE("known names create their scene") {
        SceneConfig config;
        for (const char* name : {"sprites", "benchmark", "model"}) {
            config.name = name;
            auto scene = createScene(config);
            REQUIRE(scene != nullptr);
            CHECK(std::string(scene->name()) == name);
        }
    }

    TEST_CASE("unknown names give nullptr") {
        SceneConfig config;
        config.name = "terrain";
        CHECK(createScene(config) == nullptr);
    }
}
