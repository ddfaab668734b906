#include <doctest/doctest.h>
#include "InstanceRecords.h"
#include "Transform2D.h"
#include <glm/gtc/constants.hpp>
#include <cmath>
#include <cstddef>

TEST_SUITE("Transform2D") {
    TEST_CASE("default transform is identity") {
        CHECK(Transform2D{}.toMatrix() == glm::mat3(1.0f));
    }

    TEST_CASE("scale, then rotate, then translate") {
        Transform2D transform;
        transform.position = glm::vec2(10.0f, 20.0f);
        transform.scale = glm::vec2(2.0f, 3.0f);
        transform.rotation = glm::half_pi<float>();

        glm::vec3 p = transform.toMatrix() * glm::vec3(1.0f, 0.0f, 1.0f);
        // (1,0) scaled to (2,0), rotated a quarter turn counter-clockwise to (0,2)
        CHECK(p.x == doctest::Approx(10.0f).epsilon(1e-5));
        CHECK(p.y == doctest::Approx(22.0f).epsilon(1e-5));

        glm::vec3 q = transform.toMatrix() * glm::vec3(0.0f, 1.0f, 1.0f);
        CHECK(q.x == doctest::Approx(7.0f).epsilon(1e-5));
        CHECK(q.y == doctest::Approx(20.0f).epsilon(1e-5));
    }

    TEST_CASE("combine places the child in the parent's space") {
        Transform2D parent;
        parent.position = glm::vec2(100.0f, 0.0f);
        parent.scale = glm::vec2(2.0f);
        parent.alpha = 0.5f;

        Transform2D child;
        child.position = glm::vec2(5.0f, 5.0f);
        child.alpha = 0.5f;

        Transform2D world = parent.combine(child);
        CHECK(world.position.x == doctest::Approx(110.0f));
        CHECK(world.position.y == doctest::Approx(10.0f));
        CHECK(world.scale.x == doctest::Approx(2.0f));
        CHECK(world.alpha == doctest::Approx(0.25f));
    }
}

TEST_SUITE("InstanceRecords") {
    TEST_CASE("unit quad is centred with the image top at +Y") {
        glm::vec2 sum(0.0f);
        for (const auto& vertex : UNIT_QUAD_VERTICES) {
            sum += vertex.position;
            CHECK(std::abs(vertex.position.x) == doctest::Approx(0.5f));
            CHECK(std::abs(vertex.position.y) == doctest::Approx(0.5f));
            // Top edge samples v = 0
            CHECK(vertex.texCoord.y == doctest::Approx(vertex.position.y > 0.0f ? 0.0f : 1.0f));
        }
        CHECK(sum.x == doctest::Approx(0.0f));
        CHECK(sum.y == doctest::Approx(0.0f));

        for (uint16_t index : UNIT_QUAD_INDICES) {
            CHECK(index < UNIT_QUAD_VERTICES.size());
        }
    }

    TEST_CASE("sprite instance carries size, transform columns and opacity") {
        Transform2D transform;
        transform.position = glm::vec2(-30.0f, 12.0f);
        auto instance = makeSpriteInstance(glm::vec2(128.0f, 64.0f), transform.toMatrix(), 0.75f);

        CHECK(instance.size == glm::vec2(128.0f, 64.0f));
        CHECK(instance.column0 == glm::vec3(1.0f, 0.0f, 0.0f));
        CHECK(instance.column2 == glm::vec3(-30.0f, 12.0f, 1.0f));
        CHECK(instance.alpha == doctest::Approx(0.75f));
    }

    TEST_CASE("model instance carries the model matrix") {
        glm::mat4 model(1.0f);
        model[3] = glm::vec4(1.0f, 2.0f, 3.0f, 1.0f);
        auto instance = makeModelInstance(model, 0.5f);
        CHECK(instance.model == model);
        CHECK(instance.alpha == doctest::Approx(0.5f));
    }

    TEST_CASE("record layouts match the vertex attribute offsets") {
        CHECK(sizeof(QuadVertex) == 16);
        CHECK(offsetof(QuadVertex, texCoord) == 8);
        CHECK(offsetof(SpriteInstance, column0) == 8);
        CHECK(offsetof(SpriteInstance, alpha) == 44);
        CHECK(offsetof(ModelInstance, alpha) == 64);
        CHECK(sizeof(ScreenUniforms) == 16);
        CHECK(sizeof(PostUniforms) == 16);
        CHECK(sizeof(CameraUniforms) == 64);
    }
}
