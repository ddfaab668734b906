#pragma once

// ============================================================================
// InstanceRecords.h - CPU mirrors of vertex, instance and uniform layouts
// ============================================================================
// Attribute locations and std140 offsets must match shaders/*.vert.

#include <glm/glm.hpp>
#include <array>
#include <cstdint>

// Sprite pass, binding 0: locations 0 (position), 1 (texCoord)
struct QuadVertex {
    glm::vec2 position;
    glm::vec2 texCoord;
};

// Unit quad centred on the origin, +Y up; texCoord (0,0) is the image's top-left
inline const std::array<QuadVertex, 4> UNIT_QUAD_VERTICES = {{
    {{-0.5f, -0.5f}, {0.0f, 1.0f}},
    {{ 0.5f, -0.5f}, {1.0f, 1.0f}},
    {{ 0.5f,  0.5f}, {1.0f, 0.0f}},
    {{-0.5f,  0.5f}, {0.0f, 0.0f}},
}};
constexpr std::array<uint16_t, 6> UNIT_QUAD_INDICES = {0, 1, 2, 2, 3, 0};

// Sprite pass, binding 1: locations 2 (size), 3-5 (transform columns), 6 (alpha)
struct SpriteInstance {
    glm::vec2 size;
    glm::vec3 column0;
    glm::vec3 column1;
    glm::vec3 column2;
    float alpha;
    glm::vec2 padding;
};
static_assert(sizeof(SpriteInstance) == 56, "SpriteInstance layout must match sprite.vert");

inline SpriteInstance makeSpriteInstance(const glm::vec2& size, const glm::mat3& transform, float alpha) {
    return SpriteInstance{size, transform[0], transform[1], transform[2], alpha, glm::vec2(0.0f)};
}

// Model pass, binding 1: locations 3-6 (model matrix columns), 7 (alpha)
struct ModelInstance {
    glm::mat4 model;
    float alpha;
    glm::vec3 padding;
};
static_assert(sizeof(ModelInstance) == 80, "ModelInstance layout must match model.vert");

inline ModelInstance makeModelInstance(const glm::mat4& transform, float alpha) {
    return ModelInstance{transform, alpha, glm::vec3(0.0f)};
}

// Sprite pass set 0. resolution is in physical pixels
struct ScreenUniforms {
    glm::vec2 resolution;
    float scaleFactor;
    float padding;
};

// Model pass set 0, one copy per frame slot
struct CameraUniforms {
    glm::mat4 viewProjection;
};

// Post-process pass set 0, binding 1
struct PostUniforms {
    float exposure;
    float vignette;
    glm::vec2 padding;
};
