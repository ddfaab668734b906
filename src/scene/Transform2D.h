#pragma once

#include <glm/glm.hpp>
#include <cmath>

/**
 * Transform2D - Position, rotation, scale and opacity of one sprite
 *
 * position is in logical pixels with the origin at the window centre and +Y
 * up; rotation is counter-clockwise in radians. toMatrix() gives the
 * column-major 3x3 that SpriteRenderCommand carries: scale, then rotate,
 * then translate.
 */
struct Transform2D {
    glm::vec2 position{0.0f};
    glm::vec2 scale{1.0f};
    float rotation = 0.0f;
    float alpha = 1.0f;

    glm::mat3 toMatrix() const {
        const float c = std::cos(rotation);
        const float s = std::sin(rotation);
        return glm::mat3(
            glm::vec3(c * scale.x, s * scale.x, 0.0f),
            glm::vec3(-s * scale.y, c * scale.y, 0.0f),
            glm::vec3(position, 1.0f));
    }

    // Child expressed in this transform's space; opacity multiplies
    Transform2D combine(const Transform2D& child) const {
        Transform2D result;
        glm::vec3 p = toMatrix() * glm::vec3(child.position, 1.0f);
        result.position = glm::vec2(p);
        result.scale = scale * child.scale;
        result.rotation = rotation + child.rotation;
        result.alpha = alpha * child.alpha;
        return result;
    }
};
