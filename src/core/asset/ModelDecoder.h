#pragma once

#include "ImageDecoder.h"
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <vector>

// Static mesh vertex, matches the model pass binding 0 layout
struct ModelVertex {
    glm::vec3 position{0.0f};
    glm::vec3 normal{0.0f, 1.0f, 0.0f};
    glm::vec2 texCoord{0.0f};
};

struct DecodedMesh {
    std::vector<ModelVertex> vertices;
    std::vector<uint32_t> indices;
    std::optional<DecodedImage> baseColor;  // nullopt uses the default white material
};

// One entry per triangle primitive of the file
struct DecodedModel {
    std::vector<DecodedMesh> meshes;

    size_t vertexCount() const;
    size_t indexCount() const;
};

namespace ModelDecoder {

// Accepts .gltf and .glb only
bool isSupportedPath(const std::string& path);

// Sequential indices for primitives that carry none
std::vector<uint32_t> generateIndices(size_t vertexCount);

std::optional<DecodedModel> load(const std::string& path);

}
