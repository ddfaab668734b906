#include "ModelDecoder.h"
#include <fastgltf/core.hpp>
#include <fastgltf/types.hpp>
#include <fastgltf/tools.hpp>
#include <fastgltf/glm_element_traits.hpp>
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <numeric>
#include <variant>

size_t DecodedModel::vertexCount() const {
    size_t total = 0;
    for (const auto& mesh : meshes) total += mesh.vertices.size();
    return total;
}

size_t DecodedModel::indexCount() const {
    size_t total = 0;
    for (const auto& mesh : meshes) total += mesh.indices.size();
    return total;
}

namespace ModelDecoder {

namespace {

std::optional<DecodedImage> decodeBytes(const std::byte* bytes, size_t size, const std::string& label) {
    return ImageDecoder::loadFromMemory(reinterpret_cast<const uint8_t*>(bytes), size, label);
}

// Raw bytes of a buffer once external buffers have been loaded
const std::byte* bufferBytes(const fastgltf::Buffer& buffer) {
    const std::byte* result = nullptr;
    std::visit(fastgltf::visitor{
        [&](const fastgltf::sources::Array& array) { result = array.bytes.data(); },
        [&](const fastgltf::sources::Vector& vector) { result = vector.bytes.data(); },
        [](const auto&) {}
    }, buffer.data);
    return result;
}

std::optional<DecodedImage> decodeImage(const fastgltf::Asset& asset, size_t imageIndex,
                                        const std::filesystem::path& baseDir) {
    const auto& image = asset.images[imageIndex];
    std::string label = "image " + std::to_string(imageIndex);
    std::optional<DecodedImage> result;

    std::visit(fastgltf::visitor{
        [&](const fastgltf::sources::BufferView& source) {
            const auto& view = asset.bufferViews[source.bufferViewIndex];
            const std::byte* bytes = bufferBytes(asset.buffers[view.bufferIndex]);
            if (bytes) {
                result = decodeBytes(bytes + view.byteOffset, view.byteLength, label);
            }
        },
        [&](const fastgltf::sources::Array& source) {
            result = decodeBytes(source.bytes.data(), source.bytes.size(), label);
        },
        [&](const fastgltf::sources::Vector& source) {
            result = decodeBytes(source.bytes.data(), source.bytes.size(), label);
        },
        [&](const fastgltf::sources::URI& source) {
            result = ImageDecoder::loadFromFile((baseDir / source.uri.fspath()).string());
        },
        [&](const auto&) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "ModelDecoder: Unsupported source for %s", label.c_str());
        }
    }, image.data);

    return result;
}

std::optional<DecodedImage> decodeBaseColor(const fastgltf::Asset& asset, const fastgltf::Primitive& primitive,
                                            const std::filesystem::path& baseDir) {
    if (!primitive.materialIndex.has_value()) return std::nullopt;

    const auto& material = asset.materials[primitive.materialIndex.value()];
    if (!material.pbrData.baseColorTexture.has_value()) return std::nullopt;

    const auto& texture = asset.textures[material.pbrData.baseColorTexture->textureIndex];
    if (!texture.imageIndex.has_value()) return std::nullopt;

    return decodeImage(asset, texture.imageIndex.value(), baseDir);
}

std::optional<DecodedMesh> decodePrimitive(const fastgltf::Asset& asset, const fastgltf::Primitive& primitive,
                                           const std::filesystem::path& baseDir) {
    auto* positionIt = primitive.findAttribute("POSITION");
    if (positionIt == primitive.attributes.end()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "ModelDecoder: Primitive missing POSITION attribute");
        return std::nullopt;
    }

    const auto& posAccessor = asset.accessors[positionIt->accessorIndex];
    if (posAccessor.count == 0) return std::nullopt;

    DecodedMesh mesh;
    mesh.vertices.resize(posAccessor.count);

    fastgltf::iterateAccessorWithIndex<glm::vec3>(asset, posAccessor,
        [&](glm::vec3 pos, size_t idx) {
            mesh.vertices[idx].position = pos;
        });

    // Missing normals keep the +Y default
    auto* normalIt = primitive.findAttribute("NORMAL");
    if (normalIt != primitive.attributes.end()) {
        const auto& normalAccessor = asset.accessors[normalIt->accessorIndex];
        fastgltf::iterateAccessorWithIndex<glm::vec3>(asset, normalAccessor,
            [&](glm::vec3 normal, size_t idx) {
                if (idx < mesh.vertices.size()) mesh.vertices[idx].normal = normal;
            });
    }

    auto* texCoordIt = primitive.findAttribute("TEXCOORD_0");
    if (texCoordIt != primitive.attributes.end()) {
        const auto& texCoordAccessor = asset.accessors[texCoordIt->accessorIndex];
        fastgltf::iterateAccessorWithIndex<glm::vec2>(asset, texCoordAccessor,
            [&](glm::vec2 uv, size_t idx) {
                if (idx < mesh.vertices.size()) mesh.vertices[idx].texCoord = uv;
            });
    }

    if (primitive.indicesAccessor.has_value()) {
        const auto& indexAccessor = asset.accessors[primitive.indicesAccessor.value()];
        mesh.indices.reserve(indexAccessor.count);
        fastgltf::iterateAccessor<uint32_t>(asset, indexAccessor,
            [&](uint32_t index) {
                mesh.indices.push_back(index);
            });
    } else {
        mesh.indices = generateIndices(mesh.vertices.size());
    }

    const uint32_t vertexCount = static_cast<uint32_t>(mesh.vertices.size());
    bool inRange = std::all_of(mesh.indices.begin(), mesh.indices.end(),
                               [vertexCount](uint32_t i) { return i < vertexCount; });
    if (!inRange) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelDecoder: Primitive indexes past its %u vertices", vertexCount);
        return std::nullopt;
    }

    mesh.baseColor = decodeBaseColor(asset, primitive, baseDir);
    return mesh;
}

} // anonymous namespace

bool isSupportedPath(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".gltf" || ext == ".glb";
}

std::vector<uint32_t> generateIndices(size_t vertexCount) {
    std::vector<uint32_t> indices(vertexCount);
    std::iota(indices.begin(), indices.end(), 0u);
    return indices;
}

std::optional<DecodedModel> load(const std::string& path) {
    if (!isSupportedPath(path)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelDecoder: Unsupported model format: %s", path.c_str());
        return std::nullopt;
    }

    std::filesystem::path filePath(path);
    std::error_code ec;
    if (!std::filesystem::exists(filePath, ec)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelDecoder: File not found: %s", path.c_str());
        return std::nullopt;
    }

    auto data = fastgltf::GltfDataBuffer::FromPath(filePath);
    if (data.error() != fastgltf::Error::None) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelDecoder: Failed to read file: %s", path.c_str());
        return std::nullopt;
    }

    constexpr auto gltfOptions =
        fastgltf::Options::LoadExternalBuffers |
        fastgltf::Options::LoadExternalImages;

    fastgltf::Parser parser;
    auto asset = parser.loadGltf(data.get(), filePath.parent_path(), gltfOptions);
    if (asset.error() != fastgltf::Error::None) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelDecoder: Failed to parse glTF: %s (%s)",
                     path.c_str(), std::string(fastgltf::getErrorMessage(asset.error())).c_str());
        return std::nullopt;
    }

    DecodedModel model;
    for (const auto& mesh : asset->meshes) {
        for (const auto& primitive : mesh.primitives) {
            if (primitive.type != fastgltf::PrimitiveType::Triangles) {
                continue;
            }
            auto decoded = decodePrimitive(asset.get(), primitive, filePath.parent_path());
            if (decoded) {
                model.meshes.push_back(std::move(*decoded));
            }
        }
    }

    if (model.meshes.empty()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelDecoder: No triangle meshes in %s", path.c_str());
        return std::nullopt;
    }

    SDL_Log("ModelDecoder: Loaded %zu meshes (%zu vertices, %zu indices) from %s",
            model.meshes.size(), model.vertexCount(), model.indexCount(), path.c_str());
    return model;
}

}
