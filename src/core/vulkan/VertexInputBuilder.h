#pragma once

#include <vulkan/vulkan.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

// ============================================================================
// Vertex attribute stereotypes
// ============================================================================
//
//   AttributeBuilder::vec2(LOC_SPRITE_POSITION, offsetof(QuadVertex, position))
//   AttributeBuilder::float1(LOC_SPRITE_ALPHA, offsetof(SpriteInstance, alpha), INSTANCE_BINDING)
//
// Binding defaults to 0, the static per-vertex buffer.

namespace AttributeBuilder {

constexpr vk::VertexInputAttributeDescription make(uint32_t location, vk::Format format,
                                                   uint32_t offset, uint32_t binding) {
    return vk::VertexInputAttributeDescription{location, binding, format, offset};
}

constexpr vk::VertexInputAttributeDescription float1(uint32_t location, size_t offset, uint32_t binding = 0) {
    return make(location, vk::Format::eR32Sfloat, static_cast<uint32_t>(offset), binding);
}

constexpr vk::VertexInputAttributeDescription vec2(uint32_t location, size_t offset, uint32_t binding = 0) {
    return make(location, vk::Format::eR32G32Sfloat, static_cast<uint32_t>(offset), binding);
}

constexpr vk::VertexInputAttributeDescription vec3(uint32_t location, size_t offset, uint32_t binding = 0) {
    return make(location, vk::Format::eR32G32B32Sfloat, static_cast<uint32_t>(offset), binding);
}

constexpr vk::VertexInputAttributeDescription vec4(uint32_t location, size_t offset, uint32_t binding = 0) {
    return make(location, vk::Format::eR32G32B32A32Sfloat, static_cast<uint32_t>(offset), binding);
}

}

/**
 * VertexInputBuilder - Bindings and attributes for one pipeline's vertex input
 *
 * Instanced passes read static per-vertex data from binding 0 and the
 * per-frame instance records from binding 1; instanced<V, I>() sets both up
 * with the record sizes as strides.
 */
class VertexInputBuilder {
public:
    VertexInputBuilder() = default;

    template<typename VertexType, typename InstanceType>
    static VertexInputBuilder instanced() {
        VertexInputBuilder builder;
        builder.bindings_.emplace_back(0, static_cast<uint32_t>(sizeof(VertexType)), vk::VertexInputRate::eVertex);
        builder.bindings_.emplace_back(1, static_cast<uint32_t>(sizeof(InstanceType)), vk::VertexInputRate::eInstance);
        return builder;
    }

    VertexInputBuilder& addAttribute(const vk::VertexInputAttributeDescription& attribute) {
        attributes_.push_back(attribute);
        return *this;
    }

    const std::vector<vk::VertexInputBindingDescription>& getBindings() const { return bindings_; }
    const std::vector<vk::VertexInputAttributeDescription>& getAttributes() const { return attributes_; }

private:
    std::vector<vk::VertexInputBindingDescription> bindings_;
    std::vector<vk::VertexInputAttributeDescription> attributes_;
};
