#pragma once

#include "shaders/bindings.h"
#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <optional>
#include <vector>
#include <SDL3/SDL_log.h>

/**
 * DescriptorSetLayoutBuilder - Descriptor set layout plus the pool sizes for it
 *
 * Every layout the renderer uses is one of the stereotypes below, so the
 * binding numbers come from shaders/bindings.h and nowhere else:
 *
 *   auto material = DescriptorSetLayoutBuilder::material();
 *   auto layout = material.build(device);
 *   auto pool = createDescriptorPool(device, material, maxSprites);
 */
class DescriptorSetLayoutBuilder {
public:
    static constexpr vk::ShaderStageFlags VertexStage = vk::ShaderStageFlagBits::eVertex;
    static constexpr vk::ShaderStageFlags FragmentStage = vk::ShaderStageFlagBits::eFragment;

    DescriptorSetLayoutBuilder() = default;

    DescriptorSetLayoutBuilder& add(uint32_t binding, vk::DescriptorType type, vk::ShaderStageFlags stages) {
        bindings_.push_back(vk::DescriptorSetLayoutBinding{}
            .setBinding(binding)
            .setDescriptorType(type)
            .setDescriptorCount(1)
            .setStageFlags(stages));
        return *this;
    }

    // ========================================================================
    // Stereotypes
    // ========================================================================

    // Set 0 of the sprite and model passes: screen or camera uniforms
    static DescriptorSetLayoutBuilder frameUniforms(vk::ShaderStageFlags stages = VertexStage) {
        DescriptorSetLayoutBuilder builder;
        builder.add(BINDING_FRAME_UBO, vk::DescriptorType::eUniformBuffer, stages);
        return builder;
    }

    // Set 1: one sprite texture or mesh base color, sampled in the fragment stage
    static DescriptorSetLayoutBuilder material() {
        DescriptorSetLayoutBuilder builder;
        builder.add(BINDING_MATERIAL_TEXTURE, vk::DescriptorType::eCombinedImageSampler, FragmentStage);
        return builder;
    }

    // Post-process set 0: the offscreen scene color and its parameters
    static DescriptorSetLayoutBuilder postProcessInput() {
        DescriptorSetLayoutBuilder builder;
        builder.add(BINDING_POST_SCENE_COLOR, vk::DescriptorType::eCombinedImageSampler, FragmentStage)
               .add(BINDING_POST_UBO, vk::DescriptorType::eUniformBuffer, FragmentStage);
        return builder;
    }

    std::optional<vk::raii::DescriptorSetLayout> build(const vk::raii::Device& device) const {
        try {
            return vk::raii::DescriptorSetLayout(device, vk::DescriptorSetLayoutCreateInfo{}.setBindings(bindings_));
        } catch (const vk::SystemError& e) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                "DescriptorSetLayoutBuilder: Failed to create layout: %s", e.what());
            return std::nullopt;
        }
    }

    // One entry per binding, sized for maxSets sets of this layout
    std::vector<vk::DescriptorPoolSize> poolSizes(uint32_t maxSets) const {
        std::vector<vk::DescriptorPoolSize> sizes;
        sizes.reserve(bindings_.size());
        for (const auto& binding : bindings_) {
            sizes.emplace_back(binding.descriptorType, binding.descriptorCount * maxSets);
        }
        return sizes;
    }

    const std::vector<vk::DescriptorSetLayoutBinding>& getBindings() const { return bindings_; }

private:
    std::vector<vk::DescriptorSetLayoutBinding> bindings_;
};

/**
 * Pool for maxSets sets of one layout. FREE_DESCRIPTOR_SET is set because
 * every set is owned by a vk::raii::DescriptorSet that frees itself.
 */
inline std::optional<vk::raii::DescriptorPool> createDescriptorPool(
        const vk::raii::Device& device,
        const DescriptorSetLayoutBuilder& layout,
        uint32_t maxSets) {
    auto sizes = layout.poolSizes(maxSets);
    try {
        return vk::raii::DescriptorPool(device, vk::DescriptorPoolCreateInfo{}
            .setFlags(vk::DescriptorPoolCreateFlagBits::eFreeDescriptorSet)
            .setMaxSets(maxSets)
            .setPoolSizes(sizes));
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "createDescriptorPool: Failed to create pool for %u sets: %s", maxSets, e.what());
        return std::nullopt;
    }
}

// nullopt when the pool is exhausted
inline std::optional<vk::raii::DescriptorSet> allocateDescriptorSet(
        const vk::raii::Device& device,
        const vk::raii::DescriptorPool& pool,
        const vk::raii::DescriptorSetLayout& layout) {
    vk::DescriptorSetLayout rawLayout = *layout;
    try {
        vk::raii::DescriptorSets sets(device, vk::DescriptorSetAllocateInfo{}
            .setDescriptorPool(*pool)
            .setSetLayouts(rawLayout));
        return std::move(sets.front());
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "allocateDescriptorSet: Failed: %s", e.what());
        return std::nullopt;
    }
}
