#pragma once

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <optional>
#include <SDL3/SDL_log.h>

// Every sampler the renderer creates is one of these
enum class SamplerKind {
    Sprite,      // Nearest, clamp: texels stay crisp at integer scales
    SceneColor,  // Linear, clamp: offscreen target read by the post pass
    Material     // Linear, repeat: glTF base color
};

namespace Samplers {

inline vk::SamplerCreateInfo createInfo(SamplerKind kind) {
    const bool nearest = kind == SamplerKind::Sprite;
    const vk::Filter filter = nearest ? vk::Filter::eNearest : vk::Filter::eLinear;
    const vk::SamplerAddressMode address = kind == SamplerKind::Material
        ? vk::SamplerAddressMode::eRepeat
        : vk::SamplerAddressMode::eClampToEdge;

    // Single-level images, so LOD is pinned to 0
    return vk::SamplerCreateInfo{}
        .setMagFilter(filter)
        .setMinFilter(filter)
        .setMipmapMode(nearest ? vk::SamplerMipmapMode::eNearest : vk::SamplerMipmapMode::eLinear)
        .setAddressModeU(address)
        .setAddressModeV(address)
        .setAddressModeW(address)
        .setMaxAnisotropy(1.0f)
        .setMinLod(0.0f)
        .setMaxLod(0.0f)
        .setBorderColor(vk::BorderColor::eIntOpaqueBlack);
}

inline bool create(const vk::raii::Device& device, SamplerKind kind, std::optional<vk::raii::Sampler>& out) {
    try {
        out.emplace(device, createInfo(kind));
        return true;
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Samplers: Failed to create sampler: %s", e.what());
        return false;
    }
}

}
