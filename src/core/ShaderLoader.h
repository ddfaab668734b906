#pragma once

#include <vulkan/vulkan_raii.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// SPIR-V modules compiled by glslc at build time, loaded from the shader directory
namespace ShaderLoader {

// Whole file as 32-bit words; nullopt when unreadable, empty or not word-sized
std::optional<std::vector<uint32_t>> readSpirv(const std::string& path);

std::optional<vk::raii::ShaderModule> loadShaderModule(const vk::raii::Device& device, const std::string& path);

}
