#pragma once

#include <vulkan/vulkan.hpp>
#include <cstdint>

// Pipeline barriers recorded around uploads and the per-frame instance copy.
// Buffer hazards use global memory barriers; only texture uploads transition images.

namespace Barriers {

inline void memory(vk::CommandBuffer cmd,
                   vk::PipelineStageFlags srcStage, vk::AccessFlags srcAccess,
                   vk::PipelineStageFlags dstStage, vk::AccessFlags dstAccess) {
    cmd.pipelineBarrier(srcStage, dstStage, {}, vk::MemoryBarrier{srcAccess, dstAccess}, {}, {});
}

// Instance copy -> this frame's draws
inline void transferToVertexInput(vk::CommandBuffer cmd) {
    memory(cmd,
           vk::PipelineStageFlagBits::eTransfer, vk::AccessFlagBits::eTransferWrite,
           vk::PipelineStageFlagBits::eVertexInput, vk::AccessFlagBits::eVertexAttributeRead);
}

// Earlier frames' draws -> the copy that overwrites their instance data
inline void vertexInputToTransfer(vk::CommandBuffer cmd) {
    memory(cmd,
           vk::PipelineStageFlagBits::eVertexInput, vk::AccessFlagBits::eVertexAttributeRead,
           vk::PipelineStageFlagBits::eTransfer, vk::AccessFlagBits::eTransferWrite);
}

// Static buffer upload -> any later read as vertices, indices or uniforms
inline void transferToShaderRead(vk::CommandBuffer cmd) {
    memory(cmd,
           vk::PipelineStageFlagBits::eTransfer, vk::AccessFlagBits::eTransferWrite,
           vk::PipelineStageFlagBits::eVertexInput | vk::PipelineStageFlagBits::eVertexShader |
               vk::PipelineStageFlagBits::eFragmentShader,
           vk::AccessFlagBits::eVertexAttributeRead | vk::AccessFlagBits::eIndexRead |
               vk::AccessFlagBits::eUniformRead | vk::AccessFlagBits::eShaderRead);
}

inline void transition(vk::CommandBuffer cmd, vk::Image image,
                       vk::ImageLayout from, vk::ImageLayout to,
                       vk::PipelineStageFlags srcStage, vk::AccessFlags srcAccess,
                       vk::PipelineStageFlags dstStage, vk::AccessFlags dstAccess) {
    const vk::ImageSubresourceRange colorLevel0{vk::ImageAspectFlagBits::eColor, 0, 1, 0, 1};
    cmd.pipelineBarrier(srcStage, dstStage, {}, {}, {},
        vk::ImageMemoryBarrier{srcAccess, dstAccess, from, to,
                               VK_QUEUE_FAMILY_IGNORED, VK_QUEUE_FAMILY_IGNORED, image, colorLevel0});
}

// Whole single-mip color image from a tightly packed staging buffer,
// left in SHADER_READ_ONLY_OPTIMAL for fragment sampling
inline void copyBufferToImage(vk::CommandBuffer cmd, vk::Buffer staging, vk::Image image,
                              uint32_t width, uint32_t height) {
    transition(cmd, image, vk::ImageLayout::eUndefined, vk::ImageLayout::eTransferDstOptimal,
               vk::PipelineStageFlagBits::eTopOfPipe, {},
               vk::PipelineStageFlagBits::eTransfer, vk::AccessFlagBits::eTransferWrite);

    const vk::BufferImageCopy region{0, 0, 0,
        vk::ImageSubresourceLayers{vk::ImageAspectFlagBits::eColor, 0, 0, 1},
        vk::Offset3D{0, 0, 0}, vk::Extent3D{width, height, 1}};
    cmd.copyBufferToImage(staging, image, vk::ImageLayout::eTransferDstOptimal, region);

    transition(cmd, image, vk::ImageLayout::eTransferDstOptimal, vk::ImageLayout::eShaderReadOnlyOptimal,
               vk::PipelineStageFlagBits::eTransfer, vk::AccessFlagBits::eTransferWrite,
               vk::PipelineStageFlagBits::eFragmentShader, vk::AccessFlagBits::eShaderRead);
}

}
