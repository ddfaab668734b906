#include "SpritePass.h"
#include "MemoryAllocator.h"
#include "RenderPasses.h"
#include "Framebuffers.h"
#include "DescriptorSetLayoutBuilder.h"
#include "DescriptorWriter.h"
#include "VertexInputBuilder.h"
#include "GraphicsPipelineFactory.h"
#include "CommandBufferUtils.h"
#include "shaders/bindings.h"
#include <SDL3/SDL_log.h>
#include <array>
#include <cstddef>

SpritePass::SpritePass(std::string shaderDir, vk::DescriptorSetLayout materialLayout)
    : shaderDir_(std::move(shaderDir)), materialLayout_(materialLayout) {}

SpritePass::~SpritePass() {
    onDeviceLost();
}

bool SpritePass::onDeviceReady(const PassContext& context) {
    device_ = context.device;

    if (!RenderPasses::createSprite(*device_, context.swapchainFormat, renderPass_)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SpritePass: Failed to create render pass");
        return false;
    }
    if (!createScreenUniforms(context)) return false;
    if (!createFramebuffers(context)) return false;
    if (!createPipeline()) return false;
    if (!createQuadBuffers(context)) return false;

    writeScreenUniforms(context);
    return true;
}

void SpritePass::onDeviceLost() {
    batches_.clear();
    instanceBuffer_ = nullptr;
    quadIndices_.reset();
    quadVertices_.reset();
    pipeline_.reset();
    pipelineLayout_.reset();
    screenSet_.reset();
    screenPool_.reset();
    screenLayout_.reset();
    screenBuffer_.reset();
    framebuffers_.clear();
    renderPass_.reset();
    device_ = nullptr;
}

bool SpritePass::onResized(const PassContext& context) {
    framebuffers_.clear();
    if (!createFramebuffers(context)) {
        return false;
    }
    writeScreenUniforms(context);
    return true;
}

bool SpritePass::createScreenUniforms(const PassContext& context) {
    auto result = context.memory->createPersistentBuffer(sizeof(ScreenUniforms),
                                                         vk::BufferUsageFlagBits::eUniformBuffer,
                                                         MemoryPolicy::CpuToGpu, screenBuffer_);
    if (result != AllocationResult::Success) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SpritePass: Screen uniform buffer failed: %s",
            MemoryTypes::toString(result));
        return false;
    }

    auto layoutBuilder = DescriptorSetLayoutBuilder::frameUniforms();
    screenLayout_ = layoutBuilder.build(*device_);
    if (!screenLayout_) return false;

    screenPool_ = createDescriptorPool(*device_, layoutBuilder, 1);
    if (!screenPool_) return false;

    screenSet_ = allocateDescriptorSet(*device_, *screenPool_, *screenLayout_);
    if (!screenSet_) return false;

    DescriptorWriter()
        .uniformBuffer(BINDING_FRAME_UBO, screenBuffer_.handle(), sizeof(ScreenUniforms))
        .update(*device_, **screenSet_);
    return true;
}

bool SpritePass::createFramebuffers(const PassContext& context) {
    extent_ = context.extent;
    if (!Framebuffers::createPerImage(*device_, **renderPass_, context.extent, *context.swapchainViews, framebuffers_)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SpritePass: Failed to create framebuffers");
        return false;
    }
    return true;
}

void SpritePass::writeScreenUniforms(const PassContext& context) {
    ScreenUniforms uniforms{};
    uniforms.resolution = glm::vec2(static_cast<float>(context.extent.width),
                                    static_cast<float>(context.extent.height));
    uniforms.scaleFactor = context.scaleFactor;

    ScopedMapping mapping(screenBuffer_);
    if (!mapping || !mapping.write(&uniforms, 1)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SpritePass: Failed to write screen uniforms");
    }
}

bool SpritePass::createPipeline() {
    if (!GraphicsPipelineFactory::createLayout(*device_, {**screenLayout_, materialLayout_}, pipelineLayout_)) {
        return false;
    }

    auto vertexInput = VertexInputBuilder::instanced<QuadVertex, SpriteInstance>()
        .addAttribute(AttributeBuilder::vec2(LOC_SPRITE_POSITION, offsetof(QuadVertex, position)))
        .addAttribute(AttributeBuilder::vec2(LOC_SPRITE_TEXCOORD, offsetof(QuadVertex, texCoord)))
        .addAttribute(AttributeBuilder::vec2(LOC_SPRITE_SIZE, offsetof(SpriteInstance, size), INSTANCE_BINDING))
        .addAttribute(AttributeBuilder::vec3(LOC_SPRITE_TRANSFORM, offsetof(SpriteInstance, column0), INSTANCE_BINDING))
        .addAttribute(AttributeBuilder::vec3(LOC_SPRITE_TRANSFORM + 1, offsetof(SpriteInstance, column1), INSTANCE_BINDING))
        .addAttribute(AttributeBuilder::vec3(LOC_SPRITE_TRANSFORM + 2, offsetof(SpriteInstance, column2), INSTANCE_BINDING))
        .addAttribute(AttributeBuilder::float1(LOC_SPRITE_ALPHA, offsetof(SpriteInstance, alpha), INSTANCE_BINDING));

    bool built = GraphicsPipelineFactory(*device_)
        .applyPreset(GraphicsPipelineFactory::Preset::Sprite2D)
        .setShaders(shaderDir_, "sprite")
        .setRenderPass(**renderPass_)
        .setPipelineLayout(**pipelineLayout_)
        .setVertexInput(vertexInput)
        .build(pipeline_);
    if (!built) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SpritePass: Failed to create pipeline (%s)", shaderDir_.c_str());
    }
    return built;
}

bool SpritePass::createQuadBuffers(const PassContext& context) {
    auto result = context.memory->createBufferWithData(UNIT_QUAD_VERTICES.data(), UNIT_QUAD_VERTICES.size(),
                                                       sizeof(QuadVertex), vk::BufferUsageFlagBits::eVertexBuffer,
                                                       MemoryPolicy::GpuOnly, quadVertices_);
    if (result == AllocationResult::Success) {
        result = context.memory->createBufferWithData(UNIT_QUAD_INDICES.data(), UNIT_QUAD_INDICES.size(),
                                                      sizeof(uint16_t), vk::BufferUsageFlagBits::eIndexBuffer,
                                                      MemoryPolicy::GpuOnly, quadIndices_);
    }
    if (result != AllocationResult::Success) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SpritePass: Quad buffers failed: %s",
            MemoryTypes::toString(result));
        return false;
    }
    return true;
}

void SpritePass::setFrameData(vk::Buffer instanceBuffer, std::vector<DrawBatch<vk::DescriptorSet>> batches) {
    instanceBuffer_ = instanceBuffer;
    batches_ = std::move(batches);
}

void SpritePass::record(vk::CommandBuffer cmd, const FrameInfo& frame) {
    lastDrawCount_ = 0;

    // The pass always runs: it moves the swapchain image to PRESENT_SRC
    RenderPassScope scope(cmd, **renderPass_, *framebuffers_.at(frame.imageIndex), extent_);

    if (batches_.empty() || !instanceBuffer_) {
        return;
    }

    cmd.bindPipeline(vk::PipelineBindPoint::eGraphics, **pipeline_);
    setViewportAndScissor(cmd, extent_);
    cmd.bindDescriptorSets(vk::PipelineBindPoint::eGraphics, **pipelineLayout_, SET_FRAME, **screenSet_, {});

    std::array<vk::Buffer, 2> vertexBuffers = {quadVertices_.handle(), instanceBuffer_};
    std::array<vk::DeviceSize, 2> offsets = {0, 0};
    cmd.bindVertexBuffers(VERTEX_BINDING, vertexBuffers, offsets);
    cmd.bindIndexBuffer(quadIndices_.handle(), 0, vk::IndexType::eUint16);

    for (const auto& batch : batches_) {
        cmd.bindDescriptorSets(vk::PipelineBindPoint::eGraphics, **pipelineLayout_, SET_MATERIAL, batch.key, {});
        cmd.drawIndexed(static_cast<uint32_t>(UNIT_QUAD_INDICES.size()), batch.instanceCount, 0, 0,
                        batch.firstInstance);
        ++lastDrawCount_;
    }
}
