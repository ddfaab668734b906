#include "ModelPass.h"
#include "ModelAssetManager.h"
#include "MemoryAllocator.h"
#include "Texture.h"
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

ModelPass::ModelPass(std::string shaderDir, vk::DescriptorSetLayout materialLayout, const glm::vec4& clearColor)
    : shaderDir_(std::move(shaderDir)), materialLayout_(materialLayout), clearColor_(clearColor) {}

ModelPass::~ModelPass() {
    onDeviceLost();
}

bool ModelPass::onDeviceReady(const PassContext& context) {
    device_ = context.device;

    if (!RenderPasses::createScene(*device_, SCENE_COLOR_FORMAT, DEPTH_FORMAT, renderPass_)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelPass: Failed to create render pass");
        return false;
    }
    if (!createTargets(context)) return false;
    if (!createCameraSlots(context)) return false;
    return createPipeline();
}

void ModelPass::onDeviceLost() {
    batches_.clear();
    instanceBuffer_ = nullptr;
    pipeline_.reset();
    pipelineLayout_.reset();
    cameraSlots_.clear();
    cameraPool_.reset();
    cameraLayout_.reset();
    destroyTargets();
    renderPass_.reset();
    device_ = nullptr;
}

bool ModelPass::onResized(const PassContext& context) {
    destroyTargets();
    return createTargets(context);
}

// ============================================================================
// Render targets
// ============================================================================

bool ModelPass::createTargets(const PassContext& context) {
    extent_ = context.extent;

    auto imageInfo = vk::ImageCreateInfo{}
        .setImageType(vk::ImageType::e2D)
        .setFormat(SCENE_COLOR_FORMAT)
        .setExtent(vk::Extent3D{extent_.width, extent_.height, 1})
        .setMipLevels(1)
        .setArrayLayers(1)
        .setSamples(vk::SampleCountFlagBits::e1)
        .setTiling(vk::ImageTiling::eOptimal)
        .setUsage(vk::ImageUsageFlagBits::eColorAttachment | vk::ImageUsageFlagBits::eSampled)
        .setSharingMode(vk::SharingMode::eExclusive)
        .setInitialLayout(vk::ImageLayout::eUndefined);

    auto result = context.memory->createImage(imageInfo, MemoryPolicy::GpuOnly, sceneColor_);
    if (result != AllocationResult::Success) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelPass: Scene color image failed: %s",
            MemoryTypes::toString(result));
        return false;
    }

    imageInfo.setFormat(DEPTH_FORMAT)
        .setUsage(vk::ImageUsageFlagBits::eDepthStencilAttachment);
    result = context.memory->createImage(imageInfo, MemoryPolicy::GpuOnly, depth_);
    if (result != AllocationResult::Success) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelPass: Depth image failed: %s",
            MemoryTypes::toString(result));
        return false;
    }

    sceneColorView_ = createImageView2D(*device_, sceneColor_.handle(), SCENE_COLOR_FORMAT);
    depthView_ = createImageView2D(*device_, depth_.handle(), DEPTH_FORMAT, vk::ImageAspectFlagBits::eDepth);
    if (!sceneColorView_ || !depthView_) {
        return false;
    }

    return Framebuffers::create(*device_, **renderPass_, extent_, {**sceneColorView_, **depthView_}, framebuffer_);
}

void ModelPass::destroyTargets() {
    framebuffer_.reset();
    depthView_.reset();
    sceneColorView_.reset();
    depth_.reset();
    sceneColor_.reset();
}

// ============================================================================
// Camera uniforms and pipeline
// ============================================================================

bool ModelPass::createCameraSlots(const PassContext& context) {
    auto layoutBuilder = DescriptorSetLayoutBuilder::frameUniforms();
    cameraLayout_ = layoutBuilder.build(*device_);
    if (!cameraLayout_) return false;

    cameraPool_ = createDescriptorPool(*device_, layoutBuilder, context.frameCount);
    if (!cameraPool_) return false;

    cameraSlots_.clear();
    cameraSlots_.reserve(context.frameCount);
    for (uint32_t i = 0; i < context.frameCount; ++i) {
        CameraSlot slot;
        auto result = context.memory->createPersistentBuffer(sizeof(CameraUniforms),
                                                             vk::BufferUsageFlagBits::eUniformBuffer,
                                                             MemoryPolicy::CpuToGpu, slot.buffer);
        if (result != AllocationResult::Success) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelPass: Camera buffer %u failed: %s",
                i, MemoryTypes::toString(result));
            return false;
        }

        slot.set = allocateDescriptorSet(*device_, *cameraPool_, *cameraLayout_);
        if (!slot.set) return false;

        DescriptorWriter()
            .uniformBuffer(BINDING_FRAME_UBO, slot.buffer.handle(), sizeof(CameraUniforms))
            .update(*device_, **slot.set);
        cameraSlots_.push_back(std::move(slot));
    }
    return true;
}

bool ModelPass::createPipeline() {
    if (!GraphicsPipelineFactory::createLayout(*device_, {**cameraLayout_, materialLayout_}, pipelineLayout_)) {
        return false;
    }

    const uint32_t modelOffset = offsetof(ModelInstance, model);
    const uint32_t column = sizeof(glm::vec4);
    auto vertexInput = VertexInputBuilder::instanced<ModelVertex, ModelInstance>()
        .addAttribute(AttributeBuilder::vec3(LOC_MODEL_POSITION, offsetof(ModelVertex, position)))
        .addAttribute(AttributeBuilder::vec3(LOC_MODEL_NORMAL, offsetof(ModelVertex, normal)))
        .addAttribute(AttributeBuilder::vec2(LOC_MODEL_TEXCOORD, offsetof(ModelVertex, texCoord)))
        .addAttribute(AttributeBuilder::vec4(LOC_MODEL_TRANSFORM, modelOffset, INSTANCE_BINDING))
        .addAttribute(AttributeBuilder::vec4(LOC_MODEL_TRANSFORM + 1, modelOffset + column, INSTANCE_BINDING))
        .addAttribute(AttributeBuilder::vec4(LOC_MODEL_TRANSFORM + 2, modelOffset + 2 * column, INSTANCE_BINDING))
        .addAttribute(AttributeBuilder::vec4(LOC_MODEL_TRANSFORM + 3, modelOffset + 3 * column, INSTANCE_BINDING))
        .addAttribute(AttributeBuilder::float1(LOC_MODEL_ALPHA, offsetof(ModelInstance, alpha), INSTANCE_BINDING));

    bool built = GraphicsPipelineFactory(*device_)
        .applyPreset(GraphicsPipelineFactory::Preset::Default)
        .setShaders(shaderDir_, "model")
        .setRenderPass(**renderPass_)
        .setPipelineLayout(**pipelineLayout_)
        .setVertexInput(vertexInput)
        .build(pipeline_);
    if (!built) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelPass: Failed to create pipeline (%s)", shaderDir_.c_str());
    }
    return built;
}

// ============================================================================
// Recording
// ============================================================================

void ModelPass::setFrameData(vk::Buffer instanceBuffer,
                             std::vector<DrawBatch<const ModelGpuResource*>> batches,
                             const glm::mat4& viewProjection) {
    instanceBuffer_ = instanceBuffer;
    batches_ = std::move(batches);
    viewProjection_ = viewProjection;
}

void ModelPass::record(vk::CommandBuffer cmd, const FrameInfo& frame) {
    lastDrawCount_ = 0;

    RenderPassScope scope(cmd, **renderPass_, **framebuffer_, extent_,
        {RenderPassScope::color(clearColor_.r, clearColor_.g, clearColor_.b, clearColor_.a),
         RenderPassScope::depthOne()});

    if (batches_.empty() || !instanceBuffer_) {
        return;
    }

    // This slot's fence has been waited, so its camera buffer is free to overwrite
    CameraSlot& camera = cameraSlots_.at(frame.slot % cameraSlots_.size());
    CameraUniforms uniforms{viewProjection_};
    ScopedMapping mapping(camera.buffer);
    if (!mapping || !mapping.write(&uniforms, 1)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelPass: Failed to write camera uniforms");
        return;
    }

    cmd.bindPipeline(vk::PipelineBindPoint::eGraphics, **pipeline_);
    setViewportAndScissor(cmd, extent_);
    cmd.bindDescriptorSets(vk::PipelineBindPoint::eGraphics, **pipelineLayout_, SET_FRAME, **camera.set, {});

    for (const auto& batch : batches_) {
        for (const auto& mesh : batch.key->meshes) {
            std::array<vk::Buffer, 2> vertexBuffers = {mesh.vertexBuffer.handle(), instanceBuffer_};
            std::array<vk::DeviceSize, 2> offsets = {0, 0};
            cmd.bindVertexBuffers(VERTEX_BINDING, vertexBuffers, offsets);
            cmd.bindIndexBuffer(mesh.indexBuffer.handle(), 0, vk::IndexType::eUint32);
            cmd.bindDescriptorSets(vk::PipelineBindPoint::eGraphics, **pipelineLayout_, SET_MATERIAL, mesh.material, {});
            cmd.drawIndexed(mesh.indexCount, batch.instanceCount, 0, 0, batch.firstInstance);
            ++lastDrawCount_;
        }
    }
}
