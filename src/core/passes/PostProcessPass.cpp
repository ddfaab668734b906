#include "PostProcessPass.h"
#include "ModelPass.h"
#include "MemoryAllocator.h"
#include "RenderPasses.h"
#include "Framebuffers.h"
#include "DescriptorSetLayoutBuilder.h"
#include "DescriptorWriter.h"
#include "Samplers.h"
#include "GraphicsPipelineFactory.h"
#include "CommandBufferUtils.h"
#include "shaders/bindings.h"
#include <SDL3/SDL_log.h>

PostProcessPass::PostProcessPass(std::string shaderDir, const ModelPass& scene, float exposure, float vignette)
    : shaderDir_(std::move(shaderDir)), scene_(scene), uniforms_{exposure, vignette, glm::vec2(0.0f)} {}

PostProcessPass::~PostProcessPass() {
    onDeviceLost();
}

bool PostProcessPass::onDeviceReady(const PassContext& context) {
    device_ = context.device;

    if (!RenderPasses::createPost(*device_, context.swapchainFormat, renderPass_)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "PostProcessPass: Failed to create render pass");
        return false;
    }
    if (!Samplers::create(*device_, SamplerKind::SceneColor, sampler_)) {
        return false;
    }

    auto result = context.memory->createBufferWithData(&uniforms_, 1, sizeof(PostUniforms),
                                                       vk::BufferUsageFlagBits::eUniformBuffer,
                                                       MemoryPolicy::CpuToGpu, uniformBuffer_);
    if (result != AllocationResult::Success) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "PostProcessPass: Uniform buffer failed: %s",
            MemoryTypes::toString(result));
        return false;
    }

    auto layoutBuilder = DescriptorSetLayoutBuilder::postProcessInput();
    layout_ = layoutBuilder.build(*device_);
    if (!layout_) return false;
    pool_ = createDescriptorPool(*device_, layoutBuilder, 1);
    if (!pool_) return false;
    set_ = allocateDescriptorSet(*device_, *pool_, *layout_);
    if (!set_) return false;

    if (!writeDescriptors()) return false;
    if (!createFramebuffers(context)) return false;

    if (!GraphicsPipelineFactory::createLayout(*device_, {**layout_}, pipelineLayout_)) {
        return false;
    }

    bool built = GraphicsPipelineFactory(*device_)
        .applyPreset(GraphicsPipelineFactory::Preset::FullscreenQuad)
        .setShaders(shaderDir_, "post")
        .setRenderPass(**renderPass_)
        .setPipelineLayout(**pipelineLayout_)
        .build(pipeline_);
    if (!built) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "PostProcessPass: Failed to create pipeline (%s)", shaderDir_.c_str());
    }
    return built;
}

void PostProcessPass::onDeviceLost() {
    pipeline_.reset();
    pipelineLayout_.reset();
    set_.reset();
    pool_.reset();
    layout_.reset();
    uniformBuffer_.reset();
    sampler_.reset();
    framebuffers_.clear();
    renderPass_.reset();
    device_ = nullptr;
}

bool PostProcessPass::onResized(const PassContext& context) {
    framebuffers_.clear();
    return writeDescriptors() && createFramebuffers(context);
}

bool PostProcessPass::writeDescriptors() {
    vk::ImageView sceneColor = scene_.sceneColorView();
    if (!sceneColor) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "PostProcessPass: Scene color is not available");
        return false;
    }

    DescriptorWriter()
        .sampledImage(BINDING_POST_SCENE_COLOR, **sampler_, sceneColor)
        .uniformBuffer(BINDING_POST_UBO, uniformBuffer_.handle(), sizeof(PostUniforms))
        .update(*device_, **set_);
    return true;
}

bool PostProcessPass::createFramebuffers(const PassContext& context) {
    extent_ = context.extent;
    if (!Framebuffers::createPerImage(*device_, **renderPass_, context.extent, *context.swapchainViews, framebuffers_)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "PostProcessPass: Failed to create framebuffers");
        return false;
    }
    return true;
}

void PostProcessPass::record(vk::CommandBuffer cmd, const FrameInfo& frame) {
    RenderPassScope scope(cmd, **renderPass_, *framebuffers_.at(frame.imageIndex), extent_);

    cmd.bindPipeline(vk::PipelineBindPoint::eGraphics, **pipeline_);
    setViewportAndScissor(cmd, extent_);
    cmd.bindDescriptorSets(vk::PipelineBindPoint::eGraphics, **pipelineLayout_, SET_FRAME, **set_, {});
    cmd.draw(3, 1, 0, 0);
}
