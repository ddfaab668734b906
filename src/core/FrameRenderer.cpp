#include "FrameRenderer.h"
#include "VulkanContext.h"
#include "SpriteAssetManager.h"
#include "ModelAssetManager.h"
#include "CommandResolver.h"
#include "DrawBatcher.h"
#include <SDL3/SDL_log.h>
#include <initializer_list>

FrameRenderer::~FrameRenderer() {
    destroy();
}

bool FrameRenderer::init(VulkanContext& context, const SpriteAssetManager& sprites, const ModelAssetManager& models,
                         const RendererConfig& config, const std::string& shaderDir, float scaleFactor) {
    context_ = &context;
    sprites_ = &sprites;
    models_ = &models;
    scaleFactor_ = scaleFactor;
    recreateSwapchain_ = false;

    if (!sync_.init(context.getRaiiDevice(), FrameSlots::MAX_FRAMES_IN_FLIGHT, context.getSwapchainImageCount())) {
        destroy();
        return false;
    }

    if (!spriteInstances_.init(context.memory(), FrameSlots::MAX_FRAMES_IN_FLIGHT) ||
        !modelInstances_.init(context.memory(), FrameSlots::MAX_FRAMES_IN_FLIGHT)) {
        destroy();
        return false;
    }

    modelPass_ = std::make_unique<ModelPass>(shaderDir, models.materialLayout(), config.clearColor);
    postPass_ = std::make_unique<PostProcessPass>(shaderDir, *modelPass_, config.exposure, config.vignette);
    spritePass_ = std::make_unique<SpritePass>(shaderDir, sprites.materialLayout());

    PassContext passContext = makePassContext();
    for (IRenderPass* pass : {static_cast<IRenderPass*>(modelPass_.get()),
                              static_cast<IRenderPass*>(postPass_.get()),
                              static_cast<IRenderPass*>(spritePass_.get())}) {
        if (!pass->onDeviceReady(passContext)) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameRenderer: %s failed to initialize", pass->name());
            destroy();
            return false;
        }
    }

    SDL_Log("FrameRenderer: ready (%ux%u, scale %.2f)",
        passContext.extent.width, passContext.extent.height, scaleFactor_);
    return true;
}

void FrameRenderer::destroy() {
    // Sprite pass first: reverse of creation, and post holds a reference to the model pass
    spritePass_.reset();
    postPass_.reset();
    modelPass_.reset();
    modelInstances_.destroy();
    spriteInstances_.destroy();
    sync_.destroy();
    context_ = nullptr;
    sprites_ = nullptr;
    models_ = nullptr;
}

PassContext FrameRenderer::makePassContext() const {
    PassContext passContext;
    passContext.device = &context_->getRaiiDevice();
    passContext.memory = &context_->memory();
    passContext.swapchainFormat = context_->getSwapchainImageFormat();
    passContext.extent = context_->getSwapchainExtent();
    passContext.swapchainViews = &context_->getSwapchainImageViews();
    passContext.scaleFactor = scaleFactor_;
    passContext.frameCount = FrameSlots::MAX_FRAMES_IN_FLIGHT;
    return passContext;
}

bool FrameRenderer::onSwapchainRecreated(float scaleFactor) {
    scaleFactor_ = scaleFactor;
    recreateSwapchain_ = false;
    sync_.markIdle();
    sync_.resizeImages(context_->getSwapchainImageCount());

    // Model pass first: post-process reads its new scene color view
    PassContext passContext = makePassContext();
    if (!modelPass_->onResized(passContext) ||
        !postPass_->onResized(passContext) ||
        !spritePass_->onResized(passContext)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameRenderer: Failed to resize passes");
        return false;
    }
    return true;
}

FrameResult FrameRenderer::toFrameResult(vk::Result result) {
    switch (result) {
        case vk::Result::eSuccess: return FrameResult::Success;
        case vk::Result::eErrorDeviceLost: return FrameResult::DeviceLost;
        case vk::Result::eErrorSurfaceLostKHR: return FrameResult::SurfaceLost;
        case vk::Result::eErrorOutOfDateKHR: return FrameResult::SwapchainOutOfDate;
        default: return FrameResult::SubmitFailed;
    }
}

FrameResult FrameRenderer::toFatalFrameResult(vk::Result result) {
    FrameResult mapped = toFrameResult(result);
    return isFatal(mapped) ? mapped : FrameResult::SubmitFailed;
}

// ============================================================================
// Frame
// ============================================================================

FrameResult FrameRenderer::render(const RenderQueue& queue) {
    if (!context_) {
        return FrameResult::Skipped;
    }

    vk::Extent2D extent = context_->getSwapchainExtent();
    if (extent.width == 0 || extent.height == 0) {
        return FrameResult::Skipped;
    }

    vk::Result waitResult = sync_.waitForCurrentFrame();
    if (waitResult != vk::Result::eSuccess) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameRenderer: Fence wait failed: %s",
            vk::to_string(waitResult).c_str());
        return toFrameResult(waitResult);
    }

    const uint32_t slot = sync_.currentIndex();
    spriteInstances_.releaseRetired(slot);
    modelInstances_.releaseRetired(slot);

    uint32_t imageIndex = 0;
    FrameResult acquireResult = acquire(imageIndex);
    if (acquireResult != FrameResult::Success) {
        return acquireResult;
    }

    // imageAvailable now has a pending signal that only the submit below waits
    // on. Every early return from here to the submit is fatal.
    waitResult = sync_.waitForImage(imageIndex);
    if (waitResult != vk::Result::eSuccess) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameRenderer: Image %u wait failed: %s",
            imageIndex, vk::to_string(waitResult).c_str());
        return toFatalFrameResult(waitResult);
    }

    vk::CommandBuffer cmd = context_->getCommandBuffer(slot);
    try {
        cmd.reset();
        cmd.begin(vk::CommandBufferBeginInfo{}.setFlags(vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameRenderer: Failed to begin command buffer: %s", e.what());
        return FrameResult::SubmitFailed;
    }

    stats_ = FrameStats{};

    // Instance copies are recorded before any render pass begins
    AllocationResult allocation = prepareModels(cmd, slot, queue);
    if (allocation == AllocationResult::Success) {
        allocation = prepareSprites(cmd, slot, queue);
    }
    if (allocation != AllocationResult::Success) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameRenderer: Instance upload failed: %s",
            MemoryTypes::toString(allocation));
        return FrameResult::AllocationFailed;
    }

    FrameInfo frame{slot, imageIndex};
    modelPass_->record(cmd, frame);
    postPass_->record(cmd, frame);
    spritePass_->record(cmd, frame);

    stats_.modelDraws = modelPass_->lastDrawCount();
    stats_.spriteDraws = spritePass_->lastDrawCount();

    try {
        cmd.end();
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameRenderer: Failed to end command buffer: %s", e.what());
        return FrameResult::SubmitFailed;
    }

    SDL_LogVerbose(SDL_LOG_CATEGORY_APPLICATION,
        "FrameRenderer: slot %u image %u, %u sprites in %u draws, %u models in %u draws, %u dropped",
        slot, imageIndex, stats_.spriteInstances, stats_.spriteDraws,
        stats_.modelInstances, stats_.modelDraws, stats_.droppedCommands);

    return submitAndPresent(cmd, imageIndex);
}

FrameResult FrameRenderer::acquire(uint32_t& imageIndex) {
    // Finite timeout so an unavailable surface does not stall the event loop
    constexpr uint64_t acquireTimeoutNs = 100'000'000;

    vk::Device device = context_->getDevice();
    try {
        auto result = device.acquireNextImageKHR(context_->getSwapchain(), acquireTimeoutNs,
                                                 sync_.currentImageAvailable(), nullptr);
        if (result.result == vk::Result::eTimeout || result.result == vk::Result::eNotReady) {
            return FrameResult::Skipped;
        }
        if (result.result == vk::Result::eSuboptimalKHR) {
            recreateSwapchain_ = true;
        }
        imageIndex = result.value;
    } catch (const vk::OutOfDateKHRError&) {
        recreateSwapchain_ = true;
        return FrameResult::SwapchainOutOfDate;
    } catch (const vk::SurfaceLostKHRError&) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameRenderer: Surface lost during acquire");
        return FrameResult::SurfaceLost;
    } catch (const vk::DeviceLostError&) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameRenderer: Device lost during acquire");
        return FrameResult::DeviceLost;
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameRenderer: Failed to acquire swapchain image: %s", e.what());
        return FrameResult::AcquireFailed;
    }
    return FrameResult::Success;
}

AllocationResult FrameRenderer::prepareSprites(vk::CommandBuffer cmd, uint32_t slot, const RenderQueue& queue) {
    auto resolved = resolveCommands<SpriteGpuResource>(queue.sprites,
        [this](const AssetId& id) { return sprites_->get(id); });
    stats_.droppedCommands += static_cast<uint32_t>(resolved.dropped);

    spriteRecords_.clear();
    spriteKeys_.clear();
    for (const auto& entry : resolved.commands) {
        spriteRecords_.push_back(makeSpriteInstance(entry.resource->size, entry.command->transform,
                                                    entry.command->alpha));
        spriteKeys_.push_back(entry.resource->set());
    }

    const auto count = static_cast<uint32_t>(spriteRecords_.size());
    auto result = spriteInstances_.upload(cmd, slot, spriteRecords_.data(), count);
    if (result != AllocationResult::Success) {
        return result;
    }

    stats_.spriteInstances = count;
    spritePass_->setFrameData(spriteInstances_.buffer(), DrawBatcher::buildBatches(spriteKeys_));
    return AllocationResult::Success;
}

AllocationResult FrameRenderer::prepareModels(vk::CommandBuffer cmd, uint32_t slot, const RenderQueue& queue) {
    auto resolved = resolveCommands<ModelGpuResource>(queue.models,
        [this](const AssetId& id) { return models_->get(id); });
    stats_.droppedCommands += static_cast<uint32_t>(resolved.dropped);

    modelRecords_.clear();
    modelKeys_.clear();
    for (const auto& entry : resolved.commands) {
        modelRecords_.push_back(makeModelInstance(entry.command->transform, entry.command->alpha));
        modelKeys_.push_back(entry.resource);
    }

    const auto count = static_cast<uint32_t>(modelRecords_.size());
    auto result = modelInstances_.upload(cmd, slot, modelRecords_.data(), count);
    if (result != AllocationResult::Success) {
        return result;
    }

    stats_.modelInstances = count;
    modelPass_->setFrameData(modelInstances_.buffer(), DrawBatcher::buildBatches(modelKeys_), queue.viewProjection);
    return AllocationResult::Success;
}

FrameResult FrameRenderer::submitAndPresent(vk::CommandBuffer cmd, uint32_t imageIndex) {
    vk::Semaphore waitSemaphores[] = {sync_.currentImageAvailable()};
    vk::PipelineStageFlags waitStages[] = {vk::PipelineStageFlagBits::eColorAttachmentOutput};
    vk::Semaphore signalSemaphores[] = {sync_.currentRenderFinished()};

    auto submitInfo = vk::SubmitInfo{}
        .setWaitSemaphores(waitSemaphores)
        .setWaitDstStageMask(waitStages)
        .setCommandBuffers(cmd)
        .setSignalSemaphores(signalSemaphores);

    try {
        sync_.resetCurrentFence();
        context_->getGraphicsQueue().submit(submitInfo, sync_.currentFence());
    } catch (const vk::DeviceLostError&) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameRenderer: Device lost during queue submit");
        return FrameResult::DeviceLost;
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameRenderer: Failed to submit command buffer: %s", e.what());
        return FrameResult::SubmitFailed;
    }
    sync_.markSubmitted();

    vk::SwapchainKHR swapchains[] = {context_->getSwapchain()};
    auto presentInfo = vk::PresentInfoKHR{}
        .setWaitSemaphores(signalSemaphores)
        .setSwapchains(swapchains)
        .setImageIndices(imageIndex);

    // The slot advances whatever present says: the submission already happened
    FrameResult result = FrameResult::Success;
    try {
        if (context_->getPresentQueue().presentKHR(presentInfo) == vk::Result::eSuboptimalKHR) {
            recreateSwapchain_ = true;
        }
    } catch (const vk::OutOfDateKHRError&) {
        recreateSwapchain_ = true;
        result = FrameResult::SwapchainOutOfDate;
    } catch (const vk::SurfaceLostKHRError&) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameRenderer: Surface lost during present");
        result = FrameResult::SurfaceLost;
    } catch (const vk::DeviceLostError&) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameRenderer: Device lost during present");
        result = FrameResult::DeviceLost;
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameRenderer: Failed to present: %s", e.what());
        result = FrameResult::SubmitFailed;
    }

    sync_.advance();
    return result;
}
