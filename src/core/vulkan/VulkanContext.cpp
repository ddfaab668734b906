#include "VulkanContext.h"
#include <SDL3/SDL_vulkan.h>
#include <SDL3/SDL_log.h>
#include <cstdlib>

// Required for dynamic dispatch loader - only define in one .cpp file
VULKAN_HPP_DEFAULT_DISPATCH_LOADER_DYNAMIC_STORAGE

VulkanContext::~VulkanContext() {
    shutdown();
}

bool VulkanContext::init(SDL_Window* win, const RendererConfig& config, uint32_t frameCount) {
    window_ = win;
    config_ = config;

    if (!createInstance()) return false;
    if (!createSurface()) return false;
    if (!selectPhysicalDevice()) return false;
    if (!createLogicalDevice()) return false;
    if (!createAllocator()) return false;
    if (!createSwapchain(VK_NULL_HANDLE)) return false;
    if (!createCommandPoolAndBuffers(frameCount)) return false;

    memory_.init(allocator_, getDevice(), getPhysicalDevice(), getCommandPool(), getGraphicsQueue());
    return true;
}

void VulkanContext::shutdown() {
    if (device_ == VK_NULL_HANDLE) return;
    try {
        vk::Device(device_).waitIdle();
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VulkanContext: waitIdle failed: %s", e.what());
    }

    destroyCommandPoolAndBuffers();

    destroySwapchainViews();
    if (swapchain_ != VK_NULL_HANDLE) {
        vk::Device(device_).destroySwapchainKHR(swapchain_);
        swapchain_ = VK_NULL_HANDLE;
    }

    memory_.reset();
    if (allocator_ != VK_NULL_HANDLE) {
        vmaDestroyAllocator(allocator_);
        allocator_ = VK_NULL_HANDLE;
    }

    // Release handles from RAII wrappers before manual destruction
    // (vk-bootstrap owns the destruction order of the debug messenger)
    if (raiiDevice_) {
        raiiDevice_->release();
        raiiDevice_.reset();
    }
    raiiPhysicalDevice_.reset();
    if (raiiInstance_) {
        raiiInstance_->release();
        raiiInstance_.reset();
    }

    if (device_ != VK_NULL_HANDLE) {
        vk::Device(device_).destroy();
        device_ = VK_NULL_HANDLE;
    }

    if (surface_ != VK_NULL_HANDLE) {
        vk::Instance(instance_).destroySurfaceKHR(surface_);
        surface_ = VK_NULL_HANDLE;
    }

    if (instance_ != VK_NULL_HANDLE) {
        vkb::destroy_debug_utils_messenger(instance_, vkbInstance_.debug_messenger);
        vk::Instance(instance_).destroy();
        instance_ = VK_NULL_HANDLE;
    }

    graphicsQueue_ = VK_NULL_HANDLE;
    presentQueue_ = VK_NULL_HANDLE;
    physicalDevice_ = VK_NULL_HANDLE;
    window_ = nullptr;
}

bool VulkanContext::createInstance() {
    vkb::InstanceBuilder builder;

#ifdef NDEBUG
    bool enableValidation = false;
#else
    // Can be overridden via environment variable for profiling debug builds
    bool enableValidation = (std::getenv("DISABLE_VULKAN_VALIDATION") == nullptr);
#endif
    if (config_.validation.has_value()) {
        enableValidation = *config_.validation;
    }

    if (!enableValidation) {
        SDL_Log("Vulkan validation layers disabled");
    }

    auto instRet = builder.set_app_name("Kiln")
        .set_engine_name("Kiln")
        .request_validation_layers(enableValidation)
        .use_default_debug_messenger()
        .require_api_version(1, 2, 0)
        .build();

    if (!instRet) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VulkanContext: Failed to create instance: %s",
            instRet.error().message().c_str());
        return false;
    }

    vkbInstance_ = instRet.value();
    instance_ = vkbInstance_.instance;

    // Initialize vulkan-hpp dynamic dispatcher with instance-level functions
    VULKAN_HPP_DEFAULT_DISPATCHER.init(vk::Instance(instance_), vkGetInstanceProcAddr);

    raiiInstance_ = std::make_unique<vk::raii::Instance>(raiiContext_, instance_);
    return true;
}

bool VulkanContext::createSurface() {
    if (!SDL_Vulkan_CreateSurface(window_, instance_, nullptr, &surface_)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VulkanContext: Failed to create surface: %s", SDL_GetError());
        return false;
    }
    return true;
}

bool VulkanContext::selectPhysicalDevice() {
    vkb::PhysicalDeviceSelector selector{vkbInstance_};
    auto physRet = selector.set_minimum_version(1, 2)
        .set_surface(surface_)
        .prefer_gpu_device_type(vkb::PreferredDeviceType::discrete)
        .select();

    if (!physRet) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VulkanContext: Failed to select physical device: %s",
            physRet.error().message().c_str());
        return false;
    }

    vkbPhysicalDevice_ = physRet.value();
    physicalDevice_ = vkbPhysicalDevice_.physical_device;

    auto props = vk::PhysicalDevice(physicalDevice_).getProperties();
    SDL_Log("Selected physical device: %s (Vulkan %u.%u.%u)",
        props.deviceName.data(),
        VK_API_VERSION_MAJOR(props.apiVersion),
        VK_API_VERSION_MINOR(props.apiVersion),
        VK_API_VERSION_PATCH(props.apiVersion));

    // Physical devices aren't destroyed, the wrapper is non-owning
    raiiPhysicalDevice_ = std::make_unique<vk::raii::PhysicalDevice>(*raiiInstance_, physicalDevice_);
    return true;
}

bool VulkanContext::createLogicalDevice() {
    vkb::DeviceBuilder deviceBuilder{vkbPhysicalDevice_};
    auto devRet = deviceBuilder.build();

    if (!devRet) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VulkanContext: Failed to create logical device: %s",
            devRet.error().message().c_str());
        return false;
    }

    vkbDevice_ = devRet.value();
    device_ = vkbDevice_.device;

    // Initialize vulkan-hpp dynamic dispatcher with device-level functions
    VULKAN_HPP_DEFAULT_DISPATCHER.init(vk::Device(device_));

    raiiDevice_ = std::make_unique<vk::raii::Device>(*raiiPhysicalDevice_, device_);

    auto graphicsQueueRet = vkbDevice_.get_queue(vkb::QueueType::graphics);
    if (!graphicsQueueRet) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VulkanContext: Failed to get graphics queue");
        return false;
    }
    graphicsQueue_ = graphicsQueueRet.value();

    auto presentQueueRet = vkbDevice_.get_queue(vkb::QueueType::present);
    if (!presentQueueRet) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VulkanContext: Failed to get present queue");
        return false;
    }
    presentQueue_ = presentQueueRet.value();

    return true;
}

bool VulkanContext::createAllocator() {
    VmaVulkanFunctions vulkanFunctions{};
    vulkanFunctions.vkGetInstanceProcAddr = VULKAN_HPP_DEFAULT_DISPATCHER.vkGetInstanceProcAddr;
    vulkanFunctions.vkGetDeviceProcAddr = VULKAN_HPP_DEFAULT_DISPATCHER.vkGetDeviceProcAddr;

    VmaAllocatorCreateInfo allocatorInfo{};
    allocatorInfo.physicalDevice = physicalDevice_;
    allocatorInfo.device = device_;
    allocatorInfo.instance = instance_;
    allocatorInfo.vulkanApiVersion = VK_API_VERSION_1_2;
    allocatorInfo.pVulkanFunctions = &vulkanFunctions;

    if (vmaCreateAllocator(&allocatorInfo, &allocator_) != VK_SUCCESS) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VulkanContext: Failed to create VMA allocator");
        return false;
    }
    return true;
}

bool VulkanContext::createSwapchain(VkSwapchainKHR oldSwapchain) {
    vk::SurfaceCapabilitiesKHR surfaceCaps;
    try {
        surfaceCaps = vk::PhysicalDevice(physicalDevice_).getSurfaceCapabilitiesKHR(surface_);
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VulkanContext: Failed to query surface: %s", e.what());
        return false;
    }

    // Prefer OPAQUE to prevent compositor alpha blending
    VkCompositeAlphaFlagBitsKHR compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    if (!(surfaceCaps.supportedCompositeAlpha & vk::CompositeAlphaFlagBitsKHR::eOpaque)) {
        if (surfaceCaps.supportedCompositeAlpha & vk::CompositeAlphaFlagBitsKHR::eInherit) {
            compositeAlpha = VK_COMPOSITE_ALPHA_INHERIT_BIT_KHR;
        } else if (surfaceCaps.supportedCompositeAlpha & vk::CompositeAlphaFlagBitsKHR::ePreMultiplied) {
            compositeAlpha = VK_COMPOSITE_ALPHA_PRE_MULTIPLIED_BIT_KHR;
        }
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "VulkanContext: OPAQUE composite alpha not supported");
    }

    int pixelWidth = 0;
    int pixelHeight = 0;
    SDL_GetWindowSizeInPixels(window_, &pixelWidth, &pixelHeight);

    // One more image than the minimum; MAILBOX needs it to avoid blocking
    uint32_t imageCount = surfaceCaps.minImageCount + 1;
    if (surfaceCaps.maxImageCount > 0 && imageCount > surfaceCaps.maxImageCount) {
        imageCount = surfaceCaps.maxImageCount;
    }

    vkb::SwapchainBuilder swapchainBuilder{vkbDevice_};
    swapchainBuilder
        .set_desired_format({VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR})
        .set_desired_extent(static_cast<uint32_t>(pixelWidth), static_cast<uint32_t>(pixelHeight))
        .set_desired_min_image_count(imageCount)
        .set_composite_alpha_flags(compositeAlpha)
        .set_old_swapchain(oldSwapchain);

    if (config_.presentMode == PresentMode::Mailbox) {
        swapchainBuilder
            .set_desired_present_mode(VK_PRESENT_MODE_MAILBOX_KHR)
            .add_fallback_present_mode(VK_PRESENT_MODE_FIFO_KHR);
    } else {
        swapchainBuilder.set_desired_present_mode(VK_PRESENT_MODE_FIFO_KHR);
    }

    auto swapRet = swapchainBuilder.build();
    if (!swapRet) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VulkanContext: Failed to create swapchain: %s",
            swapRet.error().message().c_str());
        return false;
    }

    auto vkbSwapchain = swapRet.value();
    auto images = vkbSwapchain.get_images();
    auto views = vkbSwapchain.get_image_views();
    if (!images || !views) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VulkanContext: Failed to get swapchain images");
        vkb::destroy_swapchain(vkbSwapchain);
        return false;
    }

    swapchain_ = vkbSwapchain.swapchain;
    swapchainImages_ = images.value();
    swapchainImageViews_.clear();
    for (VkImageView view : views.value()) {
        swapchainImageViews_.push_back(vk::ImageView(view));
    }
    swapchainImageFormat_ = static_cast<vk::Format>(vkbSwapchain.image_format);
    swapchainExtent_ = vk::Extent2D{vkbSwapchain.extent.width, vkbSwapchain.extent.height};
    presentMode_ = static_cast<vk::PresentModeKHR>(vkbSwapchain.present_mode);

    SDL_Log("Swapchain: %ux%u, %zu images, present mode %s",
        swapchainExtent_.width, swapchainExtent_.height, swapchainImages_.size(),
        vk::to_string(presentMode_).c_str());
    return true;
}

void VulkanContext::destroySwapchainViews() {
    if (device_ == VK_NULL_HANDLE) return;

    vk::Device vkDevice(device_);
    for (auto imageView : swapchainImageViews_) {
        vkDevice.destroyImageView(imageView);
    }
    swapchainImageViews_.clear();
    swapchainImages_.clear();
}

bool VulkanContext::recreateSwapchain() {
    try {
        vk::Device(device_).waitIdle();
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VulkanContext: waitIdle before swapchain recreation failed: %s", e.what());
        return false;
    }

    VkSwapchainKHR oldSwapchain = swapchain_;
    std::vector<vk::ImageView> oldViews = std::move(swapchainImageViews_);
    swapchainImageViews_.clear();
    swapchainImages_.clear();

    bool ok = createSwapchain(oldSwapchain);

    vk::Device vkDevice(device_);
    for (auto imageView : oldViews) {
        vkDevice.destroyImageView(imageView);
    }
    if (oldSwapchain != VK_NULL_HANDLE) {
        vkDevice.destroySwapchainKHR(oldSwapchain);
    }
    if (!ok) {
        swapchain_ = VK_NULL_HANDLE;
    }
    return ok;
}

void VulkanContext::waitIdle() {
    if (device_ == VK_NULL_HANDLE) return;
    try {
        vk::Device(device_).waitIdle();
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VulkanContext: waitIdle failed: %s", e.what());
    }
}

uint32_t VulkanContext::getGraphicsQueueFamily() const {
    return vkbDevice_.get_queue_index(vkb::QueueType::graphics).value();
}

// ============================================================================
// Command pool and buffers
// ============================================================================

bool VulkanContext::createCommandPoolAndBuffers(uint32_t frameCount) {
    if (frameCount == 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VulkanContext: Cannot create command buffers: frame count is 0");
        return false;
    }

    try {
        auto poolInfo = vk::CommandPoolCreateInfo{}
            .setFlags(vk::CommandPoolCreateFlagBits::eResetCommandBuffer)
            .setQueueFamilyIndex(getGraphicsQueueFamily());
        commandPool_.emplace(*raiiDevice_, poolInfo);

        auto allocInfo = vk::CommandBufferAllocateInfo{}
            .setCommandPool(**commandPool_)
            .setLevel(vk::CommandBufferLevel::ePrimary)
            .setCommandBufferCount(frameCount);
        commandBuffers_ = vk::Device(device_).allocateCommandBuffers(allocInfo);
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VulkanContext: Failed to create command pool: %s", e.what());
        commandBuffers_.clear();
        commandPool_.reset();
        return false;
    }

    SDL_Log("Command pool and %u command buffers created", frameCount);
    return true;
}

void VulkanContext::destroyCommandPoolAndBuffers() {
    // Command buffers are implicitly freed when pool is destroyed
    commandBuffers_.clear();
    commandPool_.reset();
}
