#pragma once

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <vk_mem_alloc.h>
#include <VkBootstrap.h>
#include <SDL3/SDL.h>
#include <vector>
#include <memory>
#include <optional>
#include "EngineConfig.h"
#include "MemoryAllocator.h"

/**
 * VulkanContext encapsulates core Vulkan setup:
 * - Instance creation (validation + debug messenger through vk-bootstrap)
 * - Surface creation
 * - Physical device selection
 * - Logical device creation and queue retrieval
 * - VMA allocator setup and the MemoryAllocator on top of it
 * - Swapchain management
 * - Command pool with one primary command buffer per frame slot
 *
 * Exists only while a window does. shutdown() waits for the device and
 * destroys everything in reverse creation order.
 */
class VulkanContext {
public:
    VulkanContext() = default;
    ~VulkanContext();

    // Non-copyable
    VulkanContext(const VulkanContext&) = delete;
    VulkanContext& operator=(const VulkanContext&) = delete;

    bool init(SDL_Window* window, const RendererConfig& config, uint32_t frameCount);
    void shutdown();

    // Builds a new swapchain from the old one at the window's drawable size
    bool recreateSwapchain();

    void waitIdle();

    // Getters for Vulkan handles
    vk::PhysicalDevice getPhysicalDevice() const { return vk::PhysicalDevice(physicalDevice_); }
    vk::Device getDevice() const { return vk::Device(device_); }
    vk::Queue getGraphicsQueue() const { return vk::Queue(graphicsQueue_); }
    vk::Queue getPresentQueue() const { return vk::Queue(presentQueue_); }
    uint32_t getGraphicsQueueFamily() const;

    // RAII device access for vulkan-hpp raii types
    const vk::raii::Device& getRaiiDevice() const { return *raiiDevice_; }

    const MemoryAllocator& memory() const { return memory_; }

    vk::SwapchainKHR getSwapchain() const { return vk::SwapchainKHR(swapchain_); }
    const std::vector<vk::ImageView>& getSwapchainImageViews() const { return swapchainImageViews_; }
    vk::Format getSwapchainImageFormat() const { return swapchainImageFormat_; }
    vk::Extent2D getSwapchainExtent() const { return swapchainExtent_; }
    uint32_t getSwapchainImageCount() const { return static_cast<uint32_t>(swapchainImages_.size()); }

    vk::CommandPool getCommandPool() const { return commandPool_ ? **commandPool_ : vk::CommandPool{}; }
    vk::CommandBuffer getCommandBuffer(uint32_t frameIndex) const { return commandBuffers_.at(frameIndex); }

private:
    bool createInstance();
    bool createSurface();
    bool selectPhysicalDevice();
    bool createLogicalDevice();
    bool createAllocator();
    bool createSwapchain(VkSwapchainKHR oldSwapchain);
    void destroySwapchainViews();
    bool createCommandPoolAndBuffers(uint32_t frameCount);
    void destroyCommandPoolAndBuffers();

    SDL_Window* window_ = nullptr;
    RendererConfig config_;

    vkb::Instance vkbInstance_;
    vkb::PhysicalDevice vkbPhysicalDevice_;
    vkb::Device vkbDevice_;

    VkInstance instance_ = VK_NULL_HANDLE;
    VkSurfaceKHR surface_ = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice_ = VK_NULL_HANDLE;
    VkDevice device_ = VK_NULL_HANDLE;
    VkQueue graphicsQueue_ = VK_NULL_HANDLE;
    VkQueue presentQueue_ = VK_NULL_HANDLE;

    VmaAllocator allocator_ = VK_NULL_HANDLE;
    MemoryAllocator memory_;

    VkSwapchainKHR swapchain_ = VK_NULL_HANDLE;
    std::vector<VkImage> swapchainImages_;
    std::vector<vk::ImageView> swapchainImageViews_;
    vk::Format swapchainImageFormat_ = vk::Format::eUndefined;
    vk::Extent2D swapchainExtent_{0, 0};
    vk::PresentModeKHR presentMode_ = vk::PresentModeKHR::eFifo;

    std::optional<vk::raii::CommandPool> commandPool_;
    std::vector<vk::CommandBuffer> commandBuffers_;

    // vulkan-hpp RAII wrappers around the vk-bootstrap handles
    vk::raii::Context raiiContext_;
    std::unique_ptr<vk::raii::Instance> raiiInstance_;
    std::unique_ptr<vk::raii::PhysicalDevice> raiiPhysicalDevice_;
    std::unique_ptr<vk::raii::Device> raiiDevice_;
};
