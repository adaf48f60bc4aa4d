#pragma once
#include <glfw.hpp>
#include <vulkan/vulkan.hpp>
#include <cstdint>
#include <utility>
#include <vector>

namespace burn::demo { // Begin of namespace burn::demo

// Instance, window surface and logical device with one queue that supports
// both transfer and presentation. Not movable: the debug messenger keeps a
// pointer to the dispatcher.
class VulkanContext {
public:
    explicit VulkanContext(const glfw::Window& window);

    VulkanContext(const VulkanContext&) = delete;

    VulkanContext& operator=(const VulkanContext&) = delete;

    const vk::PhysicalDevice& physicalDevice() const
    {
        return m_physicalDevice;
    }

    const vk::UniqueDevice& device() const
    {
        return m_device;
    }

    const vk::UniqueSurfaceKHR& surface() const
    {
        return m_surface;
    }

    const vk::Queue& queue() const
    {
        return m_queue;
    }

    uint32_t queueFamilyIndex() const
    {
        return m_queueFamilyIndex;
    }

private:
    vk::UniqueInstance m_instance;

    vk::DispatchLoaderDynamic m_dldi;

    vk::UniqueHandle<vk::DebugUtilsMessengerEXT, vk::DispatchLoaderDynamic>
        m_messenger;

    vk::UniqueSurfaceKHR m_surface;

    vk::PhysicalDevice m_physicalDevice;

    uint32_t m_queueFamilyIndex = 0;

    vk::UniqueDevice m_device;

    vk::Queue m_queue;
};

std::pair<vk::UniqueBuffer, vk::UniqueDeviceMemory>
createBuffer(const vk::PhysicalDevice& physicalDevice,
             const vk::UniqueDevice& device, vk::DeviceSize size,
             vk::BufferUsageFlags usage, vk::MemoryPropertyFlags properties);

std::pair<vk::UniqueImage, vk::UniqueDeviceMemory>
createImage(const vk::PhysicalDevice& physicalDevice,
            const vk::UniqueDevice& device, uint32_t width, uint32_t height,
            vk::Format format, vk::ImageUsageFlags usage);

vk::SurfaceFormatKHR chooseSwapSurfaceFormat(
    const std::vector<vk::SurfaceFormatKHR>& availableFormats);

vk::PresentModeKHR chooseSwapPresentMode(
    const std::vector<vk::PresentModeKHR>& availablePresentModes);

vk::Extent2D chooseSwapExtent(const vk::SurfaceCapabilitiesKHR& capabilities,
                              uint32_t width, uint32_t height);

} // End of namespace burn::demo
