#pragma once
#include "vulkan_context.hpp"
#include <burn/surface.hpp>
#include <vulkan/vulkan.hpp>
#include <cstdint>
#include <utility>
#include <vector>

namespace burn::demo { // Begin of namespace burn::demo

// Presents every blit on the swap chain of a window. The source raster is
// uploaded to a device image and stretched onto the swap chain image with
// vkCmdBlitImage and nearest filtering. Every presented frame starts out
// black; a clear without a following blit presents nothing.
class VulkanSurface : public Surface {
public:
    VulkanSurface(const VulkanContext& context, int width, int height);

    ~VulkanSurface();

    VulkanSurface(const VulkanSurface&) = delete;

    VulkanSurface& operator=(const VulkanSurface&) = delete;

    int width() const override;

    int height() const override;

    void clear() override;

    void blit(const Image& image, const Rect& src, const Rect& dst) override;

    // Recreates the swap chain, e.g. after the window was resized.
    void resize(int width, int height);

    // True once presentation reported that the swap chain no longer
    // matches the window.
    bool outdated() const;

private:
    void createSwapChain(uint32_t width, uint32_t height);

    void upload(const Image& image);

    void record(const Image& image, const Rect& src, const Rect& dst,
                vk::Image target);

    const VulkanContext& m_context;

    vk::Extent2D m_extent;

    vk::UniqueSwapchainKHR m_swapChain;

    std::vector<vk::Image> m_swapChainImages;

    vk::UniqueCommandPool m_commandPool;

    vk::UniqueCommandBuffer m_commandBuffer;

    vk::UniqueFence m_fence;

    vk::UniqueSemaphore m_imageAvailable;

    vk::UniqueSemaphore m_renderFinished;

    std::pair<vk::UniqueBuffer, vk::UniqueDeviceMemory> m_stagingBuffer;

    vk::DeviceSize m_stagingSize = 0;

    void* m_mappedData = nullptr;

    std::pair<vk::UniqueImage, vk::UniqueDeviceMemory> m_sourceImage;

    vk::Extent2D m_sourceExtent;

    bool m_outdated = false;
};

} // End of namespace burn::demo
