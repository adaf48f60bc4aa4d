#include "vulkan_surface.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace burn::demo {

namespace {

const vk::ImageSubresourceRange colorRange{vk::ImageAspectFlagBits::eColor, 0,
                                           1, 0, 1};

const vk::ImageSubresourceLayers colorLayers{vk::ImageAspectFlagBits::eColor,
                                             0, 0, 1};

void transition(const vk::UniqueCommandBuffer& commandBuffer, vk::Image image,
                vk::ImageLayout oldLayout, vk::ImageLayout newLayout,
                vk::AccessFlags srcAccess, vk::AccessFlags dstAccess,
                vk::PipelineStageFlags srcStage,
                vk::PipelineStageFlags dstStage)
{
    vk::ImageMemoryBarrier barrier;
    barrier.setOldLayout(oldLayout);
    barrier.setNewLayout(newLayout);
    barrier.setDstQueueFamilyIndex(VK_QUEUE_FAMILY_IGNORED);
    barrier.setSrcQueueFamilyIndex(VK_QUEUE_FAMILY_IGNORED);
    barrier.setImage(image);
    barrier.setSrcAccessMask(srcAccess);
    barrier.setDstAccessMask(dstAccess);
    barrier.setSubresourceRange(colorRange);
    commandBuffer->pipelineBarrier(srcStage, dstStage, vk::DependencyFlags{}, 0,
                                   nullptr, 0, nullptr, 1, &barrier);
}

} // namespace

VulkanSurface::VulkanSurface(const VulkanContext& context, int width,
                             int height)
    : m_context(context)
{
    const auto& device = m_context.device();

    vk::CommandPoolCreateInfo commandPoolInfo;
    commandPoolInfo.setQueueFamilyIndex(m_context.queueFamilyIndex());
    commandPoolInfo.setFlags(
        vk::CommandPoolCreateFlagBits::eResetCommandBuffer);
    m_commandPool = device->createCommandPoolUnique(commandPoolInfo);

    vk::CommandBufferAllocateInfo allocInfo;
    allocInfo.setCommandPool(m_commandPool.get());
    allocInfo.setLevel(vk::CommandBufferLevel::ePrimary);
    allocInfo.setCommandBufferCount(1);
    m_commandBuffer =
        std::move(device->allocateCommandBuffersUnique(allocInfo).front());

    vk::FenceCreateInfo fenceInfo;
    fenceInfo.setFlags(vk::FenceCreateFlagBits::eSignaled);
    m_fence = device->createFenceUnique(fenceInfo);

    vk::SemaphoreCreateInfo semaphoreInfo;
    m_imageAvailable = device->createSemaphoreUnique(semaphoreInfo);
    m_renderFinished = device->createSemaphoreUnique(semaphoreInfo);

    createSwapChain(static_cast<uint32_t>(std::max(width, 0)),
                    static_cast<uint32_t>(std::max(height, 0)));
}

VulkanSurface::~VulkanSurface()
{
    m_context.device()->waitIdle();
    if (m_mappedData) {
        m_context.device()->unmapMemory(m_stagingBuffer.second.get());
    }
}

int VulkanSurface::width() const
{
    return static_cast<int>(m_extent.width);
}

int VulkanSurface::height() const
{
    return static_cast<int>(m_extent.height);
}

void VulkanSurface::clear()
{
    // Swap chain images are cleared as part of every blit.
}

void VulkanSurface::blit(const Image& image, const Rect& src, const Rect& dst)
{
    // Minimized windows have nothing to present to.
    if (m_outdated || m_extent.width == 0 || m_extent.height == 0 ||
        image.empty()) {
        return;
    }
    const auto& device = m_context.device();

    if (device->waitForFences(m_fence.get(), true,
                              std::numeric_limits<uint64_t>::max()) !=
        vk::Result::eSuccess) {
        throw std::runtime_error("Timed out waiting for previous frame");
    }

    uint32_t index = 0;
    try {
        auto acquired = device->acquireNextImageKHR(
            m_swapChain.get(), std::numeric_limits<uint64_t>::max(),
            m_imageAvailable.get(), vk::Fence{});
        index = acquired.value;
    } catch (const vk::OutOfDateKHRError&) {
        m_outdated = true;
        return;
    }

    upload(image);

    m_commandBuffer->reset(vk::CommandBufferResetFlags{});
    vk::CommandBufferBeginInfo beginInfo;
    beginInfo.setFlags(vk::CommandBufferUsageFlagBits::eOneTimeSubmit);
    m_commandBuffer->begin(beginInfo);
    record(image, src, dst, m_swapChainImages[index]);
    m_commandBuffer->end();

    device->resetFences(m_fence.get());

    // Wait with the transfer until the swap chain image is available.
    vk::PipelineStageFlags waitStage = vk::PipelineStageFlagBits::eTransfer;
    vk::SubmitInfo submitInfo;
    submitInfo.setWaitSemaphoreCount(1);
    submitInfo.setPWaitSemaphores(&m_imageAvailable.get());
    submitInfo.setPWaitDstStageMask(&waitStage);
    submitInfo.setCommandBufferCount(1);
    submitInfo.setPCommandBuffers(&m_commandBuffer.get());
    submitInfo.setSignalSemaphoreCount(1);
    submitInfo.setPSignalSemaphores(&m_renderFinished.get());
    m_context.queue().submit(submitInfo, m_fence.get());

    vk::PresentInfoKHR presentInfo;
    presentInfo.setWaitSemaphoreCount(1);
    presentInfo.setPWaitSemaphores(&m_renderFinished.get());
    presentInfo.setSwapchainCount(1);
    presentInfo.setPSwapchains(&m_swapChain.get());
    presentInfo.setPImageIndices(&index);
    try {
        if (m_context.queue().presentKHR(presentInfo) ==
            vk::Result::eSuboptimalKHR) {
            m_outdated = true;
        }
    } catch (const vk::OutOfDateKHRError&) {
        m_outdated = true;
    }
}

void VulkanSurface::resize(int width, int height)
{
    m_context.device()->waitIdle();
    createSwapChain(static_cast<uint32_t>(std::max(width, 0)),
                    static_cast<uint32_t>(std::max(height, 0)));
}

bool VulkanSurface::outdated() const
{
    return m_outdated;
}

void VulkanSurface::createSwapChain(uint32_t width, uint32_t height)
{
    m_outdated = false;
    if (width == 0 || height == 0) {
        m_extent = vk::Extent2D{0, 0};
        return;
    }

    const auto& physicalDevice = m_context.physicalDevice();
    const auto& surface = m_context.surface();

    auto capabilities = physicalDevice.getSurfaceCapabilitiesKHR(surface.get());
    auto formats = physicalDevice.getSurfaceFormatsKHR(surface.get());
    auto presentModes = physicalDevice.getSurfacePresentModesKHR(surface.get());
    if (formats.empty() || presentModes.empty()) {
        throw std::runtime_error("Swap chain requirements not met");
    }
    if (!(capabilities.supportedUsageFlags &
          vk::ImageUsageFlagBits::eTransferDst)) {
        throw std::runtime_error("Swap chain images can not be blitted to");
    }

    auto surfaceFormat = chooseSwapSurfaceFormat(formats);
    m_extent = chooseSwapExtent(capabilities, width, height);

    // For tripple buffering
    uint32_t imageCount = std::max(3u, capabilities.minImageCount);
    if (capabilities.maxImageCount > 0) {
        imageCount = std::min(imageCount, capabilities.maxImageCount);
    }

    vk::SwapchainCreateInfoKHR info;
    info.setSurface(surface.get());
    info.setMinImageCount(imageCount);
    info.setImageFormat(surfaceFormat.format);
    info.setImageExtent(m_extent);
    info.setImageColorSpace(surfaceFormat.colorSpace);
    info.setImageArrayLayers(1);
    info.setImageUsage(vk::ImageUsageFlagBits::eColorAttachment |
                       vk::ImageUsageFlagBits::eTransferDst);
    // Graphic and presentation are on same queue therefore choose exclusive
    info.setImageSharingMode(vk::SharingMode::eExclusive);
    info.setPreTransform(capabilities.currentTransform);
    info.setCompositeAlpha(vk::CompositeAlphaFlagBitsKHR::eOpaque);
    info.setPresentMode(chooseSwapPresentMode(presentModes));
    info.setClipped(true);
    info.setOldSwapchain(m_swapChain.get());

    m_swapChain = m_context.device()->createSwapchainKHRUnique(info);
    m_swapChainImages =
        m_context.device()->getSwapchainImagesKHR(m_swapChain.get());
    spdlog::debug("Created swap chain {}x{} with {} images", m_extent.width,
                  m_extent.height, m_swapChainImages.size());
}

void VulkanSurface::upload(const Image& image)
{
    const auto& physicalDevice = m_context.physicalDevice();
    const auto& device = m_context.device();
    const auto size = static_cast<vk::DeviceSize>(image.byteSize());

    if (size > m_stagingSize) {
        if (m_mappedData) {
            device->unmapMemory(m_stagingBuffer.second.get());
        }
        m_stagingBuffer =
            createBuffer(physicalDevice, device, size,
                         vk::BufferUsageFlagBits::eTransferSrc,
                         vk::MemoryPropertyFlagBits::eHostVisible |
                             vk::MemoryPropertyFlagBits::eHostCoherent);
        m_stagingSize = size;
        m_mappedData =
            device->mapMemory(m_stagingBuffer.second.get(), 0, m_stagingSize);
    }

    const vk::Extent2D extent{static_cast<uint32_t>(image.width()),
                              static_cast<uint32_t>(image.height())};
    if (extent != m_sourceExtent) {
        m_sourceImage = createImage(physicalDevice, device, extent.width,
                                    extent.height, vk::Format::eR8G8B8A8Unorm,
                                    vk::ImageUsageFlagBits::eTransferDst |
                                        vk::ImageUsageFlagBits::eTransferSrc);
        m_sourceExtent = extent;
    }

    std::memcpy(m_mappedData, image.data(), image.byteSize());
}

void VulkanSurface::record(const Image& image, const Rect& src,
                           const Rect& dst, vk::Image target)
{
    const vk::Image source = m_sourceImage.first.get();

    // Copy staging buffer to the source image.
    transition(m_commandBuffer, source, vk::ImageLayout::eUndefined,
               vk::ImageLayout::eTransferDstOptimal, vk::AccessFlags{},
               vk::AccessFlagBits::eTransferWrite,
               vk::PipelineStageFlagBits::eTopOfPipe,
               vk::PipelineStageFlagBits::eTransfer);

    vk::BufferImageCopy region;
    region.setBufferOffset(0);
    region.setBufferRowLength(0);
    region.setBufferImageHeight(0);
    region.setImageSubresource(colorLayers);
    region.setImageOffset({0, 0, 0});
    region.setImageExtent({m_sourceExtent.width, m_sourceExtent.height, 1});
    m_commandBuffer->copyBufferToImage(m_stagingBuffer.first.get(), source,
                                       vk::ImageLayout::eTransferDstOptimal, 1,
                                       &region);

    transition(m_commandBuffer, source, vk::ImageLayout::eTransferDstOptimal,
               vk::ImageLayout::eTransferSrcOptimal,
               vk::AccessFlagBits::eTransferWrite,
               vk::AccessFlagBits::eTransferRead,
               vk::PipelineStageFlagBits::eTransfer,
               vk::PipelineStageFlagBits::eTransfer);

    // The previous contents of the swap chain image are discarded, so the
    // frame is always cleared first.
    transition(m_commandBuffer, target, vk::ImageLayout::eUndefined,
               vk::ImageLayout::eTransferDstOptimal, vk::AccessFlags{},
               vk::AccessFlagBits::eTransferWrite,
               vk::PipelineStageFlagBits::eTransfer,
               vk::PipelineStageFlagBits::eTransfer);
    const vk::ClearColorValue black(std::array<float, 4>{0.0f, 0.0f, 0.0f, 1.0f});
    m_commandBuffer->clearColorImage(target, vk::ImageLayout::eTransferDstOptimal,
                                     black, colorRange);
    transition(m_commandBuffer, target, vk::ImageLayout::eTransferDstOptimal,
               vk::ImageLayout::eTransferDstOptimal,
               vk::AccessFlagBits::eTransferWrite,
               vk::AccessFlagBits::eTransferWrite,
               vk::PipelineStageFlagBits::eTransfer,
               vk::PipelineStageFlagBits::eTransfer);

    // Stretch the source rectangle onto the destination rectangle, both
    // clipped to the part that is visible on the surface.
    const int x0 = std::clamp(dst.x, 0, width());
    const int y0 = std::clamp(dst.y, 0, height());
    const int x1 = std::clamp(dst.x + dst.width, 0, width());
    const int y1 = std::clamp(dst.y + dst.height, 0, height());
    if (x0 < x1 && y0 < y1 && src.width > 0 && src.height > 0 &&
        !image.empty()) {
        auto project = [](int offset, int srcStart, int srcLength,
                          int dstLength) {
            return srcStart + static_cast<int>(static_cast<long long>(offset) *
                                               srcLength / dstLength);
        };
        vk::ImageBlit blit;
        blit.setSrcSubresource(colorLayers);
        blit.setSrcOffsets(
            {vk::Offset3D{project(x0 - dst.x, src.x, src.width, dst.width),
                          project(y0 - dst.y, src.y, src.height, dst.height),
                          0},
             vk::Offset3D{project(x1 - dst.x, src.x, src.width, dst.width),
                          project(y1 - dst.y, src.y, src.height, dst.height),
                          1}});
        blit.setDstSubresource(colorLayers);
        blit.setDstOffsets({vk::Offset3D{x0, y0, 0}, vk::Offset3D{x1, y1, 1}});
        m_commandBuffer->blitImage(source, vk::ImageLayout::eTransferSrcOptimal,
                                   target, vk::ImageLayout::eTransferDstOptimal,
                                   blit, vk::Filter::eNearest);
    }

    transition(m_commandBuffer, target, vk::ImageLayout::eTransferDstOptimal,
               vk::ImageLayout::ePresentSrcKHR,
               vk::AccessFlagBits::eTransferWrite,
               vk::AccessFlagBits::eMemoryRead,
               vk::PipelineStageFlagBits::eTransfer,
               vk::PipelineStageFlagBits::eBottomOfPipe);
}

} // namespace burn::demo
