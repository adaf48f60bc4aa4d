#include "vulkan_context.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

namespace burn::demo {

namespace {

#ifdef NDEBUG
const bool wantValidation = false;
#else
const bool wantValidation = true;
#endif

const char* const validationLayer = "VK_LAYER_KHRONOS_validation";

const char* const debugUtilsExtension = VK_EXT_DEBUG_UTILS_EXTENSION_NAME;

// The demo only presents, so the swap chain is the one device extension.
const char* const swapchainExtension = VK_KHR_SWAPCHAIN_EXTENSION_NAME;

const vk::SurfaceFormatKHR preferredFormat{vk::Format::eB8G8R8A8Unorm,
                                           vk::ColorSpaceKHR::eSrgbNonlinear};

VKAPI_ATTR VkBool32 VKAPI_CALL
debugCallback(VkDebugUtilsMessageSeverityFlagBitsEXT messageSeverity,
              VkDebugUtilsMessageTypeFlagsEXT,
              const VkDebugUtilsMessengerCallbackDataEXT* pCallbackData, void*)
{
    if (messageSeverity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) {
        spdlog::error("validation layer: {}", pCallbackData->pMessage);
    } else if (messageSeverity >=
               VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) {
        spdlog::warn("validation layer: {}", pCallbackData->pMessage);
    } else {
        spdlog::debug("validation layer: {}", pCallbackData->pMessage);
    }
    return VK_FALSE;
}

const char* nameOf(const vk::LayerProperties& layer)
{
    return layer.layerName;
}

const char* nameOf(const vk::ExtensionProperties& extension)
{
    return extension.extensionName;
}

template <typename Properties>
bool listed(const std::vector<Properties>& available, const char* name)
{
    for (const auto& properties : available) {
        if (std::strcmp(nameOf(properties), name) == 0) {
            return true;
        }
    }
    return false;
}

bool useValidation()
{
    return wantValidation &&
           listed(vk::enumerateInstanceLayerProperties(), validationLayer) &&
           listed(vk::enumerateInstanceExtensionProperties(),
                  debugUtilsExtension);
}

std::vector<const char*> enabledLayers(bool validation)
{
    if (!validation) {
        return {};
    }
    return {validationLayer};
}

// What GLFW needs for window surfaces, plus debug utils for the messenger.
std::vector<const char*> instanceExtensions(bool validation)
{
    uint32_t count = 0;
    const char** names = glfwGetRequiredInstanceExtensions(&count);
    if (names == nullptr) {
        throw std::runtime_error("GLFW found no Vulkan window surface support");
    }
    std::vector<const char*> extensions(names, names + count);
    if (validation) {
        extensions.push_back(debugUtilsExtension);
    }
    return extensions;
}

vk::UniqueInstance createInstance(bool validation)
{
    const vk::ApplicationInfo application("burn", 1, nullptr, 0,
                                          VK_API_VERSION_1_0);
    const auto layers = enabledLayers(validation);
    const auto extensions = instanceExtensions(validation);

    vk::InstanceCreateInfo info;
    info.setPApplicationInfo(&application);
    info.setEnabledLayerCount(static_cast<uint32_t>(layers.size()));
    info.setPpEnabledLayerNames(layers.data());
    info.setEnabledExtensionCount(static_cast<uint32_t>(extensions.size()));
    info.setPpEnabledExtensionNames(extensions.data());
    return vk::createInstanceUnique(info);
}

auto createDebugMessenger(const vk::UniqueInstance& instance,
                          const vk::DispatchLoaderDynamic& dldi)
{
    VkDebugUtilsMessengerCreateInfoEXT info{};
    info.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
    info.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_VERBOSE_BIT_EXT |
                           VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                           VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    info.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                       VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                       VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
    info.pfnUserCallback = &debugCallback;

    return instance->createDebugUtilsMessengerEXTUnique(
        vk::DebugUtilsMessengerCreateInfoEXT(info), nullptr, dldi);
}

// One family for transfer and present keeps the swap chain images
// exclusive. Graphics families always support transfer.
std::optional<uint32_t> findQueueFamily(const vk::PhysicalDevice& device,
                                        const vk::UniqueSurfaceKHR& surface)
{
    const auto families = device.getQueueFamilyProperties();
    for (uint32_t index = 0; index < families.size(); ++index) {
        const bool graphics = static_cast<bool>(families[index].queueFlags &
                                                vk::QueueFlagBits::eGraphics);
        if (graphics && device.getSurfaceSupportKHR(index, surface.get())) {
            return index;
        }
    }
    return std::nullopt;
}

// Negative for devices that can not drive the demo.
int rank(const vk::PhysicalDevice& device, const vk::UniqueSurfaceKHR& surface)
{
    if (!listed(device.enumerateDeviceExtensionProperties(),
                swapchainExtension) ||
        !findQueueFamily(device, surface)) {
        return -1;
    }
    switch (device.getProperties().deviceType) {
    case vk::PhysicalDeviceType::eDiscreteGpu:
        return 2;
    case vk::PhysicalDeviceType::eIntegratedGpu:
        return 1;
    default:
        return 0;
    }
}

vk::PhysicalDevice pickDevice(const vk::UniqueInstance& instance,
                              const vk::UniqueSurfaceKHR& surface)
{
    std::optional<vk::PhysicalDevice> best;
    int bestRank = -1;
    for (const auto& device : instance->enumeratePhysicalDevices()) {
        const int deviceRank = rank(device, surface);
        if (deviceRank > bestRank) {
            best = device;
            bestRank = deviceRank;
        }
    }
    if (!best) {
        throw std::runtime_error("No Vulkan device can present to the window");
    }
    return *best;
}

vk::UniqueDevice createDevice(const vk::PhysicalDevice& physicalDevice,
                              uint32_t queueFamilyIndex, bool validation)
{
    const float priority = 1.0f;
    const vk::DeviceQueueCreateInfo queue({}, queueFamilyIndex, 1, &priority);
    const auto layers = enabledLayers(validation);

    vk::DeviceCreateInfo info;
    info.setQueueCreateInfoCount(1);
    info.setPQueueCreateInfos(&queue);
    info.setEnabledLayerCount(static_cast<uint32_t>(layers.size()));
    info.setPpEnabledLayerNames(layers.data());
    info.setEnabledExtensionCount(1);
    info.setPpEnabledExtensionNames(&swapchainExtension);
    return physicalDevice.createDeviceUnique(info);
}

uint32_t memoryTypeIndex(const vk::PhysicalDevice& physicalDevice,
                         const vk::MemoryRequirements& requirements,
                         vk::MemoryPropertyFlags properties)
{
    const auto memory = physicalDevice.getMemoryProperties();
    for (uint32_t type = 0; type < memory.memoryTypeCount; ++type) {
        const bool allowed = (requirements.memoryTypeBits >> type) & 1u;
        const auto flags = memory.memoryTypes[type].propertyFlags;
        if (allowed && (flags & properties) == properties) {
            return type;
        }
    }
    throw std::runtime_error("No memory type with the requested properties");
}

vk::UniqueDeviceMemory allocate(const vk::PhysicalDevice& physicalDevice,
                                const vk::UniqueDevice& device,
                                const vk::MemoryRequirements& requirements,
                                vk::MemoryPropertyFlags properties)
{
    return device->allocateMemoryUnique(vk::MemoryAllocateInfo(
        requirements.size,
        memoryTypeIndex(physicalDevice, requirements, properties)));
}

} // namespace

VulkanContext::VulkanContext(const glfw::Window& window)
{
    const bool validation = useValidation();

    spdlog::info("Create instance");
    m_instance = createInstance(validation);

    if (validation) {
        spdlog::info("Create debug messenger");
        m_dldi.init(m_instance.get(), vkGetInstanceProcAddr);
        m_messenger = createDebugMessenger(m_instance, m_dldi);
    }

    m_surface = window.createWindowSurface(m_instance);

    m_physicalDevice = pickDevice(m_instance, m_surface);
    spdlog::info("Use device {}",
                 static_cast<const char*>(
                     m_physicalDevice.getProperties().deviceName));

    m_queueFamilyIndex = *findQueueFamily(m_physicalDevice, m_surface);
    m_device = createDevice(m_physicalDevice, m_queueFamilyIndex, validation);
    m_queue = m_device->getQueue(m_queueFamilyIndex, 0);
}

std::pair<vk::UniqueBuffer, vk::UniqueDeviceMemory>
createBuffer(const vk::PhysicalDevice& physicalDevice,
             const vk::UniqueDevice& device, vk::DeviceSize size,
             vk::BufferUsageFlags usage, vk::MemoryPropertyFlags properties)
{
    auto buffer = device->createBufferUnique(
        vk::BufferCreateInfo({}, size, usage, vk::SharingMode::eExclusive));
    auto memory = allocate(physicalDevice, device,
                           device->getBufferMemoryRequirements(*buffer),
                           properties);
    device->bindBufferMemory(*buffer, *memory, 0);
    return {std::move(buffer), std::move(memory)};
}

std::pair<vk::UniqueImage, vk::UniqueDeviceMemory>
createImage(const vk::PhysicalDevice& physicalDevice,
            const vk::UniqueDevice& device, uint32_t width, uint32_t height,
            vk::Format format, vk::ImageUsageFlags usage)
{
    vk::ImageCreateInfo info;
    info.setImageType(vk::ImageType::e2D)
        .setFormat(format)
        .setExtent(vk::Extent3D(width, height, 1))
        .setMipLevels(1)
        .setArrayLayers(1)
        .setTiling(vk::ImageTiling::eOptimal)
        .setUsage(usage);
    auto image = device->createImageUnique(info);
    auto memory = allocate(physicalDevice, device,
                           device->getImageMemoryRequirements(*image),
                           vk::MemoryPropertyFlagBits::eDeviceLocal);
    device->bindImageMemory(*image, *memory, 0);
    return {std::move(image), std::move(memory)};
}

vk::SurfaceFormatKHR chooseSwapSurfaceFormat(
    const std::vector<vk::SurfaceFormatKHR>& availableFormats)
{
    // A single undefined entry means the surface takes any format.
    if (availableFormats.size() == 1 &&
        availableFormats.front().format == vk::Format::eUndefined) {
        return preferredFormat;
    }
    if (std::find(availableFormats.begin(), availableFormats.end(),
                  preferredFormat) == availableFormats.end()) {
        throw std::runtime_error("Surface does not offer B8G8R8A8 sRGB");
    }
    return preferredFormat;
}

vk::PresentModeKHR chooseSwapPresentMode(
    const std::vector<vk::PresentModeKHR>& availablePresentModes)
{
    // Ticks are paced by the scheduler, not by vsync. Fifo is always there.
    for (auto mode :
         {vk::PresentModeKHR::eMailbox, vk::PresentModeKHR::eImmediate}) {
        if (std::find(availablePresentModes.begin(),
                      availablePresentModes.end(),
                      mode) != availablePresentModes.end()) {
            return mode;
        }
    }
    return vk::PresentModeKHR::eFifo;
}

vk::Extent2D chooseSwapExtent(const vk::SurfaceCapabilitiesKHR& capabilities,
                              uint32_t width, uint32_t height)
{
    // The surface dictates its size unless it reports the special value.
    if (capabilities.currentExtent.width !=
        std::numeric_limits<uint32_t>::max()) {
        return capabilities.currentExtent;
    }
    return {std::clamp(width, capabilities.minImageExtent.width,
                       capabilities.maxImageExtent.width),
            std::clamp(height, capabilities.minImageExtent.height,
                       capabilities.maxImageExtent.height)};
}

} // namespace burn::demo
