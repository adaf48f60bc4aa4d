#include <glfw.hpp>
#include <stdexcept>

namespace glfw {

Library::Library()
{
    if (glfwInit() != GLFW_TRUE) {
        throw std::runtime_error("Could not initialize glfw");
    }
}

Library::~Library()
{
    glfwTerminate();
}

bool Window::shouldClose() const
{
    return glfwWindowShouldClose(m_window.get()) == GLFW_TRUE;
}

void Window::close()
{
    glfwSetWindowShouldClose(m_window.get(), GLFW_TRUE);
}

std::pair<int, int> Window::framebufferSize() const
{
    int width = 0;
    int height = 0;
    glfwGetFramebufferSize(m_window.get(), &width, &height);
    return {width, height};
}

vk::UniqueSurfaceKHR
Window::createWindowSurface(const vk::UniqueInstance& instance) const
{
    VkSurfaceKHR surface;
    if (glfwCreateWindowSurface(instance.get(), m_window.get(), nullptr,
                                &surface) != VK_SUCCESS) {
        throw std::runtime_error("Could not create window surface");
    }
    vk::ObjectDestroy<vk::Instance, VULKAN_HPP_DEFAULT_DISPATCHER_TYPE> deleter(
        instance.get());
    return vk::UniqueSurfaceKHR(vk::SurfaceKHR(surface), deleter);
}

Window createWindow(int width, int height, const std::string& title)
{
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    Window window{
        glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr)};
    if (!window) {
        throw std::runtime_error("Could not create window");
    }
    return window;
}

} // namespace glfw
