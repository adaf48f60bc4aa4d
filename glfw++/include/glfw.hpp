#pragma once
#include <vulkan/vulkan.hpp>
#include <GLFW/glfw3.h>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace glfw { // Begin of namespace glfw

// Initializes glfw for its lifetime.
class Library {
public:
    Library();

    ~Library();

    Library(const Library&) = delete;

    Library& operator=(const Library&) = delete;
};

class Window {
public:
    Window() : m_window(nullptr, glfwDestroyWindow)
    {
    }

    Window(std::nullptr_t) : m_window(nullptr, glfwDestroyWindow)
    {
    }

    Window(GLFWwindow* window) : m_window(window, glfwDestroyWindow)
    {
    }

    explicit operator bool() const
    {
        return m_window != nullptr;
    }

    bool operator!() const
    {
        return m_window == nullptr;
    }

    operator GLFWwindow*() const
    {
        return m_window.get();
    }

    bool shouldClose() const;

    void close();

    std::pair<int, int> framebufferSize() const;

    vk::UniqueSurfaceKHR createWindowSurface(const vk::UniqueInstance&) const;

private:
    std::unique_ptr<GLFWwindow, decltype(&glfwDestroyWindow)> m_window;
};

// Creates a window without a client API, for use with vulkan.
Window createWindow(int width, int height, const std::string& title = "");

} // End of namespace glfw
