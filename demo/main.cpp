#include "timer.hpp"
#include "vulkan_context.hpp"
#include "vulkan_surface.hpp"
#include <burn/effect_controller.hpp>
#include <burn/error.hpp>
#include <burn/loop_scheduler.hpp>
#include <glfw.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct Arguments {
    int width = 800;
    int height = 600;
    double scale = 3.5;
};

const char* const usage = "usage: burn_demo [width height [scale]]";

Arguments parseArguments(int argc, char** argv)
{
    Arguments arguments;
    if (argc != 1 && argc != 3 && argc != 4) {
        throw std::invalid_argument("wrong number of arguments");
    }
    if (argc >= 3) {
        arguments.width = std::stoi(argv[1]);
        arguments.height = std::stoi(argv[2]);
        if (arguments.width <= 0 || arguments.height <= 0) {
            throw std::invalid_argument("window size must be positive");
        }
    }
    if (argc == 4) {
        arguments.scale = std::stod(argv[3]);
    }
    return arguments;
}

// Ramp from black to `to`.
burn::Palette ramp(const burn::Rgba& to)
{
    std::vector<burn::Rgba> colors;
    for (int i = 0; i < burn::kPaletteSize; ++i) {
        colors.push_back(
            burn::Rgba{static_cast<uint8_t>(to.r * i / burn::kMaxIntensity),
                       static_cast<uint8_t>(to.g * i / burn::kMaxIntensity),
                       static_cast<uint8_t>(to.b * i / burn::kMaxIntensity)});
    }
    return burn::Palette(colors);
}

class Demo {
public:
    Demo(glfw::Window& window, burn::demo::VulkanSurface& surface,
         double scale)
        : m_window(window), m_surface(surface), m_scale(scale)
    {
        m_palettes = {burn::defaultPalette(), ramp({0xFF, 0xFF, 0xFF}),
                      ramp({0x3F, 0x9F, 0xFF})};

        glfwSetWindowUserPointer(m_window, this);
        glfwSetKeyCallback(m_window, &Demo::onKey);
        glfwSetFramebufferSizeCallback(m_window, &Demo::onResize);

        burn::EffectOptions options;
        options.scale = m_scale;
        m_controller = burn::burn(m_surface, m_scheduler, options);
    }

    ~Demo()
    {
        glfwSetKeyCallback(m_window, nullptr);
        glfwSetFramebufferSizeCallback(m_window, nullptr);
        glfwSetWindowUserPointer(m_window, nullptr);
    }

    Demo(const Demo&) = delete;

    Demo& operator=(const Demo&) = delete;

    void run()
    {
        FrameCounter frames("Fire");
        while (!m_window.shouldClose()) {
            waitEvents();
            if (m_resized || m_surface.outdated()) {
                m_resized = false;
                const auto [width, height] = m_window.framebufferSize();
                m_surface.resize(width, height);
                m_controller->reset();
            }
            frames.add(m_scheduler.runDue());
        }
    }

private:
    static void onKey(GLFWwindow* window, int key, int, int action, int)
    {
        auto demo = static_cast<Demo*>(glfwGetWindowUserPointer(window));
        if (demo && action != GLFW_RELEASE) {
            demo->handleKey(key);
        }
    }

    static void onResize(GLFWwindow* window, int, int)
    {
        auto demo = static_cast<Demo*>(glfwGetWindowUserPointer(window));
        if (demo) {
            demo->m_resized = true;
        }
    }

    void waitEvents()
    {
        const auto deadline = m_scheduler.nextDeadline();
        if (!deadline) {
            glfwWaitEvents();
            return;
        }
        const std::chrono::duration<double> wait =
            *deadline - burn::LoopScheduler::Clock::now();
        if (wait.count() > 0.0) {
            glfwWaitEventsTimeout(wait.count());
        } else {
            glfwPollEvents();
        }
    }

    void handleKey(int key)
    {
        switch (key) {
        case GLFW_KEY_ESCAPE:
            m_window.close();
            break;
        case GLFW_KEY_SPACE:
            if (m_controller->running()) {
                m_controller->stop();
            } else {
                m_controller->start();
            }
            break;
        case GLFW_KEY_R:
            m_controller->reset();
            break;
        case GLFW_KEY_P:
            m_paletteIndex = (m_paletteIndex + 1) % m_palettes.size();
            m_controller->setPalette(m_palettes[m_paletteIndex]);
            spdlog::info("Palette {}", m_paletteIndex);
            break;
        case GLFW_KEY_UP:
            m_controller->setInterval(m_controller->interval() + 5ms);
            spdlog::info("Interval {}ms", m_controller->interval().count());
            break;
        case GLFW_KEY_DOWN:
            m_controller->setInterval(
                std::max(m_controller->interval() - 5ms, 0ms));
            spdlog::info("Interval {}ms", m_controller->interval().count());
            break;
        case GLFW_KEY_EQUAL:
        case GLFW_KEY_KP_ADD:
            restart(m_scale + 0.5);
            break;
        case GLFW_KEY_MINUS:
        case GLFW_KEY_KP_SUBTRACT:
            restart(std::max(m_scale - 0.5, 1.0));
            break;
        default:
            break;
        }
    }

    // The scale is fixed per controller, so changing it means a new one.
    void restart(double scale)
    {
        burn::EffectOptions options;
        options.scale = scale;
        options.interval = m_controller->interval();
        options.palette = m_controller->palette();
        const bool running = m_controller->running();

        m_controller.reset();
        m_controller =
            std::make_unique<burn::EffectController>(m_surface, m_scheduler,
                                                     options);
        if (running) {
            m_controller->start();
        }
        m_scale = scale;
        spdlog::info("Scale {}", m_scale);
    }

    glfw::Window& m_window;

    burn::demo::VulkanSurface& m_surface;

    double m_scale;

    std::vector<burn::Palette> m_palettes;

    std::size_t m_paletteIndex = 0;

    bool m_resized = false;

    burn::LoopScheduler m_scheduler;

    std::unique_ptr<burn::EffectController> m_controller;
};

} // namespace

int main(int argc, char** argv)
{
    spdlog::set_level(std::getenv("BURN_DEBUG") ? spdlog::level::debug
                                                : spdlog::level::info);

    Arguments arguments;
    try {
        arguments = parseArguments(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("{}: {}", e.what(), usage);
        return EXIT_FAILURE;
    }

    try {
        glfw::Library library;

        spdlog::info("Create window");
        auto window = glfw::createWindow(arguments.width, arguments.height,
                                         "burn");

        burn::demo::VulkanContext context(window);

        const auto [width, height] = window.framebufferSize();
        burn::demo::VulkanSurface surface(context, width, height);

        Demo demo(window, surface, arguments.scale);
        demo.run();
    } catch (const burn::ConfigurationError& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
