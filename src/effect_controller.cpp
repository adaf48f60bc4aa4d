#include <burn/effect_controller.hpp>
#include <burn/error.hpp>
#include <burn/palette_rasterizer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <mutex>
#include <random>
#include <string>
#include <utility>

namespace burn {

namespace {

void validate(const EffectOptions& options)
{
    // Below one pixel per cell the grid outgrows the surface without
    // adding detail.
    if (!std::isfinite(options.scale) || options.scale < 1.0) {
        throw ConfigurationError("Scale must be at least 1, got " +
                                 std::to_string(options.scale));
    }
    if (options.interval.count() < 0) {
        throw ConfigurationError("Interval must not be negative, got " +
                                 std::to_string(options.interval.count()) +
                                 "ms");
    }
    if (options.height && *options.height < 0) {
        throw ConfigurationError("Height must not be negative, got " +
                                 std::to_string(*options.height));
    }
}

} // namespace

// Everything a tick touches. Scheduled ticks only hold a weak reference, so
// a tick that fires after the controller is gone does nothing.
class EffectController::State : public std::enable_shared_from_this<State> {
public:
    State(Surface& surface, Scheduler& scheduler, EffectOptions options)
        : m_surface(surface), m_scheduler(scheduler),
          m_rasterizer(surface, options.scale), m_palette(options.palette),
          m_interval(options.interval), m_height(options.height),
          m_seeder(options.seed ? *options.seed : std::random_device{}()),
          m_grid(createGrid())
    {
        spdlog::info("Created {}x{} fire, scale {}, interval {}ms",
                     m_grid.width(), m_grid.height(), options.scale,
                     options.interval.count());
    }

    void start()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running) {
            return;
        }
        spdlog::debug("Start fire, interval {}ms", m_interval.count());
        m_running = true;
        ++m_generation;
        tick();
        schedule();
    }

    void stop()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        halt();
    }

    void reset()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto [width, height] = gridSize();
        if (width != m_grid.width() || height != m_grid.height()) {
            spdlog::debug("Resize fire from {}x{} to {}x{}", m_grid.width(),
                          m_grid.height(), width, height);
            m_grid = createGrid();
        } else {
            m_grid.reset();
        }
        m_rasterizer.render(m_grid, m_palette);
    }

    bool running() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_running;
    }

    Palette palette() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_palette;
    }

    void setPalette(const Palette& palette)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_palette = palette;
    }

    std::chrono::milliseconds interval() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_interval;
    }

    void setInterval(std::chrono::milliseconds interval)
    {
        if (interval.count() < 0) {
            throw ConfigurationError("Interval must not be negative, got " +
                                     std::to_string(interval.count()) + "ms");
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_interval = interval;
    }

    void halt()
    {
        if (!m_running) {
            return;
        }
        spdlog::debug("Stop fire");
        m_running = false;
        ++m_generation;
        m_scheduler.cancel(m_task);
        m_task = Scheduler::kInvalidTask;
    }

    std::mutex& mutex()
    {
        return m_mutex;
    }

private:
    std::pair<int, int> gridSize() const
    {
        int pixelHeight = m_surface.height();
        if (m_height) {
            pixelHeight = std::min(pixelHeight, *m_height);
        }
        return {static_cast<int>(std::floor(m_surface.width() / m_rasterizer.scale())),
                static_cast<int>(std::floor(pixelHeight / m_rasterizer.scale()))};
    }

    HeatGrid createGrid()
    {
        const auto [width, height] = gridSize();
        HeatGrid grid(width, height, HeatGrid::Engine(m_seeder()));
        if (grid.empty()) {
            spdlog::warn("Surface of {}x{} at scale {} leaves no room for the "
                         "fire",
                         m_surface.width(), m_surface.height(),
                         m_rasterizer.scale());
        }
        return grid;
    }

    void tick()
    {
        m_grid.update();
        m_rasterizer.render(m_grid, m_palette);
    }

    void schedule()
    {
        std::weak_ptr<State> weak = shared_from_this();
        const uint64_t generation = m_generation;
        m_task = m_scheduler.scheduleAfter(m_interval, [weak, generation]() {
            if (auto state = weak.lock()) {
                state->onTimer(generation);
            }
        });
    }

    void onTimer(uint64_t generation)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // Stopped, or stopped and started again, since this was scheduled.
        if (!m_running || generation != m_generation) {
            return;
        }
        tick();
        schedule();
    }

    Surface& m_surface;

    Scheduler& m_scheduler;

    PaletteRasterizer m_rasterizer;

    Palette m_palette;

    std::chrono::milliseconds m_interval;

    std::optional<int> m_height;

    HeatGrid::Engine m_seeder;

    HeatGrid m_grid;

    bool m_running = false;

    uint64_t m_generation = 0;

    Scheduler::TaskId m_task = Scheduler::kInvalidTask;

    mutable std::mutex m_mutex;
};

EffectController::EffectController(Surface& surface, Scheduler& scheduler,
                                   EffectOptions options)
{
    validate(options);
    m_state = std::make_shared<State>(surface, scheduler, std::move(options));
    m_state->reset();
}

EffectController::~EffectController()
{
    std::lock_guard<std::mutex> lock(m_state->mutex());
    m_state->halt();
}

void EffectController::start()
{
    m_state->start();
}

void EffectController::stop()
{
    m_state->stop();
}

void EffectController::reset()
{
    m_state->reset();
}

bool EffectController::running() const
{
    return m_state->running();
}

Palette EffectController::palette() const
{
    return m_state->palette();
}

void EffectController::setPalette(const Palette& palette)
{
    m_state->setPalette(palette);
}

void EffectController::setPalette(const std::vector<Rgba>& colors)
{
    m_state->setPalette(Palette(colors));
}

std::chrono::milliseconds EffectController::interval() const
{
    return m_state->interval();
}

void EffectController::setInterval(std::chrono::milliseconds interval)
{
    m_state->setInterval(interval);
}

std::unique_ptr<EffectController> burn(Surface& surface, Scheduler& scheduler,
                                       EffectOptions options)
{
    auto controller = std::make_unique<EffectController>(surface, scheduler,
                                                         std::move(options));
    controller->start();
    return controller;
}

} // namespace burn
