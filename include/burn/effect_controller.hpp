#pragma once
#include <burn/heat_grid.hpp>
#include <burn/palette.hpp>
#include <burn/scheduler.hpp>
#include <burn/surface.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace burn { // Begin of namespace burn

struct EffectOptions {
    // Surface pixels per grid cell. Fixed for the lifetime of a controller.
    double scale = 3.5;

    std::chrono::milliseconds interval{30};

    Palette palette = defaultPalette();

    // Height of the effect in surface pixels, measured from the bottom
    // edge. Defaults to the surface height.
    std::optional<int> height;

    // Seed of the simulation's random engine. Unset draws one from
    // std::random_device.
    std::optional<HeatGrid::Engine::result_type> seed;
};

// Drives one fire on one surface. Every tick updates the grid and renders
// it; ticks are scheduled on `scheduler` every interval while running.
// Surface and scheduler must outlive the controller.
class EffectController {
public:
    EffectController(Surface& surface, Scheduler& scheduler,
                     EffectOptions options = EffectOptions{});

    ~EffectController();

    EffectController(const EffectController&) = delete;

    EffectController& operator=(const EffectController&) = delete;

    // Runs one tick right away and keeps ticking until stop(). Does
    // nothing if already running.
    void start();

    // Cancels the pending tick. The last frame stays on the surface.
    void stop();

    // Clears and reseeds the fire and renders it once. A grid matching the
    // current surface size replaces the old one if the surface was
    // resized. The running state is left alone.
    void reset();

    bool running() const;

    Palette palette() const;

    // Used from the next render on.
    void setPalette(const Palette& palette);

    // Throws ConfigurationError unless `colors` holds exactly kPaletteSize
    // entries.
    void setPalette(const std::vector<Rgba>& colors);

    std::chrono::milliseconds interval() const;

    // Used when the next tick is scheduled. A pending tick keeps its delay.
    void setInterval(std::chrono::milliseconds interval);

private:
    class State;

    std::shared_ptr<State> m_state;
};

// Creates a controller and starts it.
std::unique_ptr<EffectController> burn(Surface& surface, Scheduler& scheduler,
                                       EffectOptions options = EffectOptions{});

} // End of namespace burn
