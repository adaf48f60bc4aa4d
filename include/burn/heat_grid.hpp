#pragma once
#include <burn/palette.hpp>
#include <cstdint>
#include <random>
#include <vector>

namespace burn { // Begin of namespace burn

// Intensity buffer of the fire. Row 0 is the top, the bottom row is the
// heat source. Cells are stored row-major and always hold a value in
// [0, kMaxIntensity].
class HeatGrid {
public:
    using Engine = std::default_random_engine;

    HeatGrid(int width, int height, Engine generator = Engine{});

    int width() const;

    int height() const;

    std::size_t size() const;

    bool empty() const;

    uint8_t at(int x, int y) const;

    const std::vector<uint8_t>& cells() const;

    // Throws std::out_of_range for coordinates outside the grid or an
    // intensity above kMaxIntensity.
    void set(int x, int y, uint8_t intensity);

    // Clears every cell and sets the bottom row to kMaxIntensity.
    void reset();

    // One propagation pass. Each cell below the top row copies its heat,
    // reduced by a random decay of 0 to 2, into the cell one row up and
    // one column left or right. The column offset is applied to the flat
    // index, so the outer columns wrap into the neighbouring row.
    void update();

private:
    void spread(int from);

    int m_width;

    int m_height;

    std::vector<uint8_t> m_cells;

    Engine m_generator;

    std::uniform_int_distribution<int> m_decay{0, 2};

    std::bernoulli_distribution m_direction{0.5};
};

} // End of namespace burn
