#include <burn/heat_grid.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace burn {

HeatGrid::HeatGrid(int width, int height, Engine generator)
    : m_width(std::max(width, 0)), m_height(std::max(height, 0)),
      m_generator(std::move(generator))
{
    reset();
}

int HeatGrid::width() const
{
    return m_width;
}

int HeatGrid::height() const
{
    return m_height;
}

std::size_t HeatGrid::size() const
{
    return m_cells.size();
}

bool HeatGrid::empty() const
{
    return m_cells.empty();
}

uint8_t HeatGrid::at(int x, int y) const
{
    return m_cells.at(static_cast<std::size_t>(y) * m_width + x);
}

const std::vector<uint8_t>& HeatGrid::cells() const
{
    return m_cells;
}

void HeatGrid::set(int x, int y, uint8_t intensity)
{
    if (x < 0 || x >= m_width || y < 0 || y >= m_height) {
        throw std::out_of_range("Cell " + std::to_string(x) + "," +
                                std::to_string(y) + " outside of grid");
    }
    if (intensity > kMaxIntensity) {
        throw std::out_of_range("Intensity " + std::to_string(intensity) +
                                " above " + std::to_string(kMaxIntensity));
    }
    m_cells[static_cast<std::size_t>(y) * m_width + x] = intensity;
}

void HeatGrid::reset()
{
    m_cells.assign(static_cast<std::size_t>(m_width) * m_height, 0);
    if (m_cells.empty()) {
        return;
    }
    // The bottom row is the fire source.
    std::fill(m_cells.end() - m_width, m_cells.end(), kMaxIntensity);
}

void HeatGrid::update()
{
    for (int x = 0; x < m_width; ++x) {
        for (int y = 1; y < m_height; ++y) {
            spread(y * m_width + x);
        }
    }
}

void HeatGrid::spread(int from)
{
    // Nothing above the top row.
    if (from < m_width) {
        return;
    }
    const int decay = m_decay(m_generator);
    const int to = from - m_width + (m_direction(m_generator) ? 1 : -1);
    // Column 0 of row 1 moving left would land before the buffer.
    if (to < 0) {
        return;
    }
    m_cells[to] = static_cast<uint8_t>(std::max(m_cells[from] - decay, 0));
}

} // namespace burn
