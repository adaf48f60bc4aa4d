#include <burn/palette_rasterizer.hpp>
#include <algorithm>
#include <cmath>

namespace burn {

PaletteRasterizer::PaletteRasterizer(Surface& surface, double scale)
    : m_surface(surface), m_scale(scale)
{
}

double PaletteRasterizer::scale() const
{
    return m_scale;
}

void PaletteRasterizer::render(const HeatGrid& grid, const Palette& palette)
{
    fillFrame(grid, palette);

    m_surface.clear();
    if (grid.empty()) {
        return;
    }
    m_surface.blit(m_frame, Rect{0, 0, grid.width(), grid.height()},
                   destination(grid.height()));
}

const Image& PaletteRasterizer::frame() const
{
    return m_frame;
}

Rect PaletteRasterizer::destination(int gridHeight) const
{
    const int height = std::min(
        static_cast<int>(std::floor(gridHeight * m_scale)), m_surface.height());
    return Rect{0, m_surface.height() - height, m_surface.width(), height};
}

void PaletteRasterizer::fillFrame(const HeatGrid& grid, const Palette& palette)
{
    m_frame.resize(grid.width(), grid.height());

    const auto& cells = grid.cells();
    for (int y = 0; y < grid.height(); ++y) {
        for (int x = 0; x < grid.width(); ++x) {
            const uint8_t intensity =
                cells[static_cast<std::size_t>(y) * grid.width() + x];
            if (intensity == 0) {
                m_frame(x, y) = Rgba{0, 0, 0, 0};
            } else {
                const Rgba& color = palette[intensity];
                m_frame(x, y) = Rgba{color.r, color.g, color.b, 255};
            }
        }
    }
}

} // namespace burn
