#pragma once
#include <burn/heat_grid.hpp>
#include <burn/image.hpp>
#include <burn/palette.hpp>
#include <burn/surface.hpp>

namespace burn { // Begin of namespace burn

// Maps a HeatGrid through a Palette into an intermediate raster at grid
// resolution and stretches it onto the bottom of a surface.
class PaletteRasterizer {
public:
    PaletteRasterizer(Surface& surface, double scale);

    PaletteRasterizer(const PaletteRasterizer&) = delete;

    PaletteRasterizer& operator=(const PaletteRasterizer&) = delete;

    double scale() const;

    // Intensity 0 is written fully transparent, everything else opaque
    // with the palette's RGB. The palette's alpha is ignored.
    void render(const HeatGrid& grid, const Palette& palette);

    // Raster produced by the last render.
    const Image& frame() const;

    // Area of the surface covered by a grid `gridHeight` rows high: full
    // surface width, anchored to the bottom edge.
    Rect destination(int gridHeight) const;

private:
    void fillFrame(const HeatGrid& grid, const Palette& palette);

    Surface& m_surface;

    double m_scale;

    Image m_frame;
};

} // End of namespace burn
