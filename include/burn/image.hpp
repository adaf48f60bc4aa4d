#pragma once
#include <burn/palette.hpp>
#include <algorithm>
#include <vector>

namespace burn { // Begin of namespace burn

struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

// Owning RGBA raster, row-major, row 0 at the top.
class Image {
public:
    Image() = default;

    Image(int width, int height) : m_width(width), m_height(height)
    {
        m_pixels.resize(static_cast<std::size_t>(width) * height);
    }

    Rgba& operator()(int x, int y)
    {
        return m_pixels[static_cast<std::size_t>(y) * m_width + x];
    }

    const Rgba& operator()(int x, int y) const
    {
        return m_pixels[static_cast<std::size_t>(y) * m_width + x];
    }

    int width() const
    {
        return m_width;
    }

    int height() const
    {
        return m_height;
    }

    bool empty() const
    {
        return m_pixels.empty();
    }

    // Reallocates when the size changes. Contents are unspecified after a
    // resize and are expected to be overwritten.
    void resize(int width, int height)
    {
        if (width == m_width && height == m_height) {
            return;
        }
        m_width = width;
        m_height = height;
        m_pixels.assign(static_cast<std::size_t>(width) * height, Rgba{});
    }

    void fill(const Rgba& color)
    {
        std::fill(m_pixels.begin(), m_pixels.end(), color);
    }

    const Rgba* data() const
    {
        return m_pixels.data();
    }

    std::size_t byteSize() const
    {
        return m_pixels.size() * sizeof(Rgba);
    }

private:
    int m_width = 0;

    int m_height = 0;

    std::vector<Rgba> m_pixels;
};

} // End of namespace burn
