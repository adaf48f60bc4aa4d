#include <burn/memory_surface.hpp>
#include <algorithm>

namespace burn {

namespace {

// Maps a destination offset to the source texel under the centre of that
// destination pixel.
int sample(int offset, int srcLength, int dstLength)
{
    return static_cast<int>((2LL * offset + 1) * srcLength / (2LL * dstLength));
}

} // namespace

MemorySurface::MemorySurface(int width, int height)
    : m_image(std::max(width, 0), std::max(height, 0))
{
    clear();
}

int MemorySurface::width() const
{
    return m_image.width();
}

int MemorySurface::height() const
{
    return m_image.height();
}

void MemorySurface::clear()
{
    m_image.fill(Rgba{0, 0, 0, 0});
}

void MemorySurface::blit(const Image& image, const Rect& src, const Rect& dst)
{
    if (src.width <= 0 || src.height <= 0 || dst.width <= 0 ||
        dst.height <= 0) {
        return;
    }

    const int x0 = std::max(dst.x, 0);
    const int y0 = std::max(dst.y, 0);
    const int x1 = std::min(dst.x + dst.width, width());
    const int y1 = std::min(dst.y + dst.height, height());

    for (int y = y0; y < y1; ++y) {
        const int sy = src.y + sample(y - dst.y, src.height, dst.height);
        for (int x = x0; x < x1; ++x) {
            const int sx = src.x + sample(x - dst.x, src.width, dst.width);
            m_image(x, y) = image(sx, sy);
        }
    }
}

void MemorySurface::resize(int width, int height)
{
    m_image.resize(std::max(width, 0), std::max(height, 0));
    clear();
}

const Image& MemorySurface::image() const
{
    return m_image;
}

const Rgba& MemorySurface::pixel(int x, int y) const
{
    return m_image(x, y);
}

} // namespace burn
