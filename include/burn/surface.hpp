#pragma once
#include <burn/image.hpp>

namespace burn { // Begin of namespace burn

// Destination of the rasterized fire, e.g. a window or an offscreen buffer.
class Surface {
public:
    virtual ~Surface() = default;

    virtual int width() const = 0;

    virtual int height() const = 0;

    // Sets every pixel to transparent.
    virtual void clear() = 0;

    // Copies `src` of `image` onto `dst` of the surface, stretching with
    // nearest-neighbour sampling. Parts of `dst` outside the surface are
    // clipped.
    virtual void blit(const Image& image, const Rect& src, const Rect& dst) = 0;
};

} // End of namespace burn
