#pragma once
#include <burn/surface.hpp>

namespace burn { // Begin of namespace burn

class MemorySurface : public Surface {
public:
    MemorySurface(int width, int height);

    int width() const override;

    int height() const override;

    void clear() override;

    void blit(const Image& image, const Rect& src, const Rect& dst) override;

    // Discards the contents.
    void resize(int width, int height);

    const Image& image() const;

    const Rgba& pixel(int x, int y) const;

private:
    Image m_image;
};

} // End of namespace burn
