#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <vector>

namespace burn { // Begin of namespace burn

const int kPaletteSize = 37;

const uint8_t kMaxIntensity = kPaletteSize - 1;

struct Rgba {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;
};

bool operator==(const Rgba& lhs, const Rgba& rhs);

bool operator!=(const Rgba& lhs, const Rgba& rhs);

// Color table indexed by intensity. Always holds exactly kPaletteSize
// entries; the constructors throw ConfigurationError otherwise.
class Palette {
public:
    explicit Palette(const std::vector<Rgba>& colors);

    Palette(std::initializer_list<Rgba> colors);

    const Rgba& operator[](int intensity) const
    {
        return m_colors[intensity];
    }

    std::size_t size() const
    {
        return m_colors.size();
    }

    std::vector<Rgba> colors() const;

    bool operator==(const Palette& rhs) const;

    bool operator!=(const Palette& rhs) const;

private:
    template <typename Iter> void assign(Iter first, Iter last);

    std::array<Rgba, kPaletteSize> m_colors;
};

// The classic Doom PSX ramp from near black over red and yellow to white.
const Palette& defaultPalette();

} // End of namespace burn
