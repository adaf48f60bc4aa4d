#include <burn/palette.hpp>
#include <burn/error.hpp>
#include <algorithm>
#include <iterator>
#include <string>

namespace burn {

bool operator==(const Rgba& lhs, const Rgba& rhs)
{
    return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b &&
           lhs.a == rhs.a;
}

bool operator!=(const Rgba& lhs, const Rgba& rhs)
{
    return !(lhs == rhs);
}

Palette::Palette(const std::vector<Rgba>& colors)
{
    assign(colors.begin(), colors.end());
}

Palette::Palette(std::initializer_list<Rgba> colors)
{
    assign(colors.begin(), colors.end());
}

template <typename Iter> void Palette::assign(Iter first, Iter last)
{
    const auto count = std::distance(first, last);
    if (count != kPaletteSize) {
        throw ConfigurationError("Color palette must be " +
                                 std::to_string(kPaletteSize) +
                                 " elements, got " + std::to_string(count));
    }
    std::copy(first, last, m_colors.begin());
}

std::vector<Rgba> Palette::colors() const
{
    return std::vector<Rgba>(m_colors.begin(), m_colors.end());
}

bool Palette::operator==(const Palette& rhs) const
{
    return std::equal(m_colors.begin(), m_colors.end(), rhs.m_colors.begin());
}

bool Palette::operator!=(const Palette& rhs) const
{
    return !(*this == rhs);
}

const Palette& defaultPalette()
{
    // clang-format off
    static const Palette palette = {
        {0x07, 0x07, 0x07}, {0x1F, 0x07, 0x07}, {0x2F, 0x0F, 0x07},
        {0x47, 0x0F, 0x07}, {0x57, 0x17, 0x07}, {0x67, 0x1F, 0x07},
        {0x77, 0x1F, 0x07}, {0x8F, 0x27, 0x07}, {0x9F, 0x2F, 0x07},
        {0xAF, 0x3F, 0x07}, {0xBF, 0x47, 0x07}, {0xC7, 0x47, 0x07},
        {0xDF, 0x4F, 0x07}, {0xDF, 0x57, 0x07}, {0xDF, 0x57, 0x07},
        {0xD7, 0x5F, 0x07}, {0xD7, 0x5F, 0x07}, {0xD7, 0x67, 0x0F},
        {0xCF, 0x6F, 0x0F}, {0xCF, 0x77, 0x0F}, {0xCF, 0x7F, 0x0F},
        {0xCF, 0x87, 0x17}, {0xC7, 0x87, 0x17}, {0xC7, 0x8F, 0x17},
        {0xC7, 0x97, 0x1F}, {0xBF, 0x9F, 0x1F}, {0xBF, 0x9F, 0x1F},
        {0xBF, 0xA7, 0x27}, {0xBF, 0xA7, 0x27}, {0xBF, 0xAF, 0x2F},
        {0xB7, 0xAF, 0x2F}, {0xB7, 0xB7, 0x2F}, {0xB7, 0xB7, 0x37},
        {0xCF, 0xCF, 0x6F}, {0xDF, 0xDF, 0x9F}, {0xEF, 0xEF, 0xC7},
        {0xFF, 0xFF, 0xFF}};
    // clang-format on
    return palette;
}

} // namespace burn
