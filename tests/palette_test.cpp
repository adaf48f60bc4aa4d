/**
 * Palette tests
 *
 * - Default Doom ramp
 * - Length validation on construction
 * - Value comparison
 */

#include <burn/error.hpp>
#include <burn/palette.hpp>
#include <test_support.hpp>
#include <unity.h>
#include <stdexcept>
#include <vector>

using namespace burn;

void setUp(void)
{
}

void tearDown(void)
{
}

void test_default_palette_ramps_from_dark_to_white()
{
    const Palette& palette = defaultPalette();
    TEST_ASSERT_EQUAL_UINT(37, palette.size());
    test::assertEqualRgba(Rgba{0x07, 0x07, 0x07, 255}, palette[0], __LINE__);
    test::assertEqualRgba(Rgba{0xDF, 0x4F, 0x07, 255}, palette[12], __LINE__);
    test::assertEqualRgba(
        Rgba{0xFF, 0xFF, 0xFF, 255}, palette[kMaxIntensity], __LINE__);
}

void test_accepts_exactly_37_colors()
{
    std::vector<Rgba> colors(37, Rgba{1, 2, 3});
    colors[36] = Rgba{4, 5, 6, 7};
    Palette palette(colors);
    test::assertEqualRgba(Rgba{4, 5, 6, 7}, palette[36], __LINE__);
    TEST_ASSERT_TRUE(palette.colors() == colors);
}

void test_rejects_other_lengths()
{
    for (std::size_t count : {0, 1, 36, 38, 74}) {
        const std::vector<Rgba> colors(count);
        TEST_ASSERT_TRUE(
            test::throws<ConfigurationError>([&] { Palette palette(colors); }));
    }
}

void test_configuration_error_is_invalid_argument()
{
    const std::vector<Rgba> three(3);
    TEST_ASSERT_TRUE(
        test::throws<std::invalid_argument>([&] { Palette palette(three); }));
}

void test_compares_by_value()
{
    const Palette gray(std::vector<Rgba>(37, Rgba{9, 9, 9}));
    TEST_ASSERT_TRUE(gray == Palette(std::vector<Rgba>(37, Rgba{9, 9, 9})));
    TEST_ASSERT_TRUE(gray != defaultPalette());
}

int main()
{
    UNITY_BEGIN();

    RUN_TEST(test_default_palette_ramps_from_dark_to_white);
    RUN_TEST(test_accepts_exactly_37_colors);
    RUN_TEST(test_rejects_other_lengths);
    RUN_TEST(test_configuration_error_is_invalid_argument);
    RUN_TEST(test_compares_by_value);

    return UNITY_END();
}
