/**
 * HeatGrid tests
 *
 * - Seeding of the source row by construction and reset()
 * - Bounds of the spread rule (range, no amplification, decay)
 * - Flat-index wrap at the outer columns
 * - Degenerate sizes
 */

#include <burn/heat_grid.hpp>
#include <test_support.hpp>
#include <unity.h>
#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace burn;

namespace {

// Highest intensity in rows `row` and below.
int maxFromRow(const std::vector<uint8_t>& cells, int width, int row)
{
    return *std::max_element(cells.begin() + row * width, cells.end());
}

} // namespace

void setUp(void)
{
}

void tearDown(void)
{
}

//==============================================================================
// Seeding
//==============================================================================

void test_reset_seeds_only_the_bottom_row()
{
    HeatGrid grid(4, 4, HeatGrid::Engine(1));
    grid.update();
    grid.reset();

    const uint8_t expected[] = {0,  0,  0,  0,  0,  0,  0,  0,
                                0,  0,  0,  0,  36, 36, 36, 36};
    TEST_ASSERT_EQUAL_UINT(16, grid.size());
    TEST_ASSERT_EQUAL_UINT8_ARRAY(expected, grid.cells().data(), 16);
}

void test_construction_seeds_the_bottom_row()
{
    HeatGrid grid(3, 2);
    TEST_ASSERT_EQUAL_INT(3, grid.width());
    TEST_ASSERT_EQUAL_INT(2, grid.height());
    TEST_ASSERT_EQUAL_UINT(6, grid.size());
    const uint8_t expected[] = {0, 0, 0, 36, 36, 36};
    TEST_ASSERT_EQUAL_UINT8_ARRAY(expected, grid.cells().data(), 6);
}

void test_reset_is_idempotent()
{
    HeatGrid grid(7, 5, HeatGrid::Engine(3));
    for (int i = 0; i < 4; ++i) {
        grid.update();
    }
    grid.reset();
    const auto once = grid.cells();
    grid.reset();
    TEST_ASSERT_TRUE(grid.cells() == once);
}

//==============================================================================
// Spread rule
//==============================================================================

void test_intensity_stays_in_range()
{
    HeatGrid grid(16, 12, HeatGrid::Engine(42));
    for (int tick = 0; tick < 200; ++tick) {
        grid.update();
        for (uint8_t cell : grid.cells()) {
            TEST_ASSERT_LESS_OR_EQUAL_UINT8(kMaxIntensity, cell);
        }
    }
}

void test_update_never_amplifies()
{
    // Heat moves up or sideways only, so no row can end up hotter than the
    // hottest cell at or below it before the pass.
    HeatGrid grid(9, 9, HeatGrid::Engine(7));
    for (int tick = 0; tick < 50; ++tick) {
        const auto before = grid.cells();
        grid.update();
        const auto& after = grid.cells();
        for (int y = 0; y < grid.height(); ++y) {
            const int bound = maxFromRow(before, grid.width(), y);
            for (int x = 0; x < grid.width(); ++x) {
                TEST_ASSERT_LESS_OR_EQUAL_INT(bound, after[y * grid.width() + x]);
            }
        }
    }
}

void test_single_update_on_four_by_four()
{
    for (unsigned seed = 1; seed <= 100; ++seed) {
        HeatGrid grid(4, 4, HeatGrid::Engine(seed));
        grid.update();
        for (int x = 0; x < 4; ++x) {
            TEST_ASSERT_GREATER_OR_EQUAL_INT(34, grid.at(x, 3));
            TEST_ASSERT_LESS_OR_EQUAL_INT(36, grid.at(x, 3));
        }
        // At most four chained copies in one pass, each losing up to 2.
        for (int y = 0; y < 3; ++y) {
            for (int x = 0; x < 4; ++x) {
                const int cell = grid.at(x, y);
                TEST_ASSERT_TRUE(cell == 0 || cell >= 28);
            }
        }
    }
}

void test_first_update_heats_the_row_above_the_source()
{
    HeatGrid grid(32, 8, HeatGrid::Engine(5));
    grid.update();
    int heated = 0;
    for (int x = 0; x < grid.width(); ++x) {
        if (grid.at(x, grid.height() - 2) > 0) {
            ++heated;
        }
    }
    // A cell stays cold only if neither neighbour below picked it.
    TEST_ASSERT_GREATER_THAN_INT(grid.width() / 2, heated);
}

void test_heat_decays_upwards()
{
    HeatGrid grid(32, 32, HeatGrid::Engine(9));
    for (int tick = 0; tick < 5; ++tick) {
        grid.update();
    }
    int top = 0;
    int bottom = 0;
    for (int y = 0; y < grid.height(); ++y) {
        for (int x = 0; x < grid.width(); ++x) {
            (y < grid.height() / 2 ? top : bottom) += grid.at(x, y);
        }
    }
    TEST_ASSERT_GREATER_THAN_INT(top, bottom);
}

void test_same_seed_same_fire()
{
    HeatGrid first(10, 10, HeatGrid::Engine(123));
    HeatGrid second(10, 10, HeatGrid::Engine(123));
    for (int tick = 0; tick < 10; ++tick) {
        first.update();
        second.update();
    }
    TEST_ASSERT_TRUE(first.cells() == second.cells());
}

//==============================================================================
// Edge columns
//==============================================================================

void test_bottom_row_only_changes_through_the_right_edge_wrap()
{
    HeatGrid grid(6, 6, HeatGrid::Engine(11));
    for (int tick = 0; tick < 100; ++tick) {
        grid.update();
        TEST_ASSERT_GREATER_OR_EQUAL_INT(34, grid.at(0, 5));
        for (int x = 1; x < grid.width(); ++x) {
            TEST_ASSERT_EQUAL_UINT8(36, grid.at(x, 5));
        }
    }
}

void test_right_edge_wraps_into_column_zero_of_the_source_row()
{
    // The column offset is applied to the flat index, so the last column
    // moving right lands on column 0 of its own row.
    bool wrapped = false;
    for (unsigned seed = 1; seed <= 64 && !wrapped; ++seed) {
        HeatGrid grid(3, 2, HeatGrid::Engine(seed));
        grid.update();
        wrapped = grid.at(0, 1) < 36;
    }
    TEST_ASSERT_TRUE(wrapped);
}

void test_left_edge_wraps_into_the_last_column_two_rows_up()
{
    // With only column 0 of the source row hot, the last column of row 1
    // can only heat up through the left wrap of that cell.
    bool wrapped = false;
    for (unsigned seed = 1; seed <= 64 && !wrapped; ++seed) {
        HeatGrid grid(4, 4, HeatGrid::Engine(seed));
        for (int x = 1; x < grid.width(); ++x) {
            grid.set(x, 3, 0);
        }
        grid.update();
        wrapped = grid.at(3, 1) >= 34;
    }
    TEST_ASSERT_TRUE(wrapped);
}

void test_left_edge_of_second_row_does_not_write_before_the_grid()
{
    // Column 0 of row 1 moving left would land at index -1.
    for (unsigned seed = 1; seed <= 64; ++seed) {
        HeatGrid grid(2, 2, HeatGrid::Engine(seed));
        grid.update();
        TEST_ASSERT_EQUAL_UINT(4, grid.size());
        for (uint8_t cell : grid.cells()) {
            TEST_ASSERT_LESS_OR_EQUAL_UINT8(kMaxIntensity, cell);
        }
    }
}

void test_single_column_burns_out()
{
    // The only cell of the source row is its own right neighbour.
    HeatGrid grid(1, 3, HeatGrid::Engine(4));
    for (int tick = 0; tick < 200; ++tick) {
        grid.update();
    }
    TEST_ASSERT_EQUAL_UINT8(0, grid.at(0, 2));
}

//==============================================================================
// Degenerate sizes
//==============================================================================

void test_empty_grids()
{
    for (auto size : {std::make_pair(0, 5), std::make_pair(5, 0),
                      std::make_pair(0, 0), std::make_pair(-3, 4)}) {
        HeatGrid grid(size.first, size.second);
        TEST_ASSERT_TRUE(grid.empty());
        TEST_ASSERT_EQUAL_UINT(0, grid.size());
        grid.update();
        grid.reset();
        TEST_ASSERT_TRUE(grid.cells().empty());
    }
}

void test_single_row_never_changes()
{
    HeatGrid grid(5, 1, HeatGrid::Engine(2));
    grid.update();
    TEST_ASSERT_TRUE(grid.cells() == std::vector<uint8_t>(5, 36));
}

void test_set_validates_coordinates_and_intensity()
{
    HeatGrid grid(3, 3);
    grid.set(1, 1, 18);
    TEST_ASSERT_EQUAL_UINT8(18, grid.at(1, 1));
    TEST_ASSERT_TRUE(test::throws<std::out_of_range>([&] { grid.set(3, 0, 1); }));
    TEST_ASSERT_TRUE(test::throws<std::out_of_range>([&] { grid.set(0, -1, 1); }));
    TEST_ASSERT_TRUE(test::throws<std::out_of_range>([&] { grid.set(0, 0, 37); }));
    TEST_ASSERT_EQUAL_UINT8(0, grid.at(0, 0));
}

int main()
{
    UNITY_BEGIN();

    RUN_TEST(test_reset_seeds_only_the_bottom_row);
    RUN_TEST(test_construction_seeds_the_bottom_row);
    RUN_TEST(test_reset_is_idempotent);

    RUN_TEST(test_intensity_stays_in_range);
    RUN_TEST(test_update_never_amplifies);
    RUN_TEST(test_single_update_on_four_by_four);
    RUN_TEST(test_first_update_heats_the_row_above_the_source);
    RUN_TEST(test_heat_decays_upwards);
    RUN_TEST(test_same_seed_same_fire);

    RUN_TEST(test_bottom_row_only_changes_through_the_right_edge_wrap);
    RUN_TEST(test_right_edge_wraps_into_column_zero_of_the_source_row);
    RUN_TEST(test_left_edge_wraps_into_the_last_column_two_rows_up);
    RUN_TEST(test_left_edge_of_second_row_does_not_write_before_the_grid);
    RUN_TEST(test_single_column_burns_out);

    RUN_TEST(test_empty_grids);
    RUN_TEST(test_single_row_never_changes);
    RUN_TEST(test_set_validates_coordinates_and_intensity);

    return UNITY_END();
}
