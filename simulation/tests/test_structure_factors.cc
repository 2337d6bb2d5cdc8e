#include <gtest/gtest.h>

#include <algorithm>
#include <complex>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

#include "errors.hpp"
#include "structure_factors.hpp"

using Eigen::Vector3d;

TEST(StructureFactorTable, lookup_tabulated_and_missing) {
    std::vector<StructureFactorEntry> entries{
      {{1, 2, 3}, {4.0, -1.0}}, {{-2, 0, 1}, {7.5, 0.0}}, {{0, 0, 0}, {100.0, 0.0}}};
    StructureFactorTable table(entries);

    EXPECT_EQ(table.size(), 3);
    EXPECT_EQ(table.lookup(1, 2, 3), std::complex<double>(4.0, -1.0));
    EXPECT_EQ(table.lookup({-2, 0, 1}), std::complex<double>(7.5, 0.0));
    EXPECT_EQ(table.lookup(0, 0, 0), std::complex<double>(100.0, 0.0));
    // Inside the bounding box but never given
    EXPECT_EQ(table.lookup(0, 1, 2), std::complex<double>(0.0, 0.0));
    // Outside the bounding box
    EXPECT_EQ(table.lookup(50, -50, 9), std::complex<double>(0.0, 0.0));

    EXPECT_TRUE(table.is_tabulated({1, 2, 3}));
    EXPECT_FALSE(table.is_tabulated({0, 1, 2}));
    EXPECT_FALSE(table.is_tabulated({50, -50, 9}));
}

TEST(StructureFactorTable, configured_default_amplitude) {
    StructureFactorTable table({{{0, 0, 0}, {3.0, 0.0}}}, {2.5, 0.0});
    EXPECT_EQ(table.lookup(0, 0, 0), std::complex<double>(3.0, 0.0));
    EXPECT_EQ(table.lookup(1, 1, 1), std::complex<double>(2.5, 0.0));
    EXPECT_EQ(table.default_amplitude(), std::complex<double>(2.5, 0.0));
}

TEST(StructureFactorTable, empty_table_returns_default) {
    StructureFactorTable table({}, {1.0, 0.0});
    EXPECT_EQ(table.size(), 0);
    EXPECT_EQ(table.lookup(0, 0, 0), std::complex<double>(1.0, 0.0));
    EXPECT_EQ(table.lookup(-7, 3, 12), std::complex<double>(1.0, 0.0));
    auto blended = table.interpolate(Vector3d(0.3, -1.7, 2.2), InterpolationMode::TRILINEAR);
    EXPECT_NEAR(blended.real(), 1.0, 1e-12);
    EXPECT_EQ(blended.imag(), 0.0);
    EXPECT_FALSE(table.is_tabulated({0, 0, 0}));
}

TEST(StructureFactorTable, conflicting_duplicate_throws) {
    std::vector<StructureFactorEntry> entries{{{1, 1, 1}, {2.0, 0.0}},
                                              {{0, 0, 1}, {1.0, 0.0}},
                                              {{1, 1, 1}, {2.0, 0.5}}};
    EXPECT_THROW(StructureFactorTable table(entries), DuplicateIndexError);
}

TEST(StructureFactorTable, identical_duplicate_accepted) {
    std::vector<StructureFactorEntry> entries{{{1, 1, 1}, {2.0, 0.5}},
                                              {{1, 1, 1}, {2.0, 0.5}}};
    StructureFactorTable table(entries);
    EXPECT_EQ(table.size(), 1);
    EXPECT_EQ(table.lookup(1, 1, 1), std::complex<double>(2.0, 0.5));
}

TEST(StructureFactorTable, construction_independent_of_order) {
    std::vector<StructureFactorEntry> entries;
    for (int h = -3; h <= 2; ++h) {
        for (int k = -1; k <= 4; ++k) {
            for (int l = 0; l <= 3; ++l) {
                if ((h + k + l) % 3 == 0) continue;
                entries.push_back({{h, k, l}, {1.0 * h + 0.1 * k, 0.01 * l}});
            }
        }
    }
    auto shuffled = entries;
    std::mt19937 rng(42);
    std::shuffle(shuffled.begin(), shuffled.end(), rng);

    for (auto policy : {MissingIndexPolicy::DEFAULT, MissingIndexPolicy::NEAREST}) {
        StructureFactorTable ordered(entries, {0.5, 0.0}, policy);
        StructureFactorTable scrambled(shuffled, {0.5, 0.0}, policy);
        EXPECT_EQ(ordered.grid_as<double>().size(), scrambled.grid_as<double>().size());
        for (int h = -5; h <= 5; ++h) {
            for (int k = -3; k <= 6; ++k) {
                for (int l = -2; l <= 5; ++l) {
                    EXPECT_EQ(ordered.lookup(h, k, l), scrambled.lookup(h, k, l))
                      << "at " << h << "," << k << "," << l;
                }
            }
        }
    }
}

TEST(StructureFactorTable, nearest_policy_fills_holes_and_clamps) {
    std::vector<StructureFactorEntry> entries{{{0, 0, 0}, {1.0, 0.0}},
                                              {{3, 0, 0}, {3.0, 0.0}}};
    StructureFactorTable table(entries, {0.0, 0.0}, MissingIndexPolicy::NEAREST);

    EXPECT_EQ(table.lookup(0, 0, 0), std::complex<double>(1.0, 0.0));
    EXPECT_EQ(table.lookup(1, 0, 0), std::complex<double>(1.0, 0.0));
    EXPECT_EQ(table.lookup(2, 0, 0), std::complex<double>(3.0, 0.0));
    EXPECT_EQ(table.lookup(3, 0, 0), std::complex<double>(3.0, 0.0));
    // Outside the grid the index is clamped onto it
    EXPECT_EQ(table.lookup(10, 0, 0), std::complex<double>(3.0, 0.0));
    EXPECT_EQ(table.lookup(-4, 2, -2), std::complex<double>(1.0, 0.0));
    // Filled cells are still reported as not tabulated
    EXPECT_FALSE(table.is_tabulated({1, 0, 0}));
}

TEST(StructureFactorTable, interpolation_modes) {
    std::vector<StructureFactorEntry> entries{{{0, 0, 0}, {1.0, 0.0}},
                                              {{1, 0, 0}, {3.0, 2.0}}};
    StructureFactorTable table(entries);

    // Exact halves round down
    EXPECT_EQ(table.interpolate(Vector3d(0.4, 0.0, 0.0), InterpolationMode::NEAREST),
              std::complex<double>(1.0, 0.0));
    EXPECT_EQ(table.interpolate(Vector3d(0.6, 0.1, -0.2), InterpolationMode::NEAREST),
              std::complex<double>(3.0, 2.0));
    EXPECT_EQ(table.interpolate(Vector3d(0.5, 0.0, 0.0), InterpolationMode::NEAREST),
              std::complex<double>(1.0, 0.0));

    auto blended =
      table.interpolate(Vector3d(0.25, 0.0, 0.0), InterpolationMode::TRILINEAR);
    EXPECT_DOUBLE_EQ(blended.real(), 0.75 * 1.0 + 0.25 * 3.0);
    EXPECT_DOUBLE_EQ(blended.imag(), 0.25 * 2.0);

    // Half way towards an untabulated neighbour along k blends with zero
    auto towards_missing =
      table.interpolate(Vector3d(0.0, 0.5, 0.0), InterpolationMode::TRILINEAR);
    EXPECT_DOUBLE_EQ(towards_missing.real(), 0.5);
    EXPECT_DOUBLE_EQ(towards_missing.imag(), 0.0);
}

TEST(StructureFactorTable, oversized_index_range_rejected) {
    std::vector<StructureFactorEntry> entries{{{0, 0, 0}, {1.0, 0.0}},
                                              {{1000, 1000, 1000}, {1.0, 0.0}}};
    EXPECT_THROW(StructureFactorTable table(entries), std::invalid_argument);

    // 2^22 per axis: the cell count wraps to zero in 64 bits
    entries[1].index = {4194303, 4194303, 4194303};
    EXPECT_THROW(StructureFactorTable table(entries), std::invalid_argument);

    // The span itself does not fit in an int
    entries = {{{std::numeric_limits<int>::min(), 0, 0}, {1.0, 0.0}},
               {{std::numeric_limits<int>::max(), 0, 0}, {2.0, 0.0}}};
    EXPECT_THROW(StructureFactorTable table(entries), std::invalid_argument);

    // One long axis is fine while the total stays small
    StructureFactorTable line({{{-50000, 0, 0}, {1.0, 0.0}}, {{50000, 0, 0}, {2.0, 0.0}}});
    EXPECT_EQ(line.lookup(50000, 0, 0), std::complex<double>(2.0, 0.0));
}

TEST(StructureFactorTable, float_grid_matches_double) {
    StructureFactorTable table({{{0, 0, 0}, {1.5, -0.25}}, {{0, 1, 0}, {2.0, 0.0}}});
    auto grid = table.grid_as<float>();
    ASSERT_EQ(grid.size(), 2);
    EXPECT_FLOAT_EQ(grid[0].re, 1.5f);
    EXPECT_FLOAT_EQ(grid[0].im, -0.25f);
    EXPECT_FLOAT_EQ(grid[1].re, 2.0f);
}
