#include <gtest/gtest.h>
#include <hjbfd/pde/Grid.h>
#include <cmath>
#include <stdexcept>

// ============================================================================
// Test Tolerances
// ============================================================================

constexpr double GRID_TOL = 1e-12;  // Tight tolerance for grid construction

// ============================================================================
// Grid Construction Tests
// ============================================================================

TEST(PDEGridTest, UniformGridConstruction) {
    Grid grid(0.0, 1.0, 20);

    EXPECT_EQ(grid.size(), 20u);
    EXPECT_NEAR(grid.lower(), 0.0, GRID_TOL);
    EXPECT_NEAR(grid.upper(), 1.0, GRID_TOL);
    EXPECT_NEAR(grid.dx(), 1.0 / 19.0, GRID_TOL);
}

TEST(PDEGridTest, UnitIntervalConstructor) {
    Grid grid(11);

    EXPECT_EQ(grid.size(), 11u);
    EXPECT_NEAR(grid.point(0), 0.0, GRID_TOL);
    EXPECT_NEAR(grid.point(5), 0.5, GRID_TOL);
    EXPECT_NEAR(grid.point(10), 1.0, GRID_TOL);
}

TEST(PDEGridTest, UniformGridSpacing) {
    Grid grid(-2.0, 3.0, 51);

    for (size_t i = 1; i < grid.size(); ++i) {
        EXPECT_NEAR(grid.point(i) - grid.point(i-1), grid.dx(), GRID_TOL)
            << "Spacing not uniform at point " << i;
    }
}

TEST(PDEGridTest, EndpointsAreExact) {
    Grid grid(0.0, 1.0, 7);

    // the top end is pinned, not accumulated
    EXPECT_EQ(grid.points().front(), 0.0);
    EXPECT_EQ(grid.points().back(), 1.0);
    EXPECT_EQ(grid[6], 1.0);
}

TEST(PDEGridTest, MinimalGrid) {
    Grid grid(0.0, 1.0, 2);

    EXPECT_EQ(grid.size(), 2u);
    EXPECT_NEAR(grid.dx(), 1.0, GRID_TOL);
}

TEST(PDEGridTest, GetBounds) {
    Grid grid(0.25, 4.0, 10);
    auto [lo, hi] = grid.bounds();

    EXPECT_NEAR(lo, 0.25, GRID_TOL);
    EXPECT_NEAR(hi, 4.0, GRID_TOL);
}

TEST(PDEGridTest, CopyConstructor) {
    Grid grid(0.0, 1.0, 5);
    Grid copy(grid);

    ASSERT_EQ(copy.size(), grid.size());
    for (size_t i = 0; i < grid.size(); ++i) {
        EXPECT_EQ(copy.point(i), grid.point(i));
    }
}

// ============================================================================
// Interval Lookup
// ============================================================================

TEST(PDEGridTest, FindInterval) {
    Grid grid(0.0, 1.0, 11);  // h = 0.1

    EXPECT_EQ(grid.findInterval(0.0), 0u);
    EXPECT_EQ(grid.findInterval(0.05), 0u);
    EXPECT_EQ(grid.findInterval(0.35), 3u);
    EXPECT_EQ(grid.findInterval(0.95), 9u);
    EXPECT_EQ(grid.findInterval(1.0), 9u);  // last interval
}

TEST(PDEGridTest, FindIntervalOutOfRange) {
    Grid grid(0.0, 1.0, 11);

    EXPECT_THROW(grid.findInterval(-0.01), std::out_of_range);
    EXPECT_THROW(grid.findInterval(1.01), std::out_of_range);
}

// ============================================================================
// Validation
// ============================================================================

TEST(PDEGridTest, InvalidRange) {
    EXPECT_THROW(Grid(1.0, 1.0, 10), std::invalid_argument)
        << "Should reject x_max == x_min";
    EXPECT_THROW(Grid(1.0, 0.0, 10), std::invalid_argument)
        << "Should reject x_max < x_min";
    EXPECT_THROW(Grid(0.0, INFINITY, 10), std::invalid_argument)
        << "Should reject infinite bound";
    EXPECT_THROW(Grid(NAN, 1.0, 10), std::invalid_argument)
        << "Should reject NaN bound";
}

TEST(PDEGridTest, InvalidGridDimensions) {
    EXPECT_THROW(Grid(0.0, 1.0, 1), std::invalid_argument)
        << "Should reject single point grid";
    EXPECT_THROW(Grid(0.0, 1.0, 0), std::invalid_argument)
        << "Should reject empty grid";
}
