// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <vector>
#include <limits>
#include <stdexcept>
#include <cmath>

#include <boost/test/floating_point_comparison.hpp>
#include <boost/math/constants/constants.hpp>

#include <core/circle_selector.hpp>

namespace tiledown { namespace test {

namespace {

constexpr int gridSize {200};

double grid_point(const int i) noexcept
{
    return (i + 0.5) / gridSize;
}

double kept_fraction(const CircleSelector& selector)
{
    std::size_t num_kept {0};
    for (int i {0}; i < gridSize; ++i) {
        for (int j {0}; j < gridSize; ++j) {
            if (selector.select(grid_point(i), grid_point(j))) ++num_kept;
        }
    }
    return static_cast<double>(num_kept) / (gridSize * gridSize);
}

} // namespace

BOOST_AUTO_TEST_SUITE(core)
BOOST_AUTO_TEST_SUITE(circle_selector)

BOOST_AUTO_TEST_CASE(probabilities_outside_the_unit_interval_are_rejected)
{
    BOOST_CHECK_THROW(CircleSelector {-0.1}, std::domain_error);
    BOOST_CHECK_THROW(CircleSelector {1.00001}, std::domain_error);
    BOOST_CHECK_THROW(CircleSelector {std::numeric_limits<double>::quiet_NaN()}, std::domain_error);
    BOOST_CHECK_THROW(CircleSelector {std::numeric_limits<double>::infinity()}, std::domain_error);
    BOOST_CHECK_THROW(CircleSelector {-std::numeric_limits<double>::infinity()}, std::domain_error);
    BOOST_CHECK_NO_THROW(CircleSelector {0.0});
    BOOST_CHECK_NO_THROW(CircleSelector {1.0});
}

BOOST_AUTO_TEST_CASE(circle_area_is_the_smaller_of_p_and_one_minus_p)
{
    const auto pi = boost::math::double_constants::pi;
    const CircleSelector low {0.2}, high {0.8};
    BOOST_CHECK(low.is_positive_selection());
    BOOST_CHECK(!high.is_positive_selection());
    BOOST_CHECK_CLOSE(low.radius_squared(), 0.2 / pi, 1e-6);
    BOOST_CHECK_CLOSE(high.radius_squared(), 0.2 / pi, 1e-6);
    BOOST_CHECK_CLOSE(low.offset(), std::sqrt(0.2 / pi - 0.01), 1e-6);
    BOOST_CHECK_CLOSE(low.offset(), high.offset(), 1e-6);
    BOOST_CHECK(CircleSelector {0.5}.is_positive_selection());
}

BOOST_AUTO_TEST_CASE(rounded_part_folds_into_half_open_unit_interval_around_zero)
{
    BOOST_CHECK_CLOSE(rounded_part(0.7), -0.3, 1e-6);
    BOOST_CHECK_CLOSE(rounded_part(-0.2), -0.2, 1e-6);
    BOOST_CHECK_CLOSE(rounded_part(2.25), 0.25, 1e-6);
    BOOST_CHECK_EQUAL(rounded_part(0.5), -0.5);
    BOOST_CHECK_EQUAL(rounded_part(1.0), 0.0);
}

BOOST_AUTO_TEST_CASE(normalise_maps_positions_onto_the_unit_interval)
{
    BOOST_CHECK_EQUAL(normalise(0, 2000), 0.0);
    BOOST_CHECK_EQUAL(normalise(1000, 2000), 0.5);
    BOOST_CHECK_EQUAL(normalise(2000, 2000), 1.0);
    BOOST_CHECK_EQUAL(normalise(123, 0), 0.0);
}

BOOST_AUTO_TEST_CASE(select_is_deterministic)
{
    const CircleSelector selector {0.3};
    for (int i {0}; i < gridSize; ++i) {
        const auto u = grid_point(i), v = grid_point(gridSize - i - 1);
        const auto first = selector.select(u, v);
        BOOST_CHECK_EQUAL(selector.select(u, v), first);
        BOOST_CHECK_EQUAL(CircleSelector {0.3}.select(u, v), first);
    }
}

BOOST_AUTO_TEST_CASE(complementary_probabilities_make_complementary_decisions)
{
    const std::vector<double> probabilities {0.01, 0.1, 0.3, 0.45};
    for (const auto p : probabilities) {
        const CircleSelector selector {p}, complement {1 - p};
        for (int i {0}; i < gridSize; i += 3) {
            for (int j {0}; j < gridSize; j += 3) {
                const auto u = grid_point(i), v = grid_point(j);
                BOOST_CHECK_NE(selector.select(u, v), complement.select(u, v));
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(zero_keeps_nothing_and_one_keeps_everything)
{
    const CircleSelector none {0.0}, all {1.0};
    BOOST_CHECK_EQUAL(kept_fraction(none), 0.0);
    BOOST_CHECK_EQUAL(kept_fraction(all), 1.0);
    BOOST_CHECK(!none.select(0.0, 0.0));
    BOOST_CHECK(all.select(0.0, 0.0));
}

BOOST_AUTO_TEST_CASE(kept_area_is_close_to_the_requested_probability)
{
    const std::vector<double> probabilities {0.05, 0.1, 0.25, 0.3, 0.5, 0.7, 0.9};
    for (const auto p : probabilities) {
        BOOST_CHECK_SMALL(kept_fraction(CircleSelector {p}) - p, 0.01);
    }
}

BOOST_AUTO_TEST_CASE(circle_is_measured_from_its_centre_after_wrapping)
{
    // With p = 0.5 the circle pokes out past the far edge of the unit square
    const CircleSelector selector {0.5};
    const auto centre = selector.offset();
    const auto reach = 0.9 * std::sqrt(selector.radius_squared());
    BOOST_REQUIRE_GT(centre + reach, 0.5);
    BOOST_CHECK(selector.select(centre, centre));
    BOOST_CHECK(selector.select(centre + reach, centre));
    BOOST_CHECK(selector.select(centre, centre + reach));
    BOOST_CHECK(selector.select(centre + reach - 1, centre));
    BOOST_CHECK(!selector.select(centre + 0.5, centre + 0.5));
}

BOOST_AUTO_TEST_CASE(opposite_tile_edges_get_the_same_decision)
{
    const CircleSelector selector {0.3};
    TileBounds bounds {};
    bounds.max_x = 2000;
    bounds.max_y = 1000;
    for (int i {0}; i <= 1000; i += 10) {
        PhysicalLocation left {}, right {}, top {}, bottom {};
        left.tile = right.tile = top.tile = bottom.tile = 1;
        left.x = 0; right.x = 2000;
        left.y = right.y = i;
        top.y = 0; bottom.y = 1000;
        top.x = bottom.x = 2 * i;
        BOOST_CHECK_EQUAL(selector.select(left, bounds), selector.select(right, bounds));
        BOOST_CHECK_EQUAL(selector.select(top, bounds), selector.select(bottom, bounds));
    }
}

BOOST_AUTO_TEST_CASE(decision_is_periodic_across_neighbouring_tiles)
{
    const CircleSelector selector {0.2};
    for (int i {0}; i < gridSize; i += 7) {
        const auto u = grid_point(i), v = grid_point((3 * i) % gridSize);
        const auto decision = selector.select(u, v);
        BOOST_CHECK_EQUAL(selector.select(u + 1, v), decision);
        BOOST_CHECK_EQUAL(selector.select(u, v - 1), decision);
        BOOST_CHECK_EQUAL(selector.select(u - 2, v + 3), decision);
    }
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace tiledown
