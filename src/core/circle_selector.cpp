// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "circle_selector.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include <boost/math/constants/constants.hpp>

namespace tiledown {

namespace {

double check_probability(const double probability)
{
    if (!(probability >= 0 && probability <= 1)) {
        throw std::domain_error {"CircleSelector: probability " + std::to_string(probability) + " not in [0, 1]"};
    }
    return probability;
}

double selection_area(const double probability) noexcept
{
    return probability > 0.5 ? 1 - probability : probability;
}

} // namespace

CircleSelector::CircleSelector(const double probability)
: probability_ {check_probability(probability)}
, radius_squared_ {selection_area(probability_) / boost::math::double_constants::pi} // so pi r^2 = area
, offset_ {}
, positive_selection_ {probability_ <= 0.5}
{
    const auto area = selection_area(probability_);
    // The circle centred at (offset, offset) intersects each edge of the unit square over length area
    offset_ = std::sqrt(radius_squared_ - area * area / 4);
}

double CircleSelector::probability() const noexcept
{
    return probability_;
}

double CircleSelector::radius_squared() const noexcept
{
    return radius_squared_;
}

double CircleSelector::offset() const noexcept
{
    return offset_;
}

bool CircleSelector::is_positive_selection() const noexcept
{
    return positive_selection_;
}

bool CircleSelector::select(const double u, const double v) const noexcept
{
    const auto dx = rounded_part(u - offset_), dy = rounded_part(v - offset_);
    // An empty circle contains nothing, so p = 0 keeps no reads and p = 1 keeps every read
    const bool inside {radius_squared_ > 0 && dx * dx + dy * dy <= radius_squared_};
    return inside != !positive_selection_;
}

bool CircleSelector::select(const PhysicalLocation& location, const TileBounds& bounds) const noexcept
{
    return select(normalise(location.x, bounds.max_x), normalise(location.y, bounds.max_y));
}

double rounded_part(const double x) noexcept
{
    return x - std::floor(x + 0.5);
}

double normalise(const PhysicalLocation::Coordinate position, const PhysicalLocation::Coordinate max) noexcept
{
    if (max == 0) return 0;
    return static_cast<double>(position) / max;
}

} // namespace tiledown
