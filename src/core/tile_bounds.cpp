// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "tile_bounds.hpp"

#include <algorithm>
#include <ostream>

#include "exceptions/program_error.hpp"

namespace tiledown {

std::ostream& operator<<(std::ostream& os, const TileBounds& bounds)
{
    os << "max_x=" << bounds.max_x << " max_y=" << bounds.max_y << " reads=" << bounds.count;
    return os;
}

namespace {

class FinalisedTileBoundsModification : public ProgramError
{
    std::string do_where() const override { return "TileBoundsMap::add"; }
    std::string do_why() const override { return "tile bounds were modified after being finalised"; }
};

auto inflate(const PhysicalLocation::Coordinate max, const std::size_t count) noexcept
{
    return static_cast<PhysicalLocation::Coordinate>(max * ((count + 1.0) / count));
}

} // namespace

TileBounds& TileBoundsMap::get_or_insert(const Tile tile)
{
    auto itr = bounds_.find(tile);
    if (itr == std::end(bounds_)) {
        itr = bounds_.emplace(tile, TileBounds {}).first;
    }
    return itr->second;
}

void TileBoundsMap::add(const PhysicalLocation& location)
{
    if (finalised_) throw FinalisedTileBoundsModification {};
    auto& bounds = get_or_insert(location.tile);
    bounds.max_x = std::max(bounds.max_x, location.x);
    bounds.max_y = std::max(bounds.max_y, location.y);
    ++bounds.count;
}

void TileBoundsMap::finalise()
{
    if (finalised_) return;
    for (auto& p : bounds_) {
        auto& bounds = p.second;
        if (bounds.count > 0) {
            bounds.max_x = inflate(bounds.max_x, bounds.count);
            bounds.max_y = inflate(bounds.max_y, bounds.count);
        }
    }
    finalised_ = true;
}

bool TileBoundsMap::is_finalised() const noexcept
{
    return finalised_;
}

boost::optional<const TileBounds&> TileBoundsMap::find(const Tile tile) const
{
    const auto itr = bounds_.find(tile);
    if (itr == std::cend(bounds_)) return boost::none;
    return itr->second;
}

std::size_t TileBoundsMap::size() const noexcept
{
    return bounds_.size();
}

bool TileBoundsMap::empty() const noexcept
{
    return bounds_.empty();
}

TileBoundsMap::const_iterator TileBoundsMap::begin() const noexcept
{
    return bounds_.begin();
}

TileBoundsMap::const_iterator TileBoundsMap::end() const noexcept
{
    return bounds_.end();
}

} // namespace tiledown
