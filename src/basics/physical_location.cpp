// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "physical_location.hpp"

#include <ostream>

namespace tiledown {

constexpr PhysicalLocation::Tile PhysicalLocation::unknownTile;

bool operator==(const PhysicalLocation& lhs, const PhysicalLocation& rhs) noexcept
{
    return lhs.tile == rhs.tile && lhs.x == rhs.x && lhs.y == rhs.y;
}

bool operator!=(const PhysicalLocation& lhs, const PhysicalLocation& rhs) noexcept
{
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const PhysicalLocation& location)
{
    os << location.tile << ':' << location.x << ':' << location.y;
    return os;
}

} // namespace tiledown
