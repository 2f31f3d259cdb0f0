// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef physical_location_hpp
#define physical_location_hpp

#include <iosfwd>

namespace tiledown {

/**
 The position of a sequencing cluster on the flowcell, as encoded in the read name.
 
 Tile is non-negative when known, x and y may be negative.
 */
struct PhysicalLocation
{
    using Tile = int;
    using Coordinate = int;
    
    static constexpr Tile unknownTile {-1};
    
    Tile tile = unknownTile;
    Coordinate x = -1, y = -1;
};

bool operator==(const PhysicalLocation& lhs, const PhysicalLocation& rhs) noexcept;
bool operator!=(const PhysicalLocation& lhs, const PhysicalLocation& rhs) noexcept;

std::ostream& operator<<(std::ostream& os, const PhysicalLocation& location);

} // namespace tiledown

#endif
