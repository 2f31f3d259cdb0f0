// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef tile_bounds_hpp
#define tile_bounds_hpp

#include <cstddef>
#include <unordered_map>
#include <iosfwd>

#include <boost/optional.hpp>

#include "basics/physical_location.hpp"

namespace tiledown {

struct TileBounds
{
    PhysicalLocation::Coordinate max_x = 0, max_y = 0;
    std::size_t count = 0;
};

std::ostream& operator<<(std::ostream& os, const TileBounds& bounds);

/**
 TileBoundsMap estimates the extent of each tile from the largest coordinates observed on it.
 
 Locations are added during a single pass over the reads, after which finalise() inflates each
 maximum by (count + 1) / count, as the true extent of a tile is likely slightly larger than the
 largest coordinate in a finite sample. The map is read-only once finalised.
 */
class TileBoundsMap
{
public:
    using Tile = PhysicalLocation::Tile;
    using Container = std::unordered_map<Tile, TileBounds>;
    using const_iterator = Container::const_iterator;
    
    TileBoundsMap() = default;
    
    TileBoundsMap(const TileBoundsMap&)            = default;
    TileBoundsMap& operator=(const TileBoundsMap&) = default;
    TileBoundsMap(TileBoundsMap&&)                 = default;
    TileBoundsMap& operator=(TileBoundsMap&&)      = default;
    
    ~TileBoundsMap() = default;
    
    // Inserts zeroed bounds for tile if there are none yet
    TileBounds& get_or_insert(Tile tile);
    
    void add(const PhysicalLocation& location);
    
    void finalise();
    
    bool is_finalised() const noexcept;
    
    boost::optional<const TileBounds&> find(Tile tile) const;
    
    std::size_t size() const noexcept;
    bool empty() const noexcept;
    
    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;
    
private:
    Container bounds_;
    bool finalised_ = false;
};

} // namespace tiledown

#endif
