// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef circle_selector_hpp
#define circle_selector_hpp

#include "basics/physical_location.hpp"
#include "tile_bounds.hpp"

namespace tiledown {

/**
 CircleSelector decides whether to keep a read from its position within its tile.
 
 Positions are normalised to the unit square using the tile bounds. A circle of area p (or 1 - p
 when p > 0.5, with the decision inverted) is centred at (offset, offset), where the offset is
 chosen so that the circle cuts a width p out of each edge of the square. Coordinates are folded
 with period one, so the circle repeats across neighbouring tiles and reads at opposite edges of a
 tile (physically adjacent to the neighbouring tile) get consistent decisions.
 
 The decision only depends on the normalised position, so every record of a cluster (mates,
 secondary and supplementary alignments) is kept or removed together.
 */
class CircleSelector
{
public:
    CircleSelector() = delete;
    
    // Throws std::domain_error unless 0 <= probability <= 1
    explicit CircleSelector(double probability);
    
    CircleSelector(const CircleSelector&)            = default;
    CircleSelector& operator=(const CircleSelector&) = default;
    CircleSelector(CircleSelector&&)                 = default;
    CircleSelector& operator=(CircleSelector&&)      = default;
    
    ~CircleSelector() = default;
    
    double probability() const noexcept;
    double radius_squared() const noexcept;
    double offset() const noexcept;
    bool is_positive_selection() const noexcept;
    
    // u and v are the normalised coordinates of the read within its tile
    bool select(double u, double v) const noexcept;
    
    bool select(const PhysicalLocation& location, const TileBounds& bounds) const noexcept;
    
private:
    double probability_;
    double radius_squared_;
    double offset_;
    bool positive_selection_;
};

// Distance to the nearest integer, in [-0.5, 0.5)
double rounded_part(double x) noexcept;

double normalise(PhysicalLocation::Coordinate position, PhysicalLocation::Coordinate max) noexcept;

} // namespace tiledown

#endif
