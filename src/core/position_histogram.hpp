// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef position_histogram_hpp
#define position_histogram_hpp

#include <cstddef>
#include <map>
#include <iosfwd>

#include <boost/filesystem/path.hpp>

#include "basics/physical_location.hpp"

namespace tiledown {

/**
 PositionHistogram counts the reads at each x and y coordinate of each tile, which is useful
 for checking that reads are spread evenly within tiles (the downsampling rate depends on it).
 */
class PositionHistogram
{
public:
    using Tile = PhysicalLocation::Tile;
    using Coordinate = PhysicalLocation::Coordinate;
    
    enum class Axis { x, y };
    
    PositionHistogram() = default;
    
    PositionHistogram(const PositionHistogram&)            = default;
    PositionHistogram& operator=(const PositionHistogram&) = default;
    PositionHistogram(PositionHistogram&&)                 = default;
    PositionHistogram& operator=(PositionHistogram&&)      = default;
    
    ~PositionHistogram() = default;
    
    void add(const PhysicalLocation& location);
    
    std::size_t num_tiles() const noexcept;
    std::size_t count(Tile tile, Axis axis, Coordinate position) const noexcept;
    
    // Tab separated: tile, axis, position, count. Tiles and positions are in ascending order.
    void write(std::ostream& os) const;
    
private:
    using Bins = std::map<Coordinate, std::size_t>;
    
    std::map<Tile, Bins> x_positions_, y_positions_;
};

std::ostream& operator<<(std::ostream& os, PositionHistogram::Axis axis);

void write(const PositionHistogram& histogram, const boost::filesystem::path& file);

} // namespace tiledown

#endif
