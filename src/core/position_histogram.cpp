// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "position_histogram.hpp"

#include <ostream>
#include <fstream>
#include <utility>

#include "exceptions/file_error.hpp"

namespace tiledown {

void PositionHistogram::add(const PhysicalLocation& location)
{
    ++x_positions_[location.tile][location.x];
    ++y_positions_[location.tile][location.y];
}

std::size_t PositionHistogram::num_tiles() const noexcept
{
    return x_positions_.size();
}

std::size_t PositionHistogram::count(const Tile tile, const Axis axis, const Coordinate position) const noexcept
{
    const auto& positions = axis == Axis::x ? x_positions_ : y_positions_;
    const auto tile_itr = positions.find(tile);
    if (tile_itr == std::cend(positions)) return 0;
    const auto bin_itr = tile_itr->second.find(position);
    return bin_itr != std::cend(tile_itr->second) ? bin_itr->second : 0;
}

namespace {

template <typename Map>
void write_axis(const Map& positions, const PositionHistogram::Axis axis, std::ostream& os)
{
    for (const auto& tile : positions) {
        for (const auto& bin : tile.second) {
            os << tile.first << '\t' << axis << '\t' << bin.first << '\t' << bin.second << '\n';
        }
    }
}

} // namespace

void PositionHistogram::write(std::ostream& os) const
{
    os << "tile\taxis\tposition\tcount\n";
    write_axis(x_positions_, Axis::x, os);
    write_axis(y_positions_, Axis::y, os);
}

std::ostream& operator<<(std::ostream& os, const PositionHistogram::Axis axis)
{
    switch (axis) {
        case PositionHistogram::Axis::x: os << 'x'; break;
        case PositionHistogram::Axis::y: os << 'y'; break;
    }
    return os;
}

namespace {

class UnwritableHistogram : public UnwritableFileError
{
    std::string do_where() const override { return "write(PositionHistogram)"; }
public:
    UnwritableHistogram(boost::filesystem::path file) : UnwritableFileError {std::move(file), "position histogram"} {}
};

} // namespace

void write(const PositionHistogram& histogram, const boost::filesystem::path& file)
{
    std::ofstream out {file.string()};
    if (!out) throw UnwritableHistogram {file};
    histogram.write(out);
    out.close();
    if (out.fail()) throw UnwritableHistogram {file};
}

} // namespace tiledown
