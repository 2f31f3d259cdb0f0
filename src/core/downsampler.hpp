// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef downsampler_hpp
#define downsampler_hpp

#include <cstddef>
#include <string>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "read_name_parser.hpp"
#include "tile_bounds.hpp"
#include "circle_selector.hpp"
#include "position_histogram.hpp"

namespace tiledown {

struct DownsampleOptions
{
    using Path = boost::filesystem::path;
    
    Path input, output;
    boost::optional<Path> reference = boost::none;
    double probability = 1.0;
    boost::optional<std::size_t> stop_after = boost::none;
    bool allow_multiple_downsampling = false;
    bool remove_duplicate_information = true;
    // boost::none disables location parsing
    boost::optional<std::string> read_name_pattern = ReadNameParser::defaultPattern;
    boost::optional<Path> position_histogram = boost::none;
    std::string command_line = "";
};

struct DownsampleReport
{
    std::size_t total = 0, kept = 0, unlocated = 0;
    std::size_t num_tiles = 0;
    
    double achieved_probability() const noexcept;
};

/**
 Downsampler removes reads from an alignment file according to the physical location of their
 cluster on the flowcell, so that the output resembles a run with proportionally fewer clusters.
 
 A run makes two passes over the input. The first estimates the extent of each tile from the
 read coordinates, the second keeps or removes each read with a CircleSelector. Reads are written
 in input order, with a @PG line recording the run added to the output header.
 */
class Downsampler
{
public:
    Downsampler() = delete;
    
    // Throws InvalidProbability if the probability is not in [0, 1]
    Downsampler(DownsampleOptions options);
    
    Downsampler(const Downsampler&)            = delete;
    Downsampler& operator=(const Downsampler&) = delete;
    Downsampler(Downsampler&&)                 = default;
    Downsampler& operator=(Downsampler&&)      = default;
    
    ~Downsampler() = default;
    
    const DownsampleOptions& options() const noexcept;
    
    DownsampleReport run() const;
    
private:
    struct RunContext
    {
        TileBoundsMap tile_bounds;
        DownsampleReport report;
        boost::optional<PositionHistogram> histogram;
    };
    
    DownsampleOptions options_;
    ReadNameParser read_name_parser_;
    CircleSelector selector_;
    
    void check_inputs() const;
    void estimate_tile_bounds(RunContext& context) const;
    void select_reads(RunContext& context) const;
    void finish(RunContext& context) const;
};

DownsampleReport downsample(DownsampleOptions options);

} // namespace tiledown

#endif
