// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "downsampler.hpp"

#include <cmath>
#include <algorithm>
#include <iterator>
#include <utility>
#include <sstream>

#include <boost/filesystem/operations.hpp>

#include "config/config.hpp"
#include "io/read/read_reader.hpp"
#include "io/read/read_writer.hpp"
#include "logging/logging.hpp"
#include "logging/progress_meter.hpp"
#include "utils/path_utils.hpp"
#include "utils/string_utils.hpp"
#include "exceptions/user_error.hpp"
#include "exceptions/program_error.hpp"
#include "exceptions/file_error.hpp"

namespace tiledown {

namespace fs = boost::filesystem;

double DownsampleReport::achieved_probability() const noexcept
{
    return total > 0 ? static_cast<double>(kept) / total : 0.0;
}

namespace {

class InvalidProbability : public UserError
{
    std::string do_where() const override { return "Downsampler"; }
    std::string do_why() const override
    {
        std::ostringstream ss {};
        ss << "the probability " << probability_ << " is not in the range [0, 1]";
        return ss.str();
    }
    std::string do_help() const override { return "choose a probability between 0 and 1"; }
    
    double probability_;
public:
    InvalidProbability(double probability) : probability_ {probability} {}
};

class RepeatedDownsampleError : public UserError
{
    std::string do_where() const override { return "Downsampler::check_inputs"; }
    std::string do_why() const override
    {
        std::ostringstream ss {};
        ss << "the input file " << file_ << " has already been downsampled by " << config::ProgramRecordName
           << " (found " << num_records_ << " @PG line" << (num_records_ > 1 ? "s" : "") << ")."
           << " Downsampling the same reads twice gives a rate that is not the product of the two"
           << " probabilities, as both runs remove reads by the same geometry";
        return ss.str();
    }
    std::string do_help() const override
    {
        return "downsample the original file instead, or use --allow-multiple-downsampling-despite-warnings";
    }
    
    fs::path file_;
    std::size_t num_records_;
public:
    RepeatedDownsampleError(fs::path file, std::size_t num_records)
    : file_ {std::move(file)}
    , num_records_ {num_records}
    {}
};

class OverwritesInput : public UserError
{
    std::string do_where() const override { return "Downsampler::check_inputs"; }
    std::string do_why() const override
    {
        std::ostringstream ss {};
        ss << "the output file " << file_ << " is the same as the input file";
        return ss.str();
    }
    std::string do_help() const override { return "choose a different output path"; }
    
    fs::path file_;
public:
    OverwritesInput(fs::path file) : file_ {std::move(file)} {}
};

class UnwritableOutput : public UnwritableFileError
{
    std::string do_where() const override { return "Downsampler::check_inputs"; }
public:
    UnwritableOutput(fs::path file) : UnwritableFileError {std::move(file), "output"} {}
};

class MissingTileBounds : public ProgramError
{
    std::string do_where() const override { return "Downsampler::select_reads"; }
    std::string do_why() const override
    {
        std::ostringstream ss {};
        ss << "no bounds were estimated for tile " << tile_ << " of read " << read_name_
           << ", although every read is visited when estimating bounds";
        return ss.str();
    }
    
    PhysicalLocation::Tile tile_;
    std::string read_name_;
public:
    MissingTileBounds(PhysicalLocation::Tile tile, std::string read_name)
    : tile_ {tile}
    , read_name_ {std::move(read_name)}
    {}
};

double check_probability(const double probability)
{
    if (!(probability >= 0.0 && probability <= 1.0)) {
        throw InvalidProbability {probability};
    }
    return probability;
}

std::string position_string(const io::SamRecord& record, const io::SamHeader& header)
{
    if (record.contig_index() < 0) return "*";
    return header.contig_name(record.contig_index()) + ":" + std::to_string(record.position() + 1);
}

bool is_same_file(const fs::path& lhs, const fs::path& rhs)
{
    boost::system::error_code ec {};
    const auto result = fs::equivalent(lhs, rhs, ec);
    return !ec && result;
}

void remove_partial_output(const fs::path& file)
{
    boost::system::error_code ec {};
    fs::remove(file, ec);
    if (ec) {
        logging::WarningLogger warn_log {};
        stream(warn_log) << "Could not remove incomplete output " << file << ": " << ec.message();
    }
}

} // namespace

Downsampler::Downsampler(DownsampleOptions options)
: options_ {std::move(options)}
, read_name_parser_ {options_.read_name_pattern}
, selector_ {check_probability(options_.probability)}
{}

const DownsampleOptions& Downsampler::options() const noexcept
{
    return options_;
}

DownsampleReport Downsampler::run() const
{
    check_inputs();
    RunContext context {};
    if (options_.position_histogram) context.histogram = PositionHistogram {};
    estimate_tile_bounds(context);
    select_reads(context);
    finish(context);
    return context.report;
}

void Downsampler::check_inputs() const
{
    io::ReadReader reader {options_.input, options_.reference};
    if (is_same_file(options_.input, options_.output)) {
        throw OverwritesInput {options_.output};
    }
    if (!is_writable_location(options_.output)) {
        throw UnwritableOutput {options_.output};
    }
    const auto previous_runs = io::find_program_records(reader.header(), config::ProgramRecordName);
    if (!previous_runs.empty()) {
        if (!options_.allow_multiple_downsampling) {
            throw RepeatedDownsampleError {options_.input, previous_runs.size()};
        }
        logging::WarningLogger warn_log {};
        stream(warn_log) << "The input has already been downsampled by " << config::ProgramRecordName
                         << ". The achieved rate will not be the product of the requested probabilities";
        auto debug_log = logging::get_debug_log();
        if (debug_log) {
            for (const auto& record : previous_runs) stream(*debug_log) << record.line;
        }
    }
    reader.close();
}

void Downsampler::estimate_tile_bounds(RunContext& context) const
{
    logging::InfoLogger log {};
    log << "Estimating tile bounds from read positions";
    io::ReadReader reader {options_.input, options_.reference};
    const auto& header = reader.header();
    ProgressMeter progress {"read"};
    progress.start();
    reader.iterate([&] (const io::SamRecord& record) {
        const auto location = read_name_parser_.parse(record.name(), record.name_length());
        if (location) context.tile_bounds.add(*location);
        progress.log_completed([&] () { return position_string(record, header); });
        return true;
    }, options_.stop_after);
    progress.stop();
    reader.close();
    context.tile_bounds.finalise();
    context.report.num_tiles = context.tile_bounds.size();
    auto debug_log = logging::get_debug_log();
    if (debug_log) {
        for (const auto& p : context.tile_bounds) {
            stream(*debug_log) << "Tile " << p.first << " bounds: " << p.second;
        }
    }
    stream(log) << "Found " << context.tile_bounds.size() << " tile" << (context.tile_bounds.size() != 1 ? "s" : "");
}

void Downsampler::select_reads(RunContext& context) const
{
    logging::InfoLogger log {};
    stream(log) << "Downsampling reads with probability " << options_.probability;
    io::ReadReader reader {options_.input, options_.reference};
    auto header = reader.header();
    header.add_program_record(config::ProgramRecordName, config::to_string(config::Version), options_.command_line);
    try {
        io::ReadWriter writer {options_.output, header, options_.reference};
        ProgressMeter progress {"read"};
        progress.start();
        auto& report = context.report;
        auto trace_log = logging::get_trace_log();
        reader.iterate([&] (io::SamRecord& record) {
            ++report.total;
            const auto location = read_name_parser_.parse(record.name(), record.name_length());
            if (location) {
                if (context.histogram) context.histogram->add(*location);
                const auto bounds = context.tile_bounds.find(location->tile);
                if (!bounds) throw MissingTileBounds {location->tile, record.read_name()};
                const auto keep = selector_.select(*location, *bounds);
                if (trace_log) stream(*trace_log) << record.read_name() << ' ' << *location << (keep ? " kept" : " dropped");
                if (keep) {
                    if (options_.remove_duplicate_information) record.clear_duplicate_flag();
                    writer << record;
                    ++report.kept;
                }
            } else {
                writer << record;
                ++report.kept;
                ++report.unlocated;
            }
            progress.log_completed([&] () { return position_string(record, header); });
            return true;
        }, options_.stop_after);
        progress.stop();
        reader.close();
        writer.close();
    } catch (const std::exception&) {
        remove_partial_output(options_.output);
        throw;
    }
}

void Downsampler::finish(RunContext& context) const
{
    const auto& report = context.report;
    if (context.histogram) {
        write(*context.histogram, *options_.position_histogram);
    }
    logging::WarningLogger warn_log {};
    if (report.unlocated > 0) {
        stream(warn_log) << "Kept " << utils::format_with_commas(report.unlocated)
                         << " reads without a physical location unchanged";
    }
    const auto achieved = report.achieved_probability();
    if (report.total == 0) {
        warn_log << "No reads were processed";
    } else if (std::abs(achieved - options_.probability) / (std::min(achieved, options_.probability) + 1e-10) > 0.2) {
        stream(warn_log) << "The achieved downsampling probability (" << achieved
                         << ") is very different from the requested probability (" << options_.probability << ")."
                         << " This can happen when reads are not spread evenly over the tiles";
    }
    logging::InfoLogger log {};
    stream(log) << "Kept " << utils::format_with_commas(report.kept) << " out of "
                << utils::format_with_commas(report.total) << " reads (P=" << achieved << ")";
}

DownsampleReport downsample(DownsampleOptions options)
{
    const Downsampler downsampler {std::move(options)};
    return downsampler.run();
}

} // namespace tiledown
