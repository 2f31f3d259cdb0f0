// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <vector>
#include <string>
#include <map>
#include <random>
#include <limits>
#include <fstream>
#include <algorithm>
#include <iterator>

#include <boost/filesystem/operations.hpp>

#include <core/downsampler.hpp>
#include <config/config.hpp>
#include <io/read/read_reader.hpp>
#include <exceptions/user_error.hpp>

#include "mock/mock_sam.hpp"

namespace tiledown { namespace test {

namespace fs = boost::filesystem;

namespace {

constexpr int tileSize {2000};

// Pairs scattered uniformly over a single tile
std::vector<mock::MockRead> make_uniform_pairs(const std::size_t num_pairs, const bool duplicates = false)
{
    std::mt19937 generator {42};
    std::uniform_int_distribution<int> coordinate {0, tileSize - 1};
    std::vector<mock::MockRead> result {};
    result.reserve(2 * num_pairs);
    for (std::size_t i {0}; i < num_pairs; ++i) {
        const auto x = coordinate(generator), y = coordinate(generator);
        mock::add_pair(result, mock::make_read_name(1101, x, y), 1000 + static_cast<int>(i), duplicates);
    }
    return result;
}

DownsampleOptions make_options(const fs::path& input, const fs::path& output, const double probability)
{
    DownsampleOptions result {};
    result.input = input;
    result.output = output;
    result.probability = probability;
    result.command_line = "tiledown --input " + input.string() + " --output " + output.string();
    return result;
}

} // namespace

BOOST_AUTO_TEST_SUITE(core)
BOOST_AUTO_TEST_SUITE(downsampler)

BOOST_AUTO_TEST_CASE(downsampling_keeps_close_to_the_requested_fraction_of_reads)
{
    mock::TemporaryDirectory directory {};
    const auto input = directory / "input.sam", output = directory / "output.sam";
    mock::write_sam(input, make_uniform_pairs(1000));
    const auto report = downsample(make_options(input, output, 0.3));
    BOOST_CHECK_EQUAL(report.total, 2000);
    BOOST_CHECK_EQUAL(report.num_tiles, 1);
    BOOST_CHECK_EQUAL(report.unlocated, 0);
    BOOST_CHECK_GT(report.achieved_probability(), 0.3 * 0.8);
    BOOST_CHECK_LT(report.achieved_probability(), 0.3 * 1.2);
    const auto kept = mock::read_all(output);
    BOOST_CHECK_EQUAL(kept.size(), report.kept);
}

BOOST_AUTO_TEST_CASE(all_alignments_of_a_template_are_kept_or_removed_together)
{
    mock::TemporaryDirectory directory {};
    const auto input = directory / "input.sam", output = directory / "output.sam";
    auto reads = make_uniform_pairs(1000);
    std::vector<std::string> names {};
    for (std::size_t i {0}; i < reads.size(); i += 2) names.push_back(reads[i].name);
    for (std::size_t i {0}; i < names.size(); ++i) {
        mock::add_alternative_alignments(reads, names[i], 1000 + static_cast<int>(i));
    }
    mock::write_sam(input, reads);
    const auto report = downsample(make_options(input, output, 0.3));
    BOOST_CHECK_EQUAL(report.total, 4000);
    std::map<std::string, int> alignment_counts {};
    std::size_t num_secondary {0}, num_supplementary {0};
    for (const auto& record : mock::read_all(output)) {
        ++alignment_counts[record.read_name()];
        if (record.flags() & 256) ++num_secondary;
        if (record.flags() & 2048) ++num_supplementary;
    }
    BOOST_REQUIRE(!alignment_counts.empty());
    for (const auto& p : alignment_counts) {
        BOOST_CHECK_MESSAGE(p.second == 4, p.first << " kept " << p.second << " of its 4 alignments");
    }
    BOOST_CHECK_EQUAL(num_secondary, alignment_counts.size());
    BOOST_CHECK_EQUAL(num_supplementary, alignment_counts.size());
}

BOOST_AUTO_TEST_CASE(kept_reads_are_written_in_input_order)
{
    mock::TemporaryDirectory directory {};
    const auto input = directory / "input.sam", output = directory / "output.sam";
    mock::write_sam(input, make_uniform_pairs(500));
    downsample(make_options(input, output, 0.5));
    const auto kept = mock::read_all(output);
    BOOST_REQUIRE(!kept.empty());
    const auto input_records = mock::read_all(input);
    auto input_itr = std::cbegin(input_records);
    for (const auto& record : kept) {
        input_itr = std::find_if(input_itr, std::cend(input_records), [&] (const io::SamRecord& other) {
            return other.read_name() == record.read_name() && other.flags() == record.flags();
        });
        BOOST_REQUIRE(input_itr != std::cend(input_records));
    }
}

BOOST_AUTO_TEST_CASE(invalid_probabilities_fail_before_any_output_is_written)
{
    mock::TemporaryDirectory directory {};
    const auto input = directory / "input.sam", output = directory / "output.sam";
    mock::write_sam(input, make_uniform_pairs(10));
    const std::vector<double> probabilities {
        -1.0, -0.00001, 1.00001, 5.0, std::numeric_limits<double>::max(),
        std::numeric_limits<double>::infinity(), -std::numeric_limits<double>::infinity(),
        std::numeric_limits<double>::quiet_NaN()
    };
    for (const auto p : probabilities) {
        BOOST_CHECK_THROW(downsample(make_options(input, output, p)), UserError);
        BOOST_CHECK(!fs::exists(output));
    }
}

BOOST_AUTO_TEST_CASE(missing_input_is_reported_before_any_output_is_written)
{
    mock::TemporaryDirectory directory {};
    const auto output = directory / "output.sam";
    BOOST_CHECK_THROW(downsample(make_options(directory / "missing.sam", output, 0.5)), UserError);
    BOOST_CHECK(!fs::exists(output));
}

BOOST_AUTO_TEST_CASE(output_records_the_program_in_the_header)
{
    mock::TemporaryDirectory directory {};
    const auto input = directory / "input.sam", output = directory / "output.sam";
    mock::write_sam(input, make_uniform_pairs(10), {"@PG\tID:aligner\tPN:aligner\tVN:1.0"});
    downsample(make_options(input, output, 0.5));
    io::ReadReader reader {output};
    const auto records = io::find_program_records(reader.header(), config::ProgramRecordName);
    BOOST_REQUIRE_EQUAL(records.size(), 1);
    BOOST_CHECK(records.front().id);
    BOOST_CHECK_NE(records.front().line.find("CL:tiledown"), std::string::npos);
    BOOST_CHECK_EQUAL(io::find_program_records(reader.header(), "aligner").size(), 1);
}

BOOST_AUTO_TEST_CASE(downsampled_files_are_not_downsampled_again_unless_allowed)
{
    mock::TemporaryDirectory directory {};
    const auto input = directory / "input.sam";
    const auto once = directory / "once.sam", twice = directory / "twice.sam";
    mock::write_sam(input, make_uniform_pairs(100));
    downsample(make_options(input, once, 0.5));
    BOOST_CHECK_THROW(downsample(make_options(once, twice, 0.5)), UserError);
    BOOST_CHECK(!fs::exists(twice));
    auto options = make_options(once, twice, 0.5);
    options.allow_multiple_downsampling = true;
    BOOST_CHECK_NO_THROW(downsample(options));
    BOOST_CHECK(fs::exists(twice));
    io::ReadReader reader {twice};
    BOOST_CHECK_EQUAL(io::find_program_records(reader.header(), config::ProgramRecordName).size(), 2);
}

BOOST_AUTO_TEST_CASE(duplicate_flags_are_cleared_unless_requested_otherwise)
{
    mock::TemporaryDirectory directory {};
    const auto input = directory / "input.sam";
    const auto cleared = directory / "cleared.sam", kept = directory / "kept.sam";
    mock::write_sam(input, make_uniform_pairs(50, true));
    downsample(make_options(input, cleared, 1.0));
    const auto cleared_records = mock::read_all(cleared);
    BOOST_CHECK_EQUAL(cleared_records.size(), 100);
    for (const auto& record : cleared_records) {
        BOOST_CHECK(!record.is_marked_duplicate());
    }
    auto options = make_options(input, kept, 1.0);
    options.remove_duplicate_information = false;
    downsample(options);
    const auto kept_records = mock::read_all(kept);
    BOOST_CHECK_EQUAL(kept_records.size(), 100);
    for (const auto& record : kept_records) {
        BOOST_CHECK(record.is_marked_duplicate());
    }
}

BOOST_AUTO_TEST_CASE(stop_after_limits_the_records_processed)
{
    mock::TemporaryDirectory directory {};
    const auto input = directory / "input.sam", output = directory / "output.sam";
    mock::write_sam(input, make_uniform_pairs(500));
    auto options = make_options(input, output, 1.0);
    options.stop_after = 100;
    const auto report = downsample(options);
    BOOST_CHECK_EQUAL(report.total, 100);
    BOOST_CHECK_EQUAL(report.kept, 100);
    BOOST_CHECK_EQUAL(mock::read_all(output).size(), 100);
}

BOOST_AUTO_TEST_CASE(stop_after_limits_the_records_used_to_estimate_tile_bounds)
{
    mock::TemporaryDirectory directory {};
    const auto prefix_input = directory / "prefix.sam", prefix_output = directory / "prefix_out.sam";
    const auto input = directory / "input.sam", output = directory / "output.sam";
    auto reads = make_uniform_pairs(200);
    mock::write_sam(prefix_input, reads);
    // Records past the cap would widen tile 1101 and add tile 2202 if they were counted
    for (int i {0}; i < 50; ++i) {
        mock::add_pair(reads, mock::make_read_name(1101, 3 * tileSize + i, 3 * tileSize + i), 5000 + i);
        mock::add_pair(reads, mock::make_read_name(2202, 10 * i, 10 * i), 6000 + i);
    }
    mock::write_sam(input, reads);
    const auto prefix_report = downsample(make_options(prefix_input, prefix_output, 0.3));
    auto options = make_options(input, output, 0.3);
    options.stop_after = 400;
    const auto report = downsample(options);
    BOOST_CHECK_EQUAL(report.total, 400);
    BOOST_CHECK_EQUAL(report.num_tiles, 1);
    BOOST_CHECK_EQUAL(report.kept, prefix_report.kept);
    std::vector<std::string> expected {}, actual {};
    for (const auto& record : mock::read_all(prefix_output)) expected.push_back(record.read_name());
    for (const auto& record : mock::read_all(output)) actual.push_back(record.read_name());
    BOOST_CHECK_EQUAL_COLLECTIONS(std::cbegin(actual), std::cend(actual), std::cbegin(expected), std::cend(expected));
}

BOOST_AUTO_TEST_CASE(reads_are_kept_unchanged_when_location_parsing_is_disabled)
{
    mock::TemporaryDirectory directory {};
    const auto input = directory / "input.sam", output = directory / "output.sam";
    mock::write_sam(input, make_uniform_pairs(20, true));
    auto options = make_options(input, output, 0.1);
    options.read_name_pattern = boost::none;
    const auto report = downsample(options);
    BOOST_CHECK_EQUAL(report.total, 40);
    BOOST_CHECK_EQUAL(report.kept, 40);
    BOOST_CHECK_EQUAL(report.unlocated, 40);
    BOOST_CHECK_EQUAL(report.num_tiles, 0);
    for (const auto& record : mock::read_all(output)) {
        BOOST_CHECK(record.is_marked_duplicate());
    }
}

BOOST_AUTO_TEST_CASE(unparsable_read_names_stop_the_run_and_remove_the_output)
{
    mock::TemporaryDirectory directory {};
    const auto input = directory / "input.sam", output = directory / "output.sam";
    std::vector<mock::MockRead> reads {};
    mock::add_pair(reads, "read_without_location", 1000);
    mock::write_sam(input, reads);
    BOOST_CHECK_THROW(downsample(make_options(input, output, 0.5)), UserError);
    BOOST_CHECK(!fs::exists(output));
}

BOOST_AUTO_TEST_CASE(custom_read_name_patterns_are_used_to_find_locations)
{
    mock::TemporaryDirectory directory {};
    const auto input = directory / "input.sam", output = directory / "output.sam";
    std::vector<mock::MockRead> reads {};
    for (int i {0}; i < 100; ++i) {
        mock::add_pair(reads, "tile3_" + std::to_string(i * 19) + "_" + std::to_string(i * 7), 1000 + i);
    }
    mock::write_sam(input, reads);
    auto options = make_options(input, output, 0.5);
    options.read_name_pattern = std::string {"tile([0-9]+)_([0-9]+)_([0-9]+)"};
    const auto report = downsample(options);
    BOOST_CHECK_EQUAL(report.total, 200);
    BOOST_CHECK_EQUAL(report.num_tiles, 1);
    BOOST_CHECK_EQUAL(report.unlocated, 0);
    BOOST_CHECK_EQUAL(report.kept % 2, 0);
}

BOOST_AUTO_TEST_CASE(position_histogram_is_written_when_requested)
{
    mock::TemporaryDirectory directory {};
    const auto input = directory / "input.sam", output = directory / "output.sam";
    const auto histogram = directory / "histogram.tsv";
    mock::write_sam(input, make_uniform_pairs(100));
    auto options = make_options(input, output, 0.5);
    options.position_histogram = histogram;
    downsample(options);
    BOOST_REQUIRE(fs::exists(histogram));
    std::ifstream in {histogram.string()};
    std::string line {};
    std::getline(in, line);
    BOOST_CHECK_EQUAL(line, "tile\taxis\tposition\tcount");
    std::size_t num_rows {0};
    while (std::getline(in, line)) {
        BOOST_CHECK_EQUAL(line.substr(0, 5), "1101\t");
        ++num_rows;
    }
    BOOST_CHECK_GT(num_rows, 0);
}

BOOST_AUTO_TEST_CASE(output_may_not_overwrite_the_input)
{
    mock::TemporaryDirectory directory {};
    const auto input = directory / "input.sam";
    mock::write_sam(input, make_uniform_pairs(10));
    BOOST_CHECK_THROW(downsample(make_options(input, input, 0.5)), UserError);
    BOOST_CHECK_EQUAL(mock::read_all(input).size(), 20);
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace tiledown
