// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "option_collation.hpp"

#include <utility>

#include <boost/filesystem/operations.hpp>

#include "utils/path_utils.hpp"
#include "core/read_name_parser.hpp"
#include "exceptions/user_error.hpp"

namespace tiledown { namespace options {

namespace {

bool is_set(const std::string& option, const OptionMap& options) noexcept
{
    return options.count(option) == 1;
}

} // namespace

bool is_run_command(const OptionMap& options)
{
    return !is_set("help", options) && !is_set("version", options);
}

namespace {

class InvalidWorkingDirectory : public UserError
{
    std::string do_where() const override { return "get_working_directory"; }
    std::string do_why() const override
    {
        return "the working directory " + directory_.string() + " is not a directory";
    }
    std::string do_help() const override { return "check the path given to --working-directory"; }
    
    fs::path directory_;
public:
    InvalidWorkingDirectory(fs::path directory) : directory_ {std::move(directory)} {}
};

fs::path resolve_path(const fs::path& path, const OptionMap& options)
{
    return ::tiledown::resolve_path(path, get_working_directory(options));
}

boost::optional<fs::path> get_optional_path(const std::string& option, const OptionMap& options)
{
    if (is_set(option, options)) {
        return resolve_path(options.at(option).as<fs::path>(), options);
    }
    return boost::none;
}

} // namespace

fs::path get_working_directory(const OptionMap& options)
{
    if (is_set("working-directory", options)) {
        auto result = expand_user_path(options.at("working-directory").as<fs::path>());
        if (!fs::is_directory(result)) {
            throw InvalidWorkingDirectory {result};
        }
        return result;
    }
    return fs::current_path();
}

boost::optional<fs::path> get_debug_log_file_name(const OptionMap& options)
{
    return get_optional_path("debug", options);
}

boost::optional<fs::path> get_trace_log_file_name(const OptionMap& options)
{
    return get_optional_path("trace", options);
}

boost::optional<std::string> get_read_name_pattern(const OptionMap& options)
{
    const auto pattern = options.at("read-name-regex").as<std::string>();
    if (pattern == "NONE") return boost::none;
    if (pattern == "DEFAULT") return ReadNameParser::defaultPattern;
    return pattern;
}

DownsampleOptions collate_downsample_options(const OptionMap& options, std::string command_line)
{
    DownsampleOptions result {};
    result.input = resolve_path(options.at("input").as<fs::path>(), options);
    result.output = resolve_path(options.at("output").as<fs::path>(), options);
    result.reference = get_optional_path("reference", options);
    result.probability = options.at("probability").as<double>();
    const auto stop_after = options.at("stop-after").as<long long>();
    if (stop_after > 0) result.stop_after = static_cast<std::size_t>(stop_after);
    result.allow_multiple_downsampling = options.at("allow-multiple-downsampling-despite-warnings").as<bool>();
    result.remove_duplicate_information = options.at("remove-duplicate-information").as<bool>();
    result.read_name_pattern = get_read_name_pattern(options);
    result.position_histogram = get_optional_path("position-histogram", options);
    result.command_line = std::move(command_line);
    return result;
}

} // namespace options
} // namespace tiledown
