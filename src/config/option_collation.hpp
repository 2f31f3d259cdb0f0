// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef option_collation_hpp
#define option_collation_hpp

#include <string>

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>

#include "option_parser.hpp"
#include "core/downsampler.hpp"

namespace fs = boost::filesystem;

namespace tiledown { namespace options {

// False when only --help or --version was requested
bool is_run_command(const OptionMap& options);

boost::optional<fs::path> get_debug_log_file_name(const OptionMap& options);
boost::optional<fs::path> get_trace_log_file_name(const OptionMap& options);

fs::path get_working_directory(const OptionMap& options);

// The read name pattern given by --read-name-regex, where none disables location parsing
boost::optional<std::string> get_read_name_pattern(const OptionMap& options);

DownsampleOptions collate_downsample_options(const OptionMap& options, std::string command_line);

} // namespace options
} // namespace tiledown

#endif
