// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef option_parser_hpp
#define option_parser_hpp

#include <string>
#include <iosfwd>

#include <boost/program_options.hpp>

namespace tiledown { namespace options {

using OptionMap = boost::program_options::variables_map;

// Returns without validating if --help or --version is given
OptionMap parse_options(int argc, const char** argv);

std::ostream& operator<<(std::ostream& os, const OptionMap& options);
// One option per line, with explicitly given options marked by *
std::string to_string(const OptionMap& options);

} // namespace options
} // namespace tiledown

#endif
