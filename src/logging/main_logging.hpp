// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef main_logging_hpp
#define main_logging_hpp

#include "config/option_parser.hpp"

namespace tiledown {

// Banner with the program name, version and copyright
void log_program_startup();

// Full option listing, debug log only
void log_command_line_options(const options::OptionMap& options);

void log_program_end();

} // namespace tiledown

#endif
