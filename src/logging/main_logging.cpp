// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "main_logging.hpp"

#include <string>

#include "config/config.hpp"
#include "logging.hpp"

namespace tiledown {

namespace {

std::string banner()
{
    return std::string(config::CommandLineWidth, '-');
}

} // namespace

void log_program_startup()
{
    logging::InfoLogger log {};
    log << banner();
    stream(log) << config::ProgramName << " v" << config::Version;
    log << config::CopyrightNotice;
    log << banner();
}

void log_command_line_options(const options::OptionMap& options)
{
    auto debug_log = logging::get_debug_log();
    if (debug_log) {
        *debug_log << "Program options:";
        *debug_log << options::to_string(options);
    }
}

void log_program_end()
{
    logging::InfoLogger log {};
    log << banner();
}

} // namespace tiledown
