// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <cstdlib>
#include <chrono>
#include <exception>
#include <new>
#include <vector>
#include <string>
#include <utility>

#include "config/option_parser.hpp"
#include "config/option_collation.hpp"
#include "core/downsampler.hpp"
#include "logging/logging.hpp"
#include "logging/main_logging.hpp"
#include "logging/error_handler.hpp"
#include "exceptions/error.hpp"
#include "utils/timing.hpp"
#include "utils/string_utils.hpp"

using namespace tiledown;

namespace {

std::string join_arguments(const int argc, const char** argv)
{
    return utils::join(std::vector<std::string> {argv, argv + argc}, ' ');
}

void run_downsampling(const options::OptionMap& options, std::string command_line)
{
    log_program_startup();
    log_command_line_options(options);
    const auto start = std::chrono::system_clock::now();
    downsample(options::collate_downsample_options(options, std::move(command_line)));
    const auto end = std::chrono::system_clock::now();
    logging::InfoLogger log {};
    stream(log) << "Finished downsampling in " << utils::TimeInterval {start, end};
    log_program_end();
}

// Runs f and logs anything it throws. Returns the process exit status.
template <typename F>
int guarded(F&& f)
{
    try {
        f();
        return EXIT_SUCCESS;
    } catch (const Error& e) {
        log_error(e);
    } catch (const std::bad_alloc& e) {
        log_error(e);
    } catch (const std::exception& e) {
        log_error(e);
    } catch (...) {
        log_unknown_error();
    }
    log_program_end();
    return EXIT_FAILURE;
}

} // namespace

int main(const int argc, const char** argv)
{
    options::OptionMap options {};
    // The console log must exist before option errors can be reported
    logging::init();
    const auto parse_status = guarded([&] () { options = options::parse_options(argc, argv); });
    if (parse_status != EXIT_SUCCESS || !options::is_run_command(options)) {
        return parse_status;
    }
    return guarded([&] () {
        logging::init(options::get_debug_log_file_name(options), options::get_trace_log_file_name(options));
        run_downsampling(options, join_arguments(argc, argv));
    });
}
