// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "logging.hpp"

#include <iostream>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

namespace tiledown { namespace logging {

namespace blog     = boost::log;
namespace keywords = boost::log::keywords;
namespace expr     = boost::log::expressions;

namespace {

struct SinkState
{
    bool debug = false, trace = false;
} sinks;

auto record_format()
{
    return expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "[%Y-%m-%d %H:%M:%S]")
        << " <" << severity << "> " << expr::smessage;
}

void add_file_sink(const boost::filesystem::path& file, const severity_level min_level)
{
    blog::add_file_log(keywords::file_name = file.string(),
                       keywords::filter = severity >= min_level,
                       keywords::format = record_format(),
                       keywords::auto_flush = true);
}

} // namespace

std::ostream& operator<<(std::ostream& os, const severity_level level)
{
    static constexpr const char* tags[] {"TRCE", "DEBG", "INFO", "WARN", "EROR"};
    return os << tags[static_cast<int>(level)];
}

void init(boost::optional<boost::filesystem::path> debug_log,
          boost::optional<boost::filesystem::path> trace_log)
{
    blog::core::get()->remove_all_sinks();
    blog::add_console_log(std::clog,
                          keywords::filter = severity >= severity_level::info,
                          keywords::format = record_format());
    if (debug_log) add_file_sink(*debug_log, severity_level::debug);
    if (trace_log) add_file_sink(*trace_log, severity_level::trace);
    sinks.debug = debug_log || trace_log;
    sinks.trace = static_cast<bool>(trace_log);
    blog::add_common_attributes();
}

boost::optional<DebugLogger> get_debug_log()
{
    if (sinks.debug) return DebugLogger {};
    return boost::none;
}

boost::optional<TraceLogger> get_trace_log()
{
    if (sinks.trace) return TraceLogger {};
    return boost::none;
}

} // namespace logging
} // namespace tiledown
