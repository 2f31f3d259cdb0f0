// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef logging_hpp
#define logging_hpp

#define BOOST_LOG_DYN_LINK 1

#include <functional>
#include <sstream>
#include <string>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions/keyword.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/global_logger_storage.hpp>

namespace tiledown { namespace logging {

enum class severity_level { trace, debug, info, warning, error };

std::ostream& operator<<(std::ostream& os, severity_level level);

using SeverityLogger = boost::log::sources::severity_logger_mt<severity_level>;

BOOST_LOG_INLINE_GLOBAL_LOGGER_DEFAULT(global_logger, SeverityLogger)

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

// Console sink at info level; optional file sinks for debug and trace records
void init(boost::optional<boost::filesystem::path> debug_log = boost::none,
          boost::optional<boost::filesystem::path> trace_log = boost::none);

template <severity_level L>
class Logger
{
public:
    Logger() : lg_ {global_logger::get()} {}
    
    template <typename T>
    Logger& operator<<(const T& msg)
    {
        BOOST_LOG_SEV(lg_, L) << msg;
        return *this;
    }
    
private:
    SeverityLogger lg_;
};

using TraceLogger   = Logger<severity_level::trace>;
using DebugLogger   = Logger<severity_level::debug>;
using InfoLogger    = Logger<severity_level::info>;
using WarningLogger = Logger<severity_level::warning>;
using ErrorLogger   = Logger<severity_level::error>;

// Disengaged unless the corresponding file sink was requested in init
boost::optional<DebugLogger> get_debug_log();
boost::optional<TraceLogger> get_trace_log();

// Buffers a message and emits it as a single record when destroyed.
// Embedded newlines are indented so continuation lines line up.
template <typename Log>
class LogStream
{
public:
    LogStream(Log& log, const unsigned indent) : log_ {log}, buffer_ {}, indent_ {indent} {}
    
    LogStream(const LogStream&)            = delete;
    LogStream& operator=(const LogStream&) = delete;
    LogStream(LogStream&&)                 = default;
    LogStream& operator=(LogStream&&)      = default;
    
    ~LogStream()
    {
        auto msg = buffer_.str();
        while (!msg.empty() && msg.back() == '\n') msg.pop_back();
        if (indent_ > 0) boost::replace_all(msg, "\n", '\n' + std::string(indent_, ' '));
        log_.get() << msg;
    }
    
    template <typename M>
    LogStream& operator<<(const M& msg)
    {
        buffer_ << msg;
        return *this;
    }
    
private:
    std::reference_wrapper<Log> log_;
    std::ostringstream buffer_;
    unsigned indent_;
};

template <typename Log>
LogStream<Log> stream(Log& log, const unsigned newline_indent = 4)
{
    return LogStream<Log> {log, newline_indent};
}

template <typename Log>
void log_empty_line(Log& log)
{
    log << "";
}

} // namespace logging
} // namespace tiledown

#endif
