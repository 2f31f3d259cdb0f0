// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "error_handler.hpp"

#include <string>
#include <vector>
#include <sstream>
#include <cctype>
#include <utility>

#include "exceptions/system_error.hpp"
#include "config/config.hpp"
#include "utils/string_utils.hpp"
#include "logging.hpp"

namespace tiledown {

namespace {

// Capitalised and full stopped
std::string as_sentence(std::string text)
{
    utils::capitalise_front(text);
    if (!text.empty() && text.back() != '.') text.push_back('.');
    return text;
}

std::vector<std::string> wrap(const std::string& text, const std::size_t width, const std::string& indent = "")
{
    std::vector<std::string> result {};
    std::istringstream words {text};
    std::string word {}, line {};
    while (words >> word) {
        if (!line.empty() && indent.size() + line.size() + 1 + word.size() > width) {
            result.push_back(indent + line);
            line.clear();
        }
        if (!line.empty()) line.push_back(' ');
        line += word;
    }
    if (!line.empty()) result.push_back(indent + line);
    return result;
}

std::string article(const std::string& noun)
{
    return !noun.empty() && std::string {"aeiou"}.find(noun.front()) != std::string::npos ? "An" : "A";
}

std::string make_help_sentence(std::string help)
{
    if (help.empty()) return "";
    help.front() = static_cast<char>(std::tolower(static_cast<unsigned char>(help.front())));
    return as_sentence("To help resolve this error " + help);
}

} // namespace

void log_error(const Error& error)
{
    logging::ErrorLogger log {};
    const auto type = error.type();
    stream(log) << article(type) << ' ' << type << " error has occurred:";
    log_empty_line(log);
    for (const auto& line : wrap(as_sentence(error.why()), config::CommandLineWidth, "    ")) {
        log << line;
    }
    const auto help = make_help_sentence(error.help());
    if (!help.empty()) {
        log_empty_line(log);
        for (const auto& line : wrap(help, config::CommandLineWidth)) {
            log << line;
        }
    }
    auto debug_log = logging::get_debug_log();
    if (debug_log) stream(*debug_log) << "Error raised in " << error.where();
}

namespace {

class OutOfMemory : public SystemError
{
    std::string do_where() const override { return "unknown"; }
    std::string do_why() const override { return "the system could not satisfy a memory request"; }
    std::string do_help() const override
    {
        return "free some memory or run on a machine with more memory";
    }
};

class UnclassifiedError : public Error
{
    std::string do_type() const override { return "unclassified"; }
    std::string do_where() const override { return "unknown"; }
    std::string do_why() const override { return why_; }
    std::string do_help() const override
    {
        return "submit an error report to " + config::BugReport;
    }
    
    std::string why_;
    
public:
    UnclassifiedError(std::string why) : why_ {std::move(why)} {}
};

} // namespace

void log_error(const std::bad_alloc&)
{
    log_error(OutOfMemory {});
}

void log_error(const std::exception& error)
{
    log_error(UnclassifiedError {error.what()});
}

void log_unknown_error()
{
    log_error(UnclassifiedError {"the cause of the error is unknown"});
}

} // namespace tiledown
