// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "read_name_parser.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <utility>
#include <sstream>

#include <boost/lexical_cast.hpp>

#include "exceptions/user_error.hpp"

namespace tiledown {

namespace {

class ReadNameParseError : public UserError
{
    std::string do_where() const override { return "ReadNameParser::parse"; }
    
    std::string do_why() const override
    {
        std::ostringstream ss {};
        if (is_default_) {
            ss << "the default read name layout '" << pattern_ << "'";
        } else {
            ss << "the read name regex '" << pattern_ << "'";
        }
        ss << " did not match read name '" << read_name_ << "'";
        if (!reason_.empty()) ss << " (" << reason_ << ")";
        return ss.str();
    }
    
    std::string do_help() const override
    {
        if (is_default_) {
            return "specify a --read-name-regex with three capture groups (tile, x, y) that matches your read names."
                   " Note that read names without physical location information cannot be downsampled by position";
        }
        return "check your --read-name-regex matches the whole read name and that the three capture groups"
               " are the tile, x, and y integers";
    }
    
    std::string pattern_, read_name_, reason_;
    bool is_default_;
    
public:
    ReadNameParseError(std::string pattern, std::string read_name, bool is_default, std::string reason = "")
    : pattern_ {std::move(pattern)}
    , read_name_ {std::move(read_name)}
    , reason_ {std::move(reason)}
    , is_default_ {is_default}
    {}
};

class InvalidReadNamePattern : public UserError
{
    std::string do_where() const override { return "ReadNameParser"; }
    
    std::string do_why() const override
    {
        return "the read name regex '" + pattern_ + "' is not usable: " + reason_;
    }
    
    std::string do_help() const override
    {
        return "provide an ECMAScript regular expression with three capture groups (tile, x, y)";
    }
    
    std::string pattern_, reason_;
    
public:
    InvalidReadNamePattern(std::string pattern, std::string reason)
    : pattern_ {std::move(pattern)}
    , reason_ {std::move(reason)}
    {}
};

constexpr char delimiter {':'};
constexpr std::size_t minFields {5}, maxFields {7};

auto get_mode(const boost::optional<std::string>& pattern) noexcept
{
    using Mode = ReadNameParser::Mode;
    if (!pattern) return Mode::disabled;
    if (*pattern == ReadNameParser::defaultPattern) return Mode::standard;
    return Mode::regex;
}

std::regex compile(const boost::optional<std::string>& pattern, const ReadNameParser::Mode mode)
{
    if (mode != ReadNameParser::Mode::regex) return std::regex {};
    std::regex result {};
    try {
        result.assign(*pattern, std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& e) {
        throw InvalidReadNamePattern {*pattern, e.what()};
    }
    if (result.mark_count() < 3) {
        throw InvalidReadNamePattern {*pattern, "it must have three capture groups"};
    }
    return result;
}

} // namespace

const std::string ReadNameParser::defaultPattern {"[a-zA-Z0-9]+:[0-9]:([0-9]+):([0-9]+):([0-9]+).*"};

ReadNameParser::ReadNameParser() : ReadNameParser {defaultPattern} {}

ReadNameParser::ReadNameParser(boost::optional<std::string> pattern)
: pattern_ {std::move(pattern)}
, mode_ {get_mode(pattern_)}
, regex_ {compile(pattern_, mode_)}
{}

ReadNameParser::Mode ReadNameParser::mode() const noexcept
{
    return mode_;
}

const boost::optional<std::string>& ReadNameParser::pattern() const noexcept
{
    return pattern_;
}

boost::optional<PhysicalLocation> ReadNameParser::parse(const char* name, const std::size_t length) const
{
    switch (mode_) {
        case Mode::standard: return parse_standard(name, length);
        case Mode::regex: return parse_regex(name, length);
        case Mode::disabled: return boost::none;
    }
    return boost::none;
}

boost::optional<PhysicalLocation> ReadNameParser::parse(const std::string& name) const
{
    return parse(name.data(), name.size());
}

// private methods

PhysicalLocation ReadNameParser::parse_standard(const char* name, const std::size_t length) const
{
    // [first, last) of each field; fields beyond maxFields are counted but not stored
    std::array<std::pair<const char*, const char*>, maxFields> fields;
    std::size_t num_fields {0};
    const char* field_begin {name};
    const char* const end {name + length};
    for (const char* c {name}; c != end; ++c) {
        if (*c == delimiter) {
            if (num_fields < maxFields) fields[num_fields] = {field_begin, c};
            ++num_fields;
            field_begin = c + 1;
        }
    }
    if (field_begin != end) {
        if (num_fields < maxFields) fields[num_fields] = {field_begin, end};
        ++num_fields;
    }
    if (num_fields != minFields && num_fields != maxFields) {
        std::ostringstream ss {};
        ss << "found " << num_fields << " fields but expected " << minFields << " or " << maxFields;
        throw ReadNameParseError {*pattern_, std::string {name, length}, true, ss.str()};
    }
    const std::size_t offset {num_fields == maxFields ? 2u : 0u};
    const auto parse_field = [&] (const std::size_t index) {
        const auto& field = fields[offset + index];
        const auto value = detail::rapid_parse_int(field.first, field.second);
        if (!value) {
            throw ReadNameParseError {*pattern_, std::string {name, length}, true,
                                      "field " + std::to_string(offset + index + 1) + " is out of the integer range"};
        }
        return *value;
    };
    PhysicalLocation result {};
    result.tile = parse_field(2);
    result.x    = parse_field(3);
    result.y    = parse_field(4);
    return result;
}

PhysicalLocation ReadNameParser::parse_regex(const char* name, const std::size_t length) const
{
    std::cmatch match {};
    if (!std::regex_match(name, name + length, match, regex_)) {
        throw ReadNameParseError {*pattern_, std::string {name, length}, false};
    }
    PhysicalLocation result {};
    try {
        result.tile = boost::lexical_cast<PhysicalLocation::Tile>(match.str(1));
        result.x    = boost::lexical_cast<PhysicalLocation::Coordinate>(match.str(2));
        result.y    = boost::lexical_cast<PhysicalLocation::Coordinate>(match.str(3));
    } catch (const boost::bad_lexical_cast&) {
        throw ReadNameParseError {*pattern_, std::string {name, length}, false, "a capture group is not an integer"};
    }
    return result;
}

namespace detail {

boost::optional<int> rapid_parse_int(const char* first, const char* const last) noexcept
{
    constexpr std::int64_t limit {std::numeric_limits<int>::max()};
    std::int64_t result {0};
    bool is_negative {false};
    if (first != last && *first == '-') {
        is_negative = true;
        ++first;
    }
    for (; first != last && *first >= '0' && *first <= '9'; ++first) {
        result = result * 10 + (*first - '0');
        if (result > limit) return boost::none;
    }
    return static_cast<int>(is_negative ? -result : result);
}

} // namespace detail

} // namespace tiledown
