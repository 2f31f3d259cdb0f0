// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef read_name_parser_hpp
#define read_name_parser_hpp

#include <string>
#include <cstddef>
#include <regex>

#include <boost/optional.hpp>

#include "basics/physical_location.hpp"

namespace tiledown {

/**
 ReadNameParser extracts the physical location of a cluster (tile, x, y) from a read name.
 
 The default layout is the colon separated Illumina read name, served by a fast splitter
 rather than the regex engine. A custom pattern must be an ECMAScript regular expression
 matching the whole name with three capture groups: tile, x and y. Without a pattern no
 location is ever parsed.
 
 The first read name that does not match throws ReadNameParseError, as a single mismatch
 almost certainly means every name in the file uses a different layout.
 */
class ReadNameParser
{
public:
    enum class Mode { standard, regex, disabled };
    
    static const std::string defaultPattern;
    
    ReadNameParser();
    
    explicit ReadNameParser(boost::optional<std::string> pattern);
    
    ReadNameParser(const ReadNameParser&)            = default;
    ReadNameParser& operator=(const ReadNameParser&) = default;
    ReadNameParser(ReadNameParser&&)                 = default;
    ReadNameParser& operator=(ReadNameParser&&)      = default;
    
    ~ReadNameParser() = default;
    
    Mode mode() const noexcept;
    
    const boost::optional<std::string>& pattern() const noexcept;
    
    boost::optional<PhysicalLocation> parse(const char* name, std::size_t length) const;
    boost::optional<PhysicalLocation> parse(const std::string& name) const;
    
private:
    boost::optional<std::string> pattern_;
    Mode mode_;
    std::regex regex_;
    
    PhysicalLocation parse_standard(const char* name, std::size_t length) const;
    PhysicalLocation parse_regex(const char* name, std::size_t length) const;
};

namespace detail {

// Parses an optional minus sign followed by digits, stopping at the first non-digit.
// Disengaged if the value does not fit in an int.
boost::optional<int> rapid_parse_int(const char* first, const char* last) noexcept;

} // namespace detail

} // namespace tiledown

#endif
