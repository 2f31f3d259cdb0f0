// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef config_hpp
#define config_hpp

#include <string>
#include <iosfwd>

#include <boost/optional.hpp>

namespace tiledown { namespace config {

struct VersionNumber
{
    unsigned short major, minor;
    boost::optional<unsigned short> patch = boost::none;
    boost::optional<std::string> name = boost::none;
};

struct SystemInfo
{
    std::string system_name;
    std::string compiler_name, compiler_version;
    std::string boost_version;
    std::string build_type;
};

extern const VersionNumber Version;
extern const SystemInfo System;

std::ostream& operator<<(std::ostream& os, const VersionNumber& version);

std::string to_string(const VersionNumber& version);

extern const std::string ProgramName;

// Written as the PN of the @PG line added to every output file
extern const std::string ProgramRecordName;

// Where to send reports of program errors
extern const std::string BugReport;

extern const std::string CopyrightNotice;

// Error messages are wrapped to this many columns
extern const unsigned CommandLineWidth;

} // namespace config
} // namespace tiledown

#endif
