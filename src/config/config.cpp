// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "config.hpp"

#include <ostream>
#include <sstream>

namespace tiledown { namespace config {

namespace {

boost::optional<std::string> non_empty(std::string value)
{
    if (value.empty()) return boost::none;
    return value;
}

} // namespace

// The macros are defined by the build
const VersionNumber Version {VERSION_MAJOR, VERSION_MINOR, VERSION_PATCH, non_empty(VERSION_RELEASE)};

const SystemInfo System {SYSTEM_NAME, COMPILER_NAME, COMPILER_VERSION, BOOSTLIB_VERSION, BUILD_TYPE};

std::ostream& operator<<(std::ostream& os, const VersionNumber& version)
{
    os << version.major << '.' << version.minor;
    if (version.patch) os << '.' << *version.patch;
    if (version.name) os << '-' << *version.name;
    return os;
}

std::string to_string(const VersionNumber& version)
{
    std::ostringstream ss {};
    ss << version;
    return ss.str();
}

const std::string ProgramName {"tiledown"};

const std::string ProgramRecordName {"PositionBasedDownsample"};

const std::string BugReport {"the tiledown issue tracker"};

const std::string CopyrightNotice {"Copyright (c) 2026 The tiledown authors"};

const unsigned CommandLineWidth {72};

} // namespace config
} // namespace tiledown
