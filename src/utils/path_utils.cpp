// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "path_utils.hpp"

#include <string>
#include <cstdlib>
#include <utility>

#include <unistd.h>

#include <boost/filesystem/operations.hpp>

#include "exceptions/system_error.hpp"

namespace tiledown {

namespace {

class UnknownHomeDirectory : public SystemError
{
    std::string do_where() const override { return "expand_user_path"; }
    std::string do_why() const override
    {
        return "the path " + path_.string() + " refers to the home directory but HOME is not set to a directory";
    }
    std::string do_help() const override { return "set HOME or give the full path"; }
    
    fs::path path_;
public:
    UnknownHomeDirectory(fs::path path) : path_ {std::move(path)} {}
};

bool starts_with_home(const std::string& path) noexcept
{
    return path.size() >= 2 && path[0] == '~' && path[1] == '/';
}

bool has_write_access(const fs::path& path)
{
    return ::access(path.c_str(), W_OK) == 0;
}

} // namespace

fs::path expand_user_path(const fs::path& path)
{
    const auto& str = path.string();
    if (!starts_with_home(str)) return path;
    const char* home {std::getenv("HOME")};
    boost::system::error_code ec {};
    if (home == nullptr || !fs::is_directory(home, ec)) throw UnknownHomeDirectory {path};
    return fs::path {home} / str.substr(2);
}

fs::path resolve_path(const fs::path& path, const fs::path& working_directory)
{
    const auto expanded = expand_user_path(path);
    return expanded.is_absolute() ? expanded : fs::absolute(expanded, working_directory);
}

bool is_writable_location(const fs::path& path)
{
    boost::system::error_code ec {};
    if (fs::exists(path, ec)) return !fs::is_directory(path, ec) && has_write_access(path);
    auto directory = path.parent_path();
    if (directory.empty()) directory = fs::current_path();
    return fs::is_directory(directory, ec) && has_write_access(directory);
}

} // namespace tiledown
