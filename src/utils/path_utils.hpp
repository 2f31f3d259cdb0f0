// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef path_utils_hpp
#define path_utils_hpp

#include <boost/filesystem/path.hpp>

namespace tiledown {

namespace fs = boost::filesystem;

// Replaces a leading "~/" with $HOME
fs::path expand_user_path(const fs::path& path);

// Relative paths are taken relative to working_directory
fs::path resolve_path(const fs::path& path, const fs::path& working_directory);

// True if a file could be created (or overwritten) at path
bool is_writable_location(const fs::path& path);

} // namespace tiledown

#endif
