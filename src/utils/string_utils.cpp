// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "string_utils.hpp"

#include <cctype>

#include <boost/algorithm/string/join.hpp>

namespace tiledown { namespace utils {

std::string join(const std::vector<std::string>& strings, const char delim)
{
    return boost::algorithm::join(strings, std::string(1, delim));
}

std::string& capitalise_front(std::string& str) noexcept
{
    if (!str.empty()) {
        str.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(str.front())));
    }
    return str;
}

} // namespace utils
} // namespace tiledown
