// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef string_utils_hpp
#define string_utils_hpp

#include <vector>
#include <string>
#include <type_traits>
#include <sstream>
#include <locale>

namespace tiledown { namespace utils {

std::string join(const std::vector<std::string>& strings, char delim);

std::string& capitalise_front(std::string& str) noexcept;

namespace detail {

class ThousandsSeparator : public std::numpunct<char>
{
protected:
    char do_thousands_sep() const override { return ','; }
    std::string do_grouping() const override { return "\03"; }
};

} // namespace detail

// e.g. 1234567 -> "1,234,567"
template <typename T>
std::string format_with_commas(const T value)
{
    static_assert(std::is_integral<T>::value, "T must be an integer");
    std::ostringstream ss {};
    ss.imbue(std::locale {std::locale::classic(), new detail::ThousandsSeparator {}});
    ss << value;
    return ss.str();
}

} // namespace utils
} // namespace tiledown

#endif
