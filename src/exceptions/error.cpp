// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "error.hpp"

namespace tiledown {

const char* Error::what() const noexcept
{
    try {
        what_ = type() + " error (" + where() + "): " + why();
    } catch (const std::exception&) {
        what_.clear();
    }
    return what_.c_str();
}

} // namespace tiledown
