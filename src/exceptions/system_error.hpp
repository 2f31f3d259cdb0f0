// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef system_error_hpp
#define system_error_hpp

#include <string>

#include "error.hpp"

namespace tiledown {

// Failures of the environment, e.g. exhausted memory or disk
class SystemError : public Error
{
    std::string do_type() const override { return "system"; }
};

} // namespace tiledown

#endif
