// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef user_error_hpp
#define user_error_hpp

#include <string>

#include "error.hpp"

namespace tiledown {

// Bad input: options, files, read names
class UserError : public Error
{
    std::string do_type() const override { return "user"; }
};

} // namespace tiledown

#endif
