// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef program_error_hpp
#define program_error_hpp

#include <string>

#include "error.hpp"
#include "config/config.hpp"

namespace tiledown {

// A broken internal invariant
class ProgramError : public Error
{
    std::string do_type() const override { return "program"; }
    std::string do_help() const override
    {
        return "rerun with --debug and send the log file to " + config::BugReport;
    }
};

} // namespace tiledown

#endif
