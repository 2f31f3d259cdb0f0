// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "file_error.hpp"

#include <utility>
#include <sstream>

namespace tiledown {

FileError::FileError(Path file, std::string kind)
: file_ {std::move(file)}
, kind_ {std::move(kind)}
{}

const FileError::Path& FileError::file() const noexcept
{
    return file_;
}

std::string FileError::describe_file() const
{
    std::ostringstream ss {};
    ss << "the " << kind_ << " file " << file_;
    return ss.str();
}

std::string MissingFileError::do_why() const
{
    return describe_file() + " does not exist";
}

std::string MissingFileError::do_help() const
{
    return "check the path is correct and the file is readable";
}

MalformedFileError::MalformedFileError(Path file, std::string kind, std::vector<std::string> valid_formats)
: FileError {std::move(file), std::move(kind)}
, valid_formats_ {std::move(valid_formats)}
, reason_ {}
{}

void MalformedFileError::set_reason(std::string reason) noexcept
{
    reason_ = std::move(reason);
}

std::string MalformedFileError::do_why() const
{
    std::ostringstream ss {};
    ss << describe_file();
    if (valid_formats_.empty()) {
        ss << " is malformed";
    } else {
        ss << " is not in a supported format (";
        for (std::size_t i {0}; i < valid_formats_.size(); ++i) {
            if (i > 0) ss << (i + 1 == valid_formats_.size() ? " or " : ", ");
            ss << valid_formats_[i];
        }
        ss << ')';
    }
    if (reason_) ss << ": " << *reason_;
    return ss.str();
}

std::string MalformedFileError::do_help() const
{
    return "check the file is complete and was given to the right option";
}

std::string UnwritableFileError::do_why() const
{
    return describe_file() + " cannot be written";
}

std::string UnwritableFileError::do_help() const
{
    return "check the directory exists and that you have permission to write to it";
}

} // namespace tiledown
