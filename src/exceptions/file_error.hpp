// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef file_error_hpp
#define file_error_hpp

#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "user_error.hpp"

namespace tiledown {

/**
 Base for problems with a file named by the user. The kind describes the role the file
 plays (e.g. "read", "reference", "output") and appears in the message.
 */
class FileError : public UserError
{
public:
    using Path = boost::filesystem::path;
    
    FileError(Path file, std::string kind);
    
    virtual ~FileError() override = default;
    
    const Path& file() const noexcept;
    
protected:
    // e.g. the read file "in.bam"
    std::string describe_file() const;
    
private:
    Path file_;
    std::string kind_;
};

class MissingFileError : public FileError
{
public:
    using FileError::FileError;
    
private:
    std::string do_why() const override;
    std::string do_help() const override;
};

class MalformedFileError : public FileError
{
public:
    MalformedFileError(Path file, std::string kind, std::vector<std::string> valid_formats = {});
    
    void set_reason(std::string reason) noexcept;
    
private:
    std::string do_why() const override;
    std::string do_help() const override;
    
    std::vector<std::string> valid_formats_;
    boost::optional<std::string> reason_;
};

class UnwritableFileError : public FileError
{
public:
    using FileError::FileError;
    
private:
    std::string do_why() const override;
    std::string do_help() const override;
};

} // namespace tiledown

#endif
