// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "htslib_sam_facade.hpp"

#include <utility>
#include <sstream>

#include <boost/filesystem/operations.hpp>

#include "exceptions/file_error.hpp"
#include "exceptions/program_error.hpp"
#include "exceptions/system_error.hpp"

namespace tiledown { namespace io {

namespace fs = boost::filesystem;

class MissingReadFile : public MissingFileError
{
    std::string do_where() const override { return "HtslibSamFacade"; }
public:
    MissingReadFile(fs::path file) : MissingFileError {std::move(file), "read"} {}
};

class MissingReferenceFile : public MissingFileError
{
    std::string do_where() const override { return "HtslibSamFacade"; }
public:
    MissingReferenceFile(fs::path file) : MissingFileError {std::move(file), "reference"} {}
};

class MalformedReadFile : public MalformedFileError
{
    std::string do_where() const override { return "HtslibSamFacade"; }
    
    std::string do_help() const override
    {
        return "refer to the latest SAM specification";
    }
public:
    MalformedReadFile(fs::path file)
    : MalformedFileError {std::move(file), "read", {"SAM", "BAM", "CRAM"}}
    {}
};

class MalformedReferenceFile : public MalformedFileError
{
    std::string do_where() const override { return "HtslibSamFacade"; }
public:
    MalformedReferenceFile(fs::path file) : MalformedFileError {std::move(file), "reference", {"FASTA"}} {}
};

class UnwritableReadFile : public UnwritableFileError
{
    std::string do_where() const override { return "HtslibSamFacade"; }
public:
    UnwritableReadFile(fs::path file) : UnwritableFileError {std::move(file), "alignment"} {}
};

class IndexBuildError : public SystemError
{
    std::string do_where() const override { return "HtslibSamFacade::close"; }
    std::string do_why() const override
    {
        std::ostringstream ss {};
        ss << "could not build an index for " << file_;
        return ss.str();
    }
    std::string do_help() const override
    {
        return "check there is enough disk space and that the output directory is writable";
    }
    
    fs::path file_;
public:
    IndexBuildError(fs::path file) : file_ {std::move(file)} {}
};

class BadFacadeMode : public ProgramError
{
    std::string do_where() const override { return where_; }
    std::string do_why() const override { return "operation is not supported in this facade mode"; }
    
    std::string where_;
public:
    BadFacadeMode(std::string where) : where_ {std::move(where)} {}
};

bool is_bam(const fs::path& file)
{
    return file.extension().string() == ".bam";
}

bool is_cram(const fs::path& file)
{
    return file.extension().string() == ".cram";
}

namespace {

auto open_hts_file(const fs::path& file)
{
    hts_verbose = 0; // disable hts error reporting
    return sam_open(file.c_str(), "r");
}

auto open_hts_writable_file(const fs::path& path)
{
    std::string mode {"w"};
    if (is_bam(path)) {
        mode += "b";
    } else if (is_cram(path)) {
        mode += "c";
    }
    return sam_open(path.c_str(), mode.c_str());
}

} // namespace

HtslibSamFacade::HtslibSamFacade(Path file_path, boost::optional<Path> reference)
: file_path_ {std::move(file_path)}
, mode_ {Mode::read}
, hts_file_ {open_hts_file(file_path_), HtsFileDeleter {}}
, header_ {}
{
    if (!hts_file_) {
        if (!fs::exists(file_path_)) {
            throw MissingReadFile {file_path_};
        } else {
            throw MalformedReadFile {file_path_};
        }
    }
    set_reference(reference);
    auto hts_header = sam_hdr_read(hts_file_.get());
    if (hts_header == nullptr) {
        throw MalformedReadFile {file_path_};
    }
    header_ = SamHeader {hts_header};
}

HtslibSamFacade::HtslibSamFacade(Path sam_out, const SamHeader& header, boost::optional<Path> reference)
: file_path_ {std::move(sam_out)}
, mode_ {Mode::write}
, hts_file_ {open_hts_writable_file(file_path_), HtsFileDeleter {}}
, header_ {header}
{
    if (!hts_file_) {
        throw UnwritableReadFile {file_path_};
    }
    set_reference(reference);
    if (sam_hdr_write(hts_file_.get(), header_->get()) < 0) {
        throw UnwritableReadFile {file_path_};
    }
}

const HtslibSamFacade::Path& HtslibSamFacade::path() const noexcept
{
    return file_path_;
}

HtslibSamFacade::Mode HtslibSamFacade::mode() const noexcept
{
    return mode_;
}

bool HtslibSamFacade::is_open() const noexcept
{
    return hts_file_ != nullptr;
}

const SamHeader& HtslibSamFacade::header() const
{
    if (!header_) throw BadFacadeMode {"HtslibSamFacade::header"};
    return *header_;
}

bool HtslibSamFacade::read(SamRecord& record)
{
    if (mode_ != Mode::read || !is_open()) throw BadFacadeMode {"HtslibSamFacade::read"};
    const auto status = sam_read1(hts_file_.get(), header_->get(), record.get());
    if (status >= 0) return true;
    if (status == -1) return false;
    MalformedReadFile e {file_path_};
    e.set_reason("truncated or corrupted record");
    throw e;
}

void HtslibSamFacade::write(const SamRecord& record)
{
    if (mode_ != Mode::write || !is_open()) throw BadFacadeMode {"HtslibSamFacade::write"};
    if (sam_write1(hts_file_.get(), header_->get(), record.get()) < 0) {
        throw UnwritableReadFile {file_path_};
    }
}

void HtslibSamFacade::close()
{
    if (!is_open()) return;
    const auto status = hts_close(hts_file_.release());
    if (mode_ == Mode::write) {
        if (status < 0) throw UnwritableReadFile {file_path_};
        if (should_index() && sam_index_build(file_path_.c_str(), 0) < 0) {
            throw IndexBuildError {file_path_};
        }
    }
}

void HtslibSamFacade::set_reference(const boost::optional<Path>& reference)
{
    if (reference) {
        if (!fs::exists(*reference)) {
            throw MissingReferenceFile {*reference};
        }
        if (hts_set_fai_filename(hts_file_.get(), reference->c_str()) != 0) {
            throw MalformedReferenceFile {*reference};
        }
    }
}

bool HtslibSamFacade::should_index() const
{
    if (!(is_bam(file_path_) || is_cram(file_path_))) return false;
    const auto sort_order = header_->sort_order();
    return sort_order && *sort_order == "coordinate";
}

} // namespace io
} // namespace tiledown
