// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef htslib_sam_facade_hpp
#define htslib_sam_facade_hpp

#include <string>
#include <memory>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "htslib/hts.h"
#include "htslib/sam.h"

#include "sam_header.hpp"
#include "sam_record.hpp"

namespace tiledown { namespace io {

/**
 HtslibSamFacade streams SAM/BAM/CRAM records through htslib. A facade is either opened for
 sequential reading (from the start of the file) or for writing with a given header.
 */
class HtslibSamFacade
{
public:
    using Path = boost::filesystem::path;
    
    enum class Mode { read, write };
    
    HtslibSamFacade() = delete;
    
    // Opens file_path for reading and reads its header
    HtslibSamFacade(Path file_path, boost::optional<Path> reference = boost::none);
    // Opens sam_out for writing and writes header to it
    HtslibSamFacade(Path sam_out, const SamHeader& header, boost::optional<Path> reference = boost::none);
    
    HtslibSamFacade(const HtslibSamFacade&)            = delete;
    HtslibSamFacade& operator=(const HtslibSamFacade&) = delete;
    HtslibSamFacade(HtslibSamFacade&&)                 = default;
    HtslibSamFacade& operator=(HtslibSamFacade&&)      = default;
    
    ~HtslibSamFacade() = default;
    
    const Path& path() const noexcept;
    Mode mode() const noexcept;
    bool is_open() const noexcept;
    
    const SamHeader& header() const;
    
    // Returns false at end of file
    bool read(SamRecord& record);
    
    void write(const SamRecord& record);
    
    // Flushes any buffered output. Writers also build an index if the output is sorted BAM/CRAM.
    void close();
    
private:
    struct HtsFileDeleter
    {
        void operator()(htsFile* file) const { hts_close(file); }
    };
    
    Path file_path_;
    Mode mode_;
    std::unique_ptr<htsFile, HtsFileDeleter> hts_file_;
    boost::optional<SamHeader> header_;
    
    void set_reference(const boost::optional<Path>& reference);
    bool should_index() const;
};

bool is_bam(const boost::filesystem::path& file);
bool is_cram(const boost::filesystem::path& file);

} // namespace io
} // namespace tiledown

#endif
