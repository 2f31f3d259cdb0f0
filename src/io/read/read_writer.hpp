// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef read_writer_hpp
#define read_writer_hpp

#include <memory>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "htslib_sam_facade.hpp"

namespace tiledown { namespace io {

class ReadWriter
{
public:
    using Path = boost::filesystem::path;
    
    ReadWriter() = delete;
    
    ReadWriter(Path sam_out, const SamHeader& header, boost::optional<Path> reference = boost::none);
    
    ReadWriter(const ReadWriter&)            = delete;
    ReadWriter& operator=(const ReadWriter&) = delete;
    ReadWriter(ReadWriter&&)                 = default;
    ReadWriter& operator=(ReadWriter&&)      = default;
    
    ~ReadWriter() = default;
    
    const Path& path() const noexcept;
    
    void write(const SamRecord& record);
    
    // Must be called to detect write errors and to index sorted output
    void close();
    
private:
    Path path_;
    std::unique_ptr<HtslibSamFacade> impl_;
};

ReadWriter& operator<<(ReadWriter& dst, const SamRecord& record);

} // namespace io
} // namespace tiledown

#endif
