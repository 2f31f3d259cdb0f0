// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef read_reader_hpp
#define read_reader_hpp

#include <cstddef>
#include <functional>
#include <memory>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "htslib_sam_facade.hpp"

namespace tiledown { namespace io {

/**
 ReadReader streams the records of an alignment file in file order. Each ReadReader makes a
 single pass; open a new one to read the file again.
 */
class ReadReader
{
public:
    using Path = boost::filesystem::path;
    
    // Return false to stop iterating
    using RecordVisitor = std::function<bool(SamRecord&)>;
    
    ReadReader() = delete;
    
    ReadReader(Path file_path, boost::optional<Path> reference = boost::none);
    
    ReadReader(const ReadReader&)            = delete;
    ReadReader& operator=(const ReadReader&) = delete;
    ReadReader(ReadReader&&)                 = default;
    ReadReader& operator=(ReadReader&&)      = default;
    
    ~ReadReader() = default;
    
    const Path& path() const noexcept;
    
    const SamHeader& header() const;
    
    // Returns the number of records visited
    std::size_t iterate(const RecordVisitor& visitor, boost::optional<std::size_t> max_records = boost::none);
    
    void close();
    
private:
    Path path_;
    std::unique_ptr<HtslibSamFacade> impl_;
};

} // namespace io
} // namespace tiledown

#endif
