// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef mock_sam_hpp
#define mock_sam_hpp

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

#include <boost/filesystem/path.hpp>

#include "io/read/sam_record.hpp"

namespace tiledown { namespace test { namespace mock {

namespace fs = boost::filesystem;

struct MockRead
{
    std::string name;
    std::uint16_t flags;
    int position;
};

// Names a read "MOCK:1:<tile>:<x>:<y>"
std::string make_read_name(int tile, int x, int y);

// Adds a properly paired read and its mate
void add_pair(std::vector<MockRead>& reads, const std::string& name, int position, bool duplicate = false);

// Adds a secondary (0x100) and a supplementary (0x800) alignment of the first mate
void add_alternative_alignments(std::vector<MockRead>& reads, const std::string& name, int position);

// Writes an unsorted single contig SAM file. Extra header lines (e.g. @PG) are written verbatim.
void write_sam(const fs::path& file, const std::vector<MockRead>& reads,
               const std::vector<std::string>& extra_header_lines = {});

std::vector<io::SamRecord> read_all(const fs::path& file);

/**
 TemporaryDirectory creates a unique directory under the system temporary directory,
 which is removed with its contents on destruction.
 */
class TemporaryDirectory
{
public:
    TemporaryDirectory();
    
    TemporaryDirectory(const TemporaryDirectory&)            = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    
    ~TemporaryDirectory();
    
    const fs::path& path() const noexcept;
    
    fs::path operator/(const std::string& filename) const;
    
private:
    fs::path path_;
};

} // namespace mock
} // namespace test
} // namespace tiledown

#endif
