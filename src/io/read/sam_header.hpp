// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef sam_header_hpp
#define sam_header_hpp

#include <string>
#include <vector>
#include <memory>
#include <cstdint>

#include <boost/optional.hpp>

#include "htslib/sam.h"

namespace tiledown { namespace io {

/**
 SamHeader owns an htslib header and exposes the few header queries needed for
 checking and recording program provenance (@PG lines).
 */
class SamHeader
{
public:
    struct ProgramRecord
    {
        boost::optional<std::string> id, name;
        std::string line;
    };
    
    SamHeader() = delete;
    
    explicit SamHeader(sam_hdr_t* header); // takes ownership
    
    SamHeader(const SamHeader&);
    SamHeader& operator=(const SamHeader&);
    SamHeader(SamHeader&&)            = default;
    SamHeader& operator=(SamHeader&&) = default;
    
    ~SamHeader() = default;
    
    std::vector<ProgramRecord> program_records() const;
    
    // Adds a @PG line with a collision free ID chained to the existing program records
    void add_program_record(const std::string& name, const std::string& version, const std::string& command_line);
    
    boost::optional<std::string> sort_order() const;
    
    std::string contig_name(std::int32_t index) const;
    
    sam_hdr_t* get() const noexcept;
    
private:
    struct HtsHeaderDeleter
    {
        void operator()(sam_hdr_t* header) const { sam_hdr_destroy(header); }
    };
    
    std::unique_ptr<sam_hdr_t, HtsHeaderDeleter> hts_header_;
};

std::vector<SamHeader::ProgramRecord>
find_program_records(const SamHeader& header, const std::string& program_name);

} // namespace io
} // namespace tiledown

#endif
