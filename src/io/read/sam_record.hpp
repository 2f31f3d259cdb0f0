// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef sam_record_hpp
#define sam_record_hpp

#include <string>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "htslib/sam.h"

namespace tiledown { namespace io {

/**
 SamRecord owns a single htslib alignment record. Records are passed through unchanged apart from
 the duplicate flag, so no attempt is made to decode them further.
 */
class SamRecord
{
public:
    using ContigIndex = std::int32_t;
    using Position    = std::int64_t;
    
    SamRecord();
    
    SamRecord(const SamRecord&);
    SamRecord& operator=(const SamRecord&);
    SamRecord(SamRecord&&)            = default;
    SamRecord& operator=(SamRecord&&) = default;
    
    ~SamRecord() = default;
    
    const char* name() const noexcept;
    std::size_t name_length() const noexcept;
    std::string read_name() const;
    
    std::uint16_t flags() const noexcept;
    bool is_marked_duplicate() const noexcept;
    void clear_duplicate_flag() noexcept;
    
    ContigIndex contig_index() const noexcept;
    Position position() const noexcept; // 0-based, -1 if unplaced
    
    bam1_t* get() noexcept;
    const bam1_t* get() const noexcept;
    
private:
    struct HtsBam1Deleter
    {
        void operator()(bam1_t* b) const { bam_destroy1(b); }
    };
    
    std::unique_ptr<bam1_t, HtsBam1Deleter> hts_bam1_;
};

} // namespace io
} // namespace tiledown

#endif
