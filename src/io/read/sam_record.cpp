// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "sam_record.hpp"

#include <new>

namespace tiledown { namespace io {

namespace {

bam1_t* make_bam1()
{
    auto result = bam_init1();
    if (result == nullptr) throw std::bad_alloc {};
    return result;
}

} // namespace

SamRecord::SamRecord() : hts_bam1_ {make_bam1(), HtsBam1Deleter {}} {}

SamRecord::SamRecord(const SamRecord& other) : SamRecord {}
{
    if (bam_copy1(hts_bam1_.get(), other.hts_bam1_.get()) == nullptr) throw std::bad_alloc {};
}

SamRecord& SamRecord::operator=(const SamRecord& other)
{
    if (this != &other) {
        if (bam_copy1(hts_bam1_.get(), other.hts_bam1_.get()) == nullptr) throw std::bad_alloc {};
    }
    return *this;
}

const char* SamRecord::name() const noexcept
{
    return bam_get_qname(hts_bam1_.get());
}

std::size_t SamRecord::name_length() const noexcept
{
    // l_qname includes the NUL terminator and any extra NUL padding
    return std::char_traits<char>::length(name());
}

std::string SamRecord::read_name() const
{
    return std::string {name(), name_length()};
}

std::uint16_t SamRecord::flags() const noexcept
{
    return hts_bam1_->core.flag;
}

bool SamRecord::is_marked_duplicate() const noexcept
{
    return (hts_bam1_->core.flag & BAM_FDUP) != 0;
}

void SamRecord::clear_duplicate_flag() noexcept
{
    hts_bam1_->core.flag &= static_cast<std::uint16_t>(~BAM_FDUP);
}

SamRecord::ContigIndex SamRecord::contig_index() const noexcept
{
    return hts_bam1_->core.tid;
}

SamRecord::Position SamRecord::position() const noexcept
{
    return hts_bam1_->core.pos;
}

bam1_t* SamRecord::get() noexcept
{
    return hts_bam1_.get();
}

const bam1_t* SamRecord::get() const noexcept
{
    return hts_bam1_.get();
}

} // namespace io
} // namespace tiledown
