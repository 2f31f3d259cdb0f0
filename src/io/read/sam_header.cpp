// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "sam_header.hpp"

#include <cstdlib>
#include <new>
#include <stdexcept>
#include <algorithm>
#include <iterator>

#include "htslib/kstring.h"

namespace tiledown { namespace io {

namespace {

class KString
{
public:
    KString() = default;
    KString(const KString&)            = delete;
    KString& operator=(const KString&) = delete;
    ~KString() { std::free(ks_.s); }
    
    kstring_t* get() noexcept { return &ks_; }
    std::string str() const { return ks_.s != nullptr ? std::string {ks_.s, ks_.l} : std::string {}; }
    void clear() noexcept { ks_.l = 0; }
    
private:
    kstring_t ks_ {0, 0, nullptr};
};

sam_hdr_t* duplicate(const sam_hdr_t* header)
{
    auto result = sam_hdr_dup(header);
    if (result == nullptr) throw std::bad_alloc {};
    return result;
}

} // namespace

SamHeader::SamHeader(sam_hdr_t* header) : hts_header_ {header, HtsHeaderDeleter {}}
{
    if (!hts_header_) throw std::invalid_argument {"SamHeader: null header"};
}

SamHeader::SamHeader(const SamHeader& other) : hts_header_ {duplicate(other.get()), HtsHeaderDeleter {}} {}

SamHeader& SamHeader::operator=(const SamHeader& other)
{
    if (this != &other) {
        hts_header_.reset(duplicate(other.get()));
    }
    return *this;
}

std::vector<SamHeader::ProgramRecord> SamHeader::program_records() const
{
    const auto num_records = sam_hdr_count_lines(get(), "PG");
    if (num_records < 0) throw std::runtime_error {"SamHeader: could not parse @PG lines"};
    std::vector<ProgramRecord> result {};
    result.reserve(num_records);
    KString ks {};
    for (int i {0}; i < num_records; ++i) {
        ProgramRecord record {};
        ks.clear();
        if (sam_hdr_find_line_pos(get(), "PG", i, ks.get()) == 0) {
            record.line = ks.str();
        }
        ks.clear();
        if (sam_hdr_find_tag_pos(get(), "PG", i, "ID", ks.get()) == 0) {
            record.id = ks.str();
        }
        ks.clear();
        if (sam_hdr_find_tag_pos(get(), "PG", i, "PN", ks.get()) == 0) {
            record.name = ks.str();
        }
        result.push_back(std::move(record));
    }
    return result;
}

void SamHeader::add_program_record(const std::string& name, const std::string& version, const std::string& command_line)
{
    if (sam_hdr_add_pg(get(), name.c_str(),
                       "VN", version.c_str(),
                       "CL", command_line.c_str(),
                       static_cast<const char*>(nullptr)) != 0) {
        throw std::runtime_error {"SamHeader: could not add @PG line for " + name};
    }
}

boost::optional<std::string> SamHeader::sort_order() const
{
    KString ks {};
    if (sam_hdr_find_tag_hd(get(), "SO", ks.get()) == 0) {
        return ks.str();
    }
    return boost::none;
}

std::string SamHeader::contig_name(const std::int32_t index) const
{
    if (index < 0) return "*";
    const auto result = sam_hdr_tid2name(get(), index);
    return result != nullptr ? result : "*";
}

sam_hdr_t* SamHeader::get() const noexcept
{
    return hts_header_.get();
}

std::vector<SamHeader::ProgramRecord>
find_program_records(const SamHeader& header, const std::string& program_name)
{
    auto result = header.program_records();
    result.erase(std::remove_if(std::begin(result), std::end(result),
                                [&] (const auto& record) { return !record.name || *record.name != program_name; }),
                 std::end(result));
    return result;
}

} // namespace io
} // namespace tiledown
