// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "read_reader.hpp"

#include <utility>

namespace tiledown { namespace io {

ReadReader::ReadReader(Path file_path, boost::optional<Path> reference)
: path_ {std::move(file_path)}
, impl_ {std::make_unique<HtslibSamFacade>(path_, std::move(reference))}
{}

const ReadReader::Path& ReadReader::path() const noexcept
{
    return path_;
}

const SamHeader& ReadReader::header() const
{
    return impl_->header();
}

std::size_t ReadReader::iterate(const RecordVisitor& visitor, const boost::optional<std::size_t> max_records)
{
    std::size_t result {0};
    SamRecord record {};
    while ((!max_records || result < *max_records) && impl_->read(record)) {
        ++result;
        if (!visitor(record)) break;
    }
    return result;
}

void ReadReader::close()
{
    impl_->close();
}

} // namespace io
} // namespace tiledown
