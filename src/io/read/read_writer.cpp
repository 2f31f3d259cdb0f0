// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "read_writer.hpp"

#include <utility>

namespace tiledown { namespace io {

ReadWriter::ReadWriter(Path sam_out, const SamHeader& header, boost::optional<Path> reference)
: path_ {std::move(sam_out)}
, impl_ {std::make_unique<HtslibSamFacade>(path_, header, std::move(reference))}
{}

const ReadWriter::Path& ReadWriter::path() const noexcept
{
    return path_;
}

void ReadWriter::write(const SamRecord& record)
{
    impl_->write(record);
}

void ReadWriter::close()
{
    impl_->close();
}

ReadWriter& operator<<(ReadWriter& dst, const SamRecord& record)
{
    dst.write(record);
    return dst;
}

} // namespace io
} // namespace tiledown
