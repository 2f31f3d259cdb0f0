// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "progress_meter.hpp"

#include <utility>

#include "utils/timing.hpp"
#include "utils/string_utils.hpp"

namespace tiledown {

using utils::TimeInterval;

constexpr std::size_t ProgressMeter::defaultTickSize;

ProgressMeter::ProgressMeter(std::string noun, const std::size_t tick_size)
: noun_ {std::move(noun)}
, tick_size_ {tick_size > 0 ? tick_size : defaultTickSize}
, num_completed_ {0}
, start_ {std::chrono::system_clock::now()}
, last_tick_ {start_}
, done_ {false}
, log_ {}
{}

void ProgressMeter::start()
{
    start_ = std::chrono::system_clock::now();
    last_tick_ = start_;
    num_completed_ = 0;
    done_ = false;
}

void ProgressMeter::stop()
{
    if (!done_) {
        const auto now = std::chrono::system_clock::now();
        stream(log_) << "Processed " << utils::format_with_commas(num_completed_) << ' ' << noun_
                     << "s in " << TimeInterval {start_, now};
        done_ = true;
    }
}

void ProgressMeter::output_log(const std::string& last_position)
{
    const auto now = std::chrono::system_clock::now();
    stream(log_) << "Processed " << utils::format_with_commas(num_completed_) << ' ' << noun_ << "s."
                 << " Elapsed time: " << TimeInterval {start_, now}
                 << " (last " << tick_size_ << " in " << TimeInterval {last_tick_, now} << ")."
                 << " Last read position: " << last_position;
    last_tick_ = now;
}

} // namespace tiledown
