// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef progress_meter_hpp
#define progress_meter_hpp

#include <string>
#include <cstddef>
#include <chrono>

#include "logging.hpp"

namespace tiledown {

/**
 ProgressMeter reports the number of records streamed through a pass every
 'tick_size' records, along with the elapsed time and the position of the last record.
 */
class ProgressMeter
{
public:
    static constexpr std::size_t defaultTickSize {10'000'000};
    
    ProgressMeter(std::string noun, std::size_t tick_size = defaultTickSize);
    
    void start();
    void stop();
    
    // last_position is a callable returning the position of the last item, only invoked when
    // a progress line is logged. Returns true if a line was logged.
    template <typename F>
    bool log_completed(F&& last_position)
    {
        ++num_completed_;
        if (num_completed_ % tick_size_ != 0) return false;
        output_log(last_position());
        return true;
    }
    
private:
    std::string noun_;
    std::size_t tick_size_, num_completed_;
    std::chrono::time_point<std::chrono::system_clock> start_, last_tick_;
    bool done_;
    logging::InfoLogger log_;
    
    void output_log(const std::string& last_position);
};

} // namespace tiledown

#endif
