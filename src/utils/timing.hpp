// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef timing_hpp
#define timing_hpp

#include <chrono>
#include <ostream>

namespace tiledown { namespace utils {

struct TimeInterval
{
    using TimePoint = std::chrono::system_clock::time_point;
    TimePoint start, end;
};

template <typename T>
auto duration(const TimeInterval& interval)
{
    return std::chrono::duration_cast<T>(interval.end - interval.start);
}

// Human readable, coarsest two units only, e.g. "3h 12m"
inline std::ostream& operator<<(std::ostream& os, const TimeInterval& interval)
{
    const auto ms = duration<std::chrono::milliseconds>(interval).count();
    if (ms < 1000) {
        os << ms << "ms";
        return os;
    }
    const auto secs = duration<std::chrono::seconds>(interval).count();
    if (secs < 60) {
        os << secs << 's';
        return os;
    }
    const auto mins = duration<std::chrono::minutes>(interval).count();
    if (mins < 60) {
        os << mins << 'm';
        if (secs % 60 > 0) os << ' ' << secs % 60 << 's';
        return os;
    }
    const auto hours = duration<std::chrono::hours>(interval).count();
    os << hours << 'h';
    if (mins % 60 > 0) os << ' ' << mins % 60 << 'm';
    return os;
}

} // namespace utils
} // namespace tiledown

#endif
