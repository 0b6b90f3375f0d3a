/**
 * Wall-clock abstraction
 */

#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace trend_engine {
namespace common {

using TimePoint = std::chrono::system_clock::time_point;

class Clock {
public:
    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

// UTC timestamp, e.g. 2024-05-03T14:00:00Z
inline std::string formatTimestamp(TimePoint tp) {
    std::time_t time = std::chrono::system_clock::to_time_t(tp);
    std::tm utc_tm;
    gmtime_r(&time, &utc_tm);

    std::stringstream out;
    out << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

} // namespace common
} // namespace trend_engine
