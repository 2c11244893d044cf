#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace foresight {

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

inline int64_t to_epoch_ns(Timestamp t)
{
    return t.time_since_epoch().count();
}

inline Timestamp from_epoch_ns(int64_t ns)
{
    return Timestamp(std::chrono::nanoseconds(ns));
}

inline Timestamp from_epoch_seconds(int64_t s)
{
    return Timestamp(std::chrono::seconds(s));
}

inline int64_t to_epoch_seconds(Timestamp t)
{
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

// "2026-10-19T08:30:00.000Z"
std::string format_utc(Timestamp t);

// Compact form used in model versions, "20261019T083000Z"
std::string format_utc_compact(Timestamp t);

}  // namespace foresight
