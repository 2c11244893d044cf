#include "foresight/time_utils.hpp"

#include <cstdio>
#include <ctime>

namespace foresight {

namespace {

std::tm to_utc_tm(Timestamp t)
{
    std::time_t secs = static_cast<std::time_t>(to_epoch_seconds(t));
    if (t.time_since_epoch().count() < 0 && t.time_since_epoch() % std::chrono::seconds(1) != std::chrono::nanoseconds(0)) {
        --secs;
    }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    return tm;
}

}  // namespace

std::string format_utc(Timestamp t)
{
    std::tm tm = to_utc_tm(t);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count() % 1000;
    if (ms < 0) {
        ms += 1000;
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
    return buf;
}

std::string format_utc_compact(Timestamp t)
{
    std::tm tm = to_utc_tm(t);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

}  // namespace foresight
