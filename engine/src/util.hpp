#pragma once

#include <string>
#include <chrono>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();
    std::string iso8601_from_ms(int64_t ts_ms);
    // UTC calendar day "YYYY-MM-DD" for a millisecond timestamp
    std::string utc_day(int64_t ts_ms);
    std::string redact_dsn(const std::string& dsn);
    std::string to_lower(const std::string& str);
}
