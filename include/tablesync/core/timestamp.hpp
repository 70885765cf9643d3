#pragma once

#include <chrono>
#include <cstdio>
#include <string>

namespace tablesync::core {

// ============================================================================
// Timestamp type
// ============================================================================
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

[[nodiscard]]
inline Timestamp now_utc() noexcept {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

// ============================================================================
// ISO-8601 / RFC3339 formatter, millisecond precision, UTC
// (example: 2024-05-01T12:30:05.042Z)
// ============================================================================
[[nodiscard]]
inline std::string to_iso8601(Timestamp ts) {
    using namespace std::chrono;

    const auto day_point = floor<days>(ts);
    const year_month_day ymd{day_point};
    const hh_mm_ss hms{ts - day_point};

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u" "T" "%02d:%02d:%02d.%03dZ",
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()),
        static_cast<int>(hms.hours().count()),
        static_cast<int>(hms.minutes().count()),
        static_cast<int>(hms.seconds().count()),
        static_cast<int>(hms.subseconds().count()));
    return buf;
}

} // namespace tablesync::core
