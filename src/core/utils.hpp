#pragma once

#include <cstdint>
#include <string>
#include <chrono>
#include <ctime>
#include <sstream>
#include <iomanip>
#include <optional>

namespace trade_rank {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * Shared UTC calendar helpers used by the aggregators and collaborators.
 */
namespace utils {

constexpr int64_t kSecondsPerDay = 86400;

struct IsoWeek {
    int year{0};
    int week{0};

    bool operator==(const IsoWeek& o) const { return year == o.year && week == o.week; }
    bool operator<(const IsoWeek& o) const {
        return year != o.year ? year < o.year : week < o.week;
    }
};

/**
 * Convert timestamp to seconds since epoch.
 */
inline int64_t ts_to_sec(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

inline Timestamp sec_to_ts(int64_t sec) {
    return Timestamp{} + std::chrono::seconds(sec);
}

inline std::tm to_utc_tm(Timestamp ts) {
    auto t = static_cast<std::time_t>(ts_to_sec(ts));
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

/**
 * Build a UTC time point from calendar fields.
 */
inline Timestamp utc_time_point(int year, int month, int day, int hour = 0, int minute = 0, int second = 0) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return sec_to_ts(static_cast<int64_t>(timegm(&tm)));
}

/**
 * Days since 1970-01-01, floored for pre-epoch instants.
 */
inline int64_t days_since_epoch(Timestamp ts) {
    int64_t sec = ts_to_sec(ts);
    int64_t days = sec / kSecondsPerDay;
    if (sec % kSecondsPerDay < 0) --days;
    return days;
}

/**
 * UTC midnight of the day containing ts.
 */
inline Timestamp day_start(Timestamp ts) {
    return sec_to_ts(days_since_epoch(ts) * kSecondsPerDay);
}

inline int hour_of_day(Timestamp ts) {
    return to_utc_tm(ts).tm_hour;
}

/**
 * Day of week with Monday = 0 ... Sunday = 6.
 */
inline int iso_weekday_index(Timestamp ts) {
    int64_t days = days_since_epoch(ts);
    // 1970-01-01 was a Thursday.
    int64_t idx = (days + 3) % 7;
    if (idx < 0) idx += 7;
    return static_cast<int>(idx);
}

/**
 * ISO-8601 week-numbering year and week. The week belongs to the year of its Thursday.
 */
inline IsoWeek iso_week(Timestamp ts) {
    int64_t days = days_since_epoch(ts);
    int64_t thursday = days - iso_weekday_index(ts) + 3;
    std::tm tm = to_utc_tm(sec_to_ts(thursday * kSecondsPerDay));
    return IsoWeek{tm.tm_year + 1900, tm.tm_yday / 7 + 1};
}

/**
 * Monday 00:00:00 of the ISO week containing ts.
 */
inline Timestamp week_start(Timestamp ts) {
    int64_t monday = days_since_epoch(ts) - iso_weekday_index(ts);
    return sec_to_ts(monday * kSecondsPerDay);
}

/**
 * Sunday 23:59:59 of the ISO week containing ts.
 */
inline Timestamp week_end(Timestamp ts) {
    return week_start(ts) + std::chrono::seconds(7 * kSecondsPerDay - 1);
}

/**
 * Format timestamp as ISO 8601 string (e.g., "2024-01-15T10:30:00Z").
 */
inline std::string ts_to_iso(Timestamp ts) {
    std::tm tm = to_utc_tm(ts);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

/**
 * Format timestamp as date string (e.g., "2024-01-15").
 */
inline std::string ts_to_date(Timestamp ts) {
    std::tm tm = to_utc_tm(ts);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return std::string(buf);
}

/**
 * Parse a timestamp with the given strftime-style layout, interpreted as UTC.
 */
inline std::optional<Timestamp> parse_ts(const std::string& s, const char* layout) {
    if (s.empty()) return std::nullopt;
    std::tm tm{};
    std::istringstream ss(s);
    ss >> std::get_time(&tm, layout);
    if (ss.fail()) return std::nullopt;
    return sec_to_ts(static_cast<int64_t>(timegm(&tm)));
}

/**
 * Parse ISO 8601 timestamp string to Timestamp.
 * Supports: "2024-01-15T10:30:00Z" or "2024-01-15T10:30:00"
 */
inline std::optional<Timestamp> parse_iso_ts(const std::string& s) {
    return parse_ts(s, "%Y-%m-%dT%H:%M:%S");
}

/**
 * Parse broker export time "2024-01-15 10:30:00" (UTC).
 */
inline std::optional<Timestamp> parse_trade_time(const std::string& s) {
    return parse_ts(s, "%Y-%m-%d %H:%M:%S");
}

} // namespace utils
} // namespace trade_rank
