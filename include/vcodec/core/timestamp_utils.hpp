#pragma once

#include <cstdint>

namespace vcodec::core::timestamp_utils {

constexpr int64_t MICROS_PER_SECOND = 1000000LL;
constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t MINUTES_PER_HOUR = 60;
constexpr int64_t HOURS_PER_DAY = 24;
constexpr int64_t MONTHS_PER_YEAR = 12;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int64_t MICROS_PER_MINUTE = MICROS_PER_SECOND * SECONDS_PER_MINUTE;
constexpr int64_t MICROS_PER_HOUR = MICROS_PER_MINUTE * MINUTES_PER_HOUR;
constexpr int64_t MICROS_PER_DAY = MICROS_PER_HOUR * HOURS_PER_DAY;

// Widest UTC offset accepted for TIMETZ / TIMESTAMPTZ (exclusive)
constexpr int32_t MAX_OFFSET_SECONDS = 86400;

constexpr bool is_leap_year(int64_t year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

constexpr unsigned days_in_month(int64_t year, unsigned month) noexcept {
    constexpr unsigned table[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return table[month - 1];
}

/**
 * Days since 1970-01-01 for a proleptic Gregorian date.
 * Year uses astronomical numbering (year 0 == 1 BC).
 */
constexpr int64_t days_from_civil(int64_t y, unsigned m, unsigned d) noexcept {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t mp = m > 2 ? m - 3 : m + 9;
    const int64_t doy = (153 * mp + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

struct CivilDate {
    int64_t year;
    unsigned month;
    unsigned day;
};

// Inverse of days_from_civil
constexpr CivilDate civil_from_days(int64_t z) noexcept {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const unsigned d = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
    const unsigned m = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
    return CivilDate{yoe + era * 400 + (m <= 2 ? 1 : 0), m, d};
}

// Floor division / modulo for negative microsecond counts
constexpr int64_t floor_div(int64_t a, int64_t b) noexcept {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

constexpr int64_t floor_mod(int64_t a, int64_t b) noexcept {
    return a - floor_div(a, b) * b;
}

} // namespace vcodec::core::timestamp_utils
