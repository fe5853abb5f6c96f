#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace vcodec {
namespace core {

/**
 * @brief Exact decimal number: sign, digit significand and scale.
 *
 * value = (-1)^negative * digits * 10^-scale. The scale is kept exactly as
 * written (0E-10 has scale 10), a negative scale means trailing zeros were
 * folded into the exponent. Equality is representational: 1.0 != 1.00.
 * Zero is never negative.
 */
class Decimal {
public:
    Decimal() = default;
    Decimal(bool negative, std::string digits, int32_t scale);

    // Throws ValueFormatError / OverflowError (scale outside int32)
    static Decimal fromString(std::string_view text);
    static Decimal fromInt64(int64_t unscaled, int32_t scale = 0);

    bool isNegative() const noexcept { return negative_; }
    bool isZero() const noexcept { return digits_ == "0"; }
    const std::string& digits() const noexcept { return digits_; }
    int32_t scale() const noexcept { return scale_; }

    // Same value at another scale; OverflowError if nonzero digits would be dropped
    Decimal rescaled(int32_t newScale) const;

    // Numeric comparison ignoring representation: -1, 0, 1
    int compare(const Decimal& other) const;

    std::string toString() const;

    bool operator==(const Decimal& other) const = default;

private:
    bool negative_ = false;
    std::string digits_ = "0";
    int32_t scale_ = 0;
};

/**
 * Proleptic Gregorian calendar date. Years are astronomical: 0 is 1 BC,
 * -1 is 2 BC. Construction validates month and day.
 */
class Date {
public:
    Date() = default;
    Date(int32_t year, unsigned month, unsigned day);

    static Date fromDays(int64_t daysSinceEpoch);

    int32_t year() const noexcept { return year_; }
    unsigned month() const noexcept { return month_; }
    unsigned day() const noexcept { return day_; }
    bool isBC() const noexcept { return year_ <= 0; }

    int64_t toDays() const noexcept;

    // "YYYY-MM-DD", "YYYY-MM-DD BC" for years <= 0
    std::string toString() const;

    bool operator==(const Date& other) const = default;
    bool operator<(const Date& other) const noexcept { return toDays() < other.toDays(); }

private:
    int32_t year_ = 1970;
    unsigned month_ = 1;
    unsigned day_ = 1;
};

class Time {
public:
    Time() = default;
    Time(unsigned hour, unsigned minute, unsigned second, uint32_t microsecond = 0);

    static Time fromMicros(int64_t microsSinceMidnight);

    unsigned hour() const noexcept { return hour_; }
    unsigned minute() const noexcept { return minute_; }
    unsigned second() const noexcept { return second_; }
    uint32_t microsecond() const noexcept { return microsecond_; }

    int64_t toMicros() const noexcept;

    // "HH:MM:SS[.ffffff]"
    std::string toString() const;

    bool operator==(const Time& other) const = default;

private:
    unsigned hour_ = 0;
    unsigned minute_ = 0;
    unsigned second_ = 0;
    uint32_t microsecond_ = 0;
};

// Time of day with a fixed UTC offset (seconds east of UTC)
class TimeTz {
public:
    TimeTz() = default;
    TimeTz(Time time, int32_t offsetSeconds);

    const Time& time() const noexcept { return time_; }
    int32_t offsetSeconds() const noexcept { return offset_seconds_; }

    std::string toString() const;

    bool operator==(const TimeTz& other) const = default;

private:
    Time time_;
    int32_t offset_seconds_ = 0;
};

class Timestamp {
public:
    Timestamp() = default;
    Timestamp(Date date, Time time) : date_(date), time_(time) {}

    static Timestamp fromMicros(int64_t microsSinceEpoch);

    const Date& date() const noexcept { return date_; }
    const Time& time() const noexcept { return time_; }

    // Microseconds since 1970-01-01 00:00:00 (no zone)
    int64_t toMicros() const;

    std::string toString() const;

    bool operator==(const Timestamp& other) const = default;

private:
    Date date_;
    Time time_;
};

// Local civil date-time plus the UTC offset in effect for it
class TimestampTz {
public:
    TimestampTz() = default;
    TimestampTz(Timestamp local, int32_t offsetSeconds);

    const Timestamp& local() const noexcept { return local_; }
    int32_t offsetSeconds() const noexcept { return offset_seconds_; }

    // Same instant as microseconds since the Unix epoch in UTC
    int64_t toUtcMicros() const;

    std::string toString() const;

    bool operator==(const TimestampTz& other) const = default;

private:
    Timestamp local_;
    int32_t offset_seconds_ = 0;
};

/**
 * @brief Calendar-aware duration.
 *
 * Always stored normalized: every component shares the sign of its
 * magnitude carry, |microseconds| < 10^6, |seconds| < 60, |minutes| < 60,
 * |hours| < 24, |months| < 12. Days never carry into months.
 */
class Interval {
public:
    Interval() = default;
    Interval(int64_t years, int64_t months, int64_t days,
             int64_t hours, int64_t minutes, int64_t seconds,
             int64_t microseconds);

    static Interval fromYearsMonths(int64_t years, int64_t months) {
        return Interval(years, months, 0, 0, 0, 0, 0);
    }
    static Interval fromDayTime(int64_t days, int64_t hours = 0, int64_t minutes = 0,
                                int64_t seconds = 0, int64_t microseconds = 0) {
        return Interval(0, 0, days, hours, minutes, seconds, microseconds);
    }

    int64_t years() const noexcept { return years_; }
    int64_t months() const noexcept { return months_; }
    int64_t days() const noexcept { return days_; }
    int64_t hours() const noexcept { return hours_; }
    int64_t minutes() const noexcept { return minutes_; }
    int64_t seconds() const noexcept { return seconds_; }
    int64_t microseconds() const noexcept { return microseconds_; }

    bool isZero() const noexcept;
    bool hasYearMonthPart() const noexcept { return years_ != 0 || months_ != 0; }
    bool hasDayTimePart() const noexcept;

    // Throw OverflowError when the total does not fit int64
    int64_t totalMonths() const;
    int64_t dayTimeMicros() const;

    Interval operator-() const;

    std::string toString() const;

    bool operator==(const Interval& other) const = default;

private:
    void normalize();

    int64_t years_ = 0;
    int64_t months_ = 0;
    int64_t days_ = 0;
    int64_t hours_ = 0;
    int64_t minutes_ = 0;
    int64_t seconds_ = 0;
    int64_t microseconds_ = 0;
};

class Uuid {
public:
    using Bytes = std::array<uint8_t, 16>;

    Uuid() : bytes_{} {}
    explicit Uuid(const Bytes& bytes) : bytes_(bytes) {}

    // 8-4-4-4-12 hex groups, case-insensitive
    static Uuid fromString(std::string_view text);

    const Bytes& bytes() const noexcept { return bytes_; }

    // Lowercase canonical form
    std::string toString() const;

    bool operator==(const Uuid& other) const = default;
    bool operator<(const Uuid& other) const noexcept { return bytes_ < other.bytes_; }

private:
    Bytes bytes_;
};

} // namespace core
} // namespace vcodec
