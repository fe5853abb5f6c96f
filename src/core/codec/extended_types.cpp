#include "vcodec/core/extended_types.hpp"
#include "vcodec/core/detail/conversion_utils.hpp"
#include "vcodec/core/exception.hpp"
#include "vcodec/core/timestamp_utils.hpp"

#include <limits>
#include <sstream>

namespace vcodec {
namespace core {

namespace tu = timestamp_utils;

namespace {
    // Longest run of zeros rescaled() may append
    constexpr int64_t kMaxRescaleDigits = 1000000;
    // Exponents beyond this cannot produce a scale inside int32
    constexpr uint64_t kMaxExponentMagnitude = 1ULL << 40;

    std::string two_digits(unsigned v) {
        return detail::pad_number(static_cast<int64_t>(v), 2);
    }
}

// ---------------------------------------------------------------------------
// Decimal

Decimal::Decimal(bool negative, std::string digits, int32_t scale)
    : negative_(negative), digits_(std::move(digits)), scale_(scale) {
    if (!detail::all_digits(digits_)) {
        throw ValueFormatError("invalid decimal significand", "NUMERIC", digits_);
    }
    const size_t first = digits_.find_first_not_of('0');
    if (first == std::string::npos) {
        digits_ = "0";
    } else if (first > 0) {
        digits_.erase(0, first);
    }
    if (digits_ == "0") {
        negative_ = false;
    }
}

Decimal Decimal::fromString(std::string_view text) {
    const std::string_view s = detail::trim(text);
    size_t i = 0;
    bool negative = false;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
        negative = s[i] == '-';
        ++i;
    }

    std::string digits;
    int64_t fractionDigits = 0;
    bool seenPoint = false;
    for (; i < s.size(); ++i) {
        const char c = s[i];
        if (detail::is_digit(c)) {
            digits.push_back(c);
            if (seenPoint) ++fractionDigits;
        } else if (c == '.' && !seenPoint) {
            seenPoint = true;
        } else {
            break;
        }
    }
    if (digits.empty()) {
        throw ValueFormatError("invalid numeric literal", "NUMERIC", std::string(text));
    }

    int64_t exponent = 0;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        bool expNegative = false;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
            expNegative = s[i] == '-';
            ++i;
        }
        const std::string_view expDigits = s.substr(i);
        if (!detail::all_digits(expDigits)) {
            throw ValueFormatError("invalid numeric exponent", "NUMERIC", std::string(text));
        }
        const auto magnitude = detail::parse_digits(expDigits);
        if (!magnitude || *magnitude > kMaxExponentMagnitude) {
            throw OverflowError("numeric exponent out of range", "NUMERIC", std::string(text));
        }
        exponent = expNegative ? -static_cast<int64_t>(*magnitude) : static_cast<int64_t>(*magnitude);
        i = s.size();
    }
    if (i != s.size()) {
        throw ValueFormatError("invalid numeric literal", "NUMERIC", std::string(text));
    }

    const int64_t scale = fractionDigits - exponent;
    if (scale > std::numeric_limits<int32_t>::max() || scale < std::numeric_limits<int32_t>::min()) {
        throw OverflowError("numeric scale out of range", "NUMERIC", std::string(text));
    }
    return Decimal(negative, std::move(digits), static_cast<int32_t>(scale));
}

Decimal Decimal::fromInt64(int64_t unscaled, int32_t scale) {
    const bool negative = unscaled < 0;
    const uint64_t magnitude = negative ? 0 - static_cast<uint64_t>(unscaled)
                                        : static_cast<uint64_t>(unscaled);
    return Decimal(negative, std::to_string(magnitude), scale);
}

Decimal Decimal::rescaled(int32_t newScale) const {
    if (newScale == scale_) {
        return *this;
    }
    std::string digits = digits_;
    const int64_t delta = static_cast<int64_t>(newScale) - scale_;
    if (delta > 0) {
        if (delta > kMaxRescaleDigits) {
            throw OverflowError("rescale too large", "NUMERIC", toString());
        }
        if (!isZero()) {
            digits.append(static_cast<size_t>(delta), '0');
        }
    } else {
        const uint64_t drop = static_cast<uint64_t>(-delta);
        if (!isZero()) {
            if (drop >= digits.size() ||
                digits.find_first_not_of('0', digits.size() - drop) != std::string::npos) {
                throw OverflowError("value does not fit scale " + std::to_string(newScale),
                                    "NUMERIC", toString());
            }
            digits.erase(digits.size() - drop);
        }
    }
    return Decimal(negative_, std::move(digits), newScale);
}

int Decimal::compare(const Decimal& other) const {
    const int lhsSign = isZero() ? 0 : (negative_ ? -1 : 1);
    const int rhsSign = other.isZero() ? 0 : (other.negative_ ? -1 : 1);
    if (lhsSign != rhsSign) {
        return lhsSign < rhsSign ? -1 : 1;
    }
    if (lhsSign == 0) {
        return 0;
    }

    // Position of the most significant digit relative to the decimal point
    const int64_t lhsMagnitude = static_cast<int64_t>(digits_.size()) - scale_;
    const int64_t rhsMagnitude = static_cast<int64_t>(other.digits_.size()) - other.scale_;
    int result = 0;
    if (lhsMagnitude != rhsMagnitude) {
        result = lhsMagnitude < rhsMagnitude ? -1 : 1;
    } else {
        std::string a = digits_;
        std::string b = other.digits_;
        if (scale_ < other.scale_) {
            a.append(static_cast<size_t>(other.scale_ - scale_), '0');
        } else if (other.scale_ < scale_) {
            b.append(static_cast<size_t>(scale_ - other.scale_), '0');
        }
        const int c = a.compare(b);
        result = c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    return lhsSign < 0 ? -result : result;
}

std::string Decimal::toString() const {
    // General decimal arithmetic to-scientific-string rules
    std::string out = negative_ ? "-" : "";
    const int64_t exponent = -static_cast<int64_t>(scale_);
    const int64_t ndigits = static_cast<int64_t>(digits_.size());
    const int64_t adjusted = exponent + ndigits - 1;

    if (exponent <= 0 && adjusted >= -6) {
        if (exponent == 0) {
            out += digits_;
        } else if (ndigits > -exponent) {
            const size_t point = static_cast<size_t>(ndigits + exponent);
            out += digits_.substr(0, point);
            out += '.';
            out += digits_.substr(point);
        } else {
            out += "0.";
            out.append(static_cast<size_t>(-exponent - ndigits), '0');
            out += digits_;
        }
        return out;
    }

    out += digits_[0];
    if (ndigits > 1) {
        out += '.';
        out += digits_.substr(1);
    }
    out += 'E';
    out += adjusted >= 0 ? '+' : '-';
    out += std::to_string(adjusted >= 0 ? adjusted : -adjusted);
    return out;
}

// ---------------------------------------------------------------------------
// Date / Time

Date::Date(int32_t year, unsigned month, unsigned day)
    : year_(year), month_(month), day_(day) {
    if (month < 1 || month > 12 || day < 1 || day > tu::days_in_month(year, month)) {
        throw ValueFormatError("invalid calendar date", "DATE",
                               std::to_string(year) + "-" + std::to_string(month) + "-" +
                               std::to_string(day));
    }
}

Date Date::fromDays(int64_t daysSinceEpoch) {
    const auto civil = tu::civil_from_days(daysSinceEpoch);
    if (civil.year > std::numeric_limits<int32_t>::max() ||
        civil.year < std::numeric_limits<int32_t>::min()) {
        throw OverflowError("date out of range", "DATE", std::to_string(daysSinceEpoch));
    }
    return Date(static_cast<int32_t>(civil.year), civil.month, civil.day);
}

int64_t Date::toDays() const noexcept {
    return tu::days_from_civil(year_, month_, day_);
}

std::string Date::toString() const {
    const int64_t displayYear = year_ > 0 ? year_ : 1 - static_cast<int64_t>(year_);
    std::string out = detail::pad_number(displayYear, 4) + "-" + two_digits(month_) + "-" +
                      two_digits(day_);
    if (isBC()) {
        out += " BC";
    }
    return out;
}

Time::Time(unsigned hour, unsigned minute, unsigned second, uint32_t microsecond)
    : hour_(hour), minute_(minute), second_(second), microsecond_(microsecond) {
    if (hour > 23 || minute > 59 || second > 59 || microsecond > 999999) {
        throw ValueFormatError("invalid time of day", "TIME",
                               std::to_string(hour) + ":" + std::to_string(minute) + ":" +
                               std::to_string(second) + "." + std::to_string(microsecond));
    }
}

Time Time::fromMicros(int64_t microsSinceMidnight) {
    if (microsSinceMidnight < 0 || microsSinceMidnight >= tu::MICROS_PER_DAY) {
        throw ValueFormatError("time of day out of range", "TIME",
                               std::to_string(microsSinceMidnight));
    }
    const int64_t seconds = microsSinceMidnight / tu::MICROS_PER_SECOND;
    return Time(static_cast<unsigned>(seconds / tu::SECONDS_PER_HOUR),
                static_cast<unsigned>((seconds / tu::SECONDS_PER_MINUTE) % tu::MINUTES_PER_HOUR),
                static_cast<unsigned>(seconds % tu::SECONDS_PER_MINUTE),
                static_cast<uint32_t>(microsSinceMidnight % tu::MICROS_PER_SECOND));
}

int64_t Time::toMicros() const noexcept {
    return ((static_cast<int64_t>(hour_) * tu::MINUTES_PER_HOUR + minute_) * tu::SECONDS_PER_MINUTE +
            second_) * tu::MICROS_PER_SECOND + microsecond_;
}

std::string Time::toString() const {
    return two_digits(hour_) + ":" + two_digits(minute_) + ":" + two_digits(second_) +
           detail::format_micros_fraction(microsecond_);
}

TimeTz::TimeTz(Time time, int32_t offsetSeconds)
    : time_(time), offset_seconds_(offsetSeconds) {
    if (offsetSeconds >= tu::MAX_OFFSET_SECONDS || offsetSeconds <= -tu::MAX_OFFSET_SECONDS) {
        throw ValueFormatError("UTC offset out of range", "TIMETZ", std::to_string(offsetSeconds));
    }
}

std::string TimeTz::toString() const {
    return time_.toString() + detail::format_utc_offset(offset_seconds_);
}

// ---------------------------------------------------------------------------
// Timestamps

Timestamp Timestamp::fromMicros(int64_t microsSinceEpoch) {
    const int64_t days = tu::floor_div(microsSinceEpoch, tu::MICROS_PER_DAY);
    const int64_t rem = tu::floor_mod(microsSinceEpoch, tu::MICROS_PER_DAY);
    return Timestamp(Date::fromDays(days), Time::fromMicros(rem));
}

int64_t Timestamp::toMicros() const {
    const int64_t dayMicros = detail::checked_mul(date_.toDays(), tu::MICROS_PER_DAY, "TIMESTAMP");
    return detail::checked_add(dayMicros, time_.toMicros(), "TIMESTAMP");
}

std::string Timestamp::toString() const {
    const Date& d = date_;
    const int64_t displayYear = d.year() > 0 ? d.year() : 1 - static_cast<int64_t>(d.year());
    std::string out = detail::pad_number(displayYear, 4) + "-" + two_digits(d.month()) + "-" +
                      two_digits(d.day()) + " " + time_.toString();
    if (d.isBC()) {
        out += " BC";
    }
    return out;
}

TimestampTz::TimestampTz(Timestamp local, int32_t offsetSeconds)
    : local_(local), offset_seconds_(offsetSeconds) {
    if (offsetSeconds >= tu::MAX_OFFSET_SECONDS || offsetSeconds <= -tu::MAX_OFFSET_SECONDS) {
        throw ValueFormatError("UTC offset out of range", "TIMESTAMPTZ",
                               std::to_string(offsetSeconds));
    }
}

int64_t TimestampTz::toUtcMicros() const {
    return detail::checked_add(local_.toMicros(),
                               -static_cast<int64_t>(offset_seconds_) * tu::MICROS_PER_SECOND,
                               "TIMESTAMPTZ");
}

std::string TimestampTz::toString() const {
    const Date& d = local_.date();
    const int64_t displayYear = d.year() > 0 ? d.year() : 1 - static_cast<int64_t>(d.year());
    std::string out = detail::pad_number(displayYear, 4) + "-" + two_digits(d.month()) + "-" +
                      two_digits(d.day()) + " " + local_.time().toString() +
                      detail::format_utc_offset(offset_seconds_);
    if (d.isBC()) {
        out += " BC";
    }
    return out;
}

// ---------------------------------------------------------------------------
// Interval

Interval::Interval(int64_t years, int64_t months, int64_t days,
                   int64_t hours, int64_t minutes, int64_t seconds,
                   int64_t microseconds)
    : years_(years), months_(months), days_(days), hours_(hours),
      minutes_(minutes), seconds_(seconds), microseconds_(microseconds) {
    normalize();
}

namespace {
    // Truncating division keeps the remainder's sign equal to the value's sign
    void carry(int64_t& value, int64_t& next, int64_t base) {
        if (value >= base || value <= -base) {
            next = detail::checked_add(next, value / base, "INTERVAL");
            value %= base;
        }
    }
}

void Interval::normalize() {
    carry(microseconds_, seconds_, tu::MICROS_PER_SECOND);
    carry(seconds_, minutes_, tu::SECONDS_PER_MINUTE);
    carry(minutes_, hours_, tu::MINUTES_PER_HOUR);
    carry(hours_, days_, tu::HOURS_PER_DAY);
    carry(months_, years_, tu::MONTHS_PER_YEAR);
}

bool Interval::isZero() const noexcept {
    return !hasYearMonthPart() && !hasDayTimePart();
}

bool Interval::hasDayTimePart() const noexcept {
    return days_ != 0 || hours_ != 0 || minutes_ != 0 || seconds_ != 0 || microseconds_ != 0;
}

int64_t Interval::totalMonths() const {
    return detail::checked_add(detail::checked_mul(years_, tu::MONTHS_PER_YEAR, "INTERVAL"),
                               months_, "INTERVAL");
}

int64_t Interval::dayTimeMicros() const {
    using detail::checked_add;
    using detail::checked_mul;
    int64_t total = checked_add(checked_mul(days_, tu::HOURS_PER_DAY, "INTERVAL"), hours_, "INTERVAL");
    total = checked_add(checked_mul(total, tu::MINUTES_PER_HOUR, "INTERVAL"), minutes_, "INTERVAL");
    total = checked_add(checked_mul(total, tu::SECONDS_PER_MINUTE, "INTERVAL"), seconds_, "INTERVAL");
    return checked_add(checked_mul(total, tu::MICROS_PER_SECOND, "INTERVAL"), microseconds_, "INTERVAL");
}

Interval Interval::operator-() const {
    auto neg = [](int64_t v) { return detail::checked_mul(v, -1, "INTERVAL"); };
    return Interval(neg(years_), neg(months_), neg(days_), neg(hours_),
                    neg(minutes_), neg(seconds_), neg(microseconds_));
}

std::string Interval::toString() const {
    std::ostringstream oss;
    oss << "Interval(";
    bool first = true;
    auto field = [&](const char* name, int64_t v) {
        if (v == 0) return;
        if (!first) oss << ", ";
        oss << name << '=' << (v > 0 ? "+" : "") << v;
        first = false;
    };
    field("years", years_);
    field("months", months_);
    field("days", days_);
    field("hours", hours_);
    field("minutes", minutes_);
    field("seconds", seconds_);
    field("microseconds", microseconds_);
    oss << ')';
    return oss.str();
}

// ---------------------------------------------------------------------------
// Uuid

Uuid Uuid::fromString(std::string_view text) {
    const std::string_view s = detail::trim(text);
    const bool dashed = s.size() == 36;
    if (!dashed && s.size() != 32) {
        throw ValueFormatError("invalid UUID length", "UUID", std::string(text));
    }

    Bytes bytes{};
    size_t nibble = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (dashed && (i == 8 || i == 13 || i == 18 || i == 23)) {
            if (s[i] != '-') {
                throw ValueFormatError("invalid UUID grouping", "UUID", std::string(text));
            }
            continue;
        }
        const int v = detail::hex_digit_value(s[i]);
        if (v < 0) {
            throw ValueFormatError("invalid UUID digit", "UUID", std::string(text));
        }
        uint8_t& b = bytes[nibble / 2];
        b = static_cast<uint8_t>((nibble % 2 == 0) ? (v << 4) : (b | v));
        ++nibble;
    }
    return Uuid(bytes);
}

std::string Uuid::toString() const {
    const std::string hex = detail::hex_encode(std::vector<uint8_t>(bytes_.begin(), bytes_.end()));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20);
}

} // namespace core
} // namespace vcodec
