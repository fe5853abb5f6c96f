#include "vcodec/core/interval_codec.hpp"
#include "vcodec/core/detail/conversion_utils.hpp"
#include "vcodec/core/exception.hpp"
#include "vcodec/core/timestamp_utils.hpp"

#include <limits>
#include <optional>
#include <vector>

namespace vcodec::core::interval_codec {

namespace tu = timestamp_utils;

namespace {

std::string typeNameFor(const IntervalRange& range) {
    return "INTERVAL " + range.toString();
}

[[noreturn]] void formatError(const std::string& reason, const IntervalRange& range, std::string_view raw) {
    throw ValueFormatError(reason, typeNameFor(range), std::string(raw));
}

int64_t componentValue(std::string_view digits, const IntervalRange& range, std::string_view raw) {
    if (!detail::all_digits(digits)) {
        formatError("invalid interval component '" + std::string(digits) + "'", range, raw);
    }
    const auto v = detail::parse_digits(digits);
    if (!v || *v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw OverflowError("interval component out of range", typeNameFor(range), std::string(raw));
    }
    return static_cast<int64_t>(*v);
}

size_t fieldIndex(IntervalField f) {
    return static_cast<size_t>(f);
}

// -------------------------------------------------------------------------
// Day-time

Interval parseDayTime(std::string_view text, const IntervalRange& range, std::string_view raw) {
    std::string_view dayPart;
    std::string_view timePart = text;

    const size_t space = text.find_first_of(" \t");
    if (space != std::string_view::npos) {
        dayPart = text.substr(0, space);
        timePart = detail::trim(text.substr(space));
        if (timePart.find_first_of(" \t") != std::string_view::npos) {
            formatError("too many interval components", range, raw);
        }
        if (range.start != IntervalField::Day) {
            formatError("day component not allowed for this range", range, raw);
        }
    }

    int64_t comps[6] = {0, 0, 0, 0, 0, 0};
    bool wholeNegative = false;
    const bool hasDay = !dayPart.empty();
    if (hasDay) {
        if (dayPart[0] == '-' || dayPart[0] == '+') {
            wholeNegative = dayPart[0] == '-';
            dayPart.remove_prefix(1);
        }
        comps[fieldIndex(IntervalField::Day)] = componentValue(dayPart, range, raw);
    }

    bool restNegative = false;
    std::string_view rest = timePart;
    if (!rest.empty() && (rest[0] == '-' || rest[0] == '+')) {
        restNegative = rest[0] == '-';
        rest.remove_prefix(1);
    }
    if (!hasDay) {
        wholeNegative = restNegative;
    }

    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        const size_t colon = rest.find(':', start);
        parts.push_back(rest.substr(start, colon == std::string_view::npos ? std::string_view::npos
                                                                            : colon - start));
        if (colon == std::string_view::npos) break;
        start = colon + 1;
    }
    if (parts.size() > 3) {
        formatError("too many interval components", range, raw);
    }

    IntervalField first = range.start;
    if (hasDay) {
        first = IntervalField::Hour;
    } else if (range.start == IntervalField::Day) {
        first = parts.size() == 1 ? IntervalField::Day : IntervalField::Hour;
    }

    int64_t micros = 0;
    for (size_t k = 0; k < parts.size(); ++k) {
        const size_t idx = fieldIndex(first) + k;
        if (idx > fieldIndex(IntervalField::Second)) {
            formatError("too many interval components", range, raw);
        }
        const auto field = static_cast<IntervalField>(idx);

        std::string_view part = parts[k];
        std::string_view fraction;
        const size_t dot = part.find('.');
        if (dot != std::string_view::npos) {
            if (field != IntervalField::Second) {
                formatError("fraction only allowed on seconds", range, raw);
            }
            fraction = part.substr(dot + 1);
            part = part.substr(0, dot);
            if (!detail::all_digits(fraction)) {
                formatError("invalid fractional seconds", range, raw);
            }
        }
        const int64_t v = componentValue(part, range, raw);
        if (field > range.end) {
            continue;
        }
        comps[idx] = v;
        if (!fraction.empty()) {
            micros = detail::fraction_to_micros(fraction);
        }
    }

    auto signedValue = [](int64_t v, bool negative) { return negative ? -v : v; };
    const bool timeNegative = wholeNegative || restNegative;
    return Interval(0, 0,
                    signedValue(comps[fieldIndex(IntervalField::Day)], wholeNegative),
                    signedValue(comps[fieldIndex(IntervalField::Hour)], timeNegative),
                    signedValue(comps[fieldIndex(IntervalField::Minute)], timeNegative),
                    signedValue(comps[fieldIndex(IntervalField::Second)], timeNegative),
                    signedValue(micros, timeNegative));
}

// -------------------------------------------------------------------------
// Year-month

std::optional<IntervalField> yearMonthUnit(std::string_view word) {
    if (word == "y" || word == "yr" || word == "yrs" || word == "year" || word == "years") {
        return IntervalField::Year;
    }
    if (word == "m" || word == "mon" || word == "mons" || word == "month" || word == "months") {
        return IntervalField::Month;
    }
    return std::nullopt;
}

// "[-]Y-M"
bool isDashForm(std::string_view s) {
    size_t i = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
    const size_t dash = s.find('-', i);
    return dash != std::string_view::npos && detail::all_digits(s.substr(i, dash - i)) &&
           detail::all_digits(s.substr(dash + 1));
}

Interval parseYearMonth(std::string_view text, const IntervalRange& range, std::string_view raw) {
    std::string lower = detail::to_lower(text);
    std::string_view s = lower;

    bool ago = false;
    if (s.size() >= 3 && s.substr(s.size() - 3) == "ago" &&
        (s.size() == 3 || detail::is_space(s[s.size() - 4]))) {
        ago = true;
        s = detail::trim(s.substr(0, s.size() - 3));
    }
    if (s.empty()) {
        formatError("empty interval", range, raw);
    }

    int64_t years = 0;
    int64_t months = 0;

    if (isDashForm(s)) {
        bool negative = false;
        if (s[0] == '-' || s[0] == '+') {
            negative = s[0] == '-';
            s.remove_prefix(1);
        }
        const size_t dash = s.find('-');
        const bool allNegative = negative || ago;
        years = componentValue(s.substr(0, dash), range, raw);
        months = componentValue(s.substr(dash + 1), range, raw);
        if (allNegative) {
            years = -years;
            months = -months;
        }
    } else {
        bool wholeNegative = false;
        bool seen[2] = {false, false};
        size_t i = 0;
        bool firstComponent = true;
        while (i < s.size()) {
            while (i < s.size() && detail::is_space(s[i])) ++i;
            if (i >= s.size()) break;

            bool negative = false;
            if (s[i] == '-' || s[i] == '+') {
                negative = s[i] == '-';
                ++i;
            }
            const size_t numStart = i;
            while (i < s.size() && detail::is_digit(s[i])) ++i;
            const int64_t v = componentValue(s.substr(numStart, i - numStart), range, raw);

            while (i < s.size() && detail::is_space(s[i])) ++i;
            const size_t unitStart = i;
            while (i < s.size() && s[i] >= 'a' && s[i] <= 'z') ++i;
            const std::string_view unitWord = s.substr(unitStart, i - unitStart);

            IntervalField unit = range.start;
            if (!unitWord.empty()) {
                auto u = yearMonthUnit(unitWord);
                if (!u) {
                    formatError("unknown interval unit '" + std::string(unitWord) + "'", range, raw);
                }
                unit = *u;
            }
            const size_t slot = unit == IntervalField::Year ? 0 : 1;
            if (seen[slot]) {
                formatError("duplicate interval unit", range, raw);
            }
            seen[slot] = true;

            if (firstComponent) {
                wholeNegative = negative;
                firstComponent = false;
            }
            const int64_t signedV = (negative || wholeNegative || ago) ? -v : v;
            if (unit == IntervalField::Year) {
                years = signedV;
            } else {
                months = signedV;
            }
        }
    }

    if (range.end == IntervalField::Year) {
        months = 0;
    }
    return Interval::fromYearsMonths(years, months);
}

[[noreturn]] void mismatch(const Interval& value, const IntervalRange& range, const std::string& reason) {
    throw EncodingTypeMismatchError(reason, typeNameFor(range), value.toString());
}

int64_t unitMicros(IntervalField f) {
    switch (f) {
        case IntervalField::Day:    return tu::MICROS_PER_DAY;
        case IntervalField::Hour:   return tu::MICROS_PER_HOUR;
        case IntervalField::Minute: return tu::MICROS_PER_MINUTE;
        default:                    return tu::MICROS_PER_SECOND;
    }
}

} // namespace

Interval parse_interval(std::string_view raw, const IntervalRange& range) {
    const std::string_view text = detail::trim(raw);
    if (text.empty()) {
        formatError("empty interval", range, raw);
    }
    const Interval value = range.isYearMonth() ? parseYearMonth(text, range, raw)
                                               : parseDayTime(text, range, raw);
    // The total in the range's base unit must fit int64
    try {
        if (range.isYearMonth()) {
            static_cast<void>(value.totalMonths());
        } else {
            static_cast<void>(value.dayTimeMicros());
        }
    } catch (const OverflowError&) {
        throw OverflowError("interval out of range", typeNameFor(range), std::string(raw));
    }
    return value;
}

std::string format_interval(const Interval& value, const IntervalRange& range) {
    if (range.isYearMonth()) {
        if (value.hasDayTimePart()) {
            mismatch(value, range, "day-time components in a year-month interval");
        }
        const int64_t total = value.totalMonths();
        const bool negative = total < 0;
        const uint64_t a = negative ? 0 - static_cast<uint64_t>(total) : static_cast<uint64_t>(total);

        std::string body;
        if (range.start == IntervalField::Month) {
            body = std::to_string(a) + "m";
        } else if (range.end == IntervalField::Year) {
            if (a % 12 != 0) {
                mismatch(value, range, "months in a YEAR interval");
            }
            body = std::to_string(a / 12) + "y";
        } else {
            body = std::to_string(a / 12) + "y " + std::to_string(a % 12) + "m";
        }
        if (negative) {
            body += " ago";
        }
        return body;
    }

    if (value.hasYearMonthPart()) {
        mismatch(value, range, "year-month components in a day-time interval");
    }
    const int64_t total = value.dayTimeMicros();
    const bool negative = total < 0;
    uint64_t remaining = negative ? 0 - static_cast<uint64_t>(total) : static_cast<uint64_t>(total);

    if (range.end != IntervalField::Second &&
        remaining % static_cast<uint64_t>(unitMicros(range.end)) != 0) {
        mismatch(value, range, "components finer than " + std::string(intervalFieldName(range.end)));
    }

    std::string out = negative ? "-" : "";
    for (size_t idx = fieldIndex(range.start); idx <= fieldIndex(range.end); ++idx) {
        const auto field = static_cast<IntervalField>(idx);
        const auto unit = static_cast<uint64_t>(unitMicros(field));
        const uint64_t q = remaining / unit;
        remaining -= q * unit;
        if (field == range.start) {
            out += std::to_string(q);
        } else {
            out += (static_cast<IntervalField>(idx - 1) == IntervalField::Day) ? ' ' : ':';
            out += detail::pad_number(static_cast<int64_t>(q), 2);
        }
    }
    if (range.end == IntervalField::Second) {
        out += detail::format_micros_fraction(static_cast<uint32_t>(remaining));
    }
    return out;
}

} // namespace vcodec::core::interval_codec
