#pragma once

#include "vcodec/core/type_adapter.hpp"
#include "vcodec/core/exception.hpp"
#include "vcodec/core/timestamp_utils.hpp"
#include "vcodec/core/extended_types.hpp"
#include <chrono>
#include <string>

namespace vcodec::core {

namespace detail {
    [[noreturn]] inline void throw_adapter_mismatch(const Value& value, const char* target) {
        throw EncodingTypeMismatchError("cannot convert " + std::string(valueKindName(value.kind())) +
                                        " value to " + target,
                                        target, value.toString());
    }
}

// DATE <-> std::chrono::year_month_day
template<>
struct TypeAdapter<std::chrono::year_month_day> {
    static constexpr bool is_specialized = true;
    static constexpr ValueKind value_kind = ValueKind::Date;

    using user_type = std::chrono::year_month_day;

    static Value to_value(const user_type& ymd) {
        if (!ymd.ok()) {
            throw ValueFormatError("invalid calendar date", "DATE", "");
        }
        return Value(Date(static_cast<int>(ymd.year()),
                          static_cast<unsigned>(ymd.month()),
                          static_cast<unsigned>(ymd.day())));
    }

    static user_type from_value(const Value& value) {
        if (!value.is<Date>()) {
            detail::throw_adapter_mismatch(value, "std::chrono::year_month_day");
        }
        const Date& date = value.asDate();
        if (date.year() < static_cast<int>(std::chrono::year::min()) ||
            date.year() > static_cast<int>(std::chrono::year::max())) {
            throw OverflowError("year outside std::chrono::year range", "DATE", date.toString());
        }
        return user_type{std::chrono::year{date.year()},
                         std::chrono::month{date.month()},
                         std::chrono::day{date.day()}};
    }
};

// TIME <-> std::chrono::hh_mm_ss<std::chrono::microseconds>
template<>
struct TypeAdapter<std::chrono::hh_mm_ss<std::chrono::microseconds>> {
    static constexpr bool is_specialized = true;
    static constexpr ValueKind value_kind = ValueKind::Time;

    using user_type = std::chrono::hh_mm_ss<std::chrono::microseconds>;

    static Value to_value(const user_type& hms) {
        const auto micros = hms.to_duration().count();
        if (hms.is_negative() || micros >= timestamp_utils::MICROS_PER_DAY) {
            throw OverflowError("time of day outside 00:00:00..23:59:59.999999", "TIME",
                                std::to_string(micros));
        }
        return Value(Time::fromMicros(micros));
    }

    static user_type from_value(const Value& value) {
        if (!value.is<Time>()) {
            detail::throw_adapter_mismatch(value, "std::chrono::hh_mm_ss");
        }
        return user_type{std::chrono::microseconds{value.asTime().toMicros()}};
    }
};

// TIMESTAMP <-> std::chrono::sys_time<std::chrono::microseconds>
// The zone-less timestamp is read as UTC civil time.
template<>
struct TypeAdapter<std::chrono::sys_time<std::chrono::microseconds>> {
    static constexpr bool is_specialized = true;
    static constexpr ValueKind value_kind = ValueKind::Timestamp;

    using user_type = std::chrono::sys_time<std::chrono::microseconds>;

    static Value to_value(const user_type& tp) {
        return Value(Timestamp::fromMicros(tp.time_since_epoch().count()));
    }

    static user_type from_value(const Value& value) {
        if (value.is<Timestamp>()) {
            return user_type{std::chrono::microseconds{value.asTimestamp().toMicros()}};
        }
        if (value.is<TimestampTz>()) {
            return user_type{std::chrono::microseconds{value.asTimestampTz().toUtcMicros()}};
        }
        detail::throw_adapter_mismatch(value, "std::chrono::sys_time");
    }
};

} // namespace vcodec::core
