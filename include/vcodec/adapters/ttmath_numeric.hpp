#pragma once

#include "vcodec/core/type_adapter.hpp"
#include "vcodec/core/exception.hpp"
#include "vcodec/core/extended_types.hpp"
#include <ttmath/ttmath.h>
#include <string>

namespace vcodec::adapters {

/**
 * @brief Fixed-point decimal on top of ttmath::Int, used for NUMERIC values.
 *
 * @tparam IntWords Number of machine words of the unscaled integer (2 for 128-bit on 64-bit systems)
 * @tparam Scale    Negative for decimal places, e.g. -2 for 2 decimal places
 *
 * The value is stored as an integer with an implicit decimal point position determined by Scale.
 *
 * Examples:
 * - TTNumeric<2, -2> for NUMERIC(38,2) - money with 2 decimal places
 * - TTNumeric<2, -4> for NUMERIC(38,4)
 */
template<int IntWords, int Scale>
class TTNumeric {
public:
    using IntType = ttmath::Int<IntWords>;
    static constexpr int scale = Scale;

    TTNumeric() : value_(0) {}

    // Already scaled
    explicit TTNumeric(const IntType& raw_value) : value_(raw_value) {}

    // Exact decimal text; ValueFormatError / OverflowError when it does not fit Scale
    explicit TTNumeric(const std::string& str) {
        *this = from_decimal(core::Decimal::fromString(str));
    }

    explicit TTNumeric(const char* str) : TTNumeric(std::string(str)) {}

    const IntType& raw_value() const { return value_; }
    IntType& raw_value() { return value_; }

    core::Decimal to_decimal() const {
        std::string digits = value_.ToString();
        const bool negative = !digits.empty() && digits[0] == '-';
        if (negative) {
            digits.erase(0, 1);
        }
        return core::Decimal(negative, std::move(digits), -Scale);
    }

    static TTNumeric from_decimal(const core::Decimal& decimal) {
        // rescaled() refuses to drop nonzero digits
        const core::Decimal exact = decimal.rescaled(-Scale);
        TTNumeric result;
        std::string text = exact.isNegative() ? "-" + exact.digits() : exact.digits();
        if (result.value_.FromString(text) != 0) {
            throw core::OverflowError("value exceeds " + std::to_string(IntWords) + "-word integer",
                                      "NUMERIC", decimal.toString());
        }
        return result;
    }

    // Plain decimal text: "-12.50" for TTNumeric<2,-2>
    std::string to_string() const {
        if (scale >= 0) {
            std::string out = value_.ToString();
            if (!value_.IsZero()) out.append(static_cast<size_t>(scale), '0');
            return out;
        }

        std::string int_str = value_.ToString();
        bool is_negative = false;
        if (!int_str.empty() && int_str[0] == '-') {
            is_negative = true;
            int_str = int_str.substr(1);
        }

        const size_t decimal_places = static_cast<size_t>(-scale);
        while (int_str.length() <= decimal_places) {
            int_str = "0" + int_str;
        }

        const size_t point_pos = int_str.length() - decimal_places;
        std::string result = int_str.substr(0, point_pos) + "." + int_str.substr(point_pos);
        return is_negative ? "-" + result : result;
    }

    TTNumeric operator+(const TTNumeric& other) const { return TTNumeric(value_ + other.value_); }
    TTNumeric operator-(const TTNumeric& other) const { return TTNumeric(value_ - other.value_); }

    TTNumeric operator-() const {
        IntType neg = value_;
        neg.ChangeSign();
        return TTNumeric(neg);
    }

    bool is_zero() const { return value_.IsZero(); }
    bool is_negative() const { return value_.IsSign(); }

    bool operator==(const TTNumeric& other) const { return value_ == other.value_; }
    bool operator!=(const TTNumeric& other) const { return value_ != other.value_; }
    bool operator<(const TTNumeric& other) const { return value_ < other.value_; }

private:
    IntType value_;
};

using Money = TTNumeric<2, -2>;      // NUMERIC(38,2)
using Percent = TTNumeric<2, -4>;    // NUMERIC(38,4)

} // namespace vcodec::adapters

namespace vcodec::core {

// NUMERIC <-> TTNumeric; integer Values are accepted on the way back
template<int IntWords, int Scale>
struct TypeAdapter<vcodec::adapters::TTNumeric<IntWords, Scale>> {
    static constexpr bool is_specialized = true;
    static constexpr ValueKind value_kind = ValueKind::Decimal;

    using user_type = vcodec::adapters::TTNumeric<IntWords, Scale>;

    static Value to_value(const user_type& value) {
        return Value(value.to_decimal());
    }

    static user_type from_value(const Value& value) {
        if (value.is<Decimal>()) {
            return user_type::from_decimal(value.asDecimal());
        }
        if (value.is<int64_t>()) {
            return user_type::from_decimal(Decimal::fromInt64(value.asInt()));
        }
        throw EncodingTypeMismatchError("cannot convert " + std::string(valueKindName(value.kind())) +
                                        " value to TTNumeric",
                                        "NUMERIC", value.toString());
    }
};

} // namespace vcodec::core
