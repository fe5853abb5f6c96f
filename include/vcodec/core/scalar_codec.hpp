#pragma once

#include "vcodec/core/extended_types.hpp"
#include "vcodec/core/session_timezone.hpp"
#include "vcodec/core/type_descriptor.hpp"
#include "vcodec/core/value.hpp"

#include <string>
#include <string_view>

namespace vcodec::core::scalar_codec {

struct ScalarReadContext {
    const TypeDescriptor* type;
    const SessionTimezone* timezone;
};

/**
 * Decodes the textual form of a non-container value. The raw text is
 * the field exactly as the server sent it (already unquoted when it came
 * from inside a container). Never sees the NULL token.
 */
Value decode_scalar(std::string_view raw, const ScalarReadContext& ctx);

/**
 * SQL literal for a non-container value. Throws EncodingTypeMismatchError
 * when the value kind cannot represent the target type.
 */
std::string encode_scalar(const Value& value, const TypeDescriptor& type);

// Grammar of individual types; typeName is used in error reports
bool parse_boolean(std::string_view raw);
int64_t parse_integer(std::string_view raw);
double parse_float(std::string_view raw);
Decimal parse_decimal(std::string_view raw);
Bytes parse_binary(std::string_view raw);
Bytes parse_hex_binary(std::string_view hexText);
Date parse_date(std::string_view raw);
Time parse_time(std::string_view raw);
TimeTz parse_time_tz(std::string_view raw, const SessionTimezone& tz);
Timestamp parse_timestamp(std::string_view raw);
TimestampTz parse_timestamp_tz(std::string_view raw, const SessionTimezone& tz);

// CHAR(n): right-pad with spaces to n bytes
std::string pad_char(std::string text, int length);
// BINARY(n): right-pad with zero bytes to n bytes
Bytes pad_binary(Bytes bytes, int length);

// Shortest round-trip text, always float-shaped ("3.0", "1e+300"); "Infinity", "-Infinity", "NaN" for specials
std::string format_float(double value);

// '...' with '' doubling, or E'...' when backslashes or control characters occur
std::string quote_string(std::string_view text);

} // namespace vcodec::core::scalar_codec
