#include "vcodec/core/scalar_codec.hpp"
#include "vcodec/core/detail/conversion_utils.hpp"
#include "vcodec/core/exception.hpp"
#include "vcodec/core/interval_codec.hpp"
#include "vcodec/core/timestamp_utils.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <system_error>

namespace vcodec::core::scalar_codec {

namespace {

constexpr size_t kMaxYearDigits = 9;

struct Cursor {
    std::string_view s;
    size_t pos = 0;

    bool done() const { return pos >= s.size(); }
    char peek() const { return pos < s.size() ? s[pos] : '\0'; }

    bool accept(char c) {
        if (peek() == c) {
            ++pos;
            return true;
        }
        return false;
    }

    std::string_view digits(size_t maxCount = std::string_view::npos) {
        const size_t start = pos;
        while (!done() && detail::is_digit(s[pos]) && pos - start < maxCount) ++pos;
        return s.substr(start, pos - start);
    }

    size_t skipSpaces() {
        const size_t start = pos;
        while (!done() && detail::is_space(s[pos])) ++pos;
        return pos - start;
    }

    std::string_view rest() const { return pos < s.size() ? s.substr(pos) : std::string_view{}; }
};

[[noreturn]] void formatError(const char* reason, const char* typeName, std::string_view raw) {
    throw ValueFormatError(reason, typeName, std::string(raw));
}

// Removes a trailing " BC" marker
bool stripEra(std::string_view& text) {
    if (text.size() > 3 && detail::iends_with(text, "BC") && detail::is_space(text[text.size() - 3])) {
        text = detail::trim(text.substr(0, text.size() - 2));
        return true;
    }
    return false;
}

struct DateParts {
    int64_t year;
    unsigned month;
    unsigned day;
};

DateParts readDate(Cursor& c, const char* typeName, std::string_view raw) {
    const auto y = c.digits();
    if (y.empty()) formatError("expected year", typeName, raw);
    if (y.size() > kMaxYearDigits) {
        throw OverflowError("year out of range", typeName, std::string(raw));
    }
    if (!c.accept('-')) formatError("expected '-' after year", typeName, raw);
    const auto m = c.digits(2);
    if (m.empty() || !c.accept('-')) formatError("invalid month", typeName, raw);
    const auto d = c.digits(2);
    if (d.empty()) formatError("invalid day", typeName, raw);
    return DateParts{static_cast<int64_t>(*detail::parse_digits(y)),
                     static_cast<unsigned>(*detail::parse_digits(m)),
                     static_cast<unsigned>(*detail::parse_digits(d))};
}

Date makeDate(const DateParts& p, bool bc, const char* typeName, std::string_view raw) {
    int64_t year = p.year;
    if (bc) {
        if (year < 1) formatError("BC year must be positive", typeName, raw);
        year = 1 - year;
    }
    if (p.month < 1 || p.month > 12 || p.day < 1 ||
        p.day > timestamp_utils::days_in_month(year, p.month)) {
        formatError("invalid calendar date", typeName, raw);
    }
    return Date(static_cast<int32_t>(year), p.month, p.day);
}

Time readTime(Cursor& c, const char* typeName, std::string_view raw) {
    const auto h = c.digits(2);
    if (h.empty() || !c.accept(':')) formatError("expected HH:MM", typeName, raw);
    const auto m = c.digits(2);
    if (m.size() != 2) formatError("invalid minutes", typeName, raw);
    std::string_view s = "0";
    uint32_t micros = 0;
    if (c.accept(':')) {
        s = c.digits(2);
        if (s.size() != 2) formatError("invalid seconds", typeName, raw);
        if (c.accept('.')) {
            const auto frac = c.digits();
            if (frac.empty()) formatError("invalid fractional seconds", typeName, raw);
            micros = detail::fraction_to_micros(frac);
        }
    }
    const auto hour = *detail::parse_digits(h);
    const auto minute = *detail::parse_digits(m);
    const auto second = *detail::parse_digits(s);
    if (hour > 23 || minute > 59 || second > 59) {
        formatError("time of day out of range", typeName, raw);
    }
    return Time(static_cast<unsigned>(hour), static_cast<unsigned>(minute),
                static_cast<unsigned>(second), micros);
}

// Date and time separated by spaces or 'T'
bool readDateTimeSeparator(Cursor& c) {
    if (c.accept('T') || c.accept('t')) return true;
    return c.skipSpaces() > 0 && !c.done();
}

// Offset of the zone tail following a time: numeric offset, zone name, or session zone
int32_t resolveOffset(std::string_view tail, const Timestamp& local, const SessionTimezone& tz,
                      const char* typeName, std::string_view raw) {
    const std::string_view t = detail::trim(tail);
    if (t.empty()) {
        return tz.offsetFor(local);
    }
    if (t[0] == '+' || t[0] == '-' || t == "Z" || t == "z") {
        auto offset = detail::parse_utc_offset(t);
        if (!offset) formatError("invalid UTC offset", typeName, raw);
        return *offset;
    }
    return SessionTimezone::parse(t).offsetFor(local);
}

} // namespace

// ---------------------------------------------------------------------------
// Individual grammars

bool parse_boolean(std::string_view raw) {
    const std::string v = detail::to_lower(detail::trim(raw));
    if (v == "t" || v == "true") return true;
    if (v == "f" || v == "false") return false;
    formatError("invalid boolean", "BOOLEAN", raw);
}

int64_t parse_integer(std::string_view raw) {
    std::string_view s = detail::trim(raw);
    if (!s.empty() && s[0] == '+') {
        s.remove_prefix(1);
        if (!s.empty() && s[0] == '-') formatError("invalid integer", "INTEGER", raw);
    }
    if (s.empty()) formatError("invalid integer", "INTEGER", raw);

    int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec == std::errc::result_out_of_range) {
        throw OverflowError("integer out of range", "INTEGER", std::string(raw));
    }
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        formatError("invalid integer", "INTEGER", raw);
    }
    return value;
}

double parse_float(std::string_view raw) {
    std::string_view s = detail::trim(raw);
    const std::string lower = detail::to_lower(s);
    if (lower == "infinity" || lower == "+infinity" || lower == "inf" || lower == "+inf") {
        return std::numeric_limits<double>::infinity();
    }
    if (lower == "-infinity" || lower == "-inf") {
        return -std::numeric_limits<double>::infinity();
    }
    if (lower == "nan" || lower == "+nan" || lower == "-nan") {
        return std::numeric_limits<double>::quiet_NaN();
    }

    if (!s.empty() && s[0] == '+') {
        s.remove_prefix(1);
        if (!s.empty() && s[0] == '-') formatError("invalid float", "FLOAT", raw);
    }
    if (s.empty()) formatError("invalid float", "FLOAT", raw);

    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ptr != s.data() + s.size() ||
        (ec != std::errc() && ec != std::errc::result_out_of_range)) {
        formatError("invalid float", "FLOAT", raw);
    }
    if (ec == std::errc::result_out_of_range) {
        // from_chars reports subnormal results as out of range too
        const std::string copy(s);
        value = std::strtod(copy.c_str(), nullptr);
        if (std::isinf(value)) {
            throw OverflowError("float out of range", "FLOAT", std::string(raw));
        }
    }
    return value;
}

Decimal parse_decimal(std::string_view raw) {
    return Decimal::fromString(raw);
}

Bytes parse_binary(std::string_view raw) {
    Bytes out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        const char c = raw[i];
        if (c != '\\') {
            out.push_back(static_cast<uint8_t>(c));
            continue;
        }
        if (i + 1 >= raw.size()) formatError("dangling backslash", "VARBINARY", raw);
        const char n = raw[i + 1];
        if (n == '\\') {
            out.push_back(static_cast<uint8_t>('\\'));
            i += 1;
        } else if (n == 'x' || n == 'X') {
            if (i + 3 >= raw.size()) formatError("truncated \\x escape", "VARBINARY", raw);
            const int hi = detail::hex_digit_value(raw[i + 2]);
            const int lo = detail::hex_digit_value(raw[i + 3]);
            if (hi < 0 || lo < 0) formatError("invalid \\x escape", "VARBINARY", raw);
            out.push_back(static_cast<uint8_t>((hi << 4) | lo));
            i += 3;
        } else if (n >= '0' && n <= '7') {
            if (i + 3 >= raw.size()) formatError("truncated octal escape", "VARBINARY", raw);
            int v = 0;
            for (size_t k = 1; k <= 3; ++k) {
                const char o = raw[i + k];
                if (o < '0' || o > '7') formatError("invalid octal escape", "VARBINARY", raw);
                v = v * 8 + (o - '0');
            }
            if (v > 255) formatError("octal escape out of range", "VARBINARY", raw);
            out.push_back(static_cast<uint8_t>(v));
            i += 3;
        } else {
            formatError("invalid escape in binary text", "VARBINARY", raw);
        }
    }
    return out;
}

Bytes parse_hex_binary(std::string_view hexText) {
    std::string_view h = detail::trim(hexText);
    if (detail::istarts_with(h, "0x")) h.remove_prefix(2);
    if (h.size() % 2 != 0) formatError("odd number of hex digits", "VARBINARY", hexText);
    Bytes out;
    out.reserve(h.size() / 2);
    for (size_t i = 0; i < h.size(); i += 2) {
        const int hi = detail::hex_digit_value(h[i]);
        const int lo = detail::hex_digit_value(h[i + 1]);
        if (hi < 0 || lo < 0) formatError("invalid hex digit", "VARBINARY", hexText);
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

Date parse_date(std::string_view raw) {
    std::string_view t = detail::trim(raw);
    const bool bc = stripEra(t);
    Cursor c{t};
    const auto parts = readDate(c, "DATE", raw);
    if (!c.done()) formatError("unexpected text after date", "DATE", raw);
    return makeDate(parts, bc, "DATE", raw);
}

Time parse_time(std::string_view raw) {
    Cursor c{detail::trim(raw)};
    const Time t = readTime(c, "TIME", raw);
    if (!c.done()) formatError("unexpected text after time", "TIME", raw);
    return t;
}

TimeTz parse_time_tz(std::string_view raw, const SessionTimezone& tz) {
    Cursor c{detail::trim(raw)};

    // An optional leading date only selects the day used to resolve a zone name
    Date reference(1970, 1, 1);
    {
        Cursor probe = c;
        probe.digits();
        if (probe.peek() == '-') {
            const auto parts = readDate(c, "TIMETZ", raw);
            if (!readDateTimeSeparator(c)) formatError("expected time after date", "TIMETZ", raw);
            reference = makeDate(parts, false, "TIMETZ", raw);
        }
    }

    const Time t = readTime(c, "TIMETZ", raw);
    const int32_t offset = resolveOffset(c.rest(), Timestamp(reference, t), tz, "TIMETZ", raw);
    return TimeTz(t, offset);
}

Timestamp parse_timestamp(std::string_view raw) {
    std::string_view text = detail::trim(raw);
    const bool bc = stripEra(text);
    Cursor c{text};
    const auto parts = readDate(c, "TIMESTAMP", raw);
    Time t;
    if (!c.done()) {
        if (!readDateTimeSeparator(c)) formatError("expected time after date", "TIMESTAMP", raw);
        t = readTime(c, "TIMESTAMP", raw);
        c.skipSpaces();
        if (!c.done()) formatError("unexpected text after timestamp", "TIMESTAMP", raw);
    }
    return Timestamp(makeDate(parts, bc, "TIMESTAMP", raw), t);
}

TimestampTz parse_timestamp_tz(std::string_view raw, const SessionTimezone& tz) {
    std::string_view text = detail::trim(raw);
    const bool bc = stripEra(text);
    Cursor c{text};
    const auto parts = readDate(c, "TIMESTAMPTZ", raw);
    Time t;
    std::string_view tail;
    if (!c.done()) {
        if (!readDateTimeSeparator(c)) formatError("expected time after date", "TIMESTAMPTZ", raw);
        t = readTime(c, "TIMESTAMPTZ", raw);
        tail = c.rest();
    }
    const Timestamp local(makeDate(parts, bc, "TIMESTAMPTZ", raw), t);
    return TimestampTz(local, resolveOffset(tail, local, tz, "TIMESTAMPTZ", raw));
}

std::string pad_char(std::string text, int length) {
    if (length > 0 && text.size() < static_cast<size_t>(length)) {
        text.append(static_cast<size_t>(length) - text.size(), ' ');
    }
    return text;
}

Bytes pad_binary(Bytes bytes, int length) {
    if (length > 0 && bytes.size() < static_cast<size_t>(length)) {
        bytes.resize(static_cast<size_t>(length), 0);
    }
    return bytes;
}

// ---------------------------------------------------------------------------
// Dispatch

Value decode_scalar(std::string_view raw, const ScalarReadContext& ctx) {
    const TypeDescriptor& type = *ctx.type;
    switch (type.kind()) {
        case TypeKind::Boolean:     return Value::boolean(parse_boolean(raw));
        case TypeKind::Integer:     return Value::integer(parse_integer(raw));
        case TypeKind::Float:       return Value::floating(parse_float(raw));
        case TypeKind::Decimal:     return Value(parse_decimal(raw));
        case TypeKind::Char:        return Value::text(pad_char(std::string(raw), type.length()));
        case TypeKind::Varchar:     return Value::text(std::string(raw));
        case TypeKind::Binary:      return Value::bytes(pad_binary(parse_binary(raw), type.length()));
        case TypeKind::Varbinary:   return Value::bytes(parse_binary(raw));
        case TypeKind::Uuid:        return Value(Uuid::fromString(raw));
        case TypeKind::Date:        return Value(parse_date(raw));
        case TypeKind::Time:        return Value(parse_time(raw));
        case TypeKind::TimeTz:      return Value(parse_time_tz(raw, *ctx.timezone));
        case TypeKind::Timestamp:   return Value(parse_timestamp(raw));
        case TypeKind::TimestampTz: return Value(parse_timestamp_tz(raw, *ctx.timezone));
        case TypeKind::Interval:
            return Value(interval_codec::parse_interval(raw, type.intervalRange()));
        case TypeKind::Array:
        case TypeKind::Set:
        case TypeKind::Row:
            break;
    }
    throw UnsupportedTypeError("not a scalar type", type.toString(), std::string(raw));
}

// ---------------------------------------------------------------------------
// Encoding

namespace {
    // An integer-shaped token would be read back as INTEGER
    std::string float_shaped(std::string token) {
        if (token.find_first_of(".eE") == std::string::npos) {
            token += ".0";
        }
        return token;
    }
}

std::string format_float(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
    char buf[64];
    const auto res = std::to_chars(buf, buf + sizeof(buf), value);
    return float_shaped(std::string(buf, res.ptr));
}

std::string quote_string(std::string_view text) {
    bool escaped = false;
    for (char c : text) {
        const auto u = static_cast<unsigned char>(c);
        if (c == '\\' || u < 0x20 || u == 0x7F) {
            escaped = true;
            break;
        }
    }

    std::string out;
    out.reserve(text.size() + 3);
    if (!escaped) {
        out += '\'';
        for (char c : text) {
            if (c == '\'') out += '\'';
            out += c;
        }
        out += '\'';
        return out;
    }

    out += "E'";
    for (char c : text) {
        const auto u = static_cast<unsigned char>(c);
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\'': out += "\\'"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (u < 0x20 || u == 0x7F) {
                    out += '\\';
                    out += static_cast<char>('0' + ((u >> 6) & 7));
                    out += static_cast<char>('0' + ((u >> 3) & 7));
                    out += static_cast<char>('0' + (u & 7));
                } else {
                    out += c;
                }
        }
    }
    out += '\'';
    return out;
}

std::string encode_scalar(const Value& value, const TypeDescriptor& type) {
    if (value.isNull()) {
        return "NULL";
    }

    switch (type.kind()) {
        case TypeKind::Boolean:
            if (value.is<bool>()) return value.asBool() ? "true" : "false";
            break;
        case TypeKind::Integer:
            if (value.is<int64_t>()) return std::to_string(value.asInt());
            break;
        case TypeKind::Float:
            if (value.is<double>()) {
                const double d = value.asDouble();
                if (std::isfinite(d)) return format_float(d);
                return "'" + format_float(d) + "'::FLOAT";
            }
            if (value.is<int64_t>()) return float_shaped(std::to_string(value.asInt()));
            if (value.is<Decimal>()) return float_shaped(value.asDecimal().toString());
            break;
        case TypeKind::Decimal:
            if (value.is<Decimal>()) return value.asDecimal().toString();
            if (value.is<int64_t>()) return std::to_string(value.asInt());
            if (value.is<double>() && std::isfinite(value.asDouble())) return format_float(value.asDouble());
            break;
        case TypeKind::Char:
        case TypeKind::Varchar:
            if (value.is<std::string>()) {
                // SQL string literals cannot carry a NUL byte
                if (value.asText().find('\0') != std::string::npos) {
                    throw EncodingTypeMismatchError("text contains a NUL byte", type.toString(),
                                                    value.asText());
                }
                return quote_string(value.asText());
            }
            break;
        case TypeKind::Binary:
        case TypeKind::Varbinary:
            if (value.is<Bytes>()) return "HEX_TO_BINARY('0x" + detail::hex_encode(value.asBytes()) + "')";
            break;
        case TypeKind::Uuid:
            if (value.is<Uuid>()) return quote_string(value.asUuid().toString());
            break;
        case TypeKind::Date:
            if (value.is<Date>()) return quote_string(value.asDate().toString());
            break;
        case TypeKind::Time:
            if (value.is<Time>()) return quote_string(value.asTime().toString());
            break;
        case TypeKind::TimeTz:
            if (value.is<TimeTz>()) return quote_string(value.asTimeTz().toString());
            break;
        case TypeKind::Timestamp:
            if (value.is<Timestamp>()) return quote_string(value.asTimestamp().toString());
            break;
        case TypeKind::TimestampTz:
            if (value.is<TimestampTz>()) return quote_string(value.asTimestampTz().toString());
            break;
        case TypeKind::Interval:
            if (value.is<Interval>()) {
                return quote_string(interval_codec::format_interval(value.asInterval(), type.intervalRange()));
            }
            break;
        case TypeKind::Array:
        case TypeKind::Set:
        case TypeKind::Row:
            break;
    }

    throw EncodingTypeMismatchError("cannot encode " + std::string(valueKindName(value.kind())) +
                                    " value as " + type.toString(),
                                    type.toString(), value.toString());
}

} // namespace vcodec::core::scalar_codec
