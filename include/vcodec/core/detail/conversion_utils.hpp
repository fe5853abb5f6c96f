#pragma once

#include "vcodec/core/exception.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vcodec::core::detail {

inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

inline char to_lower_ascii(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline char to_upper_ascii(char c) {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

inline std::string_view trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e - 1])) --e;
    return s.substr(b, e - b);
}

inline std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), to_lower_ascii);
    return out;
}

inline std::string to_upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), to_upper_ascii);
    return out;
}

inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (to_lower_ascii(a[i]) != to_lower_ascii(b[i])) return false;
    }
    return true;
}

inline bool istarts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && iequals(s.substr(0, prefix.size()), prefix);
}

inline bool iends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && iequals(s.substr(s.size() - suffix.size()), suffix);
}

inline bool all_digits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), is_digit);
}

// Unsigned base-10 value of a pure digit run; nullopt on overflow
inline std::optional<uint64_t> parse_digits(std::string_view s) {
    uint64_t result = 0;
    for (char c : s) {
        if (!is_digit(c)) return std::nullopt;
        const uint64_t d = static_cast<uint64_t>(c - '0');
        if (result > (std::numeric_limits<uint64_t>::max() - d) / 10) return std::nullopt;
        result = result * 10 + d;
    }
    return result;
}

inline int hex_digit_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

inline std::string hex_encode(const std::vector<uint8_t>& bytes, bool upper = false) {
    static constexpr char lower_digits[] = "0123456789abcdef";
    static constexpr char upper_digits[] = "0123456789ABCDEF";
    const char* digits = upper ? upper_digits : lower_digits;
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

inline void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// int64 arithmetic that reports overflow as OverflowError against typeName
inline int64_t checked_add(int64_t a, int64_t b, const char* typeName) {
    if ((b > 0 && a > std::numeric_limits<int64_t>::max() - b) ||
        (b < 0 && a < std::numeric_limits<int64_t>::min() - b)) {
        throw OverflowError("arithmetic overflow", typeName);
    }
    return a + b;
}

inline int64_t checked_mul(int64_t a, int64_t b, const char* typeName) {
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    constexpr int64_t min = std::numeric_limits<int64_t>::min();
    bool overflow = false;
    if (a > 0) {
        overflow = b > 0 ? a > max / b : b < min / a;
    } else if (a < 0) {
        overflow = b > 0 ? a < min / b : (b != 0 && a < max / b);
    }
    if (overflow) {
        throw OverflowError("arithmetic overflow", typeName);
    }
    return a * b;
}

/**
 * Parses a numeric UTC offset: Z, +H, +HH, +HHMM, +HHMMSS, +HH:MM, +HH:MM:SS
 * (sign mandatory except for Z). Returns seconds east of UTC, nullopt when
 * the text is not an offset.
 */
inline std::optional<int32_t> parse_utc_offset(std::string_view text) {
    if (text == "Z" || text == "z") return 0;
    if (text.size() < 2 || (text[0] != '+' && text[0] != '-')) return std::nullopt;

    const bool negative = text[0] == '-';
    std::string_view body = text.substr(1);

    unsigned parts[3] = {0, 0, 0};
    size_t count = 0;

    if (body.find(':') != std::string_view::npos) {
        size_t start = 0;
        while (start <= body.size()) {
            size_t colon = body.find(':', start);
            std::string_view piece = body.substr(start, colon == std::string_view::npos
                                                            ? std::string_view::npos
                                                            : colon - start);
            if (count >= 3 || piece.empty() || piece.size() > 2 || !all_digits(piece) ||
                (count > 0 && piece.size() != 2)) {
                return std::nullopt;
            }
            parts[count++] = static_cast<unsigned>(*parse_digits(piece));
            if (colon == std::string_view::npos) break;
            start = colon + 1;
        }
    } else {
        if (!all_digits(body)) return std::nullopt;
        switch (body.size()) {
            case 1:
            case 2:
                parts[0] = static_cast<unsigned>(*parse_digits(body));
                break;
            case 4:
                parts[0] = static_cast<unsigned>(*parse_digits(body.substr(0, 2)));
                parts[1] = static_cast<unsigned>(*parse_digits(body.substr(2, 2)));
                break;
            case 6:
                parts[0] = static_cast<unsigned>(*parse_digits(body.substr(0, 2)));
                parts[1] = static_cast<unsigned>(*parse_digits(body.substr(2, 2)));
                parts[2] = static_cast<unsigned>(*parse_digits(body.substr(4, 2)));
                break;
            default:
                return std::nullopt;
        }
    }

    if (parts[0] > 23 || parts[1] > 59 || parts[2] > 59) return std::nullopt;
    const int32_t seconds = static_cast<int32_t>(parts[0] * 3600 + parts[1] * 60 + parts[2]);
    return negative ? -seconds : seconds;
}

// "+HH:MM", with ":SS" appended when the offset has a seconds part
inline std::string format_utc_offset(int32_t offsetSeconds) {
    std::string out(1, offsetSeconds < 0 ? '-' : '+');
    int32_t a = offsetSeconds < 0 ? -offsetSeconds : offsetSeconds;
    auto two = [&out](int32_t v) {
        out.push_back(static_cast<char>('0' + v / 10));
        out.push_back(static_cast<char>('0' + v % 10));
    };
    two(a / 3600);
    out.push_back(':');
    two((a / 60) % 60);
    if (a % 60 != 0) {
        out.push_back(':');
        two(a % 60);
    }
    return out;
}

// Fraction digits after the decimal point as microseconds (truncated past 6)
inline uint32_t fraction_to_micros(std::string_view digits) {
    uint32_t micros = 0;
    for (size_t i = 0; i < 6; ++i) {
        micros = micros * 10 + (i < digits.size() ? static_cast<uint32_t>(digits[i] - '0') : 0u);
    }
    return micros;
}

// ".ffffff" with trailing zeros removed; empty for zero
inline std::string format_micros_fraction(uint32_t micros) {
    if (micros == 0) return {};
    std::string digits(6, '0');
    for (int i = 5; i >= 0; --i) {
        digits[static_cast<size_t>(i)] = static_cast<char>('0' + micros % 10);
        micros /= 10;
    }
    while (!digits.empty() && digits.back() == '0') digits.pop_back();
    return "." + digits;
}

inline std::string pad_number(int64_t value, size_t width) {
    std::string digits = std::to_string(value < 0 ? -value : value);
    if (digits.size() < width) digits.insert(0, width - digits.size(), '0');
    return value < 0 ? "-" + digits : digits;
}

} // namespace vcodec::core::detail
