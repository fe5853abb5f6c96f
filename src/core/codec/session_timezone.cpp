#include "vcodec/core/session_timezone.hpp"
#include "vcodec/core/detail/conversion_utils.hpp"
#include "vcodec/core/exception.hpp"
#include "vcodec/core/timestamp_utils.hpp"
#include "vcodec_util/config.h"
#include "vcodec_util/logging.h"
#include "vcodec_util/trace.h"

#include <cctype>
#include <vector>

namespace vcodec {
namespace core {

SessionTimezone::SessionTimezone()
    : name_("UTC"), fixed_offset_(0), zone_(absl::UTCTimeZone()) {}

SessionTimezone::SessionTimezone(std::string name, std::optional<int32_t> fixedOffset,
                                 absl::TimeZone zone)
    : name_(std::move(name)), fixed_offset_(fixedOffset), zone_(zone) {}

SessionTimezone SessionTimezone::utc() {
    return SessionTimezone();
}

SessionTimezone SessionTimezone::fixedOffset(int32_t offsetSeconds) {
    if (offsetSeconds >= timestamp_utils::MAX_OFFSET_SECONDS ||
        offsetSeconds <= -timestamp_utils::MAX_OFFSET_SECONDS) {
        throw ValueFormatError("UTC offset out of range", "TIMESTAMPTZ", std::to_string(offsetSeconds));
    }
    if (offsetSeconds == 0) {
        return utc();
    }
    return SessionTimezone(detail::format_utc_offset(offsetSeconds), offsetSeconds,
                           absl::FixedTimeZone(offsetSeconds));
}

SessionTimezone SessionTimezone::named(const std::string& zoneName) {
    absl::TimeZone zone;
    if (!absl::LoadTimeZone(zoneName, &zone)) {
        throw ValueFormatError("unknown time zone", "TIMESTAMPTZ", zoneName);
    }
    return SessionTimezone(zoneName, std::nullopt, zone);
}

SessionTimezone SessionTimezone::parse(std::string_view text) {
    const std::string_view t = detail::trim(text);
    if (t.empty()) {
        throw ValueFormatError("empty time zone", "TIMESTAMPTZ", std::string(text));
    }
    if (detail::iequals(t, "UTC") || detail::iequals(t, "GMT") || detail::iequals(t, "Z")) {
        return utc();
    }
    if (auto offset = detail::parse_utc_offset(t)) {
        return fixedOffset(*offset);
    }
    if (t.size() > 3 && (detail::istarts_with(t, "UTC") || detail::istarts_with(t, "GMT")) &&
        (t[3] == '+' || t[3] == '-')) {
        if (auto offset = detail::parse_utc_offset(t.substr(3))) {
            return fixedOffset(*offset);
        }
        throw ValueFormatError("invalid UTC offset", "TIMESTAMPTZ", std::string(text));
    }
    return named(std::string(t));
}

SessionTimezone SessionTimezone::fromConfig() {
    return parse(util::Config::codec().defaultTimezone);
}

int32_t SessionTimezone::offsetFor(const Timestamp& localTime) const {
    if (fixed_offset_) {
        return *fixed_offset_;
    }
    const Date& d = localTime.date();
    const Time& t = localTime.time();
    const absl::CivilSecond civil(d.year(), static_cast<int>(d.month()), static_cast<int>(d.day()),
                                  static_cast<int>(t.hour()), static_cast<int>(t.minute()),
                                  static_cast<int>(t.second()));
    const absl::TimeZone::TimeInfo info = zone_.At(civil);
    if (info.kind == absl::TimeZone::TimeInfo::UNIQUE) {
        return zone_.At(info.pre).offset;
    }
    return zone_.At(info.trans - absl::Seconds(1)).offset;
}

// ---------------------------------------------------------------------------
// SET TIMEZONE observation

namespace {

struct SqlToken {
    enum Kind { Word, String, Symbol } kind;
    std::string text;
};

// Words are upper-cased; string literals are unquoted
bool tokenizeSetStatement(std::string_view sql, std::vector<SqlToken>& out) {
    size_t i = 0;
    while (i < sql.size()) {
        const char c = sql[i];
        if (detail::is_space(c)) {
            ++i;
        } else if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            size_t start = i;
            while (i < sql.size() &&
                   (std::isalnum(static_cast<unsigned char>(sql[i])) || sql[i] == '_' ||
                    sql[i] == '/' || sql[i] == '+' || sql[i] == '-')) {
                ++i;
            }
            out.push_back({SqlToken::Word, std::string(sql.substr(start, i - start))});
        } else if (c == '\'') {
            std::string value;
            ++i;
            bool closed = false;
            while (i < sql.size()) {
                if (sql[i] == '\'') {
                    if (i + 1 < sql.size() && sql[i + 1] == '\'') {
                        value += '\'';
                        i += 2;
                        continue;
                    }
                    ++i;
                    closed = true;
                    break;
                }
                value += sql[i++];
            }
            if (!closed) return false;
            out.push_back({SqlToken::String, std::move(value)});
        } else if (c == ';') {
            ++i;
        } else {
            out.push_back({SqlToken::Symbol, std::string(1, c)});
            ++i;
        }
    }
    return true;
}

bool isWord(const SqlToken& tok, std::string_view word) {
    return tok.kind == SqlToken::Word && detail::iequals(tok.text, word);
}

} // namespace

std::optional<SessionTimezone> SessionTimezone::observeStatement(std::string_view sql,
                                                                 const SessionTimezone& serverDefault) {
    std::vector<SqlToken> tokens;
    if (!tokenizeSetStatement(sql, tokens)) {
        return std::nullopt;
    }

    size_t i = 0;
    if (i >= tokens.size() || !isWord(tokens[i], "SET")) return std::nullopt;
    ++i;
    if (i < tokens.size() && isWord(tokens[i], "SESSION")) ++i;
    if (i < tokens.size() && isWord(tokens[i], "TIMEZONE")) {
        ++i;
    } else if (i + 1 < tokens.size() && isWord(tokens[i], "TIME") && isWord(tokens[i + 1], "ZONE")) {
        i += 2;
    } else {
        return std::nullopt;
    }
    if (i < tokens.size() &&
        (isWord(tokens[i], "TO") || (tokens[i].kind == SqlToken::Symbol && tokens[i].text == "="))) {
        ++i;
    }
    if (i + 1 != tokens.size()) {
        return std::nullopt;
    }

    const SqlToken& value = tokens[i];
    SessionTimezone result;
    if (value.kind == SqlToken::String) {
        result = parse(value.text);
    } else if (isWord(value, "DEFAULT") || isWord(value, "LOCAL")) {
        result = serverDefault;
    } else if (value.kind == SqlToken::Word) {
        result = parse(value.text);
    } else {
        return std::nullopt;
    }

    util::trace(util::TraceLevel::info, "SessionTimezone", [&](auto& oss) {
        oss << "session time zone set to " << result.name();
    });
    auto logger = util::Logging::get();
    if (logger) logger->debug("Session time zone changed to {}", result.name());
    return result;
}

} // namespace core
} // namespace vcodec
