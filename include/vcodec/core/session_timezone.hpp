#pragma once

#include "vcodec/core/extended_types.hpp"

#include <absl/time/time.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vcodec {
namespace core {

/**
 * @brief Timezone of the client session.
 *
 * Either a fixed UTC offset or a named IANA zone loaded from the system
 * tz database. Used to fill in the offset of TIMETZ / TIMESTAMPTZ text
 * that carries none, and to resolve zone names appearing in such text.
 * Immutable; copies are cheap.
 */
class SessionTimezone {
public:
    // UTC
    SessionTimezone();

    static SessionTimezone utc();
    static SessionTimezone fixedOffset(int32_t offsetSeconds);
    // ValueFormatError for names the tz database does not know
    static SessionTimezone named(const std::string& zoneName);
    // "UTC", "GMT", "+05:30", "UTC-3", "America/New_York"
    static SessionTimezone parse(std::string_view text);
    // util::Config::codec().defaultTimezone
    static SessionTimezone fromConfig();

    /**
     * Recognises SET TIMEZONE [TO|=] '<zone>' and SET TIME ZONE ... and
     * returns the zone the session switches to. DEFAULT and LOCAL map to
     * serverDefault. Any other statement yields nullopt.
     */
    static std::optional<SessionTimezone> observeStatement(std::string_view sql,
                                                           const SessionTimezone& serverDefault);

    bool isFixedOffset() const noexcept { return fixed_offset_.has_value(); }
    const std::string& name() const noexcept { return name_; }

    // Offset in effect for a local civil date-time. Skipped or repeated
    // local times use the offset in effect before the transition.
    int32_t offsetFor(const Timestamp& localTime) const;

    bool operator==(const SessionTimezone& other) const {
        return name_ == other.name_ && fixed_offset_ == other.fixed_offset_;
    }

private:
    SessionTimezone(std::string name, std::optional<int32_t> fixedOffset, absl::TimeZone zone);

    std::string name_;
    std::optional<int32_t> fixed_offset_;
    absl::TimeZone zone_;
};

} // namespace core
} // namespace vcodec
