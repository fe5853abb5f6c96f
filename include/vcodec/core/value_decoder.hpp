#pragma once

#include "vcodec/core/session_timezone.hpp"
#include "vcodec/core/type_descriptor.hpp"
#include "vcodec/core/value.hpp"

#include <optional>
#include <string_view>

namespace vcodec {
namespace core {

struct DecoderOptions {
    // When false, ARRAY / SET / ROW fields come back as their raw Text
    bool requestComplexTypes = true;

    // From util::Config::codec()
    static DecoderOptions fromConfig();
};

/**
 * @brief Turns field text into Values, recursing through containers.
 *
 * Stateless apart from its options; safe to share between threads.
 * Every failure is a CodecException; a partially decoded value is
 * never returned.
 */
class ValueDecoder {
public:
    explicit ValueDecoder(DecoderOptions options = {});

    // Field text as sent by the server. The NULL token yields Null for any type.
    Value decode(std::string_view raw, const TypeDescriptor& type, const SessionTimezone& tz) const;

    // nullopt is a protocol-level NULL
    Value decodeField(std::optional<std::string_view> raw, const TypeDescriptor& type,
                      const SessionTimezone& tz) const;

    // SQL literal text (quoted, cast or HEX_TO_BINARY forms), e.g. LiteralEncoder output
    Value decodeLiteral(std::string_view literal, const TypeDescriptor& type,
                        const SessionTimezone& tz) const;

    const DecoderOptions& options() const noexcept { return options_; }

private:
    Value decodeContainer(std::string_view text, const TypeDescriptor& type,
                          const SessionTimezone& tz) const;
    Value decodeElement(std::string_view token, const TypeDescriptor& type,
                        const SessionTimezone& tz) const;
    Value decodeScalarToken(std::string_view token, const TypeDescriptor& type,
                            const SessionTimezone& tz) const;

    DecoderOptions options_;
};

} // namespace core
} // namespace vcodec
