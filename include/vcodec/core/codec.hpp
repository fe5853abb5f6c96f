#pragma once

#include "vcodec/core/literal_encoder.hpp"
#include "vcodec/core/value_decoder.hpp"

#include <string>
#include <string_view>

namespace vcodec::core {

// One-shot decode with default options
inline Value decode(std::string_view raw, const TypeDescriptor& type,
                    const SessionTimezone& tz = SessionTimezone::utc()) {
    return ValueDecoder{}.decode(raw, type, tz);
}

inline std::string encode(const Value& value, std::string_view typeText) {
    return LiteralEncoder::encode(value, typeText);
}

inline std::string encode(const Value& value, const TypeDescriptor& type) {
    return LiteralEncoder::encode(value, type);
}

} // namespace vcodec::core
