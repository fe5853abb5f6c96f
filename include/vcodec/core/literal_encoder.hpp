#pragma once

#include "vcodec/core/type_descriptor.hpp"
#include "vcodec/core/value.hpp"

#include <string>
#include <string_view>

namespace vcodec {
namespace core {

/**
 * @brief Renders Values as SQL literal text for client-side binding.
 *
 * Output is safe to splice into a statement as-is:
 * - NULL at any level, whatever the target type
 * - strings quoted with '' doubling, or as E'...' when they carry
 *   backslashes or control characters
 * - binary data as HEX_TO_BINARY('0x...')
 * - ARRAY[...], SET[...], ROW(...) with elements encoded recursively;
 *   a ::TYPE cast is appended when the element type cannot be inferred
 *   from the elements alone
 */
class LiteralEncoder {
public:
    // typeText is the type as it would follow a cast operator, e.g. "ARRAY[DATE]"
    static std::string encode(const Value& value, std::string_view typeText);
    static std::string encode(const Value& value, const TypeDescriptor& type);

private:
    static std::string encodeValue(const Value& value, const TypeDescriptor& type);
    static std::string encodeSequence(const ValueList& elements, const TypeDescriptor& type,
                                      std::string_view keyword);
    static std::string encodeRow(const Row& row, const TypeDescriptor& type);

    // True when the server infers the type of an element literal without a cast
    static bool isSelfTyped(const TypeDescriptor& type) noexcept;
};

} // namespace core
} // namespace vcodec
