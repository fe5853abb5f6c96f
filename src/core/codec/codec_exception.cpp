#include "vcodec/core/exception.hpp"
#include <sstream>

namespace vcodec {
namespace core {

namespace {
    constexpr size_t kMaxRawInMessage = 200;

    std::string abbreviate(const std::string& raw) {
        if (raw.size() <= kMaxRawInMessage) {
            return raw;
        }
        return raw.substr(0, kMaxRawInMessage) + "...";
    }
}

std::string_view sqlStateFor(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::ValueFormat:          return "22P02";  // invalid text representation
        case ErrorKind::UnsupportedType:      return "0A000";  // feature not supported
        case ErrorKind::Overflow:             return "22003";  // numeric value out of range
        case ErrorKind::EncodingTypeMismatch: return "42804";  // datatype mismatch
    }
    return "HY000";
}

std::string_view errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::ValueFormat:          return "ValueFormatError";
        case ErrorKind::UnsupportedType:      return "UnsupportedTypeError";
        case ErrorKind::Overflow:             return "OverflowError";
        case ErrorKind::EncodingTypeMismatch: return "EncodingTypeMismatchError";
    }
    return "CodecException";
}

CodecException::CodecException(ErrorKind kind,
                               std::string reason,
                               std::string typeName,
                               std::string rawText)
    : kind_(kind)
    , reason_(std::move(reason))
    , type_name_(std::move(typeName))
    , raw_text_(std::move(rawText))
    , sql_state_(sqlStateFor(kind)) {
    rebuildMessage();
}

void CodecException::addContext(std::string context) {
    context_.push_back(std::move(context));
    rebuildMessage();
}

void CodecException::rebuildMessage() {
    std::ostringstream oss;
    oss << reason_;
    if (!type_name_.empty()) {
        oss << " [type " << type_name_ << "]";
    }
    if (!raw_text_.empty()) {
        oss << ": '" << abbreviate(raw_text_) << "'";
    }
    for (const auto& ctx : context_) {
        oss << "\n  " << ctx;
    }
    message_ = oss.str();
}

} // namespace core
} // namespace vcodec
