#include "vcodec/core/literal_encoder.hpp"
#include "vcodec/core/exception.hpp"
#include "vcodec/core/scalar_codec.hpp"
#include "vcodec_util/logging.h"
#include "vcodec_util/trace.h"

#include <algorithm>

namespace vcodec {
namespace core {

namespace {
    bool allNull(const ValueList& values) {
        return std::all_of(values.begin(), values.end(), [](const Value& v) { return v.isNull(); });
    }

    [[noreturn]] void throwMismatch(const Value& value, const TypeDescriptor& type) {
        const std::string typeName = type.toString();
        util::trace(util::TraceLevel::warn, "LiteralEncoder", [&](auto& oss) {
            oss << "cannot encode " << valueKindName(value.kind()) << " value as " << typeName;
        });
        throw EncodingTypeMismatchError("cannot encode " + std::string(valueKindName(value.kind())) +
                                        " value as " + typeName,
                                        typeName, value.toString());
    }
}

std::string LiteralEncoder::encode(const Value& value, std::string_view typeText) {
    const auto type = TypeDescriptor::parse(typeText);
    return encode(value, *type);
}

std::string LiteralEncoder::encode(const Value& value, const TypeDescriptor& type) {
    try {
        std::string literal = encodeValue(value, type);
        auto logger = util::Logging::get();
        if (logger) logger->debug("Encoded {} literal ({} bytes)", type.toString(), literal.size());
        return literal;
    } catch (const CodecException& e) {
        auto logger = util::Logging::get();
        if (logger) logger->warn("Literal encoding rejected: {}", e.what());
        throw;
    }
}

std::string LiteralEncoder::encodeValue(const Value& value, const TypeDescriptor& type) {
    if (value.isNull()) {
        return "NULL";
    }

    switch (type.kind()) {
        case TypeKind::Array:
            if (!value.is<Array>()) throwMismatch(value, type);
            return encodeSequence(value.asArray().elements(), type, "ARRAY");
        case TypeKind::Set:
            if (!value.is<Set>()) throwMismatch(value, type);
            return encodeSequence(value.asSet().elements(), type, "SET");
        case TypeKind::Row:
            if (!value.is<Row>()) throwMismatch(value, type);
            return encodeRow(value.asRow(), type);
        default:
            break;
    }

    if (value.isContainer()) {
        throwMismatch(value, type);
    }
    try {
        return scalar_codec::encode_scalar(value, type);
    } catch (const EncodingTypeMismatchError&) {
        util::trace(util::TraceLevel::warn, "LiteralEncoder", [&](auto& oss) {
            oss << "cannot encode " << valueKindName(value.kind()) << " value as " << type.toString();
        });
        throw;
    }
}

std::string LiteralEncoder::encodeSequence(const ValueList& elements, const TypeDescriptor& type,
                                           std::string_view keyword) {
    const TypeDescriptor& elementType = *type.element();

    std::string out(keyword);
    out += '[';
    for (size_t i = 0; i < elements.size(); ++i) {
        if (i > 0) out += ',';
        try {
            out += encodeValue(elements[i], elementType);
        } catch (CodecException& e) {
            e.addContext("at element " + std::to_string(i) + " of " + type.toString());
            throw;
        }
    }
    out += ']';

    if (elements.empty() || allNull(elements) || !isSelfTyped(elementType)) {
        out += "::";
        out += type.toString();
    }
    return out;
}

std::string LiteralEncoder::encodeRow(const Row& row, const TypeDescriptor& type) {
    const auto& fields = type.fields();
    if (row.size() != fields.size()) {
        const std::string typeName = type.toString();
        util::trace(util::TraceLevel::warn, "LiteralEncoder", [&](auto& oss) {
            oss << "row with " << row.size() << " fields cannot encode as " << typeName;
        });
        throw EncodingTypeMismatchError("row has " + std::to_string(row.size()) + " fields, expected " +
                                        std::to_string(fields.size()),
                                        typeName, Value(row).toString());
    }

    std::string out = "ROW(";
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out += ',';
        try {
            out += encodeValue(row.values()[i], *fields[i].type);
        } catch (CodecException& e) {
            e.addContext("at field " + fields[i].name + " of " + type.toString());
            throw;
        }
    }
    out += ')';

    // Each field is typed on its own: a NULL or a quoted field leaves the row ambiguous
    const bool ambiguous = std::any_of(row.values().begin(), row.values().end(),
                                       [](const Value& v) { return v.isNull(); }) ||
                           std::any_of(fields.begin(), fields.end(),
                                       [](const auto& f) { return !isSelfTyped(*f.type); });
    if (ambiguous) {
        out += "::";
        out += type.toString();
    }
    return out;
}

bool LiteralEncoder::isSelfTyped(const TypeDescriptor& type) noexcept {
    switch (type.kind()) {
        case TypeKind::Boolean:
        case TypeKind::Integer:
        case TypeKind::Float:
            return true;
        case TypeKind::Array:
        case TypeKind::Set:
            return isSelfTyped(*type.element());
        default:
            return false;
    }
}

} // namespace core
} // namespace vcodec
