#include "vcodec/core/value_decoder.hpp"
#include "vcodec/core/complex_literal_parser.hpp"
#include "vcodec/core/detail/conversion_utils.hpp"
#include "vcodec/core/exception.hpp"
#include "vcodec/core/scalar_codec.hpp"
#include "vcodec_util/config.h"
#include "vcodec_util/logging.h"
#include "vcodec_util/trace.h"

namespace vcodec {
namespace core {

namespace {
    constexpr std::string_view kHexToBinary = "HEX_TO_BINARY";

    void reportFailure(const CodecException& e, const char* operation) {
        util::trace(util::TraceLevel::error, "ValueDecoder", [&](auto& oss) {
            oss << operation << " failed (" << errorKindName(e.getKind()) << ", SQLSTATE "
                << e.getSQLState() << "): " << e.what();
        });
        auto logger = util::Logging::get();
        if (logger) logger->warn("{} rejected {} value: {}", operation, e.getTypeName(), e.getReason());
    }
}

DecoderOptions DecoderOptions::fromConfig() {
    DecoderOptions options;
    options.requestComplexTypes = util::Config::codec().requestComplexTypes;
    return options;
}

ValueDecoder::ValueDecoder(DecoderOptions options) : options_(options) {}

Value ValueDecoder::decode(std::string_view raw, const TypeDescriptor& type,
                           const SessionTimezone& tz) const {
    if (ComplexLiteralParser::isNullToken(raw)) {
        return Value::null();
    }
    try {
        if (type.isContainer()) {
            if (!options_.requestComplexTypes) {
                return Value::text(std::string(raw));
            }
            auto logger = util::Logging::get();
            if (logger) logger->debug("Decoding {} field ({} bytes)", type.toString(), raw.size());
            return decodeContainer(raw, type, tz);
        }
        return scalar_codec::decode_scalar(raw, scalar_codec::ScalarReadContext{&type, &tz});
    } catch (const CodecException& e) {
        reportFailure(e, "decode");
        throw;
    }
}

Value ValueDecoder::decodeField(std::optional<std::string_view> raw, const TypeDescriptor& type,
                                const SessionTimezone& tz) const {
    if (!raw) {
        return Value::null();
    }
    return decode(*raw, type, tz);
}

Value ValueDecoder::decodeLiteral(std::string_view literal, const TypeDescriptor& type,
                                  const SessionTimezone& tz) const {
    try {
        return decodeElement(literal, type, tz);
    } catch (const CodecException& e) {
        reportFailure(e, "decodeLiteral");
        throw;
    }
}

Value ValueDecoder::decodeContainer(std::string_view text, const TypeDescriptor& type,
                                    const SessionTimezone& tz) const {
    const std::string typeName = type.toString();
    const std::string_view body = ComplexLiteralParser::stripCast(text);

    switch (type.kind()) {
        case TypeKind::Array: {
            const auto parsed = ComplexLiteralParser::split(body, "ARRAY", typeName);
            Array array;
            for (size_t i = 0; i < parsed.elements.size(); ++i) {
                try {
                    array.push_back(decodeElement(parsed.elements[i], *type.element(), tz));
                } catch (CodecException& e) {
                    e.addContext("at element " + std::to_string(i) + " of " + typeName);
                    throw;
                }
            }
            return Value(std::move(array));
        }
        case TypeKind::Set: {
            const auto parsed = ComplexLiteralParser::split(body, "SET", typeName);
            Set set;
            for (size_t i = 0; i < parsed.elements.size(); ++i) {
                try {
                    set.insert(decodeElement(parsed.elements[i], *type.element(), tz));
                } catch (CodecException& e) {
                    e.addContext("at element " + std::to_string(i) + " of " + typeName);
                    throw;
                }
            }
            return Value(std::move(set));
        }
        case TypeKind::Row: {
            const auto parsed = ComplexLiteralParser::split(body, "ROW", typeName);
            const auto& fields = type.fields();
            if (parsed.elements.size() != fields.size()) {
                throw ValueFormatError("row has " + std::to_string(parsed.elements.size()) +
                                       " fields, expected " + std::to_string(fields.size()),
                                       typeName, std::string(text));
            }
            Row row;
            for (size_t i = 0; i < fields.size(); ++i) {
                try {
                    row.append(fields[i].name, decodeElement(parsed.elements[i], *fields[i].type, tz));
                } catch (CodecException& e) {
                    e.addContext("at field " + fields[i].name + " of " + typeName);
                    throw;
                }
            }
            return Value(std::move(row));
        }
        default:
            throw UnsupportedTypeError("not a container type", typeName, std::string(text));
    }
}

Value ValueDecoder::decodeElement(std::string_view token, const TypeDescriptor& type,
                                  const SessionTimezone& tz) const {
    const std::string_view t = ComplexLiteralParser::stripCast(token);
    if (ComplexLiteralParser::isNullToken(t)) {
        return Value::null();
    }
    if (type.isContainer()) {
        if (auto inner = ComplexLiteralParser::unquote(t, type.toString())) {
            return decodeContainer(*inner, type, tz);
        }
        return decodeContainer(t, type, tz);
    }
    return decodeScalarToken(t, type, tz);
}

Value ValueDecoder::decodeScalarToken(std::string_view token, const TypeDescriptor& type,
                                      const SessionTimezone& tz) const {
    const scalar_codec::ScalarReadContext ctx{&type, &tz};

    if (type.isBinary() && detail::istarts_with(token, kHexToBinary)) {
        std::string_view args = detail::trim(token.substr(kHexToBinary.size()));
        if (args.size() < 2 || args.front() != '(' || args.back() != ')') {
            throw ValueFormatError("malformed HEX_TO_BINARY call", type.toString(), std::string(token));
        }
        args = detail::trim(args.substr(1, args.size() - 2));
        const auto hex = ComplexLiteralParser::unquote(args, type.toString());
        Bytes bytes = scalar_codec::parse_hex_binary(hex ? std::string_view(*hex) : args);
        if (type.kind() == TypeKind::Binary) {
            bytes = scalar_codec::pad_binary(std::move(bytes), type.length());
        }
        return Value::bytes(std::move(bytes));
    }

    if (auto text = ComplexLiteralParser::unquote(token, type.toString())) {
        return scalar_codec::decode_scalar(*text, ctx);
    }
    return scalar_codec::decode_scalar(token, ctx);
}

} // namespace core
} // namespace vcodec
