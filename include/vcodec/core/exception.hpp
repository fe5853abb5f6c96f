#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <vector>

namespace vcodec {
namespace core {

enum class ErrorKind {
    ValueFormat,
    UnsupportedType,
    Overflow,
    EncodingTypeMismatch
};

// SQLSTATE reported for each error kind
std::string_view sqlStateFor(ErrorKind kind) noexcept;
std::string_view errorKindName(ErrorKind kind) noexcept;

/**
 * @brief Base of all codec failures.
 *
 * Carries the reason, the canonical text of the type involved and the
 * offending raw text. While an error unwinds out of nested containers
 * each level appends a context line, outermost last.
 */
class CodecException : public std::exception {
public:
    CodecException(ErrorKind kind,
                   std::string reason,
                   std::string typeName = {},
                   std::string rawText = {});

    const char* what() const noexcept override { return message_.c_str(); }

    ErrorKind getKind() const noexcept { return kind_; }
    const std::string& getReason() const noexcept { return reason_; }
    const std::string& getTypeName() const noexcept { return type_name_; }
    const std::string& getRawText() const noexcept { return raw_text_; }
    const std::string& getSQLState() const noexcept { return sql_state_; }
    const std::vector<std::string>& getContext() const noexcept { return context_; }

    void addContext(std::string context);

private:
    void rebuildMessage();

    ErrorKind   kind_;
    std::string reason_;
    std::string type_name_;
    std::string raw_text_;
    std::string sql_state_;
    std::string message_;
    std::vector<std::string> context_;
};

// Text does not match the grammar of the declared type
class ValueFormatError : public CodecException {
public:
    ValueFormatError(std::string reason, std::string typeName = {}, std::string rawText = {})
        : CodecException(ErrorKind::ValueFormat, std::move(reason),
                         std::move(typeName), std::move(rawText)) {}
};

// Type descriptor or interval range outside the supported set
class UnsupportedTypeError : public CodecException {
public:
    UnsupportedTypeError(std::string reason, std::string typeName = {}, std::string rawText = {})
        : CodecException(ErrorKind::UnsupportedType, std::move(reason),
                         std::move(typeName), std::move(rawText)) {}
};

// Numeric text outside the range of the target representation
class OverflowError : public CodecException {
public:
    OverflowError(std::string reason, std::string typeName = {}, std::string rawText = {})
        : CodecException(ErrorKind::Overflow, std::move(reason),
                         std::move(typeName), std::move(rawText)) {}
};

// Value shape incompatible with the requested target type
class EncodingTypeMismatchError : public CodecException {
public:
    EncodingTypeMismatchError(std::string reason, std::string typeName = {}, std::string rawText = {})
        : CodecException(ErrorKind::EncodingTypeMismatch, std::move(reason),
                         std::move(typeName), std::move(rawText)) {}
};

} // namespace core
} // namespace vcodec
