#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vcodec {
namespace core {

enum class ContainerShape {
    Bracket,   // [a,b]
    Paren,     // (a,b)
    Object     // {"k":a,"k2":b}
};

/**
 * @brief Splits one level of container text into element texts.
 *
 * Tracks nesting of [ ( { and skips quoted strings so that commas inside
 * nested containers or strings never split. Accepted quoting:
 * - "..."  JSON string, backslash escapes
 * - '...'  SQL literal, '' doubling
 * - E'...' SQL escape string, backslash escapes
 */
class ComplexLiteralParser {
public:
    struct ParseResult {
        ContainerShape shape = ContainerShape::Bracket;
        std::vector<std::string_view> elements;   // trimmed views into the input; object keys removed
    };

    /**
     * @param text     one container: optional keyword, opener, elements, closer
     * @param keyword  "ARRAY", "SET" or "ROW"
     * @param typeName canonical type text for error reports
     */
    static ParseResult split(std::string_view text, std::string_view keyword, const std::string& typeName);

    // Text before a trailing ::TYPE cast that sits outside quotes and brackets
    static std::string_view stripCast(std::string_view text);

    static bool isNullToken(std::string_view token);

    // Content of a quoted element; nullopt when the token is not quoted
    static std::optional<std::string> unquote(std::string_view token, const std::string& typeName);

private:
    // Offset just past the quoted string whose opening quote is at pos
    static size_t skipQuoted(std::string_view text, size_t pos, const std::string& typeName);

    static bool isEscapeStringStart(std::string_view text, size_t quotePos);
};

} // namespace core
} // namespace vcodec
