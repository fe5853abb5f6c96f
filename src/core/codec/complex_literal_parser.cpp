#include "vcodec/core/complex_literal_parser.hpp"
#include "vcodec/core/detail/conversion_utils.hpp"
#include "vcodec/core/exception.hpp"

#include <cctype>

namespace vcodec {
namespace core {

namespace {

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

char closerFor(char opener) {
    switch (opener) {
        case '[': return ']';
        case '(': return ')';
        case '{': return '}';
        default:  return '\0';
    }
}

uint32_t readHex(std::string_view s, size_t pos, size_t count, const std::string& typeName,
                 std::string_view token) {
    if (pos + count > s.size()) {
        throw ValueFormatError("truncated unicode escape", typeName, std::string(token));
    }
    uint32_t v = 0;
    for (size_t k = 0; k < count; ++k) {
        const int d = detail::hex_digit_value(s[pos + k]);
        if (d < 0) {
            throw ValueFormatError("invalid hex escape", typeName, std::string(token));
        }
        v = (v << 4) | static_cast<uint32_t>(d);
    }
    return v;
}

// \uXXXX at body[i] == 'u'; a high surrogate must be followed by \uDC00-\uDFFF.
// Leaves i on the last consumed hex digit.
uint32_t readUnicodeEscape(std::string_view body, size_t& i, const std::string& typeName,
                           std::string_view token) {
    uint32_t cp = readHex(body, i + 1, 4, typeName, token);
    i += 4;
    if (cp >= 0xDC00 && cp <= 0xDFFF) {
        throw ValueFormatError("unpaired surrogate", typeName, std::string(token));
    }
    if (cp >= 0xD800 && cp <= 0xDBFF) {
        if (i + 2 >= body.size() || body[i + 1] != '\\' || body[i + 2] != 'u') {
            throw ValueFormatError("unpaired surrogate", typeName, std::string(token));
        }
        const uint32_t low = readHex(body, i + 3, 4, typeName, token);
        if (low < 0xDC00 || low > 0xDFFF) {
            throw ValueFormatError("unpaired surrogate", typeName, std::string(token));
        }
        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        i += 6;
    }
    return cp;
}

std::string decodeJsonString(std::string_view body, const std::string& typeName, std::string_view token) {
    std::string out;
    out.reserve(body.size());
    for (size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (c != '\\') {
            out += c;
            continue;
        }
        if (++i >= body.size()) {
            throw ValueFormatError("dangling backslash", typeName, std::string(token));
        }
        switch (body[i]) {
            case '"':  out += '"'; break;
            case '\\': out += '\\'; break;
            case '/':  out += '/'; break;
            case 'b':  out += '\b'; break;
            case 'f':  out += '\f'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case 'u':
                detail::append_utf8(out, readUnicodeEscape(body, i, typeName, token));
                break;
            default:
                throw ValueFormatError(std::string("invalid escape \\") + body[i], typeName,
                                       std::string(token));
        }
    }
    return out;
}

std::string decodeEscapeString(std::string_view body, const std::string& typeName, std::string_view token) {
    std::string out;
    out.reserve(body.size());
    for (size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (c == '\'') {
            // Only doubled quotes survive skipQuoted inside the body
            out += '\'';
            ++i;
            continue;
        }
        if (c != '\\') {
            out += c;
            continue;
        }
        if (++i >= body.size()) {
            throw ValueFormatError("dangling backslash", typeName, std::string(token));
        }
        const char e = body[i];
        switch (e) {
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'x': {
                size_t n = 0;
                uint32_t v = 0;
                while (n < 2 && i + 1 < body.size() && detail::hex_digit_value(body[i + 1]) >= 0) {
                    v = (v << 4) | static_cast<uint32_t>(detail::hex_digit_value(body[++i]));
                    ++n;
                }
                if (n == 0) {
                    throw ValueFormatError("invalid \\x escape", typeName, std::string(token));
                }
                out += static_cast<char>(v);
                break;
            }
            case 'u':
                detail::append_utf8(out, readUnicodeEscape(body, i, typeName, token));
                break;
            default:
                if (e >= '0' && e <= '7') {
                    uint32_t v = static_cast<uint32_t>(e - '0');
                    size_t n = 1;
                    while (n < 3 && i + 1 < body.size() && body[i + 1] >= '0' && body[i + 1] <= '7') {
                        v = v * 8 + static_cast<uint32_t>(body[++i] - '0');
                        ++n;
                    }
                    out += static_cast<char>(v & 0xFF);
                } else {
                    out += e;
                }
        }
    }
    return out;
}

} // namespace

bool ComplexLiteralParser::isEscapeStringStart(std::string_view text, size_t quotePos) {
    if (quotePos == 0) return false;
    const char e = text[quotePos - 1];
    if (e != 'E' && e != 'e') return false;
    return quotePos == 1 || !isIdentChar(text[quotePos - 2]);
}

size_t ComplexLiteralParser::skipQuoted(std::string_view text, size_t pos, const std::string& typeName) {
    const char quote = text[pos];
    const bool backslashEscapes = quote == '"' || isEscapeStringStart(text, pos);
    size_t i = pos + 1;
    while (i < text.size()) {
        const char c = text[i];
        if (backslashEscapes && c == '\\') {
            i += 2;
            continue;
        }
        if (c == quote) {
            if (quote == '\'' && i + 1 < text.size() && text[i + 1] == '\'') {
                i += 2;
                continue;
            }
            return i + 1;
        }
        ++i;
    }
    throw ValueFormatError("unterminated quoted string", typeName, std::string(text));
}

std::string_view ComplexLiteralParser::stripCast(std::string_view text) {
    const std::string_view t = detail::trim(text);
    int depth = 0;
    for (size_t i = 0; i < t.size(); ++i) {
        const char c = t[i];
        if (c == '"' || c == '\'') {
            i = skipQuoted(t, i, "") - 1;
        } else if (c == '[' || c == '(' || c == '{') {
            ++depth;
        } else if (c == ']' || c == ')' || c == '}') {
            --depth;
        } else if (c == ':' && depth == 0 && i + 1 < t.size() && t[i + 1] == ':') {
            return detail::trim(t.substr(0, i));
        }
    }
    return t;
}

bool ComplexLiteralParser::isNullToken(std::string_view token) {
    return detail::iequals(detail::trim(token), "null");
}

ComplexLiteralParser::ParseResult ComplexLiteralParser::split(std::string_view text,
                                                              std::string_view keyword,
                                                              const std::string& typeName) {
    std::string_view t = detail::trim(text);
    const bool isRow = keyword == "ROW";

    if (detail::istarts_with(t, keyword)) {
        const std::string_view afterKeyword = detail::trim(t.substr(keyword.size()));
        if (!afterKeyword.empty() && closerFor(afterKeyword[0]) != '\0') {
            t = afterKeyword;
        }
    }
    if (t.empty()) {
        throw ValueFormatError("empty container text", typeName, std::string(text));
    }

    ParseResult result;
    const char opener = t[0];
    if (opener == '[' && !isRow) {
        result.shape = ContainerShape::Bracket;
    } else if (opener == '(' && isRow) {
        result.shape = ContainerShape::Paren;
    } else if (opener == '{' && isRow) {
        result.shape = ContainerShape::Object;
    } else {
        throw ValueFormatError("unexpected container opener", typeName, std::string(text));
    }

    std::vector<char> closers{closerFor(opener)};
    std::vector<std::string_view> pieces;
    size_t pieceStart = 1;
    size_t end = std::string_view::npos;
    bool sawComma = false;

    for (size_t i = 1; i < t.size() && end == std::string_view::npos; ++i) {
        const char c = t[i];
        if (c == '"' || c == '\'') {
            i = skipQuoted(t, i, typeName) - 1;
        } else if (c == '[' || c == '(' || c == '{') {
            closers.push_back(closerFor(c));
        } else if (c == ']' || c == ')' || c == '}') {
            if (c != closers.back()) {
                throw ValueFormatError("mismatched bracket", typeName, std::string(text));
            }
            closers.pop_back();
            if (closers.empty()) {
                pieces.push_back(detail::trim(t.substr(pieceStart, i - pieceStart)));
                end = i;
            }
        } else if (c == ',' && closers.size() == 1) {
            pieces.push_back(detail::trim(t.substr(pieceStart, i - pieceStart)));
            pieceStart = i + 1;
            sawComma = true;
        }
    }

    if (end == std::string_view::npos) {
        throw ValueFormatError("unbalanced container brackets", typeName, std::string(text));
    }
    if (end + 1 != t.size()) {
        throw ValueFormatError("unexpected text after container", typeName, std::string(text));
    }

    if (!sawComma && pieces.size() == 1 && pieces[0].empty()) {
        return result;
    }

    for (std::string_view piece : pieces) {
        if (piece.empty()) {
            throw ValueFormatError("empty container element", typeName, std::string(text));
        }
        if (result.shape != ContainerShape::Object) {
            result.elements.push_back(piece);
            continue;
        }

        size_t sep = std::string_view::npos;
        if (piece[0] == '"' || piece[0] == '\'') {
            size_t afterKey = skipQuoted(piece, 0, typeName);
            while (afterKey < piece.size() && detail::is_space(piece[afterKey])) ++afterKey;
            if (afterKey < piece.size() && piece[afterKey] == ':') sep = afterKey;
        } else {
            for (size_t i = 0; i < piece.size(); ++i) {
                if (piece[i] == ':' && (i + 1 >= piece.size() || piece[i + 1] != ':')) {
                    sep = i;
                    break;
                }
                if (piece[i] == ':') ++i;
            }
        }
        if (sep == std::string_view::npos) {
            throw ValueFormatError("expected key:value in row object", typeName, std::string(text));
        }
        const std::string_view value = detail::trim(piece.substr(sep + 1));
        if (value.empty()) {
            throw ValueFormatError("empty row field value", typeName, std::string(text));
        }
        result.elements.push_back(value);
    }
    return result;
}

std::optional<std::string> ComplexLiteralParser::unquote(std::string_view token, const std::string& typeName) {
    const std::string_view t = detail::trim(token);
    if (t.empty()) {
        return std::nullopt;
    }

    size_t quotePos = 0;
    if ((t[0] == 'E' || t[0] == 'e') && t.size() > 1 && t[1] == '\'') {
        quotePos = 1;
    } else if (t[0] != '"' && t[0] != '\'') {
        return std::nullopt;
    }

    if (skipQuoted(t, quotePos, typeName) != t.size()) {
        throw ValueFormatError("unexpected text after quoted string", typeName, std::string(token));
    }
    const std::string_view body = t.substr(quotePos + 1, t.size() - quotePos - 2);

    if (t[quotePos] == '"') {
        return decodeJsonString(body, typeName, token);
    }
    if (quotePos == 1) {
        return decodeEscapeString(body, typeName, token);
    }

    std::string out;
    out.reserve(body.size());
    for (size_t i = 0; i < body.size(); ++i) {
        out += body[i];
        if (body[i] == '\'') ++i;  // '' -> '
    }
    return out;
}

} // namespace core
} // namespace vcodec
