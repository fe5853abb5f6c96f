#include "vcodec/core/type_descriptor.hpp"
#include "vcodec/core/detail/conversion_utils.hpp"
#include "vcodec/core/exception.hpp"

#include <cctype>
#include <limits>
#include <optional>

namespace vcodec {
namespace core {

std::string_view typeKindName(TypeKind kind) noexcept {
    switch (kind) {
        case TypeKind::Boolean:     return "BOOLEAN";
        case TypeKind::Integer:     return "INTEGER";
        case TypeKind::Float:       return "FLOAT";
        case TypeKind::Decimal:     return "NUMERIC";
        case TypeKind::Char:        return "CHAR";
        case TypeKind::Varchar:     return "VARCHAR";
        case TypeKind::Binary:      return "BINARY";
        case TypeKind::Varbinary:   return "VARBINARY";
        case TypeKind::Uuid:        return "UUID";
        case TypeKind::Date:        return "DATE";
        case TypeKind::Time:        return "TIME";
        case TypeKind::TimeTz:      return "TIMETZ";
        case TypeKind::Timestamp:   return "TIMESTAMP";
        case TypeKind::TimestampTz: return "TIMESTAMPTZ";
        case TypeKind::Interval:    return "INTERVAL";
        case TypeKind::Array:       return "ARRAY";
        case TypeKind::Set:         return "SET";
        case TypeKind::Row:         return "ROW";
    }
    return "UNKNOWN";
}

std::string_view intervalFieldName(IntervalField field) noexcept {
    switch (field) {
        case IntervalField::Year:   return "YEAR";
        case IntervalField::Month:  return "MONTH";
        case IntervalField::Day:    return "DAY";
        case IntervalField::Hour:   return "HOUR";
        case IntervalField::Minute: return "MINUTE";
        case IntervalField::Second: return "SECOND";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// IntervalRange

bool IntervalRange::isSupported(IntervalField start, IntervalField end) noexcept {
    using F = IntervalField;
    if (start > end) {
        return false;
    }
    // Year-month and day-time families never mix
    if (start == F::Year || start == F::Month) {
        return end == F::Year || end == F::Month;
    }
    return true;
}

IntervalRange IntervalRange::make(IntervalField start, IntervalField end) {
    if (!isSupported(start, end)) {
        throw UnsupportedTypeError("unsupported interval range",
                                   "INTERVAL " + std::string(intervalFieldName(start)) + " TO " +
                                   std::string(intervalFieldName(end)));
    }
    return IntervalRange{start, end};
}

std::string IntervalRange::toString() const {
    std::string out(intervalFieldName(start));
    if (end != start) {
        out += " TO ";
        out += intervalFieldName(end);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Factories

namespace {
    int unspecifiedIfNegative(int v) {
        return v < 0 ? -1 : v;
    }
}

TypeDescriptorPtr TypeDescriptor::boolean() {
    return TypeDescriptorPtr(new TypeDescriptor(TypeKind::Boolean));
}

TypeDescriptorPtr TypeDescriptor::integer() {
    return TypeDescriptorPtr(new TypeDescriptor(TypeKind::Integer));
}

TypeDescriptorPtr TypeDescriptor::floating() {
    return TypeDescriptorPtr(new TypeDescriptor(TypeKind::Float));
}

TypeDescriptorPtr TypeDescriptor::decimal(int precision, int scale) {
    auto* d = new TypeDescriptor(TypeKind::Decimal);
    d->precision_ = unspecifiedIfNegative(precision);
    d->scale_ = unspecifiedIfNegative(scale);
    if (d->precision_ >= 0 && d->scale_ < 0) {
        d->scale_ = 0;
    }
    return TypeDescriptorPtr(d);
}

TypeDescriptorPtr TypeDescriptor::character(int length) {
    auto* d = new TypeDescriptor(TypeKind::Char);
    d->length_ = unspecifiedIfNegative(length);
    return TypeDescriptorPtr(d);
}

TypeDescriptorPtr TypeDescriptor::varchar(int maxLength) {
    auto* d = new TypeDescriptor(TypeKind::Varchar);
    d->length_ = unspecifiedIfNegative(maxLength);
    return TypeDescriptorPtr(d);
}

TypeDescriptorPtr TypeDescriptor::binary(int length) {
    auto* d = new TypeDescriptor(TypeKind::Binary);
    d->length_ = unspecifiedIfNegative(length);
    return TypeDescriptorPtr(d);
}

TypeDescriptorPtr TypeDescriptor::varbinary(int maxLength) {
    auto* d = new TypeDescriptor(TypeKind::Varbinary);
    d->length_ = unspecifiedIfNegative(maxLength);
    return TypeDescriptorPtr(d);
}

TypeDescriptorPtr TypeDescriptor::uuid() {
    return TypeDescriptorPtr(new TypeDescriptor(TypeKind::Uuid));
}

TypeDescriptorPtr TypeDescriptor::date() {
    return TypeDescriptorPtr(new TypeDescriptor(TypeKind::Date));
}

TypeDescriptorPtr TypeDescriptor::time(int precision) {
    auto* d = new TypeDescriptor(TypeKind::Time);
    d->precision_ = unspecifiedIfNegative(precision);
    return TypeDescriptorPtr(d);
}

TypeDescriptorPtr TypeDescriptor::timeTz(int precision) {
    auto* d = new TypeDescriptor(TypeKind::TimeTz);
    d->precision_ = unspecifiedIfNegative(precision);
    return TypeDescriptorPtr(d);
}

TypeDescriptorPtr TypeDescriptor::timestamp(int precision) {
    auto* d = new TypeDescriptor(TypeKind::Timestamp);
    d->precision_ = unspecifiedIfNegative(precision);
    return TypeDescriptorPtr(d);
}

TypeDescriptorPtr TypeDescriptor::timestampTz(int precision) {
    auto* d = new TypeDescriptor(TypeKind::TimestampTz);
    d->precision_ = unspecifiedIfNegative(precision);
    return TypeDescriptorPtr(d);
}

TypeDescriptorPtr TypeDescriptor::interval(IntervalRange range) {
    const IntervalRange checked = IntervalRange::make(range.start, range.end);
    auto* d = new TypeDescriptor(TypeKind::Interval);
    d->interval_range_ = checked;
    return TypeDescriptorPtr(d);
}

TypeDescriptorPtr TypeDescriptor::array(TypeDescriptorPtr element) {
    if (!element) {
        throw UnsupportedTypeError("array element type missing", "ARRAY");
    }
    auto* d = new TypeDescriptor(TypeKind::Array);
    d->element_ = std::move(element);
    return TypeDescriptorPtr(d);
}

TypeDescriptorPtr TypeDescriptor::set(TypeDescriptorPtr element) {
    if (!element) {
        throw UnsupportedTypeError("set element type missing", "SET");
    }
    auto* d = new TypeDescriptor(TypeKind::Set);
    d->element_ = std::move(element);
    return TypeDescriptorPtr(d);
}

TypeDescriptorPtr TypeDescriptor::row(std::vector<RowField> fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (!fields[i].type) {
            throw UnsupportedTypeError("row field type missing", "ROW");
        }
        if (fields[i].name.empty()) {
            fields[i].name = "f" + std::to_string(i);
        }
    }
    auto* d = new TypeDescriptor(TypeKind::Row);
    d->fields_ = std::move(fields);
    return TypeDescriptorPtr(d);
}

// ---------------------------------------------------------------------------
// Server metadata

namespace {
    // Server type oids
    constexpr uint32_t OID_BOOL = 5;
    constexpr uint32_t OID_INT = 6;
    constexpr uint32_t OID_FLOAT = 7;
    constexpr uint32_t OID_CHAR = 8;
    constexpr uint32_t OID_VARCHAR = 9;
    constexpr uint32_t OID_DATE = 10;
    constexpr uint32_t OID_TIME = 11;
    constexpr uint32_t OID_TIMESTAMP = 12;
    constexpr uint32_t OID_TIMESTAMPTZ = 13;
    constexpr uint32_t OID_INTERVAL = 14;
    constexpr uint32_t OID_TIMETZ = 15;
    constexpr uint32_t OID_NUMERIC = 16;
    constexpr uint32_t OID_VARBINARY = 17;
    constexpr uint32_t OID_UUID = 20;
    constexpr uint32_t OID_INTERVAL_YM = 114;
    constexpr uint32_t OID_LONG_VARCHAR = 115;
    constexpr uint32_t OID_LONG_VARBINARY = 116;
    constexpr uint32_t OID_BINARY = 117;

    // Modifiers carry a 4 byte header offset
    constexpr int32_t TYPMOD_HEADER = 4;

    int lengthFromModifier(int32_t typmod) {
        return typmod < 0 ? -1 : typmod - TYPMOD_HEADER;
    }
}

TypeDescriptorPtr TypeDescriptor::fromServerMetadata(uint32_t typeOid, int32_t typeModifier) {
    switch (typeOid) {
        case OID_BOOL:       return boolean();
        case OID_INT:        return integer();
        case OID_FLOAT:      return floating();
        case OID_CHAR:       return character(lengthFromModifier(typeModifier));
        case OID_VARCHAR:
        case OID_LONG_VARCHAR:
            return varchar(lengthFromModifier(typeModifier));
        case OID_DATE:       return date();
        case OID_TIME:       return time(typeModifier);
        case OID_TIMETZ:     return timeTz(typeModifier);
        case OID_TIMESTAMP:  return timestamp(typeModifier);
        case OID_TIMESTAMPTZ: return timestampTz(typeModifier);
        case OID_INTERVAL:   return interval(IntervalRange{IntervalField::Day, IntervalField::Second});
        case OID_INTERVAL_YM: return interval(IntervalRange{IntervalField::Year, IntervalField::Month});
        case OID_NUMERIC: {
            if (typeModifier < 0) {
                return decimal();
            }
            const int32_t m = typeModifier - TYPMOD_HEADER;
            return decimal((m >> 16) & 0xFFFF, m & 0xFF);
        }
        case OID_VARBINARY:
        case OID_LONG_VARBINARY:
            return varbinary(lengthFromModifier(typeModifier));
        case OID_BINARY:     return binary(lengthFromModifier(typeModifier));
        case OID_UUID:       return uuid();
        default:
            throw UnsupportedTypeError("unknown server type oid " + std::to_string(typeOid));
    }
}

// ---------------------------------------------------------------------------
// Type text parser

namespace {

constexpr std::string_view kTypeKeywords[] = {
    "BOOL", "BOOLEAN", "INT", "INTEGER", "BIGINT", "SMALLINT", "TINYINT", "INT8",
    "FLOAT", "FLOAT8", "REAL", "DOUBLE", "NUMERIC", "DECIMAL", "NUMBER", "MONEY",
    "CHAR", "CHARACTER", "VARCHAR", "LONG", "BINARY", "VARBINARY", "BYTEA", "RAW",
    "UUID", "DATE", "TIME", "TIMETZ", "TIMESTAMP", "TIMESTAMPTZ", "DATETIME",
    "SMALLDATETIME", "INTERVAL", "ARRAY", "SET", "ROW", "WITH", "WITHOUT", "ZONE",
    "PRECISION", "VARYING", "TO"};

bool isTypeKeyword(std::string_view word) {
    const std::string upper = detail::to_upper(word);
    for (auto kw : kTypeKeywords) {
        if (kw == upper) return true;
    }
    return false;
}

bool isSimpleIdentifier(std::string_view name) {
    if (name.empty()) return false;
    const char c0 = name[0];
    if (!(std::isalpha(static_cast<unsigned char>(c0)) || c0 == '_')) return false;
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
    }
    return true;
}

std::string quoteFieldName(const std::string& name) {
    if (isSimpleIdentifier(name) && !isTypeKeyword(name)) {
        return name;
    }
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

enum class TokenType { Identifier, QuotedIdentifier, Number, Punct, End };

struct Token {
    TokenType type = TokenType::End;
    std::string text;
    size_t offset = 0;
};

/**
 * Recursive descent over SQL type text. Identifiers compare
 * case-insensitively; quoted identifiers are only legal as row field names.
 */
class TypeNameParser {
public:
    explicit TypeNameParser(std::string_view text) : text_(text) {}

    TypeDescriptorPtr parseAll() {
        auto type = parseType();
        if (peek().type != TokenType::End) {
            fail("unexpected trailing text");
        }
        return type;
    }

private:
    std::string_view text_;
    size_t pos_ = 0;

    [[noreturn]] void fail(const std::string& reason) const {
        throw UnsupportedTypeError(reason + " at offset " + std::to_string(pos_), "", std::string(text_));
    }

    Token lex(size_t& pos) const {
        while (pos < text_.size() && detail::is_space(text_[pos])) ++pos;
        Token tok;
        tok.offset = pos;
        if (pos >= text_.size()) {
            return tok;
        }
        const char c = text_[pos];
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            size_t start = pos;
            while (pos < text_.size() &&
                   (std::isalnum(static_cast<unsigned char>(text_[pos])) || text_[pos] == '_')) {
                ++pos;
            }
            tok.type = TokenType::Identifier;
            tok.text = detail::to_upper(text_.substr(start, pos - start));
            tok.offset = start;
        } else if (detail::is_digit(c)) {
            size_t start = pos;
            while (pos < text_.size() && detail::is_digit(text_[pos])) ++pos;
            tok.type = TokenType::Number;
            tok.text = std::string(text_.substr(start, pos - start));
        } else if (c == '"') {
            ++pos;
            std::string name;
            bool closed = false;
            while (pos < text_.size()) {
                if (text_[pos] == '"') {
                    if (pos + 1 < text_.size() && text_[pos + 1] == '"') {
                        name += '"';
                        pos += 2;
                        continue;
                    }
                    ++pos;
                    closed = true;
                    break;
                }
                name += text_[pos++];
            }
            if (!closed) {
                throw UnsupportedTypeError("unterminated quoted identifier", "", std::string(text_));
            }
            tok.type = TokenType::QuotedIdentifier;
            tok.text = std::move(name);
        } else if (c == '(' || c == ')' || c == '[' || c == ']' || c == ',') {
            tok.type = TokenType::Punct;
            tok.text = std::string(1, c);
            ++pos;
        } else {
            throw UnsupportedTypeError(std::string("unexpected character '") + c + "'", "",
                                       std::string(text_));
        }
        return tok;
    }

    Token peek() const {
        size_t p = pos_;
        return lex(p);
    }

    Token next() {
        return lex(pos_);
    }

    bool acceptWord(std::string_view word) {
        size_t p = pos_;
        Token tok = lex(p);
        if (tok.type == TokenType::Identifier && tok.text == word) {
            pos_ = p;
            return true;
        }
        return false;
    }

    bool acceptPunct(char c) {
        size_t p = pos_;
        Token tok = lex(p);
        if (tok.type == TokenType::Punct && tok.text[0] == c) {
            pos_ = p;
            return true;
        }
        return false;
    }

    void expectPunct(char c) {
        if (!acceptPunct(c)) {
            fail(std::string("expected '") + c + "'");
        }
    }

    void expectWord(std::string_view word) {
        if (!acceptWord(word)) {
            fail("expected " + std::string(word));
        }
    }

    int expectNumber() {
        Token tok = next();
        if (tok.type != TokenType::Number) {
            fail("expected number");
        }
        const auto v = detail::parse_digits(tok.text);
        if (!v || *v > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            fail("type modifier out of range");
        }
        return static_cast<int>(*v);
    }

    // "(n)" or nothing
    int optionalModifier() {
        if (!acceptPunct('(')) return -1;
        int n = expectNumber();
        expectPunct(')');
        return n;
    }

    bool acceptWithTimeZone() {
        if (acceptWord("WITH")) {
            expectWord("TIME");
            expectWord("ZONE");
            return true;
        }
        if (acceptWord("WITHOUT")) {
            expectWord("TIME");
            expectWord("ZONE");
        }
        return false;
    }

    std::optional<IntervalField> acceptIntervalField() {
        size_t p = pos_;
        Token tok = lex(p);
        if (tok.type != TokenType::Identifier) return std::nullopt;
        std::optional<IntervalField> field;
        if (tok.text == "YEAR" || tok.text == "YEARS") field = IntervalField::Year;
        else if (tok.text == "MONTH" || tok.text == "MONTHS") field = IntervalField::Month;
        else if (tok.text == "DAY" || tok.text == "DAYS") field = IntervalField::Day;
        else if (tok.text == "HOUR" || tok.text == "HOURS") field = IntervalField::Hour;
        else if (tok.text == "MINUTE" || tok.text == "MINUTES") field = IntervalField::Minute;
        else if (tok.text == "SECOND" || tok.text == "SECONDS") field = IntervalField::Second;
        if (field) pos_ = p;
        return field;
    }

    TypeDescriptorPtr parseInterval() {
        auto start = acceptIntervalField();
        if (!start) {
            return TypeDescriptor::interval();
        }
        if (*start == IntervalField::Second) optionalModifier();
        IntervalField end = *start;
        if (acceptWord("TO")) {
            auto e = acceptIntervalField();
            if (!e) fail("expected interval field after TO");
            end = *e;
            if (end == IntervalField::Second) optionalModifier();
        }
        return TypeDescriptor::interval(IntervalRange::make(*start, end));
    }

    TypeDescriptorPtr parseCollection(bool isSet) {
        expectPunct('[');
        auto element = parseType();
        if (acceptPunct(',')) {
            expectNumber();  // element bound, not part of the descriptor
        }
        expectPunct(']');
        return isSet ? TypeDescriptor::set(std::move(element))
                     : TypeDescriptor::array(std::move(element));
    }

    bool atFieldEnd() const {
        Token tok = peek();
        return tok.type == TokenType::Punct && (tok.text == "," || tok.text == ")");
    }

    RowField parseRowField() {
        const size_t fieldStart = pos_;
        Token first = peek();

        if (first.type == TokenType::QuotedIdentifier) {
            next();
            return RowField{first.text, parseType()};
        }
        if (first.type != TokenType::Identifier) {
            fail("expected row field");
        }

        // Unnamed field first; a leftover word means the first word was a name
        if (isTypeKeyword(first.text)) {
            try {
                auto type = parseType();
                if (atFieldEnd()) {
                    return RowField{"", std::move(type)};
                }
            } catch (const UnsupportedTypeError&) {
                // Retried below as "name type"
            }
            pos_ = fieldStart;
        }

        size_t p = pos_;
        lex(p);
        pos_ = p;
        std::string name(text_.substr(first.offset, p - first.offset));
        return RowField{name, parseType()};
    }

    TypeDescriptorPtr parseRow() {
        expectPunct('(');
        std::vector<RowField> fields;
        if (!acceptPunct(')')) {
            do {
                fields.push_back(parseRowField());
            } while (acceptPunct(','));
            expectPunct(')');
        }
        return TypeDescriptor::row(std::move(fields));
    }

    TypeDescriptorPtr parseType() {
        Token tok = next();
        if (tok.type != TokenType::Identifier) {
            fail("expected type name");
        }
        const std::string& w = tok.text;

        if (w == "BOOL" || w == "BOOLEAN") return TypeDescriptor::boolean();
        if (w == "INT" || w == "INTEGER" || w == "BIGINT" || w == "SMALLINT" ||
            w == "TINYINT" || w == "INT8") {
            return TypeDescriptor::integer();
        }
        if (w == "FLOAT" || w == "FLOAT8" || w == "REAL") {
            optionalModifier();
            return TypeDescriptor::floating();
        }
        if (w == "DOUBLE") {
            expectWord("PRECISION");
            return TypeDescriptor::floating();
        }
        if (w == "NUMERIC" || w == "DECIMAL" || w == "NUMBER" || w == "MONEY") {
            int precision = w == "MONEY" ? 18 : -1;
            int scale = w == "MONEY" ? 4 : -1;
            if (acceptPunct('(')) {
                precision = expectNumber();
                scale = acceptPunct(',') ? expectNumber() : 0;
                expectPunct(')');
            }
            return TypeDescriptor::decimal(precision, scale);
        }
        if (w == "CHAR" || w == "CHARACTER") {
            if (acceptWord("VARYING")) {
                return TypeDescriptor::varchar(optionalModifier());
            }
            return TypeDescriptor::character(optionalModifier());
        }
        if (w == "VARCHAR") return TypeDescriptor::varchar(optionalModifier());
        if (w == "LONG") {
            if (acceptWord("VARCHAR")) return TypeDescriptor::varchar(optionalModifier());
            if (acceptWord("VARBINARY")) return TypeDescriptor::varbinary(optionalModifier());
            fail("expected VARCHAR or VARBINARY after LONG");
        }
        if (w == "BINARY") return TypeDescriptor::binary(optionalModifier());
        if (w == "VARBINARY" || w == "BYTEA" || w == "RAW") {
            return TypeDescriptor::varbinary(optionalModifier());
        }
        if (w == "UUID") return TypeDescriptor::uuid();
        if (w == "DATE") return TypeDescriptor::date();
        if (w == "TIME") {
            int p = optionalModifier();
            return acceptWithTimeZone() ? TypeDescriptor::timeTz(p) : TypeDescriptor::time(p);
        }
        if (w == "TIMETZ") return TypeDescriptor::timeTz(optionalModifier());
        if (w == "TIMESTAMP") {
            int p = optionalModifier();
            return acceptWithTimeZone() ? TypeDescriptor::timestampTz(p) : TypeDescriptor::timestamp(p);
        }
        if (w == "DATETIME" || w == "SMALLDATETIME") return TypeDescriptor::timestamp();
        if (w == "TIMESTAMPTZ") return TypeDescriptor::timestampTz(optionalModifier());
        if (w == "INTERVAL") return parseInterval();
        if (w == "ARRAY") return parseCollection(false);
        if (w == "SET") return parseCollection(true);
        if (w == "ROW") return parseRow();

        throw UnsupportedTypeError("unknown type name " + w, "", std::string(text_));
    }
};

} // namespace

TypeDescriptorPtr TypeDescriptor::parse(std::string_view typeText) {
    TypeNameParser parser(typeText);
    return parser.parseAll();
}

// ---------------------------------------------------------------------------
// Canonical text

std::string TypeDescriptor::toString() const {
    auto withModifier = [](std::string_view name, int n) {
        std::string out(name);
        if (n >= 0) out += "(" + std::to_string(n) + ")";
        return out;
    };

    switch (kind_) {
        case TypeKind::Decimal: {
            std::string out = "NUMERIC";
            if (precision_ >= 0) {
                out += "(" + std::to_string(precision_) + "," + std::to_string(scale_ < 0 ? 0 : scale_) + ")";
            }
            return out;
        }
        case TypeKind::Char:
        case TypeKind::Varchar:
        case TypeKind::Binary:
        case TypeKind::Varbinary:
            return withModifier(typeKindName(kind_), length_);
        case TypeKind::Time:
        case TypeKind::TimeTz:
        case TypeKind::Timestamp:
        case TypeKind::TimestampTz:
            return withModifier(typeKindName(kind_), precision_);
        case TypeKind::Interval:
            return "INTERVAL " + interval_range_.toString();
        case TypeKind::Array:
            return "ARRAY[" + element_->toString() + "]";
        case TypeKind::Set:
            return "SET[" + element_->toString() + "]";
        case TypeKind::Row: {
            std::string out = "ROW(";
            for (size_t i = 0; i < fields_.size(); ++i) {
                if (i > 0) out += ", ";
                out += quoteFieldName(fields_[i].name) + " " + fields_[i].type->toString();
            }
            out += ")";
            return out;
        }
        default:
            return std::string(typeKindName(kind_));
    }
}

bool TypeDescriptor::operator==(const TypeDescriptor& other) const {
    if (kind_ != other.kind_ || precision_ != other.precision_ || scale_ != other.scale_ ||
        length_ != other.length_) {
        return false;
    }
    if (kind_ == TypeKind::Interval && !(interval_range_ == other.interval_range_)) {
        return false;
    }
    if (kind_ == TypeKind::Array || kind_ == TypeKind::Set) {
        return *element_ == *other.element_;
    }
    if (kind_ == TypeKind::Row) {
        if (fields_.size() != other.fields_.size()) return false;
        for (size_t i = 0; i < fields_.size(); ++i) {
            if (fields_[i].name != other.fields_[i].name ||
                !(*fields_[i].type == *other.fields_[i].type)) {
                return false;
            }
        }
    }
    return true;
}

} // namespace core
} // namespace vcodec
