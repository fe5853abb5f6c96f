#include "vcodec/core/value.hpp"
#include "vcodec/core/detail/conversion_utils.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace vcodec {
namespace core {

std::string_view valueKindName(ValueKind kind) noexcept {
    switch (kind) {
        case ValueKind::Null:        return "Null";
        case ValueKind::Boolean:     return "Boolean";
        case ValueKind::Integer:     return "Integer";
        case ValueKind::Float:       return "Float";
        case ValueKind::Decimal:     return "Decimal";
        case ValueKind::Text:        return "Text";
        case ValueKind::Bytes:       return "Bytes";
        case ValueKind::Date:        return "Date";
        case ValueKind::Time:        return "Time";
        case ValueKind::TimeTz:      return "TimeTz";
        case ValueKind::Timestamp:   return "Timestamp";
        case ValueKind::TimestampTz: return "TimestampTz";
        case ValueKind::Interval:    return "Interval";
        case ValueKind::Uuid:        return "Uuid";
        case ValueKind::Array:       return "Array";
        case ValueKind::Set:         return "Set";
        case ValueKind::Row:         return "Row";
    }
    return "Unknown";
}

// ---------------------------------------------------------------------------
// Containers

Array::Array(ValueList elements) : elements_(std::move(elements)) {}

Array::Array(std::initializer_list<Value> elements) : elements_(elements) {}

void Array::push_back(Value value) {
    elements_.push_back(std::move(value));
}

bool operator==(const Array& lhs, const Array& rhs) {
    return lhs.elements_ == rhs.elements_;
}

Set::Set(std::initializer_list<Value> elements) {
    for (const auto& v : elements) {
        insert(v);
    }
}

bool Set::insert(Value value) {
    if (contains(value)) {
        return false;
    }
    elements_.push_back(std::move(value));
    return true;
}

bool Set::contains(const Value& value) const {
    return std::find(elements_.begin(), elements_.end(), value) != elements_.end();
}

bool operator==(const Set& lhs, const Set& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    // Elements are unique on both sides, so containment both ways is enough
    return std::all_of(lhs.elements_.begin(), lhs.elements_.end(),
                       [&rhs](const Value& v) { return rhs.contains(v); });
}

void Row::append(std::string name, Value value) {
    names_.push_back(std::move(name));
    values_.push_back(std::move(value));
}

const Value& Row::operator[](std::string_view name) const {
    for (size_t i = 0; i < names_.size(); ++i) {
        if (names_[i] == name) {
            return values_[i];
        }
    }
    throw std::out_of_range("no row field named '" + std::string(name) + "'");
}

bool Row::contains(std::string_view name) const {
    return std::find(names_.begin(), names_.end(), name) != names_.end();
}

bool operator==(const Row& lhs, const Row& rhs) {
    return lhs.names_ == rhs.names_ && lhs.values_ == rhs.values_;
}

// ---------------------------------------------------------------------------
// Value

bool operator==(const Value& lhs, const Value& rhs) {
    if (lhs.storage_.index() != rhs.storage_.index()) {
        return false;
    }
    return std::visit([&rhs](const auto& a) -> bool {
        using T = std::decay_t<decltype(a)>;
        const auto& b = std::get<T>(rhs.storage_);
        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isnan(a) && std::isnan(b)) return true;
            return a == b;
        } else {
            return a == b;
        }
    }, lhs.storage_);
}

namespace {
    std::string formatDouble(double v) {
        if (std::isnan(v)) return "NaN";
        if (std::isinf(v)) return v > 0 ? "Infinity" : "-Infinity";
        char buf[64];
        auto res = std::to_chars(buf, buf + sizeof(buf), v);
        return std::string(buf, res.ptr);
    }

    template<typename Container>
    void joinElements(std::ostringstream& oss, const Container& values) {
        bool first = true;
        for (const auto& v : values) {
            if (!first) oss << ", ";
            oss << v.toString();
            first = false;
        }
    }
}

std::string Value::toString() const {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return formatDouble(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "'" + v + "'";
        } else if constexpr (std::is_same_v<T, Bytes>) {
            return "\\x" + detail::hex_encode(v);
        } else if constexpr (std::is_same_v<T, Array>) {
            std::ostringstream oss;
            oss << '[';
            joinElements(oss, v.elements());
            oss << ']';
            return oss.str();
        } else if constexpr (std::is_same_v<T, Set>) {
            std::ostringstream oss;
            oss << '{';
            joinElements(oss, v.elements());
            oss << '}';
            return oss.str();
        } else if constexpr (std::is_same_v<T, Row>) {
            std::ostringstream oss;
            oss << '(';
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << v.nameAt(i) << ": " << v.at(i).toString();
            }
            oss << ')';
            return oss.str();
        } else {
            return v.toString();
        }
    }, storage_);
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    return os << valueKindName(value.kind()) << ' ' << value.toString();
}

} // namespace core
} // namespace vcodec
