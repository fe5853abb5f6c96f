#pragma once

#include "vcodec/core/extended_types.hpp"

#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace vcodec {
namespace core {

class Value;

using Bytes = std::vector<uint8_t>;
using ValueList = std::vector<Value>;

enum class ValueKind {
    Null,
    Boolean,
    Integer,
    Float,
    Decimal,
    Text,
    Bytes,
    Date,
    Time,
    TimeTz,
    Timestamp,
    TimestampTz,
    Interval,
    Uuid,
    Array,
    Set,
    Row
};

std::string_view valueKindName(ValueKind kind) noexcept;

// Ordered sequence; elements may be Null or nested containers
class Array {
public:
    Array() = default;
    explicit Array(ValueList elements);
    Array(std::initializer_list<Value> elements);

    void push_back(Value value);

    const ValueList& elements() const noexcept { return elements_; }
    size_t size() const noexcept;
    bool empty() const noexcept;
    const Value& operator[](size_t index) const;

    friend bool operator==(const Array& lhs, const Array& rhs);

private:
    ValueList elements_;
};

/**
 * Unordered collection of unique elements. insert() drops duplicates;
 * equality ignores order. Insertion order is kept for iteration.
 */
class Set {
public:
    Set() = default;
    Set(std::initializer_list<Value> elements);

    // False when an equal element is already present
    bool insert(Value value);
    bool contains(const Value& value) const;

    const ValueList& elements() const noexcept { return elements_; }
    size_t size() const noexcept;
    bool empty() const noexcept;

    friend bool operator==(const Set& lhs, const Set& rhs);

private:
    ValueList elements_;
};

// Ordered named fields; duplicate names are allowed, lookup by name finds the first
class Row {
public:
    Row() = default;

    void append(std::string name, Value value);

    size_t size() const noexcept { return names_.size(); }
    bool empty() const noexcept { return names_.empty(); }
    const std::vector<std::string>& names() const noexcept { return names_; }
    const ValueList& values() const noexcept { return values_; }
    const std::string& nameAt(size_t index) const { return names_.at(index); }
    const Value& at(size_t index) const;

    // std::out_of_range when absent
    const Value& operator[](std::string_view name) const;
    bool contains(std::string_view name) const;

    friend bool operator==(const Row& lhs, const Row& rhs);

private:
    std::vector<std::string> names_;
    ValueList values_;
};

/**
 * @brief Decoded SQL value.
 *
 * Float equality treats NaN as equal to NaN so decoded sets and
 * round trips compare the way a client observes them.
 */
class Value {
public:
    using Storage = std::variant<std::monostate, bool, int64_t, double, Decimal,
                                 std::string, Bytes, Date, Time, TimeTz, Timestamp,
                                 TimestampTz, Interval, Uuid, Array, Set, Row>;

    Value() = default;
    Value(Decimal v) : storage_(std::move(v)) {}
    Value(Date v) : storage_(v) {}
    Value(Time v) : storage_(v) {}
    Value(TimeTz v) : storage_(v) {}
    Value(Timestamp v) : storage_(v) {}
    Value(TimestampTz v) : storage_(v) {}
    Value(Interval v) : storage_(v) {}
    Value(Uuid v) : storage_(v) {}
    Value(Array v) : storage_(std::move(v)) {}
    Value(Set v) : storage_(std::move(v)) {}
    Value(Row v) : storage_(std::move(v)) {}

    static Value null() { return Value(); }
    static Value boolean(bool v) { Value r; r.storage_ = v; return r; }
    static Value integer(int64_t v) { Value r; r.storage_ = v; return r; }
    static Value floating(double v) { Value r; r.storage_ = v; return r; }
    static Value text(std::string v) { Value r; r.storage_ = std::move(v); return r; }
    static Value bytes(Bytes v) { Value r; r.storage_ = std::move(v); return r; }

    ValueKind kind() const noexcept { return static_cast<ValueKind>(storage_.index()); }
    bool isNull() const noexcept { return kind() == ValueKind::Null; }
    bool isContainer() const noexcept {
        return kind() == ValueKind::Array || kind() == ValueKind::Set || kind() == ValueKind::Row;
    }

    template<typename T>
    bool is() const noexcept { return std::holds_alternative<T>(storage_); }

    // std::bad_variant_access on kind mismatch
    template<typename T>
    const T& get() const { return std::get<T>(storage_); }

    bool asBool() const { return get<bool>(); }
    int64_t asInt() const { return get<int64_t>(); }
    double asDouble() const { return get<double>(); }
    const Decimal& asDecimal() const { return get<Decimal>(); }
    const std::string& asText() const { return get<std::string>(); }
    const Bytes& asBytes() const { return get<Bytes>(); }
    const Date& asDate() const { return get<Date>(); }
    const Time& asTime() const { return get<Time>(); }
    const TimeTz& asTimeTz() const { return get<TimeTz>(); }
    const Timestamp& asTimestamp() const { return get<Timestamp>(); }
    const TimestampTz& asTimestampTz() const { return get<TimestampTz>(); }
    const Interval& asInterval() const { return get<Interval>(); }
    const Uuid& asUuid() const { return get<Uuid>(); }
    const Array& asArray() const { return get<Array>(); }
    const Set& asSet() const { return get<Set>(); }
    const Row& asRow() const { return get<Row>(); }

    const Storage& storage() const noexcept { return storage_; }

    // Diagnostic rendering, not SQL
    std::string toString() const;

    friend bool operator==(const Value& lhs, const Value& rhs);
    friend bool operator!=(const Value& lhs, const Value& rhs) { return !(lhs == rhs); }

private:
    Storage storage_;
};

std::ostream& operator<<(std::ostream& os, const Value& value);

// Container accessors that need the complete Value type
inline size_t Array::size() const noexcept { return elements_.size(); }
inline bool Array::empty() const noexcept { return elements_.empty(); }
inline const Value& Array::operator[](size_t index) const { return elements_.at(index); }
inline size_t Set::size() const noexcept { return elements_.size(); }
inline bool Set::empty() const noexcept { return elements_.empty(); }
inline const Value& Row::at(size_t index) const { return values_.at(index); }

} // namespace core
} // namespace vcodec
