#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace vcodec {
namespace core {

enum class TypeKind {
    Boolean,
    Integer,
    Float,
    Decimal,
    Char,
    Varchar,
    Binary,
    Varbinary,
    Uuid,
    Date,
    Time,
    TimeTz,
    Timestamp,
    TimestampTz,
    Interval,
    Array,
    Set,
    Row
};

std::string_view typeKindName(TypeKind kind) noexcept;

// Ordered from coarsest to finest
enum class IntervalField {
    Year,
    Month,
    Day,
    Hour,
    Minute,
    Second
};

std::string_view intervalFieldName(IntervalField field) noexcept;

/**
 * Start/end field of an INTERVAL type. Only the thirteen SQL ranges are
 * valid: YEAR, YEAR TO MONTH, MONTH, DAY, DAY TO HOUR, DAY TO MINUTE,
 * DAY TO SECOND, HOUR, HOUR TO MINUTE, HOUR TO SECOND, MINUTE,
 * MINUTE TO SECOND, SECOND.
 */
struct IntervalRange {
    IntervalField start = IntervalField::Day;
    IntervalField end = IntervalField::Second;

    static bool isSupported(IntervalField start, IntervalField end) noexcept;

    // UnsupportedTypeError for any other combination
    static IntervalRange make(IntervalField start, IntervalField end);

    bool isYearMonth() const noexcept { return start == IntervalField::Year || start == IntervalField::Month; }

    // "DAY TO SECOND", "YEAR"
    std::string toString() const;

    bool operator==(const IntervalRange& other) const = default;
};

class TypeDescriptor;
using TypeDescriptorPtr = std::shared_ptr<const TypeDescriptor>;

struct RowField {
    std::string name;
    TypeDescriptorPtr type;
};

/**
 * @brief Immutable SQL type description driving decode and encode.
 *
 * Precision, scale and length are -1 when unspecified. Containers own
 * their children through shared pointers, so descriptors form a tree
 * that can be shared between columns.
 */
class TypeDescriptor {
public:
    static TypeDescriptorPtr boolean();
    static TypeDescriptorPtr integer();
    static TypeDescriptorPtr floating();
    static TypeDescriptorPtr decimal(int precision = -1, int scale = -1);
    static TypeDescriptorPtr character(int length = -1);
    static TypeDescriptorPtr varchar(int maxLength = -1);
    static TypeDescriptorPtr binary(int length = -1);
    static TypeDescriptorPtr varbinary(int maxLength = -1);
    static TypeDescriptorPtr uuid();
    static TypeDescriptorPtr date();
    static TypeDescriptorPtr time(int precision = -1);
    static TypeDescriptorPtr timeTz(int precision = -1);
    static TypeDescriptorPtr timestamp(int precision = -1);
    static TypeDescriptorPtr timestampTz(int precision = -1);
    static TypeDescriptorPtr interval(IntervalRange range = {});
    static TypeDescriptorPtr array(TypeDescriptorPtr element);
    static TypeDescriptorPtr set(TypeDescriptorPtr element);
    // Empty names become f<index>
    static TypeDescriptorPtr row(std::vector<RowField> fields);

    // SQL type text such as "ARRAY[NUMERIC(10,2)]" or "ROW(a INT, b INTERVAL DAY)"
    static TypeDescriptorPtr parse(std::string_view typeText);

    // Scalar descriptor from the server's type oid and type modifier
    static TypeDescriptorPtr fromServerMetadata(uint32_t typeOid, int32_t typeModifier);

    TypeKind kind() const noexcept { return kind_; }
    int precision() const noexcept { return precision_; }
    int scale() const noexcept { return scale_; }
    int length() const noexcept { return length_; }
    const IntervalRange& intervalRange() const noexcept { return interval_range_; }
    const TypeDescriptorPtr& element() const noexcept { return element_; }
    const std::vector<RowField>& fields() const noexcept { return fields_; }

    bool isContainer() const noexcept {
        return kind_ == TypeKind::Array || kind_ == TypeKind::Set || kind_ == TypeKind::Row;
    }
    bool isCharacter() const noexcept { return kind_ == TypeKind::Char || kind_ == TypeKind::Varchar; }
    bool isBinary() const noexcept { return kind_ == TypeKind::Binary || kind_ == TypeKind::Varbinary; }

    // Canonical type text; parse(toString()) reproduces an equal descriptor
    std::string toString() const;

    bool operator==(const TypeDescriptor& other) const;

private:
    explicit TypeDescriptor(TypeKind kind) : kind_(kind) {}

    TypeKind kind_;
    int precision_ = -1;
    int scale_ = -1;
    int length_ = -1;
    IntervalRange interval_range_;
    TypeDescriptorPtr element_;
    std::vector<RowField> fields_;
};

} // namespace core
} // namespace vcodec
