#include <gtest/gtest.h>
#include "vcodec/core/value.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

using namespace vcodec::core;

TEST(ValueTest, DefaultIsNull) {
    Value v;
    EXPECT_TRUE(v.isNull());
    EXPECT_EQ(v.kind(), ValueKind::Null);
    EXPECT_EQ(v, Value::null());
    EXPECT_EQ(v.toString(), "NULL");
}

TEST(ValueTest, KindMatchesStoredAlternative) {
    EXPECT_EQ(Value::boolean(true).kind(), ValueKind::Boolean);
    EXPECT_EQ(Value::integer(-3).kind(), ValueKind::Integer);
    EXPECT_EQ(Value::floating(1.5).kind(), ValueKind::Float);
    EXPECT_EQ(Value(Decimal::fromString("1.5")).kind(), ValueKind::Decimal);
    EXPECT_EQ(Value::text("a").kind(), ValueKind::Text);
    EXPECT_EQ(Value::bytes({0x41}).kind(), ValueKind::Bytes);
    EXPECT_EQ(Value(Date(2021, 6, 10)).kind(), ValueKind::Date);
    EXPECT_EQ(Value(Time(1, 2, 3)).kind(), ValueKind::Time);
    EXPECT_EQ(Value(Interval::fromDayTime(1)).kind(), ValueKind::Interval);
    EXPECT_EQ(Value(Array{}).kind(), ValueKind::Array);
    EXPECT_EQ(Value(Set{}).kind(), ValueKind::Set);
    EXPECT_EQ(Value(Row{}).kind(), ValueKind::Row);
    EXPECT_TRUE(Value(Row{}).isContainer());
    EXPECT_FALSE(Value::integer(1).isContainer());
}

TEST(ValueTest, AccessorOnWrongKindThrows) {
    Value v = Value::integer(7);
    EXPECT_EQ(v.asInt(), 7);
    EXPECT_THROW(v.asText(), std::bad_variant_access);
}

TEST(ValueTest, EmptyContainerIsNotNull) {
    Value empty(Array{});
    EXPECT_FALSE(empty.isNull());
    EXPECT_NE(empty, Value::null());
    EXPECT_NE(Value(Array{}), Value(Set{}));
}

TEST(ValueTest, NaNEqualsNaN) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(Value::floating(nan), Value::floating(nan));
    EXPECT_NE(Value::floating(nan), Value::floating(0.0));
}

TEST(ValueTest, IntegerAndFloatAreDistinct) {
    EXPECT_NE(Value::integer(1), Value::floating(1.0));
}

TEST(ValueTest, DecimalEqualityIsRepresentational) {
    EXPECT_NE(Value(Decimal::fromString("1.0")), Value(Decimal::fromString("1.00")));
    EXPECT_EQ(Value(Decimal::fromString("1.0")), Value(Decimal::fromString("1.0")));
}

TEST(ArrayTest, KeepsOrderAndNulls) {
    Array a{Value::integer(1), Value::null(), Value::integer(1)};
    ASSERT_EQ(a.size(), 3u);
    EXPECT_EQ(a[0], Value::integer(1));
    EXPECT_TRUE(a[1].isNull());
    EXPECT_EQ(a[2], Value::integer(1));
    EXPECT_THROW(a[3], std::out_of_range);

    Array b{Value::integer(1), Value::integer(1), Value::null()};
    EXPECT_NE(Value(a), Value(b));
}

TEST(SetTest, InsertDropsDuplicates) {
    Set s;
    EXPECT_TRUE(s.insert(Value::integer(1)));
    EXPECT_FALSE(s.insert(Value::integer(1)));
    EXPECT_TRUE(s.insert(Value::null()));
    EXPECT_FALSE(s.insert(Value::null()));
    EXPECT_EQ(s.size(), 2u);
    EXPECT_TRUE(s.contains(Value::null()));
}

TEST(SetTest, EqualityIgnoresOrder) {
    Set a{Value::integer(1), Value::integer(2), Value::null()};
    Set b{Value::null(), Value::integer(2), Value::integer(1)};
    EXPECT_EQ(Value(a), Value(b));

    Set c{Value::integer(1), Value::integer(3), Value::null()};
    EXPECT_NE(Value(a), Value(c));
}

TEST(RowTest, PositionalAndNamedAccess) {
    Row r;
    r.append("name", Value::text("Amy"));
    r.append("id", Value::integer(2));

    ASSERT_EQ(r.size(), 2u);
    EXPECT_EQ(r.nameAt(1), "id");
    EXPECT_EQ(r.at(0), Value::text("Amy"));
    EXPECT_EQ(r["id"], Value::integer(2));
    EXPECT_TRUE(r.contains("name"));
    EXPECT_FALSE(r.contains("date"));
    EXPECT_THROW(r["date"], std::out_of_range);
}

TEST(RowTest, EqualityComparesNamesAndValues) {
    Row a;
    a.append("f0", Value::integer(1));
    Row b;
    b.append("x", Value::integer(1));
    EXPECT_NE(Value(a), Value(b));

    Row c;
    c.append("f0", Value::integer(1));
    EXPECT_EQ(Value(a), Value(c));
}

TEST(ValueTest, ToStringRendersNestedContainers) {
    Row row;
    row.append("a", Value(Array{Value::integer(1), Value::null()}));
    row.append("b", Value::text("x"));
    EXPECT_EQ(Value(row).toString(), "(a: [1, NULL], b: 'x')");
    EXPECT_EQ(Value::bytes({0x41, 0x0a}).toString(), "\\x410a");
    EXPECT_EQ(Value::floating(-std::numeric_limits<double>::infinity()).toString(), "-Infinity");
}

TEST(ValueTest, StreamOperatorPrefixesKind) {
    std::ostringstream oss;
    oss << Value::integer(42);
    EXPECT_EQ(oss.str(), "Integer 42");
}
