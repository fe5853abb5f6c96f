#include <gtest/gtest.h>
#include "vcodec/core/exception.hpp"
#include "vcodec/core/type_descriptor.hpp"

using namespace vcodec::core;

class TypeDescriptorParseTest : public ::testing::Test {
protected:
    static std::string canonical(std::string_view text) {
        return TypeDescriptor::parse(text)->toString();
    }
};

TEST_F(TypeDescriptorParseTest, ScalarSpellings) {
    EXPECT_EQ(TypeDescriptor::parse("bool")->kind(), TypeKind::Boolean);
    EXPECT_EQ(TypeDescriptor::parse("BIGINT")->kind(), TypeKind::Integer);
    EXPECT_EQ(TypeDescriptor::parse("tinyint")->kind(), TypeKind::Integer);
    EXPECT_EQ(TypeDescriptor::parse("DOUBLE PRECISION")->kind(), TypeKind::Float);
    EXPECT_EQ(TypeDescriptor::parse("float8")->kind(), TypeKind::Float);
    EXPECT_EQ(TypeDescriptor::parse("UUID")->kind(), TypeKind::Uuid);
    EXPECT_EQ(TypeDescriptor::parse("DATETIME")->kind(), TypeKind::Timestamp);
    EXPECT_EQ(TypeDescriptor::parse("bytea")->kind(), TypeKind::Varbinary);
    EXPECT_EQ(TypeDescriptor::parse("LONG VARBINARY(100)")->kind(), TypeKind::Varbinary);
}

TEST_F(TypeDescriptorParseTest, NumericModifiers) {
    auto d = TypeDescriptor::parse("numeric(10, 2)");
    EXPECT_EQ(d->kind(), TypeKind::Decimal);
    EXPECT_EQ(d->precision(), 10);
    EXPECT_EQ(d->scale(), 2);

    EXPECT_EQ(canonical("DECIMAL(12)"), "NUMERIC(12,0)");
    EXPECT_EQ(canonical("NUMBER"), "NUMERIC");
    EXPECT_EQ(canonical("MONEY"), "NUMERIC(18,4)");
}

TEST_F(TypeDescriptorParseTest, CharacterTypes) {
    auto c = TypeDescriptor::parse("CHAR(3)");
    EXPECT_EQ(c->kind(), TypeKind::Char);
    EXPECT_EQ(c->length(), 3);
    EXPECT_TRUE(c->isCharacter());

    EXPECT_EQ(canonical("character varying(20)"), "VARCHAR(20)");
    EXPECT_EQ(canonical("LONG VARCHAR"), "VARCHAR");
    EXPECT_EQ(canonical("varchar"), "VARCHAR");
    EXPECT_EQ(TypeDescriptor::parse("BINARY(2)")->length(), 2);
}

TEST_F(TypeDescriptorParseTest, TemporalTypes) {
    EXPECT_EQ(canonical("TIME(3)"), "TIME(3)");
    EXPECT_EQ(canonical("time with time zone"), "TIMETZ");
    EXPECT_EQ(canonical("TIME(4) WITH TIME ZONE"), "TIMETZ(4)");
    EXPECT_EQ(canonical("TIMESTAMP WITHOUT TIME ZONE"), "TIMESTAMP");
    EXPECT_EQ(canonical("timestamp(6) with time zone"), "TIMESTAMPTZ(6)");
    EXPECT_EQ(canonical("TIMESTAMPTZ"), "TIMESTAMPTZ");
}

TEST_F(TypeDescriptorParseTest, IntervalRanges) {
    EXPECT_EQ(canonical("INTERVAL"), "INTERVAL DAY TO SECOND");
    EXPECT_EQ(canonical("interval year to month"), "INTERVAL YEAR TO MONTH");
    EXPECT_EQ(canonical("INTERVAL SECOND(3)"), "INTERVAL SECOND");
    EXPECT_EQ(canonical("INTERVAL DAY TO SECOND(6)"), "INTERVAL DAY TO SECOND");
    EXPECT_EQ(canonical("INTERVAL HOUR"), "INTERVAL HOUR");

    auto d = TypeDescriptor::parse("INTERVAL MINUTE TO SECOND");
    EXPECT_EQ(d->intervalRange().start, IntervalField::Minute);
    EXPECT_EQ(d->intervalRange().end, IntervalField::Second);
}

TEST_F(TypeDescriptorParseTest, UnsupportedIntervalRanges) {
    EXPECT_THROW(TypeDescriptor::parse("INTERVAL YEAR TO DAY"), UnsupportedTypeError);
    EXPECT_THROW(TypeDescriptor::parse("INTERVAL SECOND TO MINUTE"), UnsupportedTypeError);
    EXPECT_THROW(TypeDescriptor::parse("INTERVAL MONTH TO HOUR"), UnsupportedTypeError);
    EXPECT_THROW(IntervalRange::make(IntervalField::Month, IntervalField::Year), UnsupportedTypeError);
}

TEST_F(TypeDescriptorParseTest, AllThirteenRangesAreSupported) {
    int supported = 0;
    for (int s = 0; s <= 5; ++s) {
        for (int e = 0; e <= 5; ++e) {
            if (IntervalRange::isSupported(static_cast<IntervalField>(s), static_cast<IntervalField>(e))) {
                ++supported;
            }
        }
    }
    EXPECT_EQ(supported, 13);
}

TEST_F(TypeDescriptorParseTest, Collections) {
    auto a = TypeDescriptor::parse("ARRAY[ARRAY[INT]]");
    ASSERT_EQ(a->kind(), TypeKind::Array);
    ASSERT_EQ(a->element()->kind(), TypeKind::Array);
    EXPECT_EQ(a->element()->element()->kind(), TypeKind::Integer);
    EXPECT_TRUE(a->isContainer());

    EXPECT_EQ(canonical("ARRAY[VARCHAR(10),4]"), "ARRAY[VARCHAR(10)]");
    EXPECT_EQ(canonical("set[bool]"), "SET[BOOLEAN]");
}

TEST_F(TypeDescriptorParseTest, RowFieldsNamedAndUnnamed) {
    auto r = TypeDescriptor::parse("ROW(name VARCHAR, INT, \"date\" DATE)");
    ASSERT_EQ(r->kind(), TypeKind::Row);
    ASSERT_EQ(r->fields().size(), 3u);
    EXPECT_EQ(r->fields()[0].name, "name");
    EXPECT_EQ(r->fields()[0].type->kind(), TypeKind::Varchar);
    EXPECT_EQ(r->fields()[1].name, "f1");
    EXPECT_EQ(r->fields()[2].name, "date");
    EXPECT_EQ(r->fields()[2].type->kind(), TypeKind::Date);
}

TEST_F(TypeDescriptorParseTest, RowFieldNamedLikeAType) {
    auto r = TypeDescriptor::parse("ROW(date DATE, id INT)");
    ASSERT_EQ(r->fields().size(), 2u);
    EXPECT_EQ(r->fields()[0].name, "date");
    EXPECT_EQ(r->fields()[0].type->kind(), TypeKind::Date);
    EXPECT_EQ(r->fields()[1].name, "id");
}

TEST_F(TypeDescriptorParseTest, EmptyRow) {
    auto r = TypeDescriptor::parse("ROW()");
    EXPECT_EQ(r->kind(), TypeKind::Row);
    EXPECT_TRUE(r->fields().empty());
    EXPECT_EQ(r->toString(), "ROW()");
}

TEST_F(TypeDescriptorParseTest, CanonicalTextReparsesToEqualDescriptor) {
    const char* texts[] = {
        "ARRAY[ROW(a INT, \"b c\" NUMERIC(10,2), date DATE)]",
        "SET[INTERVAL HOUR TO MINUTE]",
        "ROW(ROW(), ARRAY[TIMESTAMPTZ(4)])",
        "ARRAY[ARRAY[ARRAY[CHAR(3)]]]",
    };
    for (const char* text : texts) {
        auto d = TypeDescriptor::parse(text);
        auto again = TypeDescriptor::parse(d->toString());
        EXPECT_EQ(*d, *again) << text << " -> " << d->toString();
    }
}

TEST_F(TypeDescriptorParseTest, RejectsUnknownOrMalformedText) {
    EXPECT_THROW(TypeDescriptor::parse("GEOMETRY"), UnsupportedTypeError);
    EXPECT_THROW(TypeDescriptor::parse("ARRAY[INT"), UnsupportedTypeError);
    EXPECT_THROW(TypeDescriptor::parse("INT INT"), UnsupportedTypeError);
    EXPECT_THROW(TypeDescriptor::parse("ROW(a)"), UnsupportedTypeError);
    EXPECT_THROW(TypeDescriptor::parse(""), UnsupportedTypeError);
    EXPECT_THROW(TypeDescriptor::parse("LONG INT"), UnsupportedTypeError);
}

TEST(TypeDescriptorFactoryTest, RowNamesDefaultToPosition) {
    auto r = TypeDescriptor::row({{"", TypeDescriptor::varchar()},
                                  {"id", TypeDescriptor::integer()},
                                  {"", TypeDescriptor::boolean()}});
    EXPECT_EQ(r->fields()[0].name, "f0");
    EXPECT_EQ(r->fields()[1].name, "id");
    EXPECT_EQ(r->fields()[2].name, "f2");
}

TEST(TypeDescriptorFactoryTest, MissingChildrenAreRejected) {
    EXPECT_THROW(TypeDescriptor::array(nullptr), UnsupportedTypeError);
    EXPECT_THROW(TypeDescriptor::set(nullptr), UnsupportedTypeError);
    EXPECT_THROW(TypeDescriptor::row({{"a", nullptr}}), UnsupportedTypeError);
    EXPECT_THROW(TypeDescriptor::interval({IntervalField::Hour, IntervalField::Day}), UnsupportedTypeError);
}

TEST(TypeDescriptorFactoryTest, SharedChildren) {
    auto element = TypeDescriptor::integer();
    auto a = TypeDescriptor::array(element);
    auto s = TypeDescriptor::set(element);
    EXPECT_EQ(a->element().get(), s->element().get());
    EXPECT_FALSE(*a == *s);
}

TEST(TypeDescriptorMetadataTest, ScalarOids) {
    EXPECT_EQ(TypeDescriptor::fromServerMetadata(5, -1)->kind(), TypeKind::Boolean);
    EXPECT_EQ(TypeDescriptor::fromServerMetadata(6, -1)->kind(), TypeKind::Integer);
    EXPECT_EQ(TypeDescriptor::fromServerMetadata(7, -1)->kind(), TypeKind::Float);
    EXPECT_EQ(TypeDescriptor::fromServerMetadata(10, -1)->kind(), TypeKind::Date);
    EXPECT_EQ(TypeDescriptor::fromServerMetadata(20, -1)->kind(), TypeKind::Uuid);
    EXPECT_EQ(TypeDescriptor::fromServerMetadata(15, 3)->toString(), "TIMETZ(3)");
    EXPECT_EQ(TypeDescriptor::fromServerMetadata(13, -1)->toString(), "TIMESTAMPTZ");
}

TEST(TypeDescriptorMetadataTest, LengthsAndNumericModifiers) {
    EXPECT_EQ(TypeDescriptor::fromServerMetadata(8, 7)->toString(), "CHAR(3)");
    EXPECT_EQ(TypeDescriptor::fromServerMetadata(9, 14)->toString(), "VARCHAR(10)");
    EXPECT_EQ(TypeDescriptor::fromServerMetadata(115, -1)->toString(), "VARCHAR");
    EXPECT_EQ(TypeDescriptor::fromServerMetadata(117, 6)->toString(), "BINARY(2)");
    EXPECT_EQ(TypeDescriptor::fromServerMetadata(116, -1)->toString(), "VARBINARY");

    // precision 37, scale 15
    const int32_t typmod = ((37 << 16) | 15) + 4;
    auto n = TypeDescriptor::fromServerMetadata(16, typmod);
    EXPECT_EQ(n->precision(), 37);
    EXPECT_EQ(n->scale(), 15);
    EXPECT_EQ(TypeDescriptor::fromServerMetadata(16, -1)->toString(), "NUMERIC");
}

TEST(TypeDescriptorMetadataTest, IntervalOids) {
    EXPECT_EQ(TypeDescriptor::fromServerMetadata(14, -1)->toString(), "INTERVAL DAY TO SECOND");
    EXPECT_EQ(TypeDescriptor::fromServerMetadata(114, -1)->toString(), "INTERVAL YEAR TO MONTH");
}

TEST(TypeDescriptorMetadataTest, UnknownOid) {
    EXPECT_THROW(TypeDescriptor::fromServerMetadata(9999, -1), UnsupportedTypeError);
}
