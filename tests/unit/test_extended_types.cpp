#include <gtest/gtest.h>
#include "vcodec/core/exception.hpp"
#include "vcodec/core/extended_types.hpp"
#include "vcodec/core/timestamp_utils.hpp"

using namespace vcodec::core;

// ---------------------------------------------------------------------------
// Decimal

TEST(DecimalTest, ParseKeepsScale) {
    const Decimal d = Decimal::fromString("-1.120");
    EXPECT_TRUE(d.isNegative());
    EXPECT_EQ(d.digits(), "1120");
    EXPECT_EQ(d.scale(), 3);
    EXPECT_EQ(d.toString(), "-1.120");
}

TEST(DecimalTest, ZeroWithExponentKeepsScale) {
    const Decimal zero = Decimal::fromString("0E-10");
    EXPECT_TRUE(zero.isZero());
    EXPECT_EQ(zero.scale(), 10);
    EXPECT_NE(zero, Decimal::fromString("0"));
    EXPECT_EQ(zero.compare(Decimal::fromString("0")), 0);
    EXPECT_EQ(zero.toString(), "0E-10");
}

TEST(DecimalTest, NegativeZeroNormalizes) {
    EXPECT_FALSE(Decimal::fromString("-0.00").isNegative());
    EXPECT_EQ(Decimal::fromString("-0.00"), Decimal::fromString("0.00"));
}

TEST(DecimalTest, LargeValuesAreExact) {
    const Decimal d = Decimal::fromString("1234567890123456789.0123456789");
    EXPECT_EQ(d.scale(), 10);
    EXPECT_EQ(d.toString(), "1234567890123456789.0123456789");
}

TEST(DecimalTest, ScientificText) {
    EXPECT_EQ(Decimal::fromString("1E+3").scale(), -3);
    EXPECT_EQ(Decimal::fromString("1E+3").toString(), "1E+3");
    // 1.5e2 keeps its significand: 15 with scale -1
    EXPECT_EQ(Decimal::fromString("1.5e2").scale(), -1);
    EXPECT_EQ(Decimal::fromString("1.5e2").toString(), "1.5E+2");
    EXPECT_EQ(Decimal::fromString("1.5e2").rescaled(0).toString(), "150");
    EXPECT_EQ(Decimal::fromString("0.000001").toString(), "0.000001");
    EXPECT_EQ(Decimal::fromString("0.0000001").toString(), "1E-7");
}

TEST(DecimalTest, RescaleIsExact) {
    const Decimal d = Decimal::fromString("1.5");
    EXPECT_EQ(d.rescaled(3).toString(), "1.500");
    EXPECT_EQ(Decimal::fromString("1.500").rescaled(1), d);
    EXPECT_THROW(Decimal::fromString("1.55").rescaled(1), OverflowError);
}

TEST(DecimalTest, Compare) {
    EXPECT_LT(Decimal::fromString("-2").compare(Decimal::fromString("1.5")), 0);
    EXPECT_GT(Decimal::fromString("10").compare(Decimal::fromString("9.99")), 0);
    EXPECT_EQ(Decimal::fromString("1.50").compare(Decimal::fromString("1.5")), 0);
    EXPECT_GT(Decimal::fromString("-1").compare(Decimal::fromString("-2")), 0);
}

TEST(DecimalTest, RejectsMalformedText) {
    EXPECT_THROW(Decimal::fromString(""), ValueFormatError);
    EXPECT_THROW(Decimal::fromString("1.2.3"), ValueFormatError);
    EXPECT_THROW(Decimal::fromString("abc"), ValueFormatError);
    EXPECT_THROW(Decimal::fromString("1e"), ValueFormatError);
    EXPECT_THROW(Decimal::fromString("1e99999999999999"), OverflowError);
}

TEST(DecimalTest, FromInt64) {
    EXPECT_EQ(Decimal::fromInt64(-12345, 2).toString(), "-123.45");
    EXPECT_EQ(Decimal::fromInt64(INT64_MIN).toString(), "-9223372036854775808");
}

// ---------------------------------------------------------------------------
// Dates and times

TEST(DateTest, ValidatesCalendar) {
    EXPECT_NO_THROW(Date(2020, 2, 29));
    EXPECT_THROW(Date(2021, 2, 29), ValueFormatError);
    EXPECT_THROW(Date(2021, 13, 1), ValueFormatError);
    EXPECT_THROW(Date(2021, 4, 31), ValueFormatError);
}

TEST(DateTest, DaysRoundTrip) {
    EXPECT_EQ(Date(1970, 1, 1).toDays(), 0);
    EXPECT_EQ(Date(2000, 3, 1).toDays(), 11017);
    EXPECT_EQ(Date::fromDays(-1), Date(1969, 12, 31));
    EXPECT_EQ(Date::fromDays(Date(221, 5, 2).toDays()), Date(221, 5, 2));
}

TEST(DateTest, AstronomicalYearsPrintWithEra) {
    EXPECT_EQ(Date(0, 1, 1).toString(), "0001-01-01 BC");
    EXPECT_EQ(Date(-1, 12, 31).toString(), "0002-12-31 BC");
    EXPECT_EQ(Date(276, 12, 1).toString(), "0276-12-01");
    EXPECT_EQ(Date(12345, 1, 2).toString(), "12345-01-02");
}

TEST(TimeTest, FormatsTrimmedFraction) {
    EXPECT_EQ(Time(22, 36, 33, 123000).toString(), "22:36:33.123");
    EXPECT_EQ(Time(0, 0, 0).toString(), "00:00:00");
    EXPECT_EQ(Time::fromMicros(Time(1, 2, 3, 4).toMicros()), Time(1, 2, 3, 4));
    EXPECT_THROW(Time(24, 0, 0), ValueFormatError);
    EXPECT_THROW(Time::fromMicros(vcodec::core::timestamp_utils::MICROS_PER_DAY), ValueFormatError);
}

TEST(TimeTzTest, OffsetIsPartOfTheValue) {
    const TimeTz a(Time(22, 36, 33, 123000), 23400);
    EXPECT_EQ(a.toString(), "22:36:33.123+06:30");
    EXPECT_NE(a, TimeTz(Time(22, 36, 33, 123000), 0));
    EXPECT_THROW(TimeTz(Time(), 86400), ValueFormatError);
    EXPECT_EQ(TimeTz(Time(1, 0, 0), -19176).toString(), "01:00:00-05:19:36");
}

TEST(TimestampTest, MicrosRoundTrip) {
    const Timestamp ts(Date(2001, 12, 1), Time(0, 30, 45, 87000));
    EXPECT_EQ(Timestamp::fromMicros(ts.toMicros()), ts);
    EXPECT_EQ(Timestamp::fromMicros(-1), Timestamp(Date(1969, 12, 31), Time(23, 59, 59, 999999)));
    EXPECT_EQ(ts.toString(), "2001-12-01 00:30:45.087");
}

TEST(TimestampTest, BcSuffixFollowsTime) {
    const Timestamp ts(Date(-43, 3, 15), Time(12, 0, 0));
    EXPECT_EQ(ts.toString(), "0044-03-15 12:00:00 BC");
}

TEST(TimestampTzTest, UtcInstant) {
    const TimestampTz tz(Timestamp(Date(1970, 1, 1), Time(6, 30, 0)), 23400);
    EXPECT_EQ(tz.toUtcMicros(), 0);
    EXPECT_EQ(tz.toString(), "1970-01-01 06:30:00+06:30");
}

// ---------------------------------------------------------------------------
// Interval

TEST(IntervalTest, NormalizesUpwardWithoutCrossingMonths) {
    const Interval i = Interval::fromDayTime(0, 0, 0, 216901, 24000);
    EXPECT_EQ(i, Interval::fromDayTime(2, 12, 15, 1, 24000));
    EXPECT_EQ(Interval::fromDayTime(400).months(), 0);
    EXPECT_EQ(Interval::fromYearsMonths(0, 22), Interval::fromYearsMonths(1, 10));
}

TEST(IntervalTest, NegativeComponentsKeepSign) {
    const Interval i = Interval::fromDayTime(0, -32);
    EXPECT_EQ(i.days(), -1);
    EXPECT_EQ(i.hours(), -8);
    EXPECT_EQ(-i, Interval::fromDayTime(1, 8));
}

TEST(IntervalTest, PartsAndTotals) {
    const Interval ym = Interval::fromYearsMonths(1, 10);
    EXPECT_TRUE(ym.hasYearMonthPart());
    EXPECT_FALSE(ym.hasDayTimePart());
    EXPECT_EQ(ym.totalMonths(), 22);

    const Interval dt = Interval::fromDayTime(1, 2, 3, 4, 500);
    EXPECT_EQ(dt.dayTimeMicros(), ((((24 + 2) * 60 + 3) * 60 + 4) * 1000000LL) + 500);
    EXPECT_TRUE(Interval().isZero());
}

TEST(IntervalTest, ToStringListsNonZeroFields) {
    EXPECT_EQ(Interval::fromDayTime(1, 2).toString(), "Interval(days=+1, hours=+2)");
    EXPECT_EQ(Interval::fromYearsMonths(0, -10).toString(), "Interval(months=-10)");
}

// ---------------------------------------------------------------------------
// Uuid

TEST(UuidTest, ParsesDashedAndPlainForms) {
    const Uuid a = Uuid::fromString("00010203-0405-0607-0809-0A0B0C0D0E0F");
    const Uuid b = Uuid::fromString("000102030405060708090a0b0c0d0e0f");
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.toString(), "00010203-0405-0607-0809-0a0b0c0d0e0f");
}

TEST(UuidTest, RejectsMalformedText) {
    EXPECT_THROW(Uuid::fromString("00010203-0405-0607-0809"), ValueFormatError);
    EXPECT_THROW(Uuid::fromString("0001020304050-607-0809-0a0b0c0d0e0f"), ValueFormatError);
    EXPECT_THROW(Uuid::fromString("zz010203-0405-0607-0809-0a0b0c0d0e0f"), ValueFormatError);
}
