#include "test_base.hpp"

using namespace vcodec::test;

namespace {

Timestamp at(int32_t y, unsigned mo, unsigned d, unsigned h, unsigned mi = 0) {
    return Timestamp(Date(y, mo, d), Time(h, mi, 0));
}

} // namespace

class SessionTimezoneTest : public CodecTestBase {
protected:
    // America/New_York, or a skip when the tz database lacks it
    bool loadNewYork(SessionTimezone& out) {
        try {
            out = SessionTimezone::named("America/New_York");
            return true;
        } catch (const ValueFormatError&) {
            return false;
        }
    }
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(SessionTimezoneTest, DefaultIsUtc) {
    SessionTimezone tz;
    EXPECT_EQ(tz.name(), "UTC");
    EXPECT_TRUE(tz.isFixedOffset());
    EXPECT_EQ(tz.offsetFor(at(2021, 7, 1, 12)), 0);
    EXPECT_EQ(tz, SessionTimezone::utc());
}

TEST_F(SessionTimezoneTest, FixedOffsets) {
    EXPECT_EQ(SessionTimezone::fixedOffset(0), SessionTimezone::utc());
    EXPECT_EQ(SessionTimezone::fixedOffset(19800).name(), "+05:30");
    EXPECT_EQ(SessionTimezone::fixedOffset(-3600).name(), "-01:00");
    EXPECT_EQ(SessionTimezone::fixedOffset(-19176).name(), "-05:19:36");
    EXPECT_EQ(SessionTimezone::fixedOffset(-3600).offsetFor(at(1900, 1, 1, 0)), -3600);
    EXPECT_THROW(SessionTimezone::fixedOffset(86400), ValueFormatError);
    EXPECT_THROW(SessionTimezone::fixedOffset(-86400), ValueFormatError);
}

TEST_F(SessionTimezoneTest, ParseSpellings) {
    EXPECT_EQ(SessionTimezone::parse("utc"), SessionTimezone::utc());
    EXPECT_EQ(SessionTimezone::parse(" GMT "), SessionTimezone::utc());
    EXPECT_EQ(SessionTimezone::parse("Z"), SessionTimezone::utc());
    EXPECT_EQ(SessionTimezone::parse("+05:30"), SessionTimezone::fixedOffset(19800));
    EXPECT_EQ(SessionTimezone::parse("-08"), SessionTimezone::fixedOffset(-28800));
    EXPECT_EQ(SessionTimezone::parse("UTC-3"), SessionTimezone::fixedOffset(-10800));
    EXPECT_EQ(SessionTimezone::parse("GMT+0530"), SessionTimezone::fixedOffset(19800));
}

TEST_F(SessionTimezoneTest, ParseRejects) {
    EXPECT_THROW(SessionTimezone::parse(""), ValueFormatError);
    EXPECT_THROW(SessionTimezone::parse("UTC+x"), ValueFormatError);
    EXPECT_THROW(SessionTimezone::parse("+25:00"), ValueFormatError);
    EXPECT_THROW(SessionTimezone::parse("Not/A_Zone"), ValueFormatError);
    EXPECT_THROW(SessionTimezone::named("Mars/Olympus_Mons"), ValueFormatError);
}

// ============================================================================
// Named zones
// ============================================================================

TEST_F(SessionTimezoneTest, NamedZoneFollowsDaylightSaving) {
    SessionTimezone ny;
    if (!loadNewYork(ny)) GTEST_SKIP() << "tz database has no America/New_York";
    EXPECT_FALSE(ny.isFixedOffset());
    EXPECT_EQ(ny.name(), "America/New_York");
    EXPECT_EQ(ny.offsetFor(at(2021, 7, 1, 12)), -14400);
    EXPECT_EQ(ny.offsetFor(at(2021, 1, 15, 12)), -18000);
    EXPECT_EQ(SessionTimezone::parse("America/New_York"), ny);
}

TEST_F(SessionTimezoneTest, SkippedLocalTimeUsesOffsetBeforeTransition) {
    SessionTimezone ny;
    if (!loadNewYork(ny)) GTEST_SKIP() << "tz database has no America/New_York";
    EXPECT_EQ(ny.offsetFor(at(2021, 3, 14, 2, 30)), -18000);
}

TEST_F(SessionTimezoneTest, RepeatedLocalTimeUsesOffsetBeforeTransition) {
    SessionTimezone ny;
    if (!loadNewYork(ny)) GTEST_SKIP() << "tz database has no America/New_York";
    EXPECT_EQ(ny.offsetFor(at(2021, 11, 7, 1, 30)), -14400);
}

TEST_F(SessionTimezoneTest, SessionZoneChangesDecodedOffset) {
    SessionTimezone ny;
    if (!loadNewYork(ny)) GTEST_SKIP() << "tz database has no America/New_York";

    Value before = decode("2021-07-01 12:00:00", "TIMESTAMPTZ");
    timezone_ = ny;
    Value after = decode("2021-07-01 12:00:00", "TIMESTAMPTZ");

    EXPECT_EQ(before.asTimestampTz().offsetSeconds(), 0);
    EXPECT_EQ(after.asTimestampTz().offsetSeconds(), -14400);
    EXPECT_EQ(before.asTimestampTz().local(), after.asTimestampTz().local());
}

// ============================================================================
// SET TIMEZONE observation
// ============================================================================

TEST_F(SessionTimezoneTest, ObservesSetTimezone) {
    const auto server = SessionTimezone::fixedOffset(3600);

    auto a = SessionTimezone::observeStatement("SET TIMEZONE TO '+02:00'", server);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(*a, SessionTimezone::fixedOffset(7200));

    auto b = SessionTimezone::observeStatement("set time zone 'UTC';", server);
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*b, SessionTimezone::utc());

    auto c = SessionTimezone::observeStatement("SET SESSION TIMEZONE = UTC", server);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(*c, SessionTimezone::utc());
}

TEST_F(SessionTimezoneTest, DefaultAndLocalRestoreServerZone) {
    const auto server = SessionTimezone::fixedOffset(-7200);
    EXPECT_EQ(SessionTimezone::observeStatement("SET TIME ZONE DEFAULT", server), server);
    EXPECT_EQ(SessionTimezone::observeStatement("SET TIMEZONE TO LOCAL", server), server);
}

TEST_F(SessionTimezoneTest, ObservationIsTraced) {
    SessionTimezone::observeStatement("SET TIMEZONE TO '+02:00'", SessionTimezone::utc());
    EXPECT_TRUE(trace_.hasComponent("SessionTimezone"));
}

TEST_F(SessionTimezoneTest, IgnoresOtherStatements) {
    const auto server = SessionTimezone::utc();
    EXPECT_FALSE(SessionTimezone::observeStatement("SELECT 1", server).has_value());
    EXPECT_FALSE(SessionTimezone::observeStatement("SET search_path TO app", server).has_value());
    EXPECT_FALSE(SessionTimezone::observeStatement("SET TIMEZONE TO 'UTC' extra", server).has_value());
    EXPECT_FALSE(SessionTimezone::observeStatement("SET TIMEZONE TO 'UTC", server).has_value());
    EXPECT_FALSE(SessionTimezone::observeStatement("SET TIMEZONE", server).has_value());
    EXPECT_FALSE(trace_.hasComponent("SessionTimezone"));
}

TEST_F(SessionTimezoneTest, UnknownZoneInSetStatementIsAnError) {
    EXPECT_THROW(SessionTimezone::observeStatement("SET TIMEZONE TO 'Bogus/Zone'", SessionTimezone::utc()),
                 ValueFormatError);
}
