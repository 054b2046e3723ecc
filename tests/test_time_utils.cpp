#include <gtest/gtest.h>

#include "scheduler/time_utils.hpp"

TEST(TimeUtils, NaiveAndZuluTimestampsAreTheSameInstant) {
    auto naive = parseIsoTimestamp("2026-10-20T07:00:00");
    auto zulu = parseIsoTimestamp("2026-10-20T07:00:00Z");
    ASSERT_TRUE(naive.has_value());
    ASSERT_TRUE(zulu.has_value());
    EXPECT_EQ(*naive, *zulu);
    EXPECT_EQ(formatIsoUtc(*naive), "2026-10-20T07:00:00Z");
}

TEST(TimeUtils, OffsetIsConvertedToUtc) {
    auto t = parseIsoTimestamp("2026-10-20T12:30:00+05:30");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(formatIsoUtc(*t), "2026-10-20T07:00:00Z");

    auto west = parseIsoTimestamp("2026-10-20 02:00-0500");
    ASSERT_TRUE(west.has_value());
    EXPECT_EQ(formatIsoUtc(*west), "2026-10-20T07:00:00Z");
}

TEST(TimeUtils, RejectsMalformedTimestamps) {
    EXPECT_FALSE(parseIsoTimestamp("tomorrow at 7").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2026-13-01T00:00:00").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2026-02-30T00:00:00").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2026-10-20T25:00:00").has_value());
    EXPECT_FALSE(parseIsoTimestamp("").has_value());
}

TEST(TimeUtils, LeapDayIsAccepted) {
    EXPECT_TRUE(parseIsoTimestamp("2028-02-29T00:00:00Z").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2027-02-29T00:00:00Z").has_value());
}

TEST(TimeUtils, FractionalSecondsAreKept) {
    auto t = parseIsoTimestamp("2026-10-20T07:00:00.250Z");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(toEpochMillis(*t) % 1000, 250);
}

TEST(TimeUtils, CivilRoundTripAcrossOffsets) {
    CivilTime local{2026, 12, 31, 23, 30, 0};
    UtcTime utc = civilToUtc(local, 330);
    CivilTime back = civilFromUtc(utc, 330);
    EXPECT_EQ(back.year, 2026);
    EXPECT_EQ(back.month, 12);
    EXPECT_EQ(back.day, 31);
    EXPECT_EQ(back.hour, 23);
    EXPECT_EQ(back.minute, 30);

    CivilTime inUtc = civilFromUtc(utc, 0);
    EXPECT_EQ(inUtc.hour, 18);
    EXPECT_EQ(inUtc.minute, 0);
}

TEST(TimeUtils, DaysFromCivilEpoch) {
    EXPECT_EQ(daysFromCivil(1970, 1, 1), 0);
    EXPECT_EQ(daysFromCivil(2000, 3, 1), 11017);
}

TEST(TimeUtils, TimezoneNamesAndOffsets) {
    EXPECT_EQ(parseUtcOffsetMinutes("UTC"), 0);
    EXPECT_EQ(parseUtcOffsetMinutes("gmt"), 0);
    EXPECT_EQ(parseUtcOffsetMinutes("Asia/Kolkata"), 330);
    EXPECT_EQ(parseUtcOffsetMinutes("+05:30"), 330);
    EXPECT_EQ(parseUtcOffsetMinutes("-0800"), -480);
    EXPECT_EQ(parseUtcOffsetMinutes("UTC+5"), 300);
    EXPECT_EQ(parseUtcOffsetMinutes("GMT-03:00"), -180);
    EXPECT_FALSE(parseUtcOffsetMinutes("Mars/Olympus").has_value());
    EXPECT_FALSE(parseUtcOffsetMinutes("+25:00").has_value());
}

TEST(TimeUtils, EpochMillisRoundTrip) {
    UtcTime t = fromEpochMillis(1792476000123LL);
    EXPECT_EQ(toEpochMillis(t), 1792476000123LL);
}
