#include <gtest/gtest.h>
#include "timecode.hpp"

namespace scenereel {

TEST(TimecodeTest, SecondsFromFrames) {
    Timecode tc(45, 30.0);
    EXPECT_EQ(tc.frames(), 45);
    EXPECT_DOUBLE_EQ(tc.seconds(), 1.5);
}

TEST(TimecodeTest, StringFormat) {
    EXPECT_EQ(Timecode(0, 25.0).to_string(), "00:00:00.000");
    EXPECT_EQ(Timecode(45, 30.0).to_string(), "00:00:01.500");
    EXPECT_EQ(Timecode(90000, 25.0).to_string(), "01:00:00.000");
    EXPECT_EQ(Timecode(1, 3.0).to_string(), "00:00:00.333");
}

TEST(TimecodeTest, NeverPrintsSixtySeconds) {
    // 59.9996 s rounds up into the next minute
    Timecode tc = Timecode::from_seconds(59.9996, 10000.0);
    EXPECT_EQ(tc.to_string(), "00:01:00.000");
}

TEST(TimecodeTest, FromSecondsRoundsToNearestFrame) {
    EXPECT_EQ(Timecode::from_seconds(1.0, 29.97).frames(), 30);
    EXPECT_EQ(Timecode::from_seconds(2.0, 24.0).frames(), 48);
}

TEST(TimecodeTest, Ordering) {
    EXPECT_LT(Timecode(10, 24.0), Timecode(11, 24.0));
    EXPECT_EQ(Timecode(10, 24.0), Timecode(10, 24.0));
    EXPECT_NE(Timecode(10, 24.0), Timecode(12, 24.0));
}

TEST(TimecodeTest, RejectsInvalidValues) {
    EXPECT_THROW(Timecode(-1, 24.0), std::invalid_argument);
    EXPECT_THROW(Timecode(0, 0.0), std::invalid_argument);
    EXPECT_THROW(Timecode::from_seconds(-0.5, 24.0), std::invalid_argument);
}

TEST(ParseTimestampTest, WholeAndFractionalSeconds) {
    EXPECT_DOUBLE_EQ(parse_timestamp("0:01:30"), 90.0);
    EXPECT_DOUBLE_EQ(parse_timestamp("1:00:00.5"), 3600.5);
    EXPECT_DOUBLE_EQ(parse_timestamp("00:00:02.250"), 2.25);
}

TEST(ParseTimestampTest, RoundTripsFormattedTimecode) {
    Timecode tc(1234, 25.0);
    EXPECT_NEAR(parse_timestamp(tc.to_string()), tc.seconds(), 1e-3);
}

TEST(ParseTimestampTest, RejectsMalformedInput) {
    EXPECT_THROW(parse_timestamp("01:30"), std::invalid_argument);
    EXPECT_THROW(parse_timestamp("1:2:3:4"), std::invalid_argument);
    EXPECT_THROW(parse_timestamp("a:00:00"), std::invalid_argument);
    EXPECT_THROW(parse_timestamp("0:00:1x"), std::invalid_argument);
    EXPECT_THROW(parse_timestamp("0:-1:00"), std::invalid_argument);
    EXPECT_THROW(parse_timestamp(""), std::invalid_argument);
}

TEST(ParseTimestampTest, RejectsNonDecimalFields) {
    EXPECT_THROW(parse_timestamp("0:00:nan"), std::invalid_argument);
    EXPECT_THROW(parse_timestamp("0:00:inf"), std::invalid_argument);
    EXPECT_THROW(parse_timestamp("0x1:00:00"), std::invalid_argument);
    EXPECT_THROW(parse_timestamp("0:00:+5"), std::invalid_argument);
    EXPECT_THROW(parse_timestamp("0:00: 5"), std::invalid_argument);
    EXPECT_THROW(parse_timestamp("0:00:1.2.3"), std::invalid_argument);
}

TEST(ParseTimestampTest, RejectsTrailingSeparator) {
    EXPECT_THROW(parse_timestamp("0:01:30:"), std::invalid_argument);
    EXPECT_THROW(parse_timestamp("0::30"), std::invalid_argument);
}

} // namespace scenereel
