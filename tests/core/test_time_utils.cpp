#include <gtest/gtest.h>
#include <chrono>
#include "quant_ngin/core/time_utils.hpp"

using namespace quant_ngin;
using namespace quant_ngin::core;

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, ParseDashedDate) {
    auto parsed = parse_date("2024-03-15");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), make_date(2024, 3, 15));
    EXPECT_EQ(format_date(parsed.value()), "2024-03-15");
}

TEST_F(TimeUtilsTest, ParseCompactDate) {
    auto parsed = parse_date("20231229");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(format_date(parsed.value()), "2023-12-29");
}

TEST_F(TimeUtilsTest, RejectsGarbageAndOutOfRange) {
    EXPECT_TRUE(parse_date("yesterday").is_error());
    EXPECT_TRUE(parse_date("2024-13-01").is_error());
    EXPECT_EQ(parse_date("").error()->code(), ErrorCode::CONVERSION_ERROR);
}

TEST_F(TimeUtilsTest, EpochAndLeapDay) {
    EXPECT_EQ(make_date(1970, 1, 1).time_since_epoch().count(), 0);
    EXPECT_EQ(format_date(make_date(2024, 2, 29)), "2024-02-29");
    EXPECT_EQ(make_date(2024, 3, 1) - make_date(2024, 2, 28), std::chrono::hours(48));
}

TEST_F(TimeUtilsTest, FloorToDayDropsIntradayTime) {
    const Timestamp day = make_date(2022, 7, 4);
    EXPECT_EQ(floor_to_day(day + std::chrono::hours(15) + std::chrono::minutes(30)), day);
    EXPECT_EQ(floor_to_day(day), day);

    const Timestamp before_epoch = make_date(1969, 12, 31) + std::chrono::hours(5);
    EXPECT_EQ(floor_to_day(before_epoch), make_date(1969, 12, 31));
}
