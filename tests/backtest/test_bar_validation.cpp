#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "core/test_base.hpp"
#include "quant_ngin/backtest/bar_validation.hpp"

using namespace quant_ngin;
using namespace quant_ngin::testing;

class BarValidationTest : public TestBase {
protected:
    std::vector<Bar> valid_bars(size_t n = 60) {
        return make_bars(std::vector<double>(n, 100.0));
    }
};

TEST_F(BarValidationTest, AcceptsCleanSeries) {
    EXPECT_TRUE(validate_bars(valid_bars()).is_ok());
    EXPECT_TRUE(validate_bars(valid_bars(DEFAULT_MIN_BARS)).is_ok());
}

TEST_F(BarValidationTest, EmptyInputIsDataNotFound) {
    auto result = validate_bars({});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_NOT_FOUND);
}

TEST_F(BarValidationTest, FewerThanFiftyBarsIsInsufficient) {
    auto result = validate_bars(valid_bars(49));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSUFFICIENT_DATA);

    EXPECT_TRUE(validate_bars(valid_bars(10), 10).is_ok());
}

TEST_F(BarValidationTest, NonPositiveCloseIsInvalid) {
    auto bars = valid_bars();
    bars[20].close = 0.0;
    bars[20].low = -1.0;
    auto result = validate_bars(bars);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(BarValidationTest, NonFiniteValuesAreInvalid) {
    auto bars = valid_bars();
    bars[5].high = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(validate_bars(bars).error()->code(), ErrorCode::INVALID_DATA);

    bars = valid_bars();
    bars[5].volume = std::numeric_limits<double>::infinity();
    EXPECT_EQ(validate_bars(bars).error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(BarValidationTest, HighLowEnvelopeIsEnforced) {
    auto bars = valid_bars();
    bars[7].high = 99.5;
    EXPECT_TRUE(validate_bars(bars).is_error());

    bars = valid_bars();
    bars[7].low = 100.5;
    EXPECT_TRUE(validate_bars(bars).is_error());
}

TEST_F(BarValidationTest, NegativeVolumeIsInvalid) {
    auto bars = valid_bars();
    bars[3].volume = -5.0;
    EXPECT_EQ(validate_bars(bars).error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(BarValidationTest, TimestampsMustStrictlyIncrease) {
    auto bars = valid_bars();
    bars[10].timestamp = bars[9].timestamp;
    EXPECT_EQ(validate_bars(bars).error()->code(), ErrorCode::INVALID_DATA);

    bars = valid_bars();
    std::swap(bars[10].timestamp, bars[11].timestamp);
    EXPECT_EQ(validate_bars(bars).error()->code(), ErrorCode::INVALID_DATA);
}
