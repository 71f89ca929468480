#include <gtest/gtest.h>
#include <memory>
#include "core/test_base.hpp"
#include "data/mock_data_provider.hpp"
#include "quant_ngin/data/retrying_data_provider.hpp"

using namespace quant_ngin;
using namespace quant_ngin::testing;

class RetryingDataProviderTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        config_.max_retries = 3;
        config_.base_delay = std::chrono::milliseconds(0);
        primary_ = std::make_shared<MockDataProvider>("primary");
        fallback_ = std::make_shared<MockDataProvider>("fallback");
        start_ = core::make_date(2023, 1, 1);
        end_ = core::make_date(2023, 12, 31);
    }

    RetryingDataProvider make_provider() {
        return RetryingDataProvider({primary_, fallback_}, config_);
    }

    RetryConfig config_;
    std::shared_ptr<MockDataProvider> primary_;
    std::shared_ptr<MockDataProvider> fallback_;
    Timestamp start_;
    Timestamp end_;
};

TEST_F(RetryingDataProviderTest, FirstProviderAnswersDirectly) {
    primary_->set_bars("A", make_bars({1.0, 2.0}, "A"));
    auto provider = make_provider();

    auto bars = provider.get_bars("A", start_, end_);
    ASSERT_TRUE(bars.is_ok());
    EXPECT_EQ(bars.value().size(), 2u);
    EXPECT_EQ(primary_->bar_calls(), 1);
    EXPECT_EQ(fallback_->bar_calls(), 0);
}

TEST_F(RetryingDataProviderTest, TransientFailureIsRetried) {
    primary_->set_bars("A", make_bars({1.0, 2.0}, "A"));
    primary_->fail_first_calls(2);
    auto provider = make_provider();

    auto bars = provider.get_bars("A", start_, end_);
    ASSERT_TRUE(bars.is_ok());
    EXPECT_EQ(primary_->bar_calls(), 3);
    EXPECT_EQ(fallback_->bar_calls(), 0);
}

TEST_F(RetryingDataProviderTest, FallsBackAfterExhaustingRetries) {
    primary_->fail_symbol("A", ErrorCode::CONNECTION_ERROR);
    fallback_->set_bars("A", make_bars({1.0, 2.0, 3.0}, "A"));
    auto provider = make_provider();

    auto bars = provider.get_bars("A", start_, end_);
    ASSERT_TRUE(bars.is_ok());
    EXPECT_EQ(bars.value().size(), 3u);
    EXPECT_EQ(primary_->bar_calls(), 3);
    EXPECT_EQ(fallback_->bar_calls(), 1);
}

TEST_F(RetryingDataProviderTest, EmptyResultCountsAsFailure) {
    primary_->set_bars("A", {});
    auto provider = make_provider();

    auto bars = provider.get_bars("A", start_, end_);
    ASSERT_TRUE(bars.is_error());
    EXPECT_EQ(bars.error()->code(), ErrorCode::DATA_NOT_FOUND);
    EXPECT_EQ(primary_->bar_calls(), 3);
    EXPECT_EQ(fallback_->bar_calls(), 3);
}

TEST_F(RetryingDataProviderTest, LastErrorIsReported) {
    primary_->fail_symbol("A", ErrorCode::PROVIDER_ERROR);
    fallback_->fail_symbol("A", ErrorCode::CONNECTION_ERROR);
    auto provider = make_provider();

    auto bars = provider.get_bars("A", start_, end_);
    ASSERT_TRUE(bars.is_error());
    EXPECT_EQ(bars.error()->code(), ErrorCode::CONNECTION_ERROR);
}

TEST_F(RetryingDataProviderTest, BenchmarkUsesSameRetryPolicy) {
    fallback_->set_benchmark("000300", {{core::make_date(2023, 1, 3), 3000.0}});
    auto provider = make_provider();

    auto points = provider.get_benchmark("000300", start_, end_);
    ASSERT_TRUE(points.is_ok());
    EXPECT_EQ(primary_->benchmark_calls(), 3);
    EXPECT_EQ(fallback_->benchmark_calls(), 1);
}

TEST_F(RetryingDataProviderTest, FundamentalsPreferFirstRealSnapshot) {
    FundamentalSnapshot real;
    real.roe = 25.0;
    real.is_default = false;
    fallback_->set_fundamentals("A", real);
    auto provider = make_provider();

    auto snapshot = provider.get_fundamentals("A");
    EXPECT_FALSE(snapshot.is_default);
    EXPECT_DOUBLE_EQ(snapshot.roe, 25.0);

    EXPECT_TRUE(provider.get_fundamentals("B").is_default);
}

TEST_F(RetryingDataProviderTest, NoProvidersIsNotInitialized) {
    RetryingDataProvider provider({}, config_);
    auto bars = provider.get_bars("A", start_, end_);
    ASSERT_TRUE(bars.is_error());
    EXPECT_EQ(bars.error()->code(), ErrorCode::NOT_INITIALIZED);
}

TEST_F(RetryingDataProviderTest, RetryConfigJsonUsesMilliseconds) {
    RetryConfig config;
    config.from_json({{"max_retries", 5}, {"base_delay_ms", 250}});
    EXPECT_EQ(config.max_retries, 5);
    EXPECT_EQ(config.base_delay, std::chrono::milliseconds(250));
}

TEST_F(RetryingDataProviderTest, ZeroRetriesIsRejectedWithoutCallingProviders) {
    primary_->set_bars("A", make_bars({1.0, 2.0}, "A"));
    config_.max_retries = 0;
    auto provider = make_provider();

    auto bars = provider.get_bars("A", start_, end_);
    ASSERT_TRUE(bars.is_error());
    EXPECT_EQ(bars.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(bars.error()->component(), "RetryConfig");
    EXPECT_EQ(primary_->bar_calls(), 0);
}

TEST_F(RetryingDataProviderTest, RetryConfigBounds) {
    RetryConfig config;
    EXPECT_TRUE(config.validate().is_ok());

    config.max_retries = RetryConfig::MAX_RETRIES_LIMIT;
    EXPECT_TRUE(config.validate().is_ok());

    config.max_retries = RetryConfig::MAX_RETRIES_LIMIT + 1;
    EXPECT_TRUE(config.validate().is_error());

    config.max_retries = -1;
    EXPECT_TRUE(config.validate().is_error());

    config.max_retries = 3;
    config.base_delay = std::chrono::milliseconds(-5);
    auto result = config.validate();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}
