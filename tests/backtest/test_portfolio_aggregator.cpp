#include <gtest/gtest.h>
#include <cmath>
#include "core/test_base.hpp"
#include "data/mock_data_provider.hpp"
#include "quant_ngin/backtest/portfolio_aggregator.hpp"

using namespace quant_ngin;
using namespace quant_ngin::backtest;
using namespace quant_ngin::testing;

class PortfolioAggregatorTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        start_ = core::make_date(2023, 1, 1);
        end_ = core::make_date(2023, 12, 31);
    }

    // 30 flat days then `days` closes moving by `step` per day
    static std::vector<double> trend(double step, size_t days = 40) {
        std::vector<double> closes(30, 100.0);
        for (size_t k = 1; k <= days; ++k) {
            closes.push_back(100.0 + step * static_cast<double>(k));
        }
        return closes;
    }

    PortfolioAggregator aggregator_{5, 20, 1.0, 50};
    Timestamp start_;
    Timestamp end_;
};

TEST_F(PortfolioAggregatorTest, EvaluateUsesLaggedSignal) {
    auto bars = make_bars(trend(2.0));
    auto perf = aggregator_.evaluate("UP", bars);
    ASSERT_TRUE(perf.is_ok());

    // Signal turns on at day 30, so returns are earned from day 31 onward
    const double expected = bars.back().close / bars[30].close - 1.0;
    EXPECT_NEAR(perf.value().total_return, expected, 1e-9);
    EXPECT_NEAR(perf.value().annualized_return, expected, 1e-9);
    EXPECT_EQ(perf.value().bar_count, bars.size());
}

TEST_F(PortfolioAggregatorTest, EvaluateAnnualizesOverConfiguredYears) {
    PortfolioAggregator two_years(5, 20, 2.0, 50);
    auto perf = two_years.evaluate("UP", make_bars(trend(2.0)));
    ASSERT_TRUE(perf.is_ok());
    const double total = perf.value().total_return;
    EXPECT_NEAR(perf.value().annualized_return, std::sqrt(1.0 + total) - 1.0, 1e-12);
}

TEST_F(PortfolioAggregatorTest, EvaluateRejectsShortHistory) {
    auto perf = aggregator_.evaluate("SHORT", make_bars(std::vector<double>(20, 10.0)));
    ASSERT_TRUE(perf.is_error());
    EXPECT_EQ(perf.error()->code(), ErrorCode::INSUFFICIENT_DATA);
}

TEST_F(PortfolioAggregatorTest, SummarizeRanksAndComputesStatistics) {
    std::vector<SymbolPerformance> perfs{{"A", 0.1, 0.10, 100},
                                         {"B", 0.3, 0.30, 100},
                                         {"C", 0.2, 0.20, 100}};
    auto result = PortfolioAggregator::summarize(perfs, {});

    ASSERT_EQ(result.rankings.size(), 3u);
    EXPECT_EQ(result.rankings[0].symbol, "B");
    EXPECT_EQ(result.rankings[1].symbol, "C");
    EXPECT_EQ(result.rankings[2].symbol, "A");
    EXPECT_NEAR(result.mean_annualized_return, 0.2, 1e-12);
    EXPECT_NEAR(result.std_annualized_return, 0.1, 1e-12);
    EXPECT_NEAR(result.sharpe_ratio, 2.0, 1e-9);
}

TEST_F(PortfolioAggregatorTest, SummarizeSingleSymbolHasZeroSharpe) {
    auto result = PortfolioAggregator::summarize({{"A", 0.1, 0.1, 60}}, {});
    EXPECT_DOUBLE_EQ(result.std_annualized_return, 0.0);
    EXPECT_DOUBLE_EQ(result.sharpe_ratio, 0.0);
}

TEST_F(PortfolioAggregatorTest, FailingSymbolIsExcludedNotFatal) {
    MockDataProvider provider;
    provider.set_bars("UP", make_bars(trend(2.0), "UP"));
    provider.set_bars("SLOW", make_bars(trend(0.5), "SLOW"));
    provider.set_bars("SHORT", make_bars(std::vector<double>(10, 5.0), "SHORT"));
    provider.fail_symbol("DOWN", ErrorCode::CONNECTION_ERROR);

    auto result = aggregator_.run(provider, {"SLOW", "DOWN", "UP", "SHORT", "NONE"}, start_, end_);

    ASSERT_EQ(result.rankings.size(), 2u);
    EXPECT_EQ(result.rankings[0].symbol, "UP");
    EXPECT_EQ(result.rankings[1].symbol, "SLOW");

    ASSERT_EQ(result.excluded.size(), 3u);
    EXPECT_EQ(result.excluded[0].symbol, "DOWN");
    EXPECT_EQ(result.excluded[1].symbol, "SHORT");
    EXPECT_EQ(result.excluded[2].symbol, "NONE");
    EXPECT_EQ(provider.bar_calls(), 5);
}

TEST_F(PortfolioAggregatorTest, ResultSerializesRankings) {
    auto result = PortfolioAggregator::summarize({{"A", 0.1, 0.1, 60}}, {{"B", "no data"}});
    auto j = result.to_json();
    ASSERT_EQ(j["rankings"].size(), 1u);
    EXPECT_EQ(j["rankings"][0]["symbol"], "A");
    EXPECT_EQ(j["excluded"][0]["reason"], "no data");
}
