#include <gtest/gtest.h>
#include "quant_ngin/strategy/fundamental_scorer.hpp"

using namespace quant_ngin;

class FundamentalScorerTest : public ::testing::Test {
protected:
    FundamentalConfig config_;
};

TEST_F(FundamentalScorerTest, DefaultSnapshotPassesDefaultThresholds) {
    FundamentalSnapshot snapshot;
    auto assessment = score_fundamentals(snapshot, config_);
    EXPECT_DOUBLE_EQ(assessment.score, 1.0);
    EXPECT_FALSE(assessment.excluded);
    EXPECT_TRUE(assessment.failed_metrics.empty());
}

TEST_F(FundamentalScorerTest, GrowthNeedsBothRevenueAndProfit) {
    FundamentalSnapshot snapshot;
    snapshot.profit_growth = 5.0;
    auto assessment = score_fundamentals(snapshot, config_);
    EXPECT_DOUBLE_EQ(assessment.roe_score, 1.0);
    EXPECT_DOUBLE_EQ(assessment.growth_score, 0.0);
    EXPECT_DOUBLE_EQ(assessment.cash_score, 1.0);
    EXPECT_NEAR(assessment.score, 2.0 / 3.0, 1e-12);
    EXPECT_TRUE(assessment.excluded);
    ASSERT_EQ(assessment.failed_metrics.size(), 1u);
    EXPECT_NE(assessment.failed_metrics[0].find("profit growth"), std::string::npos);
}

TEST_F(FundamentalScorerTest, EveryFailingMetricIsReported) {
    FundamentalSnapshot snapshot;
    snapshot.roe = 3.0;
    snapshot.revenue_growth = -2.0;
    snapshot.profit_growth = -8.0;
    snapshot.cash_flow = 0.2;
    auto assessment = score_fundamentals(snapshot, config_);
    EXPECT_DOUBLE_EQ(assessment.score, 0.0);
    EXPECT_EQ(assessment.failed_metrics.size(), 4u);
}

TEST_F(FundamentalScorerTest, ThresholdsAreInclusive) {
    FundamentalSnapshot snapshot;
    snapshot.roe = config_.min_roe;
    snapshot.cash_flow = config_.min_cash_flow;
    EXPECT_FALSE(score_fundamentals(snapshot, config_).excluded);
}

TEST_F(FundamentalScorerTest, ConfigJsonKeepsUnsetThresholds) {
    config_.from_json({{"enabled", true}, {"min_roe", 20.0}});
    EXPECT_TRUE(config_.enabled);
    EXPECT_DOUBLE_EQ(config_.min_roe, 20.0);
    EXPECT_DOUBLE_EQ(config_.min_cash_flow, 1.0);
}
