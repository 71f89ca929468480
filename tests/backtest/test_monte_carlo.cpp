#include <gtest/gtest.h>
#include <random>
#include "core/test_base.hpp"
#include "quant_ngin/backtest/monte_carlo.hpp"

using namespace quant_ngin;
using namespace quant_ngin::testing;

class MonteCarloTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        std::mt19937 gen(42);
        std::normal_distribution<> d(0.0005, 0.015);
        for (int i = 0; i < 300; ++i) {
            returns_.push_back(d(gen));
        }
        config_.enabled = true;
        config_.num_simulations = 200;
        config_.seed_base = 7;
    }

    std::vector<double> returns_;
    MonteCarloConfig config_;
};

TEST_F(MonteCarloTest, IdenticalInputsReproduceIdenticalStatistics) {
    auto first = MonteCarloResampler(config_).run(returns_);
    auto second = MonteCarloResampler(config_).run(returns_);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    EXPECT_EQ(first.value().terminal_returns, second.value().terminal_returns);
    EXPECT_DOUBLE_EQ(first.value().mean, second.value().mean);
    EXPECT_DOUBLE_EQ(first.value().std_dev, second.value().std_dev);
    EXPECT_DOUBLE_EQ(first.value().percentile_2_5, second.value().percentile_2_5);
    EXPECT_DOUBLE_EQ(first.value().percentile_97_5, second.value().percentile_97_5);
}

TEST_F(MonteCarloTest, WorkerCountDoesNotChangeOutcomes) {
    auto serial_config = config_;
    serial_config.max_workers = 1;
    auto wide_config = config_;
    wide_config.max_workers = 16;

    auto serial = MonteCarloResampler(serial_config).run(returns_);
    auto wide = MonteCarloResampler(wide_config).run(returns_);
    ASSERT_TRUE(serial.is_ok());
    ASSERT_TRUE(wide.is_ok());
    EXPECT_EQ(serial.value().terminal_returns, wide.value().terminal_returns);
}

TEST_F(MonteCarloTest, SimulationIsSeededPerIndex) {
    EXPECT_DOUBLE_EQ(MonteCarloResampler::simulate(returns_, 7),
                     MonteCarloResampler::simulate(returns_, 7));

    auto result = MonteCarloResampler(config_).run(returns_);
    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().terminal_returns[3],
                     MonteCarloResampler::simulate(returns_, config_.seed_base + 3));
}

TEST_F(MonteCarloTest, PermutationKeepsTerminalReturn) {
    double compounded = 1.0;
    for (double r : returns_) {
        compounded *= 1.0 + r;
    }
    EXPECT_NEAR(MonteCarloResampler::simulate(returns_, 123), compounded - 1.0, 1e-9);
}

TEST_F(MonteCarloTest, SummaryStatisticsAreConsistent) {
    auto result = MonteCarloResampler(config_).run(returns_);
    ASSERT_TRUE(result.is_ok());
    const auto& mc = result.value();

    EXPECT_EQ(mc.terminal_returns.size(), 200u);
    EXPECT_LE(mc.percentile_2_5, mc.mean + 1e-12);
    EXPECT_GE(mc.percentile_97_5, mc.mean - 1e-12);
    EXPECT_GE(mc.std_dev, 0.0);
    EXPECT_GE(mc.probability_positive, 0.0);
    EXPECT_LE(mc.probability_positive, 1.0);
    EXPECT_TRUE(mc.to_json().contains("percentile_97_5"));
}

TEST_F(MonteCarloTest, EmptyReturnsAreRejected) {
    auto result = MonteCarloResampler(config_).run({});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(MonteCarloTest, InvalidConfigIsRejected) {
    config_.num_simulations = 0;
    EXPECT_TRUE(MonteCarloResampler(config_).run(returns_).is_error());

    config_.num_simulations = 10;
    config_.max_workers = 0;
    EXPECT_TRUE(MonteCarloResampler(config_).run(returns_).is_error());
}
