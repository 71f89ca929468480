//===== test_base.hpp =====
#pragma once

#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <vector>
#include "quant_ngin/core/logger.hpp"
#include "quant_ngin/core/time_utils.hpp"
#include "quant_ngin/core/types.hpp"

namespace quant_ngin {
namespace testing {

class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        LoggerConfig config;
        config.min_level = LogLevel::WARNING;
        config.destination = LogDestination::CONSOLE;
        Logger::instance().initialize(config);
    }

    void TearDown() override {
        Logger::reset_for_tests();
    }
};

/**
 * @brief Consecutive daily bars with high = close + 1 and low = close - 1
 */
inline std::vector<Bar> make_bars(const std::vector<double>& closes,
                                  const std::string& symbol = "TEST",
                                  Timestamp first_day = core::make_date(2023, 1, 2)) {
    std::vector<Bar> bars;
    bars.reserve(closes.size());
    for (size_t i = 0; i < closes.size(); ++i) {
        const Timestamp ts = first_day + std::chrono::hours(24 * static_cast<int64_t>(i));
        bars.emplace_back(ts, closes[i], closes[i] + 1.0, closes[i] - 1.0, closes[i], 1000.0,
                          symbol);
    }
    return bars;
}

/**
 * @brief 30 flat closes at 100 followed by rise_days closes rising by 2 per day
 *
 * With the default indicator periods the fast MA crosses above the slow MA on
 * day 30 with a composite score of 2/3.
 */
inline std::vector<double> flat_then_rising(size_t rise_days = 40) {
    std::vector<double> closes(30, 100.0);
    for (size_t k = 1; k <= rise_days; ++k) {
        closes.push_back(100.0 + 2.0 * static_cast<double>(k));
    }
    return closes;
}

}  // namespace testing
}  // namespace quant_ngin
