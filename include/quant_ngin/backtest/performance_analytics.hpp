// include/quant_ngin/backtest/performance_analytics.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <vector>
#include "quant_ngin/backtest/return_accounting.hpp"

namespace quant_ngin {

/**
 * @brief Scalar summary of one run
 */
struct PerformanceMetrics {
    double total_return{0.0};
    double annualized_return{0.0};
    double annualized_volatility{0.0};
    double sharpe_ratio{0.0};
    double max_drawdown{0.0};  // Always <= 0
    double calmar_ratio{0.0};
    double win_rate{0.0};
    double profit_loss_ratio{0.0};
    int trade_count{0};
    int active_days{0};   // Days with a non-zero net return
    int trading_days{0};  // Bars in the run, including the seed day

    nlohmann::json to_json() const;
};

/**
 * @brief Stateless calculator for run statistics
 *
 * Arithmetic guards fall back to documented values instead of failing:
 * Sharpe is 0 when volatility is 0, Calmar is 0 when there is no drawdown,
 * win rate is 0 with no active days, and an empty win or loss bucket
 * averages to 0 or 1 respectively in the profit/loss ratio.
 */
class PerformanceAnalytics {
public:
    static constexpr double TRADING_DAYS_PER_YEAR = 252.0;
    static constexpr double RISK_FREE_RATE = 0.03;

    PerformanceAnalytics() = default;

    // ========== Return Calculations ==========

    /**
     * @brief Linear annualization: (final_equity - 1) * 252 / days
     */
    double calculate_annualized_return(double final_equity, int trading_days) const;

    // ========== Risk-Adjusted Return Metrics ==========

    /**
     * @brief Annualized sample volatility of log returns
     */
    double calculate_volatility(const std::vector<double>& returns) const;

    double calculate_sharpe_ratio(double annualized_return, double annualized_volatility) const;

    double calculate_calmar_ratio(double annualized_return, double max_drawdown) const;

    // ========== Drawdown Metrics ==========

    /**
     * @brief Relative distance below the running equity peak, per day
     */
    std::vector<double> calculate_drawdowns(const std::vector<double>& equity) const;

    double calculate_max_drawdown(const std::vector<double>& equity) const;

    // ========== Trade Statistics ==========

    double calculate_win_rate(const std::vector<double>& returns) const;

    double calculate_profit_loss_ratio(const std::vector<double>& returns) const;

    /**
     * @brief Compute every metric for a return series
     */
    PerformanceMetrics compute(const ReturnSeries& series) const;
};

}  // namespace quant_ngin
