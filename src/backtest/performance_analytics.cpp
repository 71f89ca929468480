// src/backtest/performance_analytics.cpp
#include "quant_ngin/backtest/performance_analytics.hpp"
#include <algorithm>
#include <cmath>
#include "quant_ngin/statistics/statistics_tools.hpp"

namespace quant_ngin {

nlohmann::json PerformanceMetrics::to_json() const {
    nlohmann::json j;
    j["total_return"] = total_return;
    j["annualized_return"] = annualized_return;
    j["annualized_volatility"] = annualized_volatility;
    j["sharpe_ratio"] = sharpe_ratio;
    j["max_drawdown"] = max_drawdown;
    j["calmar_ratio"] = calmar_ratio;
    j["win_rate"] = win_rate;
    j["profit_loss_ratio"] = profit_loss_ratio;
    j["trade_count"] = trade_count;
    j["active_days"] = active_days;
    j["trading_days"] = trading_days;
    return j;
}

// ========== Return Calculations ==========

double PerformanceAnalytics::calculate_annualized_return(double final_equity,
                                                         int trading_days) const {
    if (trading_days <= 0) {
        return 0.0;
    }
    return (final_equity - 1.0) * TRADING_DAYS_PER_YEAR / static_cast<double>(trading_days);
}

// ========== Risk-Adjusted Return Metrics ==========

double PerformanceAnalytics::calculate_volatility(const std::vector<double>& returns) const {
    std::vector<double> log_returns;
    log_returns.reserve(returns.size());
    for (double r : returns) {
        const double lr = std::log1p(r);
        if (std::isfinite(lr)) {
            log_returns.push_back(lr);
        }
    }
    return statistics::sample_std_dev(log_returns) * std::sqrt(TRADING_DAYS_PER_YEAR);
}

double PerformanceAnalytics::calculate_sharpe_ratio(double annualized_return,
                                                    double annualized_volatility) const {
    if (annualized_volatility <= 0.0) {
        return 0.0;
    }
    return (annualized_return - RISK_FREE_RATE) / annualized_volatility;
}

double PerformanceAnalytics::calculate_calmar_ratio(double annualized_return,
                                                    double max_drawdown) const {
    if (max_drawdown == 0.0) {
        return 0.0;
    }
    return annualized_return / std::abs(max_drawdown);
}

// ========== Drawdown Metrics ==========

std::vector<double> PerformanceAnalytics::calculate_drawdowns(
    const std::vector<double>& equity) const {
    std::vector<double> drawdowns;
    drawdowns.reserve(equity.size());

    double peak = 0.0;
    for (double value : equity) {
        peak = std::max(peak, value);
        drawdowns.push_back(peak > 0.0 ? (value - peak) / peak : 0.0);
    }
    return drawdowns;
}

double PerformanceAnalytics::calculate_max_drawdown(const std::vector<double>& equity) const {
    const auto drawdowns = calculate_drawdowns(equity);
    if (drawdowns.empty()) {
        return 0.0;
    }
    return std::min(0.0, *std::min_element(drawdowns.begin(), drawdowns.end()));
}

// ========== Trade Statistics ==========

double PerformanceAnalytics::calculate_win_rate(const std::vector<double>& returns) const {
    int wins = 0;
    int active = 0;
    for (double r : returns) {
        if (r != 0.0) {
            ++active;
            if (r > 0.0) {
                ++wins;
            }
        }
    }
    return active > 0 ? static_cast<double>(wins) / active : 0.0;
}

double PerformanceAnalytics::calculate_profit_loss_ratio(const std::vector<double>& returns) const {
    std::vector<double> wins;
    std::vector<double> losses;
    for (double r : returns) {
        if (r > 0.0) {
            wins.push_back(r);
        } else if (r < 0.0) {
            losses.push_back(r);
        }
    }

    const double avg_win = wins.empty() ? 0.0 : statistics::mean(wins);
    const double avg_loss = losses.empty() ? 1.0 : std::abs(statistics::mean(losses));
    return avg_win / avg_loss;
}

PerformanceMetrics PerformanceAnalytics::compute(const ReturnSeries& series) const {
    PerformanceMetrics metrics;
    const std::vector<double> returns = series.realized_returns();

    metrics.trading_days = static_cast<int>(series.equity.size());
    metrics.total_return = series.total_return();
    metrics.annualized_return =
        calculate_annualized_return(metrics.total_return + 1.0, metrics.trading_days);
    metrics.annualized_volatility = calculate_volatility(returns);
    metrics.sharpe_ratio =
        calculate_sharpe_ratio(metrics.annualized_return, metrics.annualized_volatility);
    metrics.max_drawdown = calculate_max_drawdown(series.equity);
    metrics.calmar_ratio = calculate_calmar_ratio(metrics.annualized_return, metrics.max_drawdown);
    metrics.win_rate = calculate_win_rate(returns);
    metrics.profit_loss_ratio = calculate_profit_loss_ratio(returns);
    metrics.trade_count = series.trade_count;
    metrics.active_days = static_cast<int>(
        std::count_if(returns.begin(), returns.end(), [](double r) { return r != 0.0; }));

    return metrics;
}

}  // namespace quant_ngin
