// src/backtest/return_accounting.cpp
#include "quant_ngin/backtest/return_accounting.hpp"
#include <cmath>
#include <cstdlib>

namespace quant_ngin {

Result<void> CostConfig::validate() const {
    if (commission_rate < 0.0 || slippage_rate < 0.0 || stamp_tax_rate < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Cost rates must not be negative",
                                "CostConfig");
    }
    return Result<void>();
}

nlohmann::json CostConfig::to_json() const {
    nlohmann::json j;
    j["commission_rate"] = commission_rate;
    j["slippage_rate"] = slippage_rate;
    j["stamp_tax_rate"] = stamp_tax_rate;
    return j;
}

void CostConfig::from_json(const nlohmann::json& j) {
    if (j.contains("commission_rate"))
        commission_rate = j.at("commission_rate").get<double>();
    if (j.contains("slippage_rate"))
        slippage_rate = j.at("slippage_rate").get<double>();
    if (j.contains("stamp_tax_rate"))
        stamp_tax_rate = j.at("stamp_tax_rate").get<double>();
}

std::vector<double> ReturnSeries::realized_returns() const {
    if (net_returns.size() < 2) {
        return {};
    }
    return std::vector<double>(net_returns.begin() + 1, net_returns.end());
}

Result<ReturnSeries> compute_returns(const std::vector<Bar>& bars,
                                     const std::vector<StrategyState>& states,
                                     const CostConfig& costs) {
    if (bars.size() != states.size()) {
        return make_error<ReturnSeries>(
            ErrorCode::INVALID_ARGUMENT,
            "State count " + std::to_string(states.size()) + " does not match bar count " +
                std::to_string(bars.size()),
            "ReturnAccounting");
    }

    const size_t n = bars.size();
    ReturnSeries series;
    series.market_returns.assign(n, std::nullopt);
    series.gross_returns.assign(n, 0.0);
    series.costs.assign(n, 0.0);
    series.net_returns.assign(n, 0.0);
    series.equity.assign(n, 1.0);

    for (size_t i = 1; i < n; ++i) {
        const double prev_close = bars[i - 1].close;
        if (prev_close <= 0.0 || !std::isfinite(prev_close)) {
            return make_error<ReturnSeries>(ErrorCode::INVALID_DATA,
                                            "Non-positive close before index " + std::to_string(i),
                                            "ReturnAccounting");
        }

        const double market = bars[i].close / prev_close - 1.0;
        series.market_returns[i] = market;

        const StrategyState& prev = states[i - 1];
        const StrategyState& today = states[i];
        series.gross_returns[i] = static_cast<double>(prev.signal) * market * prev.position;

        if (std::abs(today.signal - prev.signal) > 0) {
            series.costs[i] = costs.commission_rate + costs.slippage_rate +
                              costs.stamp_tax_rate * std::abs(today.signal);
            ++series.trade_count;
        }

        series.net_returns[i] = series.gross_returns[i] - series.costs[i];
        series.equity[i] = series.equity[i - 1] * (1.0 + series.net_returns[i]);
    }

    return series;
}

}  // namespace quant_ngin
