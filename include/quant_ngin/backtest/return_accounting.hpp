// include/quant_ngin/backtest/return_accounting.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <vector>
#include "quant_ngin/core/config_base.hpp"
#include "quant_ngin/core/error.hpp"
#include "quant_ngin/core/types.hpp"
#include "quant_ngin/strategy/types.hpp"

namespace quant_ngin {

/**
 * @brief Per-trade cost rates, as fractions of traded notional
 */
struct CostConfig : public ConfigBase {
    double commission_rate{0.001};
    double slippage_rate{0.0005};
    double stamp_tax_rate{0.001};  // Charged on |signal| after the change

    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Daily strategy returns and the equity curve they compound into
 *
 * All vectors are aligned with the bars. Index 0 is the seed day: no market
 * return, zero strategy return and equity of exactly 1.0.
 */
struct ReturnSeries {
    std::vector<OptionalValue> market_returns;  // close[i] / close[i-1] - 1
    std::vector<double> gross_returns;
    std::vector<double> costs;
    std::vector<double> net_returns;
    std::vector<double> equity;
    int trade_count{0};  // Days on which the signal changed

    double total_return() const {
        return equity.empty() ? 0.0 : equity.back() - 1.0;
    }

    /**
     * @brief Net returns without the seed day
     */
    std::vector<double> realized_returns() const;
};

/**
 * @brief Turn the signal sequence into net returns and equity
 *
 * Today's return is earned with yesterday's signal and position. Costs are
 * charged only on days the signal changes.
 */
Result<ReturnSeries> compute_returns(const std::vector<Bar>& bars,
                                     const std::vector<StrategyState>& states,
                                     const CostConfig& costs);

}  // namespace quant_ngin
