// include/quant_ngin/strategy/fundamental_scorer.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "quant_ngin/core/config_base.hpp"
#include "quant_ngin/core/types.hpp"

namespace quant_ngin {

/**
 * @brief Fundamental thresholds, in the provider's native units
 */
struct FundamentalConfig : public ConfigBase {
    bool enabled{false};
    double min_roe{15.0};
    double min_revenue_growth{10.0};
    double min_profit_growth{15.0};
    double min_cash_flow{1.0};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Outcome of scoring one snapshot against the thresholds
 */
struct FundamentalAssessment {
    double roe_score{0.0};
    double growth_score{0.0};  // 1 only if revenue AND profit growth clear
    double cash_score{0.0};
    double score{0.0};        // Mean of the three sub-scores

    // Advisory hard filter: true if any metric is below its threshold
    bool excluded{false};
    std::vector<std::string> failed_metrics;
};

/**
 * @brief Score a fundamental snapshot
 *
 * The hard filter is advisory. It is reported and logged but never stops a
 * run on its own.
 */
FundamentalAssessment score_fundamentals(const FundamentalSnapshot& snapshot,
                                         const FundamentalConfig& config);

}  // namespace quant_ngin
