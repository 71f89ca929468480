// include/quant_ngin/strategy/strategy_state_machine.hpp
#pragma once

#include <vector>
#include "quant_ngin/core/error.hpp"
#include "quant_ngin/core/types.hpp"
#include "quant_ngin/indicators/indicators.hpp"
#include "quant_ngin/strategy/signal_rules.hpp"
#include "quant_ngin/strategy/types.hpp"

namespace quant_ngin {

/**
 * @brief Everything the transition function reads for one day
 */
struct DayInputs {
    size_t index{0};
    Timestamp timestamp;
    double close{0.0};

    OptionalValue fast_ma;
    OptionalValue slow_ma;
    OptionalValue prev_fast_ma;
    OptionalValue prev_slow_ma;

    OptionalValue atr;
    OptionalValue atr_baseline;  // Mean ATR over the previous 20 days

    OptionalValue bb_upper;
    OptionalValue bb_lower;
};

/**
 * @brief Day-by-day fold from bars and indicators to strategy states
 *
 * Each day's record is computed from the previous record and today's inputs
 * only. Risk exits are checked before any new signal and the first one that
 * matches wins:
 *   1. trailing stop if enabled, otherwise stop-loss then take-profit
 *   2. drawdown limit since entry, only if step 1 did not fire
 */
class StrategyStateMachine {
public:
    static constexpr size_t ATR_LOOKBACK = 20;
    static constexpr double NEUTRAL_FUNDAMENTAL_SCORE = 0.5;
    static constexpr double TECHNICAL_WEIGHT = 0.6;
    static constexpr double FUNDAMENTAL_WEIGHT = 0.4;

    explicit StrategyStateMachine(StrategyConfig config);

    const StrategyConfig& config() const {
        return config_;
    }

    /**
     * @brief Position fraction used for every new entry
     */
    double entry_fraction() const {
        return entry_fraction_;
    }

    /**
     * @brief Collect the inputs for day i
     * @param index Day index, at least 1
     */
    static DayInputs gather_inputs(const std::vector<Bar>& bars, const IndicatorSeries& indicators,
                                   size_t index);

    /**
     * @brief Mean of the MA, Bollinger and ATR sub-scores
     */
    static double technical_score(const DayInputs& today);

    double composite_score(double technical, double fundamental) const;

    /**
     * @brief Advance one day
     * @param prev Yesterday's record
     * @param today Today's inputs
     * @param fundamental_score Score applied to every day of the run
     */
    StrategyState step(const StrategyState& prev, const DayInputs& today,
                       double fundamental_score) const;

    /**
     * @brief Fold the whole series, starting from the all-flat seed on day 0
     * @return One record per bar
     */
    Result<std::vector<StrategyState>> run(const std::vector<Bar>& bars,
                                           const IndicatorSeries& indicators,
                                           double fundamental_score) const;

private:
    StrategyConfig config_;
    SignalRule rule_;
    double entry_fraction_{0.0};

    StrategyState enter(const StrategyState& scores, double close) const;
    RiskEvent check_risk(const StrategyState& prev, double close, double& trailing_level) const;
};

}  // namespace quant_ngin
