// include/quant_ngin/strategy/signal_rules.hpp
#pragma once

#include <variant>
#include "quant_ngin/core/types.hpp"
#include "quant_ngin/strategy/types.hpp"

namespace quant_ngin {

/**
 * @brief What a signal rule asks the state machine to do today
 */
enum class SignalAction {
    ENTER,  // Open (or re-open) a long position at today's close
    CARRY,  // Keep yesterday's state
    EXIT    // Go flat
};

/**
 * @brief Inputs a signal rule sees for one day
 *
 * A moving average that is not defined yet makes every comparison that uses
 * it false.
 */
struct SignalContext {
    OptionalValue fast_ma;
    OptionalValue slow_ma;
    OptionalValue prev_fast_ma;
    OptionalValue prev_slow_ma;
    double composite_score{0.0};
    int prev_signal{0};
};

/**
 * @brief Buy on an upward MA cross, sell on a downward one
 */
struct CrossoverRule {
    static constexpr double MIN_COMPOSITE = 0.5;

    SignalAction decide(const SignalContext& ctx) const;
};

/**
 * @brief Stay long while the fast MA is above the slow MA
 */
struct TrendFollowingRule {
    static constexpr double MIN_COMPOSITE = 0.5;

    SignalAction decide(const SignalContext& ctx) const;
};

/**
 * @brief Enter on a strong composite score, exit on a weak one
 */
struct MultiFactorRule {
    static constexpr double ENTRY_THRESHOLD = 0.7;
    static constexpr double EXIT_THRESHOLD = 0.3;

    SignalAction decide(const SignalContext& ctx) const;
};

using SignalRule = std::variant<CrossoverRule, TrendFollowingRule, MultiFactorRule>;

SignalRule make_signal_rule(SignalMode mode);

SignalAction decide(const SignalRule& rule, const SignalContext& ctx);

}  // namespace quant_ngin
