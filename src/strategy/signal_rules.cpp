// src/strategy/signal_rules.cpp
#include "quant_ngin/strategy/signal_rules.hpp"

namespace quant_ngin {

SignalAction CrossoverRule::decide(const SignalContext& ctx) const {
    if (!ctx.fast_ma || !ctx.slow_ma || !ctx.prev_fast_ma || !ctx.prev_slow_ma) {
        return SignalAction::CARRY;
    }

    const bool crossed_up = *ctx.prev_fast_ma <= *ctx.prev_slow_ma && *ctx.fast_ma > *ctx.slow_ma;
    const bool crossed_down =
        *ctx.prev_fast_ma >= *ctx.prev_slow_ma && *ctx.fast_ma < *ctx.slow_ma;

    if (crossed_up && ctx.composite_score >= MIN_COMPOSITE) {
        return SignalAction::ENTER;
    }
    if (crossed_down) {
        return SignalAction::EXIT;
    }
    return SignalAction::CARRY;
}

SignalAction TrendFollowingRule::decide(const SignalContext& ctx) const {
    const bool uptrend = ctx.fast_ma && ctx.slow_ma && *ctx.fast_ma > *ctx.slow_ma;

    if (uptrend && ctx.composite_score >= MIN_COMPOSITE) {
        return ctx.prev_signal == 0 ? SignalAction::ENTER : SignalAction::CARRY;
    }
    return SignalAction::EXIT;
}

SignalAction MultiFactorRule::decide(const SignalContext& ctx) const {
    if (ctx.composite_score >= ENTRY_THRESHOLD) {
        return ctx.prev_signal == 0 ? SignalAction::ENTER : SignalAction::CARRY;
    }
    if (ctx.composite_score <= EXIT_THRESHOLD) {
        return SignalAction::EXIT;
    }
    return SignalAction::CARRY;
}

SignalRule make_signal_rule(SignalMode mode) {
    switch (mode) {
        case SignalMode::TREND_FOLLOWING:
            return TrendFollowingRule{};
        case SignalMode::MULTI_FACTOR:
            return MultiFactorRule{};
        case SignalMode::CROSSOVER:
        default:
            return CrossoverRule{};
    }
}

SignalAction decide(const SignalRule& rule, const SignalContext& ctx) {
    return std::visit([&ctx](const auto& r) { return r.decide(ctx); }, rule);
}

}  // namespace quant_ngin
