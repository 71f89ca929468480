// src/strategy/strategy_state_machine.cpp
#include "quant_ngin/strategy/strategy_state_machine.hpp"
#include <algorithm>
#include <utility>
#include "quant_ngin/core/logger.hpp"
#include "quant_ngin/core/time_utils.hpp"
#include "quant_ngin/strategy/position_sizing.hpp"

namespace quant_ngin {

StrategyStateMachine::StrategyStateMachine(StrategyConfig config)
    : config_(std::move(config)),
      rule_(make_signal_rule(config_.signal_mode)),
      entry_fraction_(sizing::size_position(config_.sizing)) {}

DayInputs StrategyStateMachine::gather_inputs(const std::vector<Bar>& bars,
                                              const IndicatorSeries& indicators, size_t index) {
    DayInputs in;
    in.index = index;
    in.timestamp = bars[index].timestamp;
    in.close = bars[index].close;

    in.fast_ma = indicators.fast_ma[index];
    in.slow_ma = indicators.slow_ma[index];
    if (index > 0) {
        in.prev_fast_ma = indicators.fast_ma[index - 1];
        in.prev_slow_ma = indicators.slow_ma[index - 1];
    }

    in.atr = indicators.atr[index];
    if (index >= ATR_LOOKBACK) {
        double sum = 0.0;
        size_t count = 0;
        for (size_t k = index - ATR_LOOKBACK; k < index; ++k) {
            if (indicators.atr[k]) {
                sum += *indicators.atr[k];
                ++count;
            }
        }
        if (count > 0) {
            in.atr_baseline = sum / static_cast<double>(count);
        }
    }

    in.bb_upper = indicators.bb_upper[index];
    in.bb_lower = indicators.bb_lower[index];
    return in;
}

double StrategyStateMachine::technical_score(const DayInputs& today) {
    const double ma_score = (today.fast_ma && today.slow_ma && *today.fast_ma > *today.slow_ma)
                                ? 1.0
                                : 0.0;
    const double bb_score = (today.bb_lower && today.bb_upper && *today.bb_lower < today.close &&
                             today.close < *today.bb_upper)
                                ? 1.0
                                : 0.0;
    const double atr_score =
        (today.atr && today.atr_baseline && *today.atr > *today.atr_baseline) ? 1.0 : 0.0;

    return (ma_score + bb_score + atr_score) / 3.0;
}

double StrategyStateMachine::composite_score(double technical, double fundamental) const {
    if (config_.signal_mode == SignalMode::MULTI_FACTOR) {
        return TECHNICAL_WEIGHT * technical + FUNDAMENTAL_WEIGHT * fundamental;
    }
    return technical;
}

StrategyState StrategyStateMachine::enter(const StrategyState& scores, double close) const {
    StrategyState state = scores;
    state.signal = 1;
    state.position = entry_fraction_;
    state.entry_price = close;
    state.stop_loss = close * (1.0 - config_.risk.stop_loss_pct);
    state.take_profit = close * (1.0 + config_.risk.take_profit_pct);
    state.trailing_stop =
        config_.risk.trailing_stop_enabled ? close * (1.0 - config_.risk.trailing_stop_pct) : 0.0;
    return state;
}

RiskEvent StrategyStateMachine::check_risk(const StrategyState& prev, double close,
                                           double& trailing_level) const {
    const RiskConfig& risk = config_.risk;

    if (risk.trailing_stop_enabled) {
        trailing_level = std::max(prev.trailing_stop, close * (1.0 - risk.trailing_stop_pct));
        if (close <= trailing_level) {
            return RiskEvent::TRAILING_STOP;
        }
    } else {
        if (close <= prev.stop_loss) {
            return RiskEvent::STOP_LOSS;
        }
        if (close >= prev.take_profit) {
            return RiskEvent::TAKE_PROFIT;
        }
    }

    if (close / prev.entry_price - 1.0 <= -risk.max_drawdown_limit) {
        return RiskEvent::DRAWDOWN_LIMIT;
    }
    return RiskEvent::NONE;
}

StrategyState StrategyStateMachine::step(const StrategyState& prev, const DayInputs& today,
                                         double fundamental_score) const {
    StrategyState scores;
    scores.technical_score = technical_score(today);
    scores.fundamental_score = fundamental_score;
    scores.composite_score = composite_score(scores.technical_score, fundamental_score);

    // Yesterday's levels, with the trailing stop ratcheted if today's check moved it
    StrategyState carried = prev;
    carried.risk_event = RiskEvent::NONE;
    carried.technical_score = scores.technical_score;
    carried.fundamental_score = scores.fundamental_score;
    carried.composite_score = scores.composite_score;

    if (prev.position > 0.0 && prev.entry_price > 0.0) {
        double trailing_level = prev.trailing_stop;
        const RiskEvent event = check_risk(prev, today.close, trailing_level);
        if (event != RiskEvent::NONE) {
            StrategyState flat = scores;
            flat.risk_event = event;
            DEBUG("Risk exit " << risk_event_to_string(event) << " on "
                               << core::format_date(today.timestamp) << " at " << today.close
                               << " (entry " << prev.entry_price << ")");
            return flat;
        }
        carried.trailing_stop = trailing_level;
    }

    SignalContext ctx;
    ctx.fast_ma = today.fast_ma;
    ctx.slow_ma = today.slow_ma;
    ctx.prev_fast_ma = today.prev_fast_ma;
    ctx.prev_slow_ma = today.prev_slow_ma;
    ctx.composite_score = scores.composite_score;
    ctx.prev_signal = prev.signal;

    switch (decide(rule_, ctx)) {
        case SignalAction::ENTER:
            return enter(scores, today.close);
        case SignalAction::EXIT:
            return scores;
        case SignalAction::CARRY:
        default:
            return carried;
    }
}

Result<std::vector<StrategyState>> StrategyStateMachine::run(const std::vector<Bar>& bars,
                                                             const IndicatorSeries& indicators,
                                                             double fundamental_score) const {
    auto valid = config_.validate();
    if (valid.is_error()) {
        return forward_error<std::vector<StrategyState>>(valid, "StrategyStateMachine");
    }

    if (indicators.fast_ma.size() != bars.size() || indicators.slow_ma.size() != bars.size() ||
        indicators.atr.size() != bars.size() || indicators.bb_upper.size() != bars.size() ||
        indicators.bb_lower.size() != bars.size()) {
        return make_error<std::vector<StrategyState>>(
            ErrorCode::INVALID_ARGUMENT, "Indicator series are not aligned with the bars",
            "StrategyStateMachine");
    }

    std::vector<StrategyState> states;
    if (bars.empty()) {
        return states;
    }

    states.reserve(bars.size());
    states.emplace_back();

    for (size_t i = 1; i < bars.size(); ++i) {
        states.push_back(step(states.back(), gather_inputs(bars, indicators, i), fundamental_score));
    }

    return states;
}

}  // namespace quant_ngin
