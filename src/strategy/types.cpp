// src/strategy/types.cpp
#include "quant_ngin/strategy/types.hpp"

namespace quant_ngin {

std::string signal_mode_to_string(SignalMode mode) {
    switch (mode) {
        case SignalMode::CROSSOVER:
            return "crossover";
        case SignalMode::TREND_FOLLOWING:
            return "trend_following";
        case SignalMode::MULTI_FACTOR:
            return "multi_factor";
        default:
            return "unknown";
    }
}

Result<SignalMode> signal_mode_from_string(const std::string& name) {
    if (name == "crossover")
        return SignalMode::CROSSOVER;
    if (name == "trend_following")
        return SignalMode::TREND_FOLLOWING;
    if (name == "multi_factor")
        return SignalMode::MULTI_FACTOR;
    return make_error<SignalMode>(ErrorCode::INVALID_ARGUMENT, "Unknown signal mode: " + name,
                                  "StrategyConfig");
}

std::string risk_event_to_string(RiskEvent event) {
    switch (event) {
        case RiskEvent::NONE:
            return "none";
        case RiskEvent::STOP_LOSS:
            return "stop_loss";
        case RiskEvent::TAKE_PROFIT:
            return "take_profit";
        case RiskEvent::DRAWDOWN_LIMIT:
            return "drawdown_limit";
        case RiskEvent::TRAILING_STOP:
            return "trailing_stop";
        default:
            return "unknown";
    }
}

Result<void> RiskConfig::validate() const {
    if (stop_loss_pct < 0.0 || take_profit_pct < 0.0 || max_drawdown_limit < 0.0 ||
        trailing_stop_pct < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Risk percentages must not be negative", "RiskConfig");
    }
    if (stop_loss_pct >= 1.0 || trailing_stop_pct >= 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Stop percentages must be below 100%", "RiskConfig");
    }
    return Result<void>();
}

nlohmann::json RiskConfig::to_json() const {
    nlohmann::json j;
    j["stop_loss_pct"] = stop_loss_pct;
    j["take_profit_pct"] = take_profit_pct;
    j["max_drawdown_limit"] = max_drawdown_limit;
    j["trailing_stop_enabled"] = trailing_stop_enabled;
    j["trailing_stop_pct"] = trailing_stop_pct;
    return j;
}

void RiskConfig::from_json(const nlohmann::json& j) {
    if (j.contains("stop_loss_pct"))
        stop_loss_pct = j.at("stop_loss_pct").get<double>();
    if (j.contains("take_profit_pct"))
        take_profit_pct = j.at("take_profit_pct").get<double>();
    if (j.contains("max_drawdown_limit"))
        max_drawdown_limit = j.at("max_drawdown_limit").get<double>();
    if (j.contains("trailing_stop_enabled"))
        trailing_stop_enabled = j.at("trailing_stop_enabled").get<bool>();
    if (j.contains("trailing_stop_pct"))
        trailing_stop_pct = j.at("trailing_stop_pct").get<double>();
}

Result<void> StrategyConfig::validate() const {
    auto indicator_result = indicators.validate();
    if (indicator_result.is_error())
        return indicator_result;

    auto risk_result = risk.validate();
    if (risk_result.is_error())
        return risk_result;

    return sizing.validate();
}

nlohmann::json StrategyConfig::to_json() const {
    nlohmann::json j;
    j["signal_mode"] = signal_mode_to_string(signal_mode);
    j["indicators"] = indicators.to_json();
    j["risk"] = risk.to_json();
    j["sizing"] = sizing.to_json();
    j["fundamentals"] = fundamentals.to_json();
    return j;
}

void StrategyConfig::from_json(const nlohmann::json& j) {
    if (j.contains("signal_mode")) {
        auto parsed = signal_mode_from_string(j.at("signal_mode").get<std::string>());
        if (parsed.is_error()) {
            throw *parsed.error();
        }
        signal_mode = parsed.value();
    }
    if (j.contains("indicators"))
        indicators.from_json(j.at("indicators"));
    if (j.contains("risk"))
        risk.from_json(j.at("risk"));
    if (j.contains("sizing"))
        sizing.from_json(j.at("sizing"));
    if (j.contains("fundamentals"))
        fundamentals.from_json(j.at("fundamentals"));
}

}  // namespace quant_ngin
