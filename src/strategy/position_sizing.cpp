// src/strategy/position_sizing.cpp
#include "quant_ngin/strategy/position_sizing.hpp"
#include <algorithm>
#include <cmath>

namespace quant_ngin {

std::string sizing_method_to_string(SizingMethod method) {
    switch (method) {
        case SizingMethod::FIXED:
            return "fixed";
        case SizingMethod::KELLY:
            return "kelly";
        case SizingMethod::RISK_PARITY:
            return "risk_parity";
        default:
            return "unknown";
    }
}

Result<SizingMethod> sizing_method_from_string(const std::string& name) {
    if (name == "fixed")
        return SizingMethod::FIXED;
    if (name == "kelly")
        return SizingMethod::KELLY;
    if (name == "risk_parity")
        return SizingMethod::RISK_PARITY;
    return make_error<SizingMethod>(ErrorCode::INVALID_ARGUMENT,
                                    "Unknown sizing method: " + name, "SizingConfig");
}

Result<void> SizingConfig::validate() const {
    if (capital <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Capital must be positive",
                                "SizingConfig");
    }
    if (max_position <= 0.0 || max_position > 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Max position must be in (0, 1]", "SizingConfig");
    }
    if (risk_per_trade < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Risk per trade must not be negative", "SizingConfig");
    }
    if (win_rate < 0.0 || win_rate > 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Win rate must be in [0, 1]",
                                "SizingConfig");
    }
    if (avg_win < 0.0 || avg_loss < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Average win/loss must not be negative", "SizingConfig");
    }
    if (method == SizingMethod::RISK_PARITY && avg_loss <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Risk parity sizing requires a positive average loss",
                                "SizingConfig");
    }
    return Result<void>();
}

nlohmann::json SizingConfig::to_json() const {
    nlohmann::json j;
    j["method"] = sizing_method_to_string(method);
    j["capital"] = capital;
    j["risk_per_trade"] = risk_per_trade;
    j["max_position"] = max_position;
    j["win_rate"] = win_rate;
    j["avg_win"] = avg_win;
    j["avg_loss"] = avg_loss;
    return j;
}

void SizingConfig::from_json(const nlohmann::json& j) {
    if (j.contains("method")) {
        auto parsed = sizing_method_from_string(j.at("method").get<std::string>());
        if (parsed.is_error()) {
            throw *parsed.error();
        }
        method = parsed.value();
    }
    if (j.contains("capital"))
        capital = j.at("capital").get<double>();
    if (j.contains("risk_per_trade"))
        risk_per_trade = j.at("risk_per_trade").get<double>();
    if (j.contains("max_position"))
        max_position = j.at("max_position").get<double>();
    if (j.contains("win_rate"))
        win_rate = j.at("win_rate").get<double>();
    if (j.contains("avg_win"))
        avg_win = j.at("avg_win").get<double>();
    if (j.contains("avg_loss"))
        avg_loss = j.at("avg_loss").get<double>();
}

namespace sizing {

double kelly_fraction(double win_rate, double avg_win, double avg_loss) {
    if (avg_loss == 0.0 || avg_win <= 0.0) {
        return KELLY_FALLBACK;
    }
    const double kelly = (win_rate * avg_win - (1.0 - win_rate) * avg_loss) / avg_win;
    return std::max(KELLY_MIN, std::min(KELLY_MAX, kelly));
}

double position_amount(SizingMethod method, double win_rate, double avg_win, double avg_loss,
                       double risk_per_trade, double capital) {
    switch (method) {
        case SizingMethod::KELLY:
            return kelly_fraction(win_rate, avg_win, avg_loss) * capital;
        case SizingMethod::RISK_PARITY:
            if (avg_loss <= 0.0) {
                return 0.0;
            }
            return capital * risk_per_trade / avg_loss;
        case SizingMethod::FIXED:
        default:
            return FIXED_FRACTION * capital;
    }
}

double size_position(SizingMethod method, double win_rate, double avg_win, double avg_loss,
                     double risk_per_trade, double capital, double max_position) {
    if (capital <= 0.0 || max_position <= 0.0) {
        return 0.0;
    }
    const double amount =
        position_amount(method, win_rate, avg_win, avg_loss, risk_per_trade, capital);
    const double fraction = amount / capital;
    if (!std::isfinite(fraction)) {
        return 0.0;
    }
    return std::clamp(fraction, 0.0, max_position);
}

double size_position(const SizingConfig& config) {
    return size_position(config.method, config.win_rate, config.avg_win, config.avg_loss,
                         config.risk_per_trade, config.capital, config.max_position);
}

}  // namespace sizing
}  // namespace quant_ngin
