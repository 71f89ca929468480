// include/quant_ngin/strategy/types.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "quant_ngin/core/config_base.hpp"
#include "quant_ngin/core/error.hpp"
#include "quant_ngin/core/types.hpp"
#include "quant_ngin/indicators/indicators.hpp"
#include "quant_ngin/strategy/fundamental_scorer.hpp"
#include "quant_ngin/strategy/position_sizing.hpp"

namespace quant_ngin {

/**
 * @brief How new entries and exits are generated
 */
enum class SignalMode {
    CROSSOVER,        // Fast/slow moving average crosses
    TREND_FOLLOWING,  // Long while fast MA is above slow MA
    MULTI_FACTOR      // Composite score bands with a dead zone
};

std::string signal_mode_to_string(SignalMode mode);
Result<SignalMode> signal_mode_from_string(const std::string& name);

/**
 * @brief Exit reason recorded on the day a risk rule forces the position flat
 */
enum class RiskEvent {
    NONE = 0,
    STOP_LOSS = 1,
    TAKE_PROFIT = 2,
    DRAWDOWN_LIMIT = 3,
    TRAILING_STOP = 4
};

std::string risk_event_to_string(RiskEvent event);

/**
 * @brief Risk overlay parameters, as fractions of the entry price
 */
struct RiskConfig : public ConfigBase {
    double stop_loss_pct{0.10};
    double take_profit_pct{0.30};
    double max_drawdown_limit{0.20};  // Loss since entry that forces an exit
    bool trailing_stop_enabled{false};
    double trailing_stop_pct{0.10};

    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Immutable configuration of one strategy run
 */
struct StrategyConfig : public ConfigBase {
    SignalMode signal_mode{SignalMode::CROSSOVER};
    IndicatorConfig indicators;
    RiskConfig risk;
    SizingConfig sizing;
    FundamentalConfig fundamentals;

    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Strategy outcome for a single day
 *
 * One record per bar. Day 0 is the all-flat seed. A flat record carries
 * zero price levels.
 */
struct StrategyState {
    int signal{0};          // 0 = flat, 1 = long
    double position{0.0};   // Fraction of capital in [0, max_position]
    double entry_price{0.0};
    double stop_loss{0.0};
    double take_profit{0.0};
    double trailing_stop{0.0};
    RiskEvent risk_event{RiskEvent::NONE};

    double technical_score{0.0};
    double fundamental_score{0.0};
    double composite_score{0.0};

    bool is_long() const {
        return signal == 1;
    }
};

}  // namespace quant_ngin
