// include/quant_ngin/strategy/position_sizing.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "quant_ngin/core/config_base.hpp"
#include "quant_ngin/core/error.hpp"

namespace quant_ngin {

/**
 * @brief Position sizing methods
 */
enum class SizingMethod {
    FIXED,       // Half of capital regardless of inputs
    KELLY,       // Clamped Kelly fraction of capital
    RISK_PARITY  // capital * risk_per_trade / avg_loss
};

std::string sizing_method_to_string(SizingMethod method);
Result<SizingMethod> sizing_method_from_string(const std::string& name);

/**
 * @brief Sizing inputs used whenever the strategy opens a position
 *
 * The trade statistics are assumptions supplied up front, not estimates
 * from the run itself.
 */
struct SizingConfig : public ConfigBase {
    SizingMethod method{SizingMethod::FIXED};
    double capital{1000000.0};
    double risk_per_trade{0.02};
    double max_position{0.5};  // Upper bound on the position fraction

    double win_rate{0.5};
    double avg_win{0.10};
    double avg_loss{0.05};

    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

namespace sizing {

constexpr double KELLY_FALLBACK = 0.1;
constexpr double KELLY_MIN = 0.1;
constexpr double KELLY_MAX = 0.9;
constexpr double FIXED_FRACTION = 0.5;

/**
 * @brief Kelly fraction clamped to [0.1, 0.9]
 *
 * Returns exactly 0.1 when avg_loss is zero (or avg_win is not positive)
 * instead of dividing by zero.
 */
double kelly_fraction(double win_rate, double avg_win, double avg_loss);

/**
 * @brief Currency amount to allocate for a new position
 *
 * Risk parity with a non-positive avg_loss allocates nothing.
 */
double position_amount(SizingMethod method, double win_rate, double avg_win, double avg_loss,
                       double risk_per_trade, double capital);

/**
 * @brief Position fraction in [0, max_position]
 *
 * Divides position_amount by capital and clamps. Non-positive capital or a
 * non-finite amount yields 0.
 */
double size_position(SizingMethod method, double win_rate, double avg_win, double avg_loss,
                     double risk_per_trade, double capital, double max_position);

double size_position(const SizingConfig& config);

}  // namespace sizing
}  // namespace quant_ngin
