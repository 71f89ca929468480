// include/quant_ngin/indicators/indicators.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <vector>
#include "quant_ngin/core/config_base.hpp"
#include "quant_ngin/core/error.hpp"
#include "quant_ngin/core/types.hpp"

namespace quant_ngin {

/**
 * @brief Lookback settings for the technical indicators
 */
struct IndicatorConfig : public ConfigBase {
    int fast_ma_period{5};
    int slow_ma_period{20};
    int atr_period{14};
    int bollinger_period{20};
    double bollinger_std_dev{2.0};

    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Bollinger band triple, each aligned with the input series
 */
struct BollingerBands {
    std::vector<OptionalValue> upper;
    std::vector<OptionalValue> middle;
    std::vector<OptionalValue> lower;
};

/**
 * @brief All indicators for a bar series, aligned 1:1 with the bars
 */
struct IndicatorSeries {
    std::vector<OptionalValue> fast_ma;
    std::vector<OptionalValue> slow_ma;
    std::vector<OptionalValue> atr;
    std::vector<OptionalValue> bb_upper;
    std::vector<OptionalValue> bb_middle;
    std::vector<OptionalValue> bb_lower;

    size_t size() const {
        return fast_ma.size();
    }
};

namespace indicators {

/**
 * @brief Simple rolling mean
 * @return Series of the same length; empty before index period - 1
 */
std::vector<OptionalValue> moving_average(const std::vector<double>& series, int period);

/**
 * @brief Average True Range
 *
 * True range needs the previous close, so day 0 has none and the first
 * defined ATR is at index period.
 */
std::vector<OptionalValue> atr(const std::vector<double>& high, const std::vector<double>& low,
                               const std::vector<double>& close, int period);

/**
 * @brief Bollinger bands using the rolling sample standard deviation
 */
BollingerBands bollinger_bands(const std::vector<double>& close, int period,
                               double std_dev_multiplier);

/**
 * @brief Compute every indicator the strategy needs
 */
IndicatorSeries compute_all(const std::vector<Bar>& bars, const IndicatorConfig& config);

}  // namespace indicators
}  // namespace quant_ngin
