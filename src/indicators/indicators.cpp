// src/indicators/indicators.cpp
#include "quant_ngin/indicators/indicators.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace quant_ngin {

Result<void> IndicatorConfig::validate() const {
    if (fast_ma_period < 1 || slow_ma_period < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Moving average periods must be at least 1", "IndicatorConfig");
    }
    if (atr_period < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "ATR period must be at least 1",
                                "IndicatorConfig");
    }
    if (bollinger_period < 2) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Bollinger period must be at least 2", "IndicatorConfig");
    }
    if (bollinger_std_dev <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Bollinger multiplier must be positive", "IndicatorConfig");
    }
    return Result<void>();
}

nlohmann::json IndicatorConfig::to_json() const {
    nlohmann::json j;
    j["fast_ma_period"] = fast_ma_period;
    j["slow_ma_period"] = slow_ma_period;
    j["atr_period"] = atr_period;
    j["bollinger_period"] = bollinger_period;
    j["bollinger_std_dev"] = bollinger_std_dev;
    return j;
}

void IndicatorConfig::from_json(const nlohmann::json& j) {
    if (j.contains("fast_ma_period"))
        fast_ma_period = j.at("fast_ma_period").get<int>();
    if (j.contains("slow_ma_period"))
        slow_ma_period = j.at("slow_ma_period").get<int>();
    if (j.contains("atr_period"))
        atr_period = j.at("atr_period").get<int>();
    if (j.contains("bollinger_period"))
        bollinger_period = j.at("bollinger_period").get<int>();
    if (j.contains("bollinger_std_dev"))
        bollinger_std_dev = j.at("bollinger_std_dev").get<double>();
}

namespace indicators {

namespace {

// Mean of values[end - period + 1 .. end], all of which must be defined
double window_mean(const std::vector<double>& values, size_t end, int period) {
    double sum = 0.0;
    for (size_t k = end + 1 - static_cast<size_t>(period); k <= end; ++k) {
        sum += values[k];
    }
    return sum / static_cast<double>(period);
}

}  // namespace

std::vector<OptionalValue> moving_average(const std::vector<double>& series, int period) {
    std::vector<OptionalValue> result(series.size());
    if (period < 1) {
        return result;
    }

    for (size_t i = static_cast<size_t>(period) - 1; i < series.size(); ++i) {
        result[i] = window_mean(series, i, period);
    }
    return result;
}

std::vector<OptionalValue> atr(const std::vector<double>& high, const std::vector<double>& low,
                               const std::vector<double>& close, int period) {
    const size_t n = std::min({high.size(), low.size(), close.size()});
    std::vector<OptionalValue> result(close.size());
    if (period < 1 || n < 2) {
        return result;
    }

    // tr[0] stays unused: there is no previous close on day 0
    std::vector<double> tr(n, 0.0);
    for (size_t i = 1; i < n; ++i) {
        const double prev_close = close[i - 1];
        tr[i] = std::max({high[i] - low[i], std::abs(high[i] - prev_close),
                          std::abs(low[i] - prev_close)});
    }

    for (size_t i = static_cast<size_t>(period); i < n; ++i) {
        result[i] = window_mean(tr, i, period);
    }
    return result;
}

BollingerBands bollinger_bands(const std::vector<double>& close, int period,
                               double std_dev_multiplier) {
    BollingerBands bands;
    bands.middle = moving_average(close, period);
    bands.upper.resize(close.size());
    bands.lower.resize(close.size());
    if (period < 2) {
        return bands;
    }

    for (size_t i = static_cast<size_t>(period) - 1; i < close.size(); ++i) {
        const double mid = *bands.middle[i];
        double ss = 0.0;
        for (size_t k = i + 1 - static_cast<size_t>(period); k <= i; ++k) {
            ss += (close[k] - mid) * (close[k] - mid);
        }
        const double sd = std::sqrt(ss / static_cast<double>(period - 1));
        bands.upper[i] = mid + std_dev_multiplier * sd;
        bands.lower[i] = mid - std_dev_multiplier * sd;
    }
    return bands;
}

IndicatorSeries compute_all(const std::vector<Bar>& bars, const IndicatorConfig& config) {
    std::vector<double> high, low, close;
    high.reserve(bars.size());
    low.reserve(bars.size());
    close.reserve(bars.size());
    for (const auto& bar : bars) {
        high.push_back(bar.high);
        low.push_back(bar.low);
        close.push_back(bar.close);
    }

    IndicatorSeries series;
    series.fast_ma = moving_average(close, config.fast_ma_period);
    series.slow_ma = moving_average(close, config.slow_ma_period);
    series.atr = atr(high, low, close, config.atr_period);

    auto bands = bollinger_bands(close, config.bollinger_period, config.bollinger_std_dev);
    series.bb_upper = std::move(bands.upper);
    series.bb_middle = std::move(bands.middle);
    series.bb_lower = std::move(bands.lower);
    return series;
}

}  // namespace indicators
}  // namespace quant_ngin
