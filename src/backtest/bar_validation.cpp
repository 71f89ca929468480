// src/backtest/bar_validation.cpp
#include "quant_ngin/backtest/bar_validation.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include "quant_ngin/core/time_utils.hpp"

namespace quant_ngin {

namespace {

Result<void> invalid_bar(size_t index, const Bar& bar, const std::string& reason) {
    return make_error<void>(ErrorCode::INVALID_DATA,
                            "Bar " + std::to_string(index) + " (" +
                                core::format_date(bar.timestamp) + ") " + reason,
                            "BarValidation");
}

}  // namespace

Result<void> validate_bars(const std::vector<Bar>& bars, size_t min_bars) {
    if (bars.empty()) {
        return make_error<void>(ErrorCode::DATA_NOT_FOUND, "No bars supplied", "BarValidation");
    }
    if (bars.size() < min_bars) {
        return make_error<void>(ErrorCode::INSUFFICIENT_DATA,
                                "Need at least " + std::to_string(min_bars) + " bars, got " +
                                    std::to_string(bars.size()),
                                "BarValidation");
    }

    for (size_t i = 0; i < bars.size(); ++i) {
        const Bar& bar = bars[i];

        if (!std::isfinite(bar.open) || !std::isfinite(bar.high) || !std::isfinite(bar.low) ||
            !std::isfinite(bar.close) || !std::isfinite(bar.volume)) {
            return invalid_bar(i, bar, "has a non-finite field");
        }
        if (bar.close <= 0.0) {
            return invalid_bar(i, bar, "has a non-positive close");
        }
        if (bar.high < std::max({bar.open, bar.close, bar.low})) {
            return invalid_bar(i, bar, "has high below open, close or low");
        }
        if (bar.low > std::min({bar.open, bar.close, bar.high})) {
            return invalid_bar(i, bar, "has low above open, close or high");
        }
        if (bar.volume < 0.0) {
            return invalid_bar(i, bar, "has negative volume");
        }
        if (i > 0 && bar.timestamp <= bars[i - 1].timestamp) {
            return invalid_bar(i, bar, "is not after the previous bar");
        }
    }

    return Result<void>();
}

}  // namespace quant_ngin
