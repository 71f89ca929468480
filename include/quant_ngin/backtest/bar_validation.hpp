// include/quant_ngin/backtest/bar_validation.hpp
#pragma once

#include <vector>
#include "quant_ngin/core/error.hpp"
#include "quant_ngin/core/types.hpp"

namespace quant_ngin {

constexpr size_t DEFAULT_MIN_BARS = 50;

/**
 * @brief Reject a bar series the engine cannot run on
 *
 * Checks, in order: non-empty (DATA_NOT_FOUND), at least min_bars
 * (INSUFFICIENT_DATA), then per bar finite OHLCV, high/low envelope,
 * non-negative volume and strictly ascending dates (INVALID_DATA).
 */
Result<void> validate_bars(const std::vector<Bar>& bars, size_t min_bars = DEFAULT_MIN_BARS);

}  // namespace quant_ngin
