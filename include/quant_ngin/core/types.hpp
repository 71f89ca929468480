// include/quant_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace quant_ngin {

/**
 * @brief Timestamp type for consistent time representation
 * Daily bars carry midnight UTC of their trading date
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief A value that may not be available yet
 * Empty means "insufficient history", never zero
 */
using OptionalValue = std::optional<double>;

/**
 * @brief Market data bar structure
 * One trading day of OHLCV data for a symbol
 */
struct Bar {
    Timestamp timestamp;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};
    std::string symbol;

    Bar() = default;
    Bar(Timestamp ts, Price o, Price h, Price l, Price c, double v, std::string s)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v), symbol(std::move(s)) {}
};

/**
 * @brief A single benchmark close, e.g. an index level
 */
struct BenchmarkPoint {
    Timestamp timestamp;
    Price close{0.0};
};

/**
 * @brief Point-in-time fundamental metrics for one symbol
 *
 * Units are the provider's native ones (percent for ROE and growth, 100M CNY
 * for operating cash flow). Defaults apply when the provider cannot supply
 * a field.
 */
struct FundamentalSnapshot {
    static constexpr double DEFAULT_ROE = 15.0;
    static constexpr double DEFAULT_REVENUE_GROWTH = 10.0;
    static constexpr double DEFAULT_PROFIT_GROWTH = 15.0;
    static constexpr double DEFAULT_CASH_FLOW = 1.0;

    double roe{DEFAULT_ROE};
    double revenue_growth{DEFAULT_REVENUE_GROWTH};
    double profit_growth{DEFAULT_PROFIT_GROWTH};
    double cash_flow{DEFAULT_CASH_FLOW};
    bool is_default{true};  // True when nothing came from the provider
};

}  // namespace quant_ngin
