// include/quant_ngin/data/market_data_provider.hpp
#pragma once

#include <string>
#include <vector>
#include "quant_ngin/core/error.hpp"
#include "quant_ngin/core/types.hpp"

namespace quant_ngin {

/**
 * @brief Source of daily bars, benchmark closes and fundamentals
 */
class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    /**
     * @brief Provider name used in logs
     */
    virtual std::string name() const = 0;

    /**
     * @brief Daily bars for a symbol, ascending by date
     * @param symbol Instrument code
     * @param start_date First date, inclusive
     * @param end_date Last date, inclusive
     */
    virtual Result<std::vector<Bar>> get_bars(const std::string& symbol,
                                              const Timestamp& start_date,
                                              const Timestamp& end_date) = 0;

    /**
     * @brief Daily closes of a benchmark index
     */
    virtual Result<std::vector<BenchmarkPoint>> get_benchmark(const std::string& benchmark_id,
                                                              const Timestamp& start_date,
                                                              const Timestamp& end_date) = 0;

    /**
     * @brief Latest fundamentals for a symbol
     *
     * Never fails. Fields the provider cannot supply keep their defaults.
     */
    virtual FundamentalSnapshot get_fundamentals(const std::string& symbol) = 0;
};

}  // namespace quant_ngin
