// include/quant_ngin/backtest/portfolio_aggregator.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "quant_ngin/core/error.hpp"
#include "quant_ngin/core/types.hpp"
#include "quant_ngin/data/market_data_provider.hpp"

namespace quant_ngin {
namespace backtest {

struct SymbolPerformance {
    std::string symbol;
    double total_return{0.0};
    double annualized_return{0.0};
    size_t bar_count{0};
};

struct ExcludedSymbol {
    std::string symbol;
    std::string reason;
};

/**
 * @brief Basket ranking, best annualized return first
 */
struct PortfolioResult {
    std::vector<SymbolPerformance> rankings;
    std::vector<ExcludedSymbol> excluded;
    double mean_annualized_return{0.0};
    double std_annualized_return{0.0};  // Sample standard deviation
    double sharpe_ratio{0.0};           // mean / std, no risk-free rate

    nlohmann::json to_json() const;
};

/**
 * @brief Ranks a basket with a reduced trend-following rule
 *
 * Long while the fast MA is above the slow MA, returns earned with the
 * previous day's signal, no risk overlay and no costs. Each symbol runs in
 * its own task, so the provider must accept concurrent calls. A symbol
 * whose fetch or validation fails is excluded and never aborts the basket.
 */
class PortfolioAggregator {
public:
    PortfolioAggregator(int fast_period, int slow_period, double backtest_years,
                        size_t min_bars);

    /**
     * @brief Reduced pipeline for one symbol's bars
     */
    Result<SymbolPerformance> evaluate(const std::string& symbol,
                                       const std::vector<Bar>& bars) const;

    /**
     * @brief Rank already evaluated symbols and compute basket statistics
     */
    static PortfolioResult summarize(std::vector<SymbolPerformance> performances,
                                     std::vector<ExcludedSymbol> excluded);

    PortfolioResult run(MarketDataProvider& provider, const std::vector<std::string>& symbols,
                        const Timestamp& start_date, const Timestamp& end_date) const;

private:
    int fast_period_;
    int slow_period_;
    double backtest_years_;
    size_t min_bars_;
};

}  // namespace backtest
}  // namespace quant_ngin
