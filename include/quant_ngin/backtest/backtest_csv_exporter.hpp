// include/quant_ngin/backtest/backtest_csv_exporter.hpp
#pragma once

#include <string>
#include "quant_ngin/backtest/backtest_engine.hpp"
#include "quant_ngin/backtest/portfolio_aggregator.hpp"
#include "quant_ngin/core/error.hpp"

namespace quant_ngin {
namespace backtest {

/**
 * @brief Writes run results as plain files for a presentation layer
 *
 * Files: daily_states.csv, trades.csv, risk_events.csv, metrics.json and,
 * for basket runs, portfolio.csv. Undefined values are written as empty
 * cells.
 */
class BacktestCSVExporter {
public:
    explicit BacktestCSVExporter(std::string output_directory);

    const std::string& output_directory() const {
        return output_directory_;
    }

    /**
     * @brief Write every single-symbol file
     */
    Result<void> export_run(const RunResult& result) const;

    Result<void> export_daily_states(const RunResult& result) const;
    Result<void> export_trades(const RunResult& result) const;
    Result<void> export_risk_events(const RunResult& result) const;
    Result<void> export_metrics(const RunResult& result) const;

    Result<void> export_portfolio(const PortfolioResult& portfolio) const;

private:
    std::string output_directory_;

    Result<void> ensure_directory() const;
    std::string path_for(const std::string& filename) const;
};

}  // namespace backtest
}  // namespace quant_ngin
