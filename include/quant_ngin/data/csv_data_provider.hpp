// include/quant_ngin/data/csv_data_provider.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "quant_ngin/data/market_data_provider.hpp"

namespace quant_ngin {

/**
 * @brief Provider backed by a directory of CSV files
 *
 * Layout:
 *   <dir>/<symbol>.csv        date,open,high,low,close,volume
 *   <dir>/<benchmark>.csv     date,close (extra columns ignored)
 *   <dir>/fundamentals.json   {"<symbol>": {"roe": .., "revenue_growth": ..,
 *                              "profit_growth": .., "cash_flow": ..}}
 */
class CSVDataProvider : public MarketDataProvider {
public:
    explicit CSVDataProvider(std::string data_directory);

    std::string name() const override {
        return "csv";
    }

    Result<std::vector<Bar>> get_bars(const std::string& symbol, const Timestamp& start_date,
                                      const Timestamp& end_date) override;

    Result<std::vector<BenchmarkPoint>> get_benchmark(const std::string& benchmark_id,
                                                      const Timestamp& start_date,
                                                      const Timestamp& end_date) override;

    FundamentalSnapshot get_fundamentals(const std::string& symbol) override;

    const std::string& data_directory() const {
        return data_directory_;
    }

private:
    std::string data_directory_;

    Result<std::shared_ptr<arrow::Table>> read_csv(const std::string& path) const;
};

}  // namespace quant_ngin
