// include/quant_ngin/data/postgres_data_provider.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <pqxx/pqxx>
#include <string>
#include <vector>
#include "quant_ngin/core/config_base.hpp"
#include "quant_ngin/data/market_data_provider.hpp"

namespace quant_ngin {

struct PostgresProviderConfig : public ConfigBase {
    std::string connection_string;
    std::string bars_table{"market_data.daily_bars"};  // symbol, date, open, high, low, close, volume
    std::string fundamentals_table{"market_data.fundamentals"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Provider reading bars and fundamentals from PostgreSQL
 *
 * Benchmarks are read from the bars table with the benchmark id as symbol.
 * Query results are assembled into Arrow tables and converted with
 * DataConversionUtils, so nulls fail the same way as in CSV input.
 */
class PostgresDataProvider : public MarketDataProvider {
public:
    explicit PostgresDataProvider(PostgresProviderConfig config);
    ~PostgresDataProvider() override;

    PostgresDataProvider(const PostgresDataProvider&) = delete;
    PostgresDataProvider& operator=(const PostgresDataProvider&) = delete;

    std::string name() const override {
        return "postgres";
    }

    Result<void> connect();
    void disconnect();
    bool is_connected() const;

    Result<std::vector<Bar>> get_bars(const std::string& symbol, const Timestamp& start_date,
                                      const Timestamp& end_date) override;

    Result<std::vector<BenchmarkPoint>> get_benchmark(const std::string& benchmark_id,
                                                      const Timestamp& start_date,
                                                      const Timestamp& end_date) override;

    FundamentalSnapshot get_fundamentals(const std::string& symbol) override;

    /**
     * @brief Reject table names that are not plain schema.table identifiers
     */
    static Result<void> validate_table_name(const std::string& table_name);

private:
    PostgresProviderConfig config_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    Result<void> ensure_connected();

    Result<std::shared_ptr<arrow::Table>> query_ohlcv(const std::string& symbol,
                                                      const Timestamp& start_date,
                                                      const Timestamp& end_date);

    static Result<std::shared_ptr<arrow::Table>> convert_to_arrow_table(
        const pqxx::result& result);
};

}  // namespace quant_ngin
