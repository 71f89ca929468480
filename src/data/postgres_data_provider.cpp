// src/data/postgres_data_provider.cpp

#include "quant_ngin/data/postgres_data_provider.hpp"
#include <algorithm>
#include <cctype>
#include <utility>
#include "quant_ngin/core/logger.hpp"
#include "quant_ngin/core/time_utils.hpp"
#include "quant_ngin/data/conversion_utils.hpp"

namespace quant_ngin {

nlohmann::json PostgresProviderConfig::to_json() const {
    nlohmann::json j;
    j["connection_string"] = connection_string;
    j["bars_table"] = bars_table;
    j["fundamentals_table"] = fundamentals_table;
    return j;
}

void PostgresProviderConfig::from_json(const nlohmann::json& j) {
    if (j.contains("connection_string"))
        connection_string = j.at("connection_string").get<std::string>();
    if (j.contains("bars_table"))
        bars_table = j.at("bars_table").get<std::string>();
    if (j.contains("fundamentals_table"))
        fundamentals_table = j.at("fundamentals_table").get<std::string>();
}

PostgresDataProvider::PostgresDataProvider(PostgresProviderConfig config)
    : config_(std::move(config)), connection_(nullptr) {
    Logger::register_component("PostgresDataProvider");
}

PostgresDataProvider::~PostgresDataProvider() {
    disconnect();
}

Result<void> PostgresDataProvider::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ensure_connected();
}

Result<void> PostgresDataProvider::ensure_connected() {
    if (connection_ && connection_->is_open()) {
        return Result<void>();
    }

    try {
        connection_ = std::make_unique<pqxx::connection>(config_.connection_string);
        if (!connection_->is_open()) {
            return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                    "Failed to open database connection", "PostgresDataProvider");
        }
        INFO("Connected to PostgreSQL database " << connection_->dbname());
        return Result<void>();
    } catch (const std::exception& e) {
        connection_.reset();
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Database connection error: " + std::string(e.what()),
                                "PostgresDataProvider");
    }
}

void PostgresDataProvider::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_ && connection_->is_open()) {
        connection_->close();
        connection_.reset();
        INFO("Disconnected from PostgreSQL database");
    }
}

bool PostgresDataProvider::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_ && connection_->is_open();
}

Result<void> PostgresDataProvider::validate_table_name(const std::string& table_name) {
    if (table_name.empty() || table_name.size() > 100) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Invalid table name: must be 1-100 characters",
                                "PostgresDataProvider");
    }

    for (char c : table_name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.') {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Invalid table name: " + table_name, "PostgresDataProvider");
        }
    }

    std::string lower_name = table_name;
    std::transform(lower_name.begin(), lower_name.end(), lower_name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const std::vector<std::string> forbidden = {"drop",   "delete", "insert", "update",
                                                "alter",  "create", "union",  "select"};
    for (const auto& word : forbidden) {
        if (lower_name.find(word) != std::string::npos) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Invalid table name: contains SQL keyword '" + word + "'",
                                    "PostgresDataProvider");
        }
    }

    return Result<void>();
}

Result<std::shared_ptr<arrow::Table>> PostgresDataProvider::query_ohlcv(
    const std::string& symbol, const Timestamp& start_date, const Timestamp& end_date) {
    auto table_validation = validate_table_name(config_.bars_table);
    if (table_validation.is_error()) {
        return forward_error<std::shared_ptr<arrow::Table>>(table_validation,
                                                            "PostgresDataProvider");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto connected = ensure_connected();
    if (connected.is_error()) {
        return forward_error<std::shared_ptr<arrow::Table>>(connected, "PostgresDataProvider");
    }

    const std::string query =
        "SELECT to_char(date, 'YYYY-MM-DD') AS date, open, high, low, close, volume "
        "FROM " +
        config_.bars_table +
        " WHERE symbol = $1 AND date BETWEEN $2 AND $3 "
        "ORDER BY date";

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(query, symbol, core::format_date(start_date),
                                      core::format_date(end_date));
        txn.commit();
        return convert_to_arrow_table(result);
    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::DATABASE_ERROR, "Query execution failed: " + std::string(e.what()),
            "PostgresDataProvider");
    }
}

Result<std::shared_ptr<arrow::Table>> PostgresDataProvider::convert_to_arrow_table(
    const pqxx::result& result) {
    auto schema = arrow::schema(
        {arrow::field("date", arrow::utf8()), arrow::field("open", arrow::float64()),
         arrow::field("high", arrow::float64()), arrow::field("low", arrow::float64()),
         arrow::field("close", arrow::float64()), arrow::field("volume", arrow::float64())});

    arrow::MemoryPool* pool = arrow::default_memory_pool();
    arrow::StringBuilder date_builder(pool);
    std::vector<std::unique_ptr<arrow::DoubleBuilder>> value_builders;
    for (int i = 0; i < 5; ++i) {
        value_builders.push_back(std::make_unique<arrow::DoubleBuilder>(pool));
    }
    const char* value_columns[] = {"open", "high", "low", "close", "volume"};

    auto handle_builder_error = [](const std::string& operation) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR, "Arrow builder error during " + operation,
            "PostgresDataProvider");
    };

    try {
        if (!date_builder.Reserve(result.size()).ok()) {
            return handle_builder_error("reserve");
        }
        for (auto& builder : value_builders) {
            if (!builder->Reserve(result.size()).ok()) {
                return handle_builder_error("reserve");
            }
        }

        // Nulls are kept so the conversion layer reports them
        for (const auto& row : result) {
            const auto date_field = row["date"];
            auto status = date_field.is_null() ? date_builder.AppendNull()
                                               : date_builder.Append(date_field.as<std::string>());
            if (!status.ok()) {
                return handle_builder_error("append");
            }

            for (size_t c = 0; c < value_builders.size(); ++c) {
                const auto field = row[value_columns[c]];
                status = field.is_null() ? value_builders[c]->AppendNull()
                                         : value_builders[c]->Append(field.as<double>());
                if (!status.ok()) {
                    return handle_builder_error("append");
                }
            }
        }

        std::vector<std::shared_ptr<arrow::Array>> arrays(6);
        if (!date_builder.Finish(&arrays[0]).ok()) {
            return handle_builder_error("finish");
        }
        for (size_t c = 0; c < value_builders.size(); ++c) {
            if (!value_builders[c]->Finish(&arrays[c + 1]).ok()) {
                return handle_builder_error("finish");
            }
        }

        return arrow::Table::Make(schema, arrays);

    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Exception during Arrow table conversion: " + std::string(e.what()),
            "PostgresDataProvider");
    }
}

Result<std::vector<Bar>> PostgresDataProvider::get_bars(const std::string& symbol,
                                                        const Timestamp& start_date,
                                                        const Timestamp& end_date) {
    auto table = query_ohlcv(symbol, start_date, end_date);
    if (table.is_error()) {
        return forward_error<std::vector<Bar>>(table, "PostgresDataProvider");
    }
    return DataConversionUtils::arrow_table_to_bars(table.value(), symbol);
}

Result<std::vector<BenchmarkPoint>> PostgresDataProvider::get_benchmark(
    const std::string& benchmark_id, const Timestamp& start_date, const Timestamp& end_date) {
    auto table = query_ohlcv(benchmark_id, start_date, end_date);
    if (table.is_error()) {
        return forward_error<std::vector<BenchmarkPoint>>(table, "PostgresDataProvider");
    }
    return DataConversionUtils::arrow_table_to_benchmark(table.value());
}

FundamentalSnapshot PostgresDataProvider::get_fundamentals(const std::string& symbol) {
    FundamentalSnapshot snapshot;

    auto table_validation = validate_table_name(config_.fundamentals_table);
    if (table_validation.is_error()) {
        WARN(table_validation.error()->what() << ", using default fundamentals for " << symbol);
        return snapshot;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto connected = ensure_connected();
    if (connected.is_error()) {
        WARN(connected.error()->what() << ", using default fundamentals for " << symbol);
        return snapshot;
    }

    const std::string query =
        "SELECT roe, revenue_growth, profit_growth, cash_flow FROM " +
        config_.fundamentals_table + " WHERE symbol = $1 ORDER BY report_date DESC LIMIT 1";

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(query, symbol);
        txn.commit();

        if (result.empty()) {
            WARN("No fundamentals for " << symbol << ", using defaults");
            return snapshot;
        }

        const auto row = result[0];
        bool found = false;
        auto read = [&row, &found](const char* column, double& field) {
            if (!row[column].is_null()) {
                field = row[column].as<double>();
                found = true;
            }
        };
        read("roe", snapshot.roe);
        read("revenue_growth", snapshot.revenue_growth);
        read("profit_growth", snapshot.profit_growth);
        read("cash_flow", snapshot.cash_flow);
        snapshot.is_default = !found;
    } catch (const std::exception& e) {
        WARN("Fundamentals query failed for " << symbol << ": " << e.what()
                                              << ", using defaults");
        return FundamentalSnapshot{};
    }

    return snapshot;
}

}  // namespace quant_ngin
