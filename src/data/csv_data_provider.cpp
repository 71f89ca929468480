// src/data/csv_data_provider.cpp
#include "quant_ngin/data/csv_data_provider.hpp"
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "quant_ngin/core/logger.hpp"
#include "quant_ngin/data/conversion_utils.hpp"

namespace quant_ngin {

namespace {

template <typename T>
std::vector<T> filter_range(std::vector<T> rows, const Timestamp& start_date,
                            const Timestamp& end_date) {
    std::vector<T> filtered;
    filtered.reserve(rows.size());
    for (auto& row : rows) {
        if (row.timestamp >= start_date && row.timestamp <= end_date) {
            filtered.push_back(std::move(row));
        }
    }
    return filtered;
}

void read_field(const nlohmann::json& j, const char* key, double& field, bool& found) {
    if (j.contains(key) && j.at(key).is_number()) {
        field = j.at(key).get<double>();
        found = true;
    }
}

}  // namespace

CSVDataProvider::CSVDataProvider(std::string data_directory)
    : data_directory_(std::move(data_directory)) {}

Result<std::shared_ptr<arrow::Table>> CSVDataProvider::read_csv(const std::string& path) const {
    if (!std::filesystem::exists(path)) {
        return make_error<std::shared_ptr<arrow::Table>>(ErrorCode::DATA_NOT_FOUND,
                                                         "No data file: " + path,
                                                         "CSVDataProvider");
    }

    auto input = arrow::io::ReadableFile::Open(path);
    if (!input.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::FILE_IO_ERROR, "Failed to open " + path + ": " + input.status().ToString(),
            "CSVDataProvider");
    }

    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    auto convert_options = arrow::csv::ConvertOptions::Defaults();
    // Dates stay text and are parsed by the conversion layer
    convert_options.column_types["date"] = arrow::utf8();

    auto reader = arrow::csv::TableReader::Make(arrow::io::default_io_context(), *input,
                                                read_options, parse_options, convert_options);
    if (!reader.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::PROVIDER_ERROR,
            "Failed to create CSV reader for " + path + ": " + reader.status().ToString(),
            "CSVDataProvider");
    }

    auto table = (*reader)->Read();
    if (!table.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::PROVIDER_ERROR,
            "Failed to read " + path + ": " + table.status().ToString(), "CSVDataProvider");
    }

    return *table;
}

Result<std::vector<Bar>> CSVDataProvider::get_bars(const std::string& symbol,
                                                   const Timestamp& start_date,
                                                   const Timestamp& end_date) {
    const std::string path = (std::filesystem::path(data_directory_) / (symbol + ".csv")).string();

    auto table = read_csv(path);
    if (table.is_error()) {
        return forward_error<std::vector<Bar>>(table, "CSVDataProvider");
    }

    auto bars = DataConversionUtils::arrow_table_to_bars(table.value(), symbol);
    if (bars.is_error()) {
        return forward_error<std::vector<Bar>>(bars, "CSVDataProvider");
    }

    auto filtered = filter_range(bars.take_value(), start_date, end_date);
    DEBUG("Loaded " << filtered.size() << " bars for " << symbol << " from " << path);
    return filtered;
}

Result<std::vector<BenchmarkPoint>> CSVDataProvider::get_benchmark(const std::string& benchmark_id,
                                                                   const Timestamp& start_date,
                                                                   const Timestamp& end_date) {
    const std::string path =
        (std::filesystem::path(data_directory_) / (benchmark_id + ".csv")).string();

    auto table = read_csv(path);
    if (table.is_error()) {
        return forward_error<std::vector<BenchmarkPoint>>(table, "CSVDataProvider");
    }

    auto points = DataConversionUtils::arrow_table_to_benchmark(table.value());
    if (points.is_error()) {
        return forward_error<std::vector<BenchmarkPoint>>(points, "CSVDataProvider");
    }

    return filter_range(points.take_value(), start_date, end_date);
}

FundamentalSnapshot CSVDataProvider::get_fundamentals(const std::string& symbol) {
    FundamentalSnapshot snapshot;
    const std::string path =
        (std::filesystem::path(data_directory_) / "fundamentals.json").string();

    std::ifstream file(path);
    if (!file.is_open()) {
        WARN("No fundamentals file at " << path << ", using defaults for " << symbol);
        return snapshot;
    }

    try {
        nlohmann::json j;
        file >> j;
        if (!j.contains(symbol)) {
            WARN("No fundamentals for " << symbol << ", using defaults");
            return snapshot;
        }

        const auto& record = j.at(symbol);
        bool found = false;
        read_field(record, "roe", snapshot.roe, found);
        read_field(record, "revenue_growth", snapshot.revenue_growth, found);
        read_field(record, "profit_growth", snapshot.profit_growth, found);
        read_field(record, "cash_flow", snapshot.cash_flow, found);
        snapshot.is_default = !found;
    } catch (const nlohmann::json::exception& e) {
        WARN("Failed to parse " << path << ": " << e.what() << ", using defaults for " << symbol);
        return FundamentalSnapshot{};
    }

    return snapshot;
}

}  // namespace quant_ngin
