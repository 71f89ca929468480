// src/data/conversion_utils.cpp
#include "quant_ngin/data/conversion_utils.hpp"
#include <cerrno>
#include <cstdlib>
#include "quant_ngin/core/time_utils.hpp"

namespace quant_ngin {

Result<std::shared_ptr<arrow::Array>> DataConversionUtils::column_array(
    const std::shared_ptr<arrow::Table>& table, const std::string& name) {
    auto column = table->GetColumnByName(name);
    if (column == nullptr) {
        return make_error<std::shared_ptr<arrow::Array>>(
            ErrorCode::INVALID_DATA, "Missing required column: " + name, "DataConversionUtils");
    }
    if (column->num_chunks() == 0) {
        return make_error<std::shared_ptr<arrow::Array>>(
            ErrorCode::INVALID_DATA, "Column has no data: " + name, "DataConversionUtils");
    }
    return column->chunk(0);
}

Result<Timestamp> DataConversionUtils::extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                                         int64_t index) {
    if (array->IsNull(index)) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Null date at row " + std::to_string(index),
                                     "DataConversionUtils");
    }

    switch (array->type_id()) {
        case arrow::Type::STRING: {
            auto str_array = std::static_pointer_cast<arrow::StringArray>(array);
            return core::parse_date(str_array->GetString(index));
        }
        case arrow::Type::DATE32: {
            auto date_array = std::static_pointer_cast<arrow::Date32Array>(array);
            const int64_t days = date_array->Value(index);
            return Timestamp(std::chrono::hours(24 * days));
        }
        case arrow::Type::TIMESTAMP: {
            auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
            auto ts_type = std::static_pointer_cast<arrow::TimestampType>(array->type());
            const int64_t raw = ts_array->Value(index);
            std::chrono::seconds secs(0);
            switch (ts_type->unit()) {
                case arrow::TimeUnit::SECOND:
                    secs = std::chrono::seconds(raw);
                    break;
                case arrow::TimeUnit::MILLI:
                    secs = std::chrono::seconds(raw / 1000);
                    break;
                case arrow::TimeUnit::MICRO:
                    secs = std::chrono::seconds(raw / 1000000);
                    break;
                case arrow::TimeUnit::NANO:
                    secs = std::chrono::seconds(raw / 1000000000);
                    break;
            }
            return core::floor_to_day(Timestamp(secs));
        }
        default:
            return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                         "Unsupported date column type: " +
                                             array->type()->ToString(),
                                         "DataConversionUtils");
    }
}

Result<double> DataConversionUtils::extract_double(const std::shared_ptr<arrow::Array>& array,
                                                   int64_t index) {
    if (array->IsNull(index)) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Null value at row " + std::to_string(index),
                                  "DataConversionUtils");
    }

    switch (array->type_id()) {
        case arrow::Type::DOUBLE:
            return std::static_pointer_cast<arrow::DoubleArray>(array)->Value(index);
        case arrow::Type::FLOAT:
            return static_cast<double>(
                std::static_pointer_cast<arrow::FloatArray>(array)->Value(index));
        case arrow::Type::INT64:
            return static_cast<double>(
                std::static_pointer_cast<arrow::Int64Array>(array)->Value(index));
        case arrow::Type::INT32:
            return static_cast<double>(
                std::static_pointer_cast<arrow::Int32Array>(array)->Value(index));
        case arrow::Type::STRING: {
            const std::string text =
                std::static_pointer_cast<arrow::StringArray>(array)->GetString(index);
            errno = 0;
            char* end = nullptr;
            const double value = std::strtod(text.c_str(), &end);
            if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE) {
                return make_error<double>(ErrorCode::CONVERSION_ERROR,
                                          "Non-numeric value '" + text + "' at row " +
                                              std::to_string(index),
                                          "DataConversionUtils");
            }
            return value;
        }
        default:
            return make_error<double>(ErrorCode::CONVERSION_ERROR,
                                      "Unsupported numeric column type: " +
                                          array->type()->ToString(),
                                      "DataConversionUtils");
    }
}

Result<std::vector<Bar>> DataConversionUtils::arrow_table_to_bars(
    const std::shared_ptr<arrow::Table>& table, const std::string& symbol) {
    if (!table) {
        return make_error<std::vector<Bar>>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                            "DataConversionUtils");
    }
    if (table->num_rows() == 0) {
        return std::vector<Bar>{};
    }

    try {
        auto combined = table->CombineChunks();
        if (!combined.ok()) {
            return make_error<std::vector<Bar>>(ErrorCode::CONVERSION_ERROR,
                                                "Failed to combine chunks: " +
                                                    combined.status().ToString(),
                                                "DataConversionUtils");
        }
        const auto& flat = *combined;

        const std::vector<std::string> names = {"date", "open", "high", "low", "close", "volume"};
        std::vector<std::shared_ptr<arrow::Array>> columns;
        for (const auto& name : names) {
            auto column = column_array(flat, name);
            if (column.is_error()) {
                return forward_error<std::vector<Bar>>(column, "DataConversionUtils");
            }
            columns.push_back(column.value());
        }

        std::vector<Bar> bars;
        bars.reserve(flat->num_rows());

        for (int64_t i = 0; i < flat->num_rows(); ++i) {
            auto ts = extract_timestamp(columns[0], i);
            if (ts.is_error()) {
                return forward_error<std::vector<Bar>>(ts, "DataConversionUtils");
            }

            double values[5];
            for (size_t c = 1; c < columns.size(); ++c) {
                auto value = extract_double(columns[c], i);
                if (value.is_error()) {
                    return make_error<std::vector<Bar>>(
                        value.error()->code(),
                        "Column '" + names[c] + "': " + value.error()->what(),
                        "DataConversionUtils");
                }
                values[c - 1] = value.value();
            }

            bars.emplace_back(ts.value(), values[0], values[1], values[2], values[3], values[4],
                              symbol);
        }

        return bars;

    } catch (const std::exception& e) {
        return make_error<std::vector<Bar>>(
            ErrorCode::CONVERSION_ERROR,
            std::string("Error converting table to bars: ") + e.what(), "DataConversionUtils");
    }
}

Result<std::vector<BenchmarkPoint>> DataConversionUtils::arrow_table_to_benchmark(
    const std::shared_ptr<arrow::Table>& table) {
    if (!table) {
        return make_error<std::vector<BenchmarkPoint>>(
            ErrorCode::INVALID_ARGUMENT, "Table pointer is null", "DataConversionUtils");
    }
    if (table->num_rows() == 0) {
        return std::vector<BenchmarkPoint>{};
    }

    try {
        auto combined = table->CombineChunks();
        if (!combined.ok()) {
            return make_error<std::vector<BenchmarkPoint>>(
                ErrorCode::CONVERSION_ERROR,
                "Failed to combine chunks: " + combined.status().ToString(),
                "DataConversionUtils");
        }
        const auto& flat = *combined;

        auto dates = column_array(flat, "date");
        if (dates.is_error()) {
            return forward_error<std::vector<BenchmarkPoint>>(dates, "DataConversionUtils");
        }
        auto closes = column_array(flat, "close");
        if (closes.is_error()) {
            return forward_error<std::vector<BenchmarkPoint>>(closes, "DataConversionUtils");
        }

        std::vector<BenchmarkPoint> points;
        points.reserve(flat->num_rows());
        for (int64_t i = 0; i < flat->num_rows(); ++i) {
            auto ts = extract_timestamp(dates.value(), i);
            if (ts.is_error()) {
                return forward_error<std::vector<BenchmarkPoint>>(ts, "DataConversionUtils");
            }
            auto close = extract_double(closes.value(), i);
            if (close.is_error()) {
                return forward_error<std::vector<BenchmarkPoint>>(close, "DataConversionUtils");
            }
            points.push_back(BenchmarkPoint{ts.value(), close.value()});
        }
        return points;

    } catch (const std::exception& e) {
        return make_error<std::vector<BenchmarkPoint>>(
            ErrorCode::CONVERSION_ERROR,
            std::string("Error converting table to benchmark: ") + e.what(),
            "DataConversionUtils");
    }
}

}  // namespace quant_ngin
