// include/quant_ngin/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "quant_ngin/core/error.hpp"
#include "quant_ngin/core/types.hpp"

namespace quant_ngin {

/**
 * @brief Arrow table to engine type conversions
 *
 * Tables must have a "date" column (utf8 YYYY-MM-DD, date32 or timestamp)
 * and float or integer price columns. A null or unparseable cell fails the
 * whole conversion; rows are never dropped.
 */
class DataConversionUtils {
public:
    /**
     * @brief Convert an OHLCV table to bars
     * @param table Columns date, open, high, low, close, volume
     * @param symbol Symbol stamped on every bar
     */
    static Result<std::vector<Bar>> arrow_table_to_bars(const std::shared_ptr<arrow::Table>& table,
                                                        const std::string& symbol);

    /**
     * @brief Convert a date/close table to benchmark points
     */
    static Result<std::vector<BenchmarkPoint>> arrow_table_to_benchmark(
        const std::shared_ptr<arrow::Table>& table);

private:
    static Result<std::shared_ptr<arrow::Array>> column_array(
        const std::shared_ptr<arrow::Table>& table, const std::string& name);

    static Result<Timestamp> extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                               int64_t index);

    static Result<double> extract_double(const std::shared_ptr<arrow::Array>& array,
                                         int64_t index);
};

}  // namespace quant_ngin
