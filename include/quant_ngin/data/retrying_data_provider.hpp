// include/quant_ngin/data/retrying_data_provider.hpp
#pragma once

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "quant_ngin/core/config_base.hpp"
#include "quant_ngin/data/market_data_provider.hpp"

namespace quant_ngin {

struct RetryConfig : public ConfigBase {
    int max_retries{3};                            // Attempts per provider
    std::chrono::milliseconds base_delay{1000};  // Doubles after each failed attempt

    static constexpr int MAX_RETRIES_LIMIT = 30;

    Result<void> validate() const override;
    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Tries an ordered list of providers with exponential backoff
 *
 * Each provider gets max_retries attempts, sleeping base_delay * 2^attempt
 * between them, before the next provider is tried. An empty bar or
 * benchmark list counts as a failed attempt. The last error is returned if
 * every provider fails.
 */
class RetryingDataProvider : public MarketDataProvider {
public:
    RetryingDataProvider(std::vector<std::shared_ptr<MarketDataProvider>> providers,
                         RetryConfig config = RetryConfig{});

    std::string name() const override {
        return "retrying";
    }

    Result<std::vector<Bar>> get_bars(const std::string& symbol, const Timestamp& start_date,
                                      const Timestamp& end_date) override;

    Result<std::vector<BenchmarkPoint>> get_benchmark(const std::string& benchmark_id,
                                                      const Timestamp& start_date,
                                                      const Timestamp& end_date) override;

    /**
     * @brief Fundamentals from the first provider that has real data
     */
    FundamentalSnapshot get_fundamentals(const std::string& symbol) override;

private:
    std::vector<std::shared_ptr<MarketDataProvider>> providers_;
    RetryConfig config_;

    template <typename T, typename Fetch>
    Result<std::vector<T>> with_retries(const std::string& what, Fetch fetch);
};

}  // namespace quant_ngin
