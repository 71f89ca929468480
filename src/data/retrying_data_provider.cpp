// src/data/retrying_data_provider.cpp
#include "quant_ngin/data/retrying_data_provider.hpp"
#include <thread>
#include <utility>
#include "quant_ngin/core/logger.hpp"

namespace quant_ngin {

Result<void> RetryConfig::validate() const {
    if (max_retries < 1 || max_retries > MAX_RETRIES_LIMIT) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "max_retries must be between 1 and " +
                                    std::to_string(MAX_RETRIES_LIMIT) + ", got " +
                                    std::to_string(max_retries),
                                "RetryConfig");
    }
    if (base_delay.count() < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "base_delay_ms must not be negative",
                                "RetryConfig");
    }
    return Result<void>();
}

nlohmann::json RetryConfig::to_json() const {
    nlohmann::json j;
    j["max_retries"] = max_retries;
    j["base_delay_ms"] = base_delay.count();
    return j;
}

void RetryConfig::from_json(const nlohmann::json& j) {
    if (j.contains("max_retries"))
        max_retries = j.at("max_retries").get<int>();
    if (j.contains("base_delay_ms"))
        base_delay = std::chrono::milliseconds(j.at("base_delay_ms").get<int64_t>());
}

RetryingDataProvider::RetryingDataProvider(
    std::vector<std::shared_ptr<MarketDataProvider>> providers, RetryConfig config)
    : providers_(std::move(providers)), config_(std::move(config)) {}

template <typename T, typename Fetch>
Result<std::vector<T>> RetryingDataProvider::with_retries(const std::string& what, Fetch fetch) {
    if (providers_.empty()) {
        return make_error<std::vector<T>>(ErrorCode::NOT_INITIALIZED, "No data providers configured",
                                          "RetryingDataProvider");
    }

    auto valid = config_.validate();
    if (valid.is_error()) {
        return forward_error<std::vector<T>>(valid, "RetryingDataProvider");
    }

    ErrorCode last_code = ErrorCode::PROVIDER_ERROR;
    std::string last_message;

    for (const auto& provider : providers_) {
        for (int attempt = 0; attempt < config_.max_retries; ++attempt) {
            auto result = fetch(*provider);
            if (result.is_ok() && !result.value().empty()) {
                if (attempt > 0) {
                    INFO("Fetched " << what << " from " << provider->name() << " after "
                                    << attempt + 1 << " attempts");
                }
                return result;
            }

            if (result.is_error()) {
                last_code = result.error()->code();
                last_message = result.error()->what();
            } else {
                last_code = ErrorCode::DATA_NOT_FOUND;
                last_message = "Empty result for " + what;
            }
            WARN("Provider " << provider->name() << " failed for " << what << " (attempt "
                             << attempt + 1 << "/" << config_.max_retries
                             << "): " << last_message);

            if (attempt < config_.max_retries - 1) {
                std::this_thread::sleep_for(config_.base_delay * (1 << attempt));
            }
        }
    }

    return make_error<std::vector<T>>(last_code,
                                      "All providers failed for " + what + ": " + last_message,
                                      "RetryingDataProvider");
}

Result<std::vector<Bar>> RetryingDataProvider::get_bars(const std::string& symbol,
                                                        const Timestamp& start_date,
                                                        const Timestamp& end_date) {
    return with_retries<Bar>("bars of " + symbol, [&](MarketDataProvider& provider) {
        return provider.get_bars(symbol, start_date, end_date);
    });
}

Result<std::vector<BenchmarkPoint>> RetryingDataProvider::get_benchmark(
    const std::string& benchmark_id, const Timestamp& start_date, const Timestamp& end_date) {
    return with_retries<BenchmarkPoint>("benchmark " + benchmark_id,
                                        [&](MarketDataProvider& provider) {
                                            return provider.get_benchmark(benchmark_id, start_date,
                                                                          end_date);
                                        });
}

FundamentalSnapshot RetryingDataProvider::get_fundamentals(const std::string& symbol) {
    for (const auto& provider : providers_) {
        FundamentalSnapshot snapshot = provider->get_fundamentals(symbol);
        if (!snapshot.is_default) {
            return snapshot;
        }
    }
    return FundamentalSnapshot{};
}

}  // namespace quant_ngin
