// src/backtest/monte_carlo.cpp
#include "quant_ngin/backtest/monte_carlo.hpp"
#include <algorithm>
#include <future>
#include <random>
#include <utility>
#include "quant_ngin/core/logger.hpp"
#include "quant_ngin/statistics/statistics_tools.hpp"

namespace quant_ngin {

Result<void> MonteCarloConfig::validate() const {
    if (num_simulations <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Number of simulations must be positive", "MonteCarloConfig");
    }
    if (max_workers <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Worker count must be positive",
                                "MonteCarloConfig");
    }
    return Result<void>();
}

nlohmann::json MonteCarloConfig::to_json() const {
    nlohmann::json j;
    j["enabled"] = enabled;
    j["num_simulations"] = num_simulations;
    j["seed_base"] = seed_base;
    j["max_workers"] = max_workers;
    return j;
}

void MonteCarloConfig::from_json(const nlohmann::json& j) {
    if (j.contains("enabled"))
        enabled = j.at("enabled").get<bool>();
    if (j.contains("num_simulations"))
        num_simulations = j.at("num_simulations").get<int>();
    if (j.contains("seed_base"))
        seed_base = j.at("seed_base").get<uint64_t>();
    if (j.contains("max_workers"))
        max_workers = j.at("max_workers").get<int>();
}

nlohmann::json MonteCarloResult::to_json() const {
    nlohmann::json j;
    j["num_simulations"] = terminal_returns.size();
    j["mean"] = mean;
    j["std_dev"] = std_dev;
    j["percentile_2_5"] = percentile_2_5;
    j["percentile_97_5"] = percentile_97_5;
    j["probability_positive"] = probability_positive;
    return j;
}

MonteCarloResampler::MonteCarloResampler(MonteCarloConfig config) : config_(std::move(config)) {}

double MonteCarloResampler::simulate(const std::vector<double>& returns, uint64_t seed) {
    std::vector<double> shuffled = returns;
    std::mt19937_64 rng(seed);
    std::shuffle(shuffled.begin(), shuffled.end(), rng);

    double equity = 1.0;
    for (double r : shuffled) {
        equity *= (1.0 + r);
    }
    return equity - 1.0;
}

Result<MonteCarloResult> MonteCarloResampler::run(const std::vector<double>& returns) const {
    auto valid = config_.validate();
    if (valid.is_error()) {
        return forward_error<MonteCarloResult>(valid, "MonteCarloResampler");
    }
    if (returns.empty()) {
        return make_error<MonteCarloResult>(ErrorCode::INVALID_ARGUMENT,
                                            "Cannot resample an empty return series",
                                            "MonteCarloResampler");
    }

    const size_t n = static_cast<size_t>(config_.num_simulations);
    const size_t workers = std::min(n, static_cast<size_t>(config_.max_workers));
    const size_t chunk = (n + workers - 1) / workers;

    MonteCarloResult result;
    result.terminal_returns.assign(n, 0.0);

    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (size_t begin = 0; begin < n; begin += chunk) {
        const size_t end = std::min(n, begin + chunk);
        futures.push_back(std::async(std::launch::async, [this, &returns, &result, begin, end]() {
            for (size_t s = begin; s < end; ++s) {
                result.terminal_returns[s] = simulate(returns, config_.seed_base + s);
            }
        }));
    }
    for (auto& f : futures) {
        f.get();
    }

    const auto& outcomes = result.terminal_returns;
    result.mean = statistics::mean(outcomes);
    result.std_dev = statistics::population_std_dev(outcomes);
    result.percentile_2_5 = statistics::percentile(outcomes, 2.5);
    result.percentile_97_5 = statistics::percentile(outcomes, 97.5);
    result.probability_positive =
        static_cast<double>(std::count_if(outcomes.begin(), outcomes.end(),
                                          [](double r) { return r > 0.0; })) /
        static_cast<double>(n);

    INFO("Monte Carlo: " << n << " simulations, mean " << result.mean << ", std "
                         << result.std_dev << ", 95% band [" << result.percentile_2_5 << ", "
                         << result.percentile_97_5 << "], P(>0) "
                         << result.probability_positive);

    return result;
}

}  // namespace quant_ngin
