// include/quant_ngin/backtest/monte_carlo.hpp
#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <vector>
#include "quant_ngin/core/config_base.hpp"
#include "quant_ngin/core/error.hpp"

namespace quant_ngin {

struct MonteCarloConfig : public ConfigBase {
    bool enabled{false};
    int num_simulations{500};
    uint64_t seed_base{0};
    int max_workers{4};  // Upper bound on concurrent workers

    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Distribution of terminal returns over all simulations
 */
struct MonteCarloResult {
    std::vector<double> terminal_returns;  // Indexed by simulation
    double mean{0.0};
    double std_dev{0.0};  // Population standard deviation
    double percentile_2_5{0.0};
    double percentile_97_5{0.0};
    double probability_positive{0.0};

    nlohmann::json to_json() const;
};

/**
 * @brief Shuffle resampler for a realized daily return series
 *
 * Simulation s shuffles the returns with a generator seeded by seed_base + s
 * and compounds the permuted series. The outcome does not depend on how the
 * simulations are spread across workers.
 */
class MonteCarloResampler {
public:
    explicit MonteCarloResampler(MonteCarloConfig config);

    Result<MonteCarloResult> run(const std::vector<double>& returns) const;

    /**
     * @brief Terminal return of a single simulation
     */
    static double simulate(const std::vector<double>& returns, uint64_t seed);

private:
    MonteCarloConfig config_;
};

}  // namespace quant_ngin
