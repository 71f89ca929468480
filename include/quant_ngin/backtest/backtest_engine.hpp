// include/quant_ngin/backtest/backtest_engine.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "quant_ngin/backtest/monte_carlo.hpp"
#include "quant_ngin/backtest/performance_analytics.hpp"
#include "quant_ngin/backtest/return_accounting.hpp"
#include "quant_ngin/core/config_base.hpp"
#include "quant_ngin/core/error.hpp"
#include "quant_ngin/core/types.hpp"
#include "quant_ngin/data/market_data_provider.hpp"
#include "quant_ngin/indicators/indicators.hpp"
#include "quant_ngin/strategy/fundamental_scorer.hpp"
#include "quant_ngin/strategy/types.hpp"

namespace quant_ngin {
namespace backtest {

/**
 * @brief Symbols for the basket ranking
 */
struct PortfolioConfig : public ConfigBase {
    bool enabled{false};
    std::vector<std::string> symbols;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Everything one backtest invocation needs
 *
 * Dates are written as YYYY-MM-DD. When absent, the range ends today and
 * reaches back backtest_years * 365 days. An empty benchmark_id compares
 * against buy-and-hold of the symbol itself.
 */
struct BacktestConfig : public ConfigBase {
    std::string symbol{"000001"};
    std::string benchmark_id;
    Timestamp start_date;
    Timestamp end_date;
    double backtest_years{3.0};
    size_t min_bars{50};

    StrategyConfig strategy;
    CostConfig costs;
    MonteCarloConfig monte_carlo;
    PortfolioConfig portfolio;

    std::string output_directory{"results"};

    BacktestConfig();

    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief A day on which the signal changed
 */
struct TradeRecord {
    Timestamp date;
    double close{0.0};
    int signal{0};
    double position{0.0};
    RiskEvent risk_event{RiskEvent::NONE};
    double cost{0.0};
    double technical_score{0.0};
    double composite_score{0.0};
};

/**
 * @brief A forced exit by the risk overlay
 */
struct RiskEventRecord {
    Timestamp date;
    double entry_price{0.0};
    double trigger_price{0.0};
    double change_pct{0.0};  // trigger / entry - 1
    RiskEvent event{RiskEvent::NONE};
};

/**
 * @brief Complete output of one run, owned by the caller
 */
struct RunResult {
    std::string symbol;
    std::vector<Bar> bars;
    IndicatorSeries indicators;
    std::vector<StrategyState> states;
    ReturnSeries returns;

    std::string benchmark_source;  // Benchmark id, or "buy_and_hold"
    std::vector<OptionalValue> benchmark_returns;
    std::vector<double> benchmark_equity;

    FundamentalSnapshot fundamentals;
    FundamentalAssessment fundamental_assessment;
    double fundamental_score{0.0};  // Score the state machine used

    std::map<RiskEvent, int> risk_event_counts;
    std::vector<TradeRecord> trades;
    std::vector<RiskEventRecord> risk_events;

    PerformanceMetrics metrics;
    double total_return{0.0};
    double benchmark_return{0.0};
    double excess_return{0.0};

    std::optional<MonteCarloResult> monte_carlo;
};

/**
 * @brief Runs the single-symbol pipeline
 *
 * bars -> validation -> indicators -> fundamentals -> state machine ->
 * returns -> analytics, plus the optional Monte Carlo step. Each call is
 * independent; the engine keeps no state between runs.
 */
class BacktestEngine {
public:
    explicit BacktestEngine(BacktestConfig config);

    const BacktestConfig& config() const {
        return config_;
    }

    /**
     * @brief Run on data already in memory
     * @param bars Daily bars, ascending
     * @param fundamentals Snapshot used for every day
     * @param benchmark Benchmark closes; empty selects buy-and-hold
     */
    Result<RunResult> run(const std::vector<Bar>& bars, const FundamentalSnapshot& fundamentals,
                          const std::vector<BenchmarkPoint>& benchmark = {}) const;

    /**
     * @brief Fetch the configured symbol and benchmark, then run
     *
     * A bar fetch failure ends the run. A benchmark failure falls back to
     * buy-and-hold.
     */
    Result<RunResult> run(MarketDataProvider& provider) const;

    /**
     * @brief Benchmark returns and equity aligned to the bar dates
     * @return false if fewer than two bar dates have a benchmark close
     */
    static bool align_benchmark(const std::vector<Bar>& bars,
                                const std::vector<BenchmarkPoint>& benchmark,
                                std::vector<OptionalValue>& returns, std::vector<double>& equity);

private:
    BacktestConfig config_;

    static void build_logs(RunResult& result);
};

}  // namespace backtest
}  // namespace quant_ngin
