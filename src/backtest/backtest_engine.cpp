// src/backtest/backtest_engine.cpp
#include "quant_ngin/backtest/backtest_engine.hpp"
#include <cmath>
#include <unordered_map>
#include <utility>
#include "quant_ngin/backtest/bar_validation.hpp"
#include "quant_ngin/core/logger.hpp"
#include "quant_ngin/core/time_utils.hpp"
#include "quant_ngin/strategy/strategy_state_machine.hpp"

namespace quant_ngin {
namespace backtest {

namespace {

constexpr const char* BUY_AND_HOLD = "buy_and_hold";

Timestamp parse_config_date(const nlohmann::json& j, const char* key) {
    auto parsed = core::parse_date(j.at(key).get<std::string>());
    if (parsed.is_error()) {
        throw TradeError(ErrorCode::INVALID_ARGUMENT,
                         std::string("Invalid ") + key + ": " + parsed.error()->what(),
                         "BacktestConfig");
    }
    return parsed.value();
}

Timestamp years_before(const Timestamp& end, double years) {
    const auto days = static_cast<int64_t>(std::llround(years * 365.0));
    return end - std::chrono::hours(24 * days);
}

}  // namespace

nlohmann::json PortfolioConfig::to_json() const {
    nlohmann::json j;
    j["enabled"] = enabled;
    j["symbols"] = symbols;
    return j;
}

void PortfolioConfig::from_json(const nlohmann::json& j) {
    if (j.contains("enabled"))
        enabled = j.at("enabled").get<bool>();
    if (j.contains("symbols"))
        symbols = j.at("symbols").get<std::vector<std::string>>();
}

BacktestConfig::BacktestConfig() {
    end_date = core::floor_to_day(std::chrono::system_clock::now());
    start_date = years_before(end_date, backtest_years);
}

Result<void> BacktestConfig::validate() const {
    if (symbol.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Symbol must not be empty",
                                "BacktestConfig");
    }
    if (start_date >= end_date) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Start date " + core::format_date(start_date) +
                                    " is not before end date " + core::format_date(end_date),
                                "BacktestConfig");
    }
    if (backtest_years <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Backtest years must be positive",
                                "BacktestConfig");
    }
    if (min_bars < 2) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Minimum bar count must be at least 2",
                                "BacktestConfig");
    }

    auto strategy_result = strategy.validate();
    if (strategy_result.is_error())
        return strategy_result;

    auto cost_result = costs.validate();
    if (cost_result.is_error())
        return cost_result;

    if (monte_carlo.enabled) {
        return monte_carlo.validate();
    }
    return Result<void>();
}

nlohmann::json BacktestConfig::to_json() const {
    nlohmann::json j;
    j["symbol"] = symbol;
    j["benchmark_id"] = benchmark_id;
    j["start_date"] = core::format_date(start_date);
    j["end_date"] = core::format_date(end_date);
    j["backtest_years"] = backtest_years;
    j["min_bars"] = min_bars;
    j["strategy"] = strategy.to_json();
    j["costs"] = costs.to_json();
    j["monte_carlo"] = monte_carlo.to_json();
    j["portfolio"] = portfolio.to_json();
    j["output_directory"] = output_directory;
    return j;
}

void BacktestConfig::from_json(const nlohmann::json& j) {
    if (j.contains("symbol"))
        symbol = j.at("symbol").get<std::string>();
    if (j.contains("benchmark_id"))
        benchmark_id = j.at("benchmark_id").get<std::string>();
    if (j.contains("backtest_years"))
        backtest_years = j.at("backtest_years").get<double>();
    if (j.contains("min_bars"))
        min_bars = j.at("min_bars").get<size_t>();

    if (j.contains("end_date"))
        end_date = parse_config_date(j, "end_date");
    if (j.contains("start_date")) {
        start_date = parse_config_date(j, "start_date");
    } else {
        start_date = years_before(end_date, backtest_years);
    }

    if (j.contains("strategy"))
        strategy.from_json(j.at("strategy"));
    if (j.contains("costs"))
        costs.from_json(j.at("costs"));
    if (j.contains("monte_carlo"))
        monte_carlo.from_json(j.at("monte_carlo"));
    if (j.contains("portfolio"))
        portfolio.from_json(j.at("portfolio"));
    if (j.contains("output_directory"))
        output_directory = j.at("output_directory").get<std::string>();
}

BacktestEngine::BacktestEngine(BacktestConfig config) : config_(std::move(config)) {}

bool BacktestEngine::align_benchmark(const std::vector<Bar>& bars,
                                     const std::vector<BenchmarkPoint>& benchmark,
                                     std::vector<OptionalValue>& returns,
                                     std::vector<double>& equity) {
    std::unordered_map<int64_t, double> closes;
    for (const auto& point : benchmark) {
        const auto day = std::chrono::duration_cast<std::chrono::hours>(
                             core::floor_to_day(point.timestamp).time_since_epoch())
                             .count();
        closes[day] = point.close;
    }

    std::vector<OptionalValue> aligned(bars.size());
    size_t matched = 0;
    for (size_t i = 0; i < bars.size(); ++i) {
        const auto day = std::chrono::duration_cast<std::chrono::hours>(
                             core::floor_to_day(bars[i].timestamp).time_since_epoch())
                             .count();
        auto it = closes.find(day);
        if (it != closes.end() && it->second > 0.0) {
            aligned[i] = it->second;
            ++matched;
        }
    }
    if (matched < 2) {
        return false;
    }

    returns.assign(bars.size(), std::nullopt);
    equity.assign(bars.size(), 1.0);
    for (size_t i = 1; i < bars.size(); ++i) {
        if (aligned[i] && aligned[i - 1]) {
            returns[i] = *aligned[i] / *aligned[i - 1] - 1.0;
        }
        equity[i] = equity[i - 1] * (1.0 + returns[i].value_or(0.0));
    }
    return true;
}

void BacktestEngine::build_logs(RunResult& result) {
    const auto& states = result.states;
    for (size_t i = 1; i < states.size(); ++i) {
        const StrategyState& prev = states[i - 1];
        const StrategyState& today = states[i];

        if (today.risk_event != RiskEvent::NONE) {
            ++result.risk_event_counts[today.risk_event];

            RiskEventRecord record;
            record.date = result.bars[i].timestamp;
            record.entry_price = prev.entry_price;
            record.trigger_price = result.bars[i].close;
            record.change_pct =
                prev.entry_price > 0.0 ? result.bars[i].close / prev.entry_price - 1.0 : 0.0;
            record.event = today.risk_event;
            result.risk_events.push_back(record);
        }

        if (today.signal != prev.signal) {
            TradeRecord trade;
            trade.date = result.bars[i].timestamp;
            trade.close = result.bars[i].close;
            trade.signal = today.signal;
            trade.position = today.position;
            trade.risk_event = today.risk_event;
            trade.cost = result.returns.costs[i];
            trade.technical_score = today.technical_score;
            trade.composite_score = today.composite_score;
            result.trades.push_back(trade);
        }
    }
}

Result<RunResult> BacktestEngine::run(const std::vector<Bar>& bars,
                                      const FundamentalSnapshot& fundamentals,
                                      const std::vector<BenchmarkPoint>& benchmark) const {
    Logger::register_component("BacktestEngine");

    auto config_result = config_.validate();
    if (config_result.is_error()) {
        ERROR("Invalid backtest configuration: " << config_result.error()->what());
        return forward_error<RunResult>(config_result, "BacktestEngine");
    }

    auto valid = validate_bars(bars, config_.min_bars);
    if (valid.is_error()) {
        ERROR("Rejected input for " << config_.symbol << ": " << valid.error()->what());
        return forward_error<RunResult>(valid, "BacktestEngine");
    }

    RunResult result;
    result.symbol = config_.symbol;
    result.bars = bars;
    result.fundamentals = fundamentals;

    INFO("Backtest " << config_.symbol << ": " << bars.size() << " bars from "
                     << core::format_date(bars.front().timestamp) << " to "
                     << core::format_date(bars.back().timestamp) << ", mode "
                     << signal_mode_to_string(config_.strategy.signal_mode));

    result.indicators = indicators::compute_all(bars, config_.strategy.indicators);

    const FundamentalConfig& fundamental_config = config_.strategy.fundamentals;
    result.fundamental_assessment = score_fundamentals(fundamentals, fundamental_config);
    if (fundamental_config.enabled) {
        result.fundamental_score = result.fundamental_assessment.score;
        if (result.fundamental_assessment.excluded) {
            for (const auto& failed : result.fundamental_assessment.failed_metrics) {
                WARN(config_.symbol << " fails fundamental filter: " << failed);
            }
        }
    } else {
        result.fundamental_score = StrategyStateMachine::NEUTRAL_FUNDAMENTAL_SCORE;
    }

    StrategyStateMachine machine(config_.strategy);
    auto states = machine.run(bars, result.indicators, result.fundamental_score);
    if (states.is_error()) {
        return forward_error<RunResult>(states, "BacktestEngine");
    }
    result.states = states.take_value();

    auto returns = compute_returns(bars, result.states, config_.costs);
    if (returns.is_error()) {
        return forward_error<RunResult>(returns, "BacktestEngine");
    }
    result.returns = returns.take_value();

    PerformanceAnalytics analytics;
    result.metrics = analytics.compute(result.returns);
    build_logs(result);

    if (!benchmark.empty() &&
        align_benchmark(bars, benchmark, result.benchmark_returns, result.benchmark_equity)) {
        result.benchmark_source = config_.benchmark_id.empty() ? "benchmark" : config_.benchmark_id;
    } else {
        if (!benchmark.empty()) {
            WARN("Benchmark does not overlap the bars, using buy-and-hold of "
                 << config_.symbol);
        }
        result.benchmark_source = BUY_AND_HOLD;
        result.benchmark_returns = result.returns.market_returns;
        result.benchmark_equity.assign(bars.size(), 1.0);
        for (size_t i = 1; i < bars.size(); ++i) {
            result.benchmark_equity[i] =
                result.benchmark_equity[i - 1] * (1.0 + result.benchmark_returns[i].value_or(0.0));
        }
    }

    result.total_return = result.returns.total_return();
    result.benchmark_return = result.benchmark_equity.back() - 1.0;
    result.excess_return = result.total_return - result.benchmark_return;

    if (config_.monte_carlo.enabled) {
        MonteCarloResampler resampler(config_.monte_carlo);
        auto mc = resampler.run(result.returns.realized_returns());
        if (mc.is_error()) {
            return forward_error<RunResult>(mc, "BacktestEngine");
        }
        result.monte_carlo = mc.take_value();
    }

    INFO("Backtest " << config_.symbol << " done: total " << result.total_return
                     << ", annualized " << result.metrics.annualized_return << ", sharpe "
                     << result.metrics.sharpe_ratio << ", max drawdown "
                     << result.metrics.max_drawdown << ", trades " << result.metrics.trade_count
                     << ", risk exits " << result.risk_events.size());

    return result;
}

Result<RunResult> BacktestEngine::run(MarketDataProvider& provider) const {
    auto bars = provider.get_bars(config_.symbol, config_.start_date, config_.end_date);
    if (bars.is_error()) {
        ERROR("Failed to fetch bars for " << config_.symbol << ": " << bars.error()->what());
        return forward_error<RunResult>(bars, "BacktestEngine");
    }

    const FundamentalSnapshot fundamentals = provider.get_fundamentals(config_.symbol);

    std::vector<BenchmarkPoint> benchmark;
    if (!config_.benchmark_id.empty()) {
        auto fetched =
            provider.get_benchmark(config_.benchmark_id, config_.start_date, config_.end_date);
        if (fetched.is_error()) {
            WARN("Benchmark " << config_.benchmark_id
                              << " unavailable, using buy-and-hold: " << fetched.error()->what());
        } else {
            benchmark = fetched.take_value();
        }
    }

    return run(bars.value(), fundamentals, benchmark);
}

}  // namespace backtest
}  // namespace quant_ngin
