// src/backtest/portfolio_aggregator.cpp
#include "quant_ngin/backtest/portfolio_aggregator.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <utility>
#include "quant_ngin/backtest/bar_validation.hpp"
#include "quant_ngin/core/logger.hpp"
#include "quant_ngin/indicators/indicators.hpp"
#include "quant_ngin/statistics/statistics_tools.hpp"

namespace quant_ngin {
namespace backtest {

nlohmann::json PortfolioResult::to_json() const {
    nlohmann::json j;
    j["rankings"] = nlohmann::json::array();
    for (const auto& p : rankings) {
        j["rankings"].push_back({{"symbol", p.symbol},
                                 {"total_return", p.total_return},
                                 {"annualized_return", p.annualized_return},
                                 {"bar_count", p.bar_count}});
    }
    j["excluded"] = nlohmann::json::array();
    for (const auto& e : excluded) {
        j["excluded"].push_back({{"symbol", e.symbol}, {"reason", e.reason}});
    }
    j["mean_annualized_return"] = mean_annualized_return;
    j["std_annualized_return"] = std_annualized_return;
    j["sharpe_ratio"] = sharpe_ratio;
    return j;
}

PortfolioAggregator::PortfolioAggregator(int fast_period, int slow_period, double backtest_years,
                                         size_t min_bars)
    : fast_period_(fast_period),
      slow_period_(slow_period),
      backtest_years_(backtest_years),
      min_bars_(min_bars) {}

Result<SymbolPerformance> PortfolioAggregator::evaluate(const std::string& symbol,
                                                        const std::vector<Bar>& bars) const {
    auto valid = validate_bars(bars, min_bars_);
    if (valid.is_error()) {
        return forward_error<SymbolPerformance>(valid, "PortfolioAggregator");
    }
    if (fast_period_ < 1 || slow_period_ < 1 || backtest_years_ <= 0.0) {
        return make_error<SymbolPerformance>(ErrorCode::INVALID_ARGUMENT,
                                             "Invalid basket parameters", "PortfolioAggregator");
    }

    std::vector<double> closes;
    closes.reserve(bars.size());
    for (const auto& bar : bars) {
        closes.push_back(bar.close);
    }
    const auto fast = indicators::moving_average(closes, fast_period_);
    const auto slow = indicators::moving_average(closes, slow_period_);

    double equity = 1.0;
    int prev_signal = 0;
    for (size_t i = 1; i < closes.size(); ++i) {
        equity *= 1.0 + prev_signal * (closes[i] / closes[i - 1] - 1.0);
        prev_signal = (fast[i] && slow[i] && *fast[i] > *slow[i]) ? 1 : 0;
    }

    SymbolPerformance perf;
    perf.symbol = symbol;
    perf.total_return = equity - 1.0;
    perf.annualized_return = std::pow(1.0 + perf.total_return, 1.0 / backtest_years_) - 1.0;
    perf.bar_count = bars.size();
    return perf;
}

PortfolioResult PortfolioAggregator::summarize(std::vector<SymbolPerformance> performances,
                                               std::vector<ExcludedSymbol> excluded) {
    PortfolioResult result;
    result.rankings = std::move(performances);
    result.excluded = std::move(excluded);

    std::stable_sort(result.rankings.begin(), result.rankings.end(),
                     [](const SymbolPerformance& a, const SymbolPerformance& b) {
                         return a.annualized_return > b.annualized_return;
                     });

    std::vector<double> annualized;
    annualized.reserve(result.rankings.size());
    for (const auto& p : result.rankings) {
        annualized.push_back(p.annualized_return);
    }

    result.mean_annualized_return = statistics::mean(annualized);
    result.std_annualized_return = statistics::sample_std_dev(annualized);
    result.sharpe_ratio = result.std_annualized_return > 0.0
                              ? result.mean_annualized_return / result.std_annualized_return
                              : 0.0;
    return result;
}

PortfolioResult PortfolioAggregator::run(MarketDataProvider& provider,
                                         const std::vector<std::string>& symbols,
                                         const Timestamp& start_date,
                                         const Timestamp& end_date) const {
    std::vector<std::future<Result<SymbolPerformance>>> futures;
    futures.reserve(symbols.size());

    for (const auto& symbol : symbols) {
        futures.push_back(std::async(std::launch::async, [this, &provider, symbol, start_date,
                                                          end_date]() -> Result<SymbolPerformance> {
            Logger::register_component("PortfolioAggregator");
            try {
                auto bars = provider.get_bars(symbol, start_date, end_date);
                if (bars.is_error()) {
                    return forward_error<SymbolPerformance>(bars, "PortfolioAggregator");
                }
                return evaluate(symbol, bars.value());
            } catch (const std::exception& e) {
                return make_error<SymbolPerformance>(ErrorCode::UNKNOWN_ERROR, e.what(),
                                                     "PortfolioAggregator");
            }
        }));
    }

    std::vector<SymbolPerformance> performances;
    std::vector<ExcludedSymbol> excluded;
    for (size_t i = 0; i < futures.size(); ++i) {
        auto result = futures[i].get();
        if (result.is_error()) {
            WARN("Excluding " << symbols[i] << " from basket: " << result.error()->what());
            excluded.push_back({symbols[i], result.error()->what()});
        } else {
            performances.push_back(result.value());
        }
    }

    auto summary = summarize(std::move(performances), std::move(excluded));
    INFO("Basket of " << symbols.size() << " symbols: " << summary.rankings.size()
                      << " ranked, mean annualized " << summary.mean_annualized_return
                      << ", sharpe " << summary.sharpe_ratio);
    return summary;
}

}  // namespace backtest
}  // namespace quant_ngin
