// tests/data/mock_data_provider.hpp
#pragma once

#include <atomic>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "quant_ngin/data/market_data_provider.hpp"

namespace quant_ngin {
namespace testing {

/**
 * @brief In-memory provider with scripted failures
 *
 * Data is set up before use and only read afterwards, so concurrent calls
 * are safe.
 */
class MockDataProvider : public MarketDataProvider {
public:
    explicit MockDataProvider(std::string name = "mock") : name_(std::move(name)) {}

    std::string name() const override {
        return name_;
    }

    void set_bars(const std::string& symbol, std::vector<Bar> bars) {
        bars_[symbol] = std::move(bars);
    }

    void set_benchmark(const std::string& id, std::vector<BenchmarkPoint> points) {
        benchmarks_[id] = std::move(points);
    }

    void set_fundamentals(const std::string& symbol, FundamentalSnapshot snapshot) {
        fundamentals_[symbol] = snapshot;
    }

    void fail_symbol(const std::string& symbol, ErrorCode code) {
        failures_[symbol] = code;
    }

    // The first n bar requests fail with PROVIDER_ERROR
    void fail_first_calls(int n) {
        failing_calls_ = n;
    }

    Result<std::vector<Bar>> get_bars(const std::string& symbol, const Timestamp& start_date,
                                      const Timestamp& end_date) override {
        const int call = bar_calls_++;
        if (call < failing_calls_) {
            return make_error<std::vector<Bar>>(ErrorCode::PROVIDER_ERROR, "scripted failure",
                                                name_);
        }
        auto failure = failures_.find(symbol);
        if (failure != failures_.end()) {
            return make_error<std::vector<Bar>>(failure->second, "scripted failure for " + symbol,
                                                name_);
        }
        auto it = bars_.find(symbol);
        if (it == bars_.end()) {
            return make_error<std::vector<Bar>>(ErrorCode::DATA_NOT_FOUND,
                                                "no bars for " + symbol, name_);
        }
        std::vector<Bar> selected;
        for (const auto& bar : it->second) {
            if (bar.timestamp >= start_date && bar.timestamp <= end_date) {
                selected.push_back(bar);
            }
        }
        return selected;
    }

    Result<std::vector<BenchmarkPoint>> get_benchmark(const std::string& benchmark_id,
                                                      const Timestamp&,
                                                      const Timestamp&) override {
        ++benchmark_calls_;
        auto it = benchmarks_.find(benchmark_id);
        if (it == benchmarks_.end()) {
            return make_error<std::vector<BenchmarkPoint>>(
                ErrorCode::DATA_NOT_FOUND, "no benchmark " + benchmark_id, name_);
        }
        return it->second;
    }

    FundamentalSnapshot get_fundamentals(const std::string& symbol) override {
        ++fundamental_calls_;
        auto it = fundamentals_.find(symbol);
        return it == fundamentals_.end() ? FundamentalSnapshot{} : it->second;
    }

    int bar_calls() const {
        return bar_calls_.load();
    }
    int benchmark_calls() const {
        return benchmark_calls_.load();
    }
    int fundamental_calls() const {
        return fundamental_calls_.load();
    }

private:
    std::string name_;
    std::map<std::string, std::vector<Bar>> bars_;
    std::map<std::string, std::vector<BenchmarkPoint>> benchmarks_;
    std::map<std::string, FundamentalSnapshot> fundamentals_;
    std::map<std::string, ErrorCode> failures_;
    int failing_calls_{0};
    std::atomic<int> bar_calls_{0};
    std::atomic<int> benchmark_calls_{0};
    std::atomic<int> fundamental_calls_{0};
};

}  // namespace testing
}  // namespace quant_ngin
