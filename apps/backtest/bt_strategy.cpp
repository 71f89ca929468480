// apps/backtest/bt_strategy.cpp
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include "quant_ngin/backtest/backtest_csv_exporter.hpp"
#include "quant_ngin/backtest/backtest_engine.hpp"
#include "quant_ngin/backtest/portfolio_aggregator.hpp"
#include "quant_ngin/core/logger.hpp"
#include "quant_ngin/core/time_utils.hpp"
#include "quant_ngin/data/csv_data_provider.hpp"
#include "quant_ngin/data/postgres_data_provider.hpp"
#include "quant_ngin/data/retrying_data_provider.hpp"

using namespace quant_ngin;
using namespace quant_ngin::backtest;

namespace {

void print_usage() {
    std::cerr << "Usage: bt_strategy <config.json> [data_dir]" << std::endl;
}

void print_summary(const RunResult& result) {
    const auto& m = result.metrics;
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "\n======= Backtest " << result.symbol << " =======" << std::endl;
    std::cout << "Bars:               " << result.bars.size() << " ("
              << core::format_date(result.bars.front().timestamp) << " to "
              << core::format_date(result.bars.back().timestamp) << ")" << std::endl;
    std::cout << "Total return:       " << m.total_return * 100.0 << "%" << std::endl;
    std::cout << "Annualized return:  " << m.annualized_return * 100.0 << "%" << std::endl;
    std::cout << "Volatility:         " << m.annualized_volatility * 100.0 << "%" << std::endl;
    std::cout << "Sharpe ratio:       " << m.sharpe_ratio << std::endl;
    std::cout << "Max drawdown:       " << m.max_drawdown * 100.0 << "%" << std::endl;
    std::cout << "Calmar ratio:       " << m.calmar_ratio << std::endl;
    std::cout << "Win rate:           " << m.win_rate * 100.0 << "%" << std::endl;
    std::cout << "Profit/loss ratio:  " << m.profit_loss_ratio << std::endl;
    std::cout << "Trades:             " << m.trade_count << std::endl;
    std::cout << "Risk exits:         " << result.risk_events.size() << std::endl;
    std::cout << "Benchmark (" << result.benchmark_source
              << "): " << result.benchmark_return * 100.0 << "%" << std::endl;
    std::cout << "Excess return:      " << result.excess_return * 100.0 << "%" << std::endl;

    if (result.monte_carlo) {
        const auto& mc = *result.monte_carlo;
        std::cout << "Monte Carlo:        mean " << mc.mean * 100.0 << "%, 95% interval ["
                  << mc.percentile_2_5 * 100.0 << "%, " << mc.percentile_97_5 * 100.0
                  << "%], P(>0) " << mc.probability_positive << std::endl;
    }
}

void print_portfolio(const PortfolioResult& portfolio) {
    std::cout << "\n======= Basket ranking =======" << std::endl;
    for (size_t i = 0; i < portfolio.rankings.size(); ++i) {
        const auto& p = portfolio.rankings[i];
        std::cout << std::setw(3) << i + 1 << ". " << std::setw(10) << p.symbol << "  "
                  << p.annualized_return * 100.0 << "%" << std::endl;
    }
    for (const auto& e : portfolio.excluded) {
        std::cout << "     excluded " << e.symbol << ": " << e.reason << std::endl;
    }
    std::cout << "Mean annualized:    " << portfolio.mean_annualized_return * 100.0 << "%"
              << std::endl;
    std::cout << "Sharpe ratio:       " << portfolio.sharpe_ratio << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }
    const std::string config_path = argv[1];
    const std::string data_dir = argc > 2 ? argv[2] : "data";

    try {
        nlohmann::json raw;
        {
            std::ifstream file(config_path);
            if (!file.is_open()) {
                std::cerr << "Failed to open config file: " << config_path << std::endl;
                return 1;
            }
            file >> raw;
        }

        LoggerConfig logger_config;
        logger_config.min_level = LogLevel::INFO;
        logger_config.destination = LogDestination::BOTH;
        logger_config.filename_prefix = "bt_strategy";
        if (raw.contains("logging"))
            logger_config.from_json(raw.at("logging"));

        auto& logger = Logger::instance();
        logger.initialize(logger_config);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("bt_strategy");

        BacktestConfig config;
        auto load_result = config.load_from_file(config_path);
        if (load_result.is_error()) {
            ERROR("Failed to load " << config_path << ": " << load_result.error()->what());
            std::cerr << load_result.error()->what() << std::endl;
            return 1;
        }

        RetryConfig retry_config;
        if (raw.contains("retry"))
            retry_config.from_json(raw.at("retry"));
        auto retry_valid = retry_config.validate();
        if (retry_valid.is_error()) {
            ERROR("Invalid retry settings: " << retry_valid.error()->what());
            std::cerr << retry_valid.error()->what() << std::endl;
            return 1;
        }

        std::vector<std::shared_ptr<MarketDataProvider>> providers;
        if (raw.contains("postgres")) {
            PostgresProviderConfig pg_config;
            pg_config.from_json(raw.at("postgres"));
            auto postgres = std::make_shared<PostgresDataProvider>(pg_config);
            auto connected = postgres->connect();
            if (connected.is_error()) {
                WARN("Postgres unavailable, falling back to CSV: " << connected.error()->what());
            } else {
                providers.push_back(postgres);
            }
        }
        providers.push_back(std::make_shared<CSVDataProvider>(data_dir));

        RetryingDataProvider provider(providers, retry_config);

        INFO("Running backtest for " << config.symbol << " from "
                                     << core::format_date(config.start_date) << " to "
                                     << core::format_date(config.end_date));

        BacktestEngine engine(config);
        auto run_result = engine.run(provider);
        if (run_result.is_error()) {
            ERROR("Backtest failed: " << run_result.error()->what());
            std::cerr << "Backtest failed: " << run_result.error()->what() << std::endl;
            return 1;
        }
        const RunResult& result = run_result.value();
        print_summary(result);

        BacktestCSVExporter exporter(config.output_directory);
        auto export_result = exporter.export_run(result);
        if (export_result.is_error()) {
            ERROR("Export failed: " << export_result.error()->what());
            return 1;
        }

        if (config.portfolio.enabled && !config.portfolio.symbols.empty()) {
            const auto& indicators = config.strategy.indicators;
            PortfolioAggregator aggregator(indicators.fast_ma_period, indicators.slow_ma_period,
                                           config.backtest_years, config.min_bars);
            auto portfolio = aggregator.run(provider, config.portfolio.symbols, config.start_date,
                                            config.end_date);
            print_portfolio(portfolio);

            auto portfolio_export = exporter.export_portfolio(portfolio);
            if (portfolio_export.is_error()) {
                ERROR("Portfolio export failed: " << portfolio_export.error()->what());
                return 1;
            }
        }

        std::cout << "\nResults written to " << config.output_directory << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
