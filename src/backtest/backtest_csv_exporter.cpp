// src/backtest/backtest_csv_exporter.cpp
#include "quant_ngin/backtest/backtest_csv_exporter.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <utility>
#include "quant_ngin/core/logger.hpp"
#include "quant_ngin/core/time_utils.hpp"

namespace quant_ngin {
namespace backtest {

namespace {

void write_optional(std::ostream& out, const OptionalValue& value) {
    if (value) {
        out << *value;
    }
}

Result<void> open_failed(const std::string& path) {
    return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to open " + path + " for writing",
                            "BacktestCSVExporter");
}

}  // namespace

BacktestCSVExporter::BacktestCSVExporter(std::string output_directory)
    : output_directory_(std::move(output_directory)) {}

std::string BacktestCSVExporter::path_for(const std::string& filename) const {
    return (std::filesystem::path(output_directory_) / filename).string();
}

Result<void> BacktestCSVExporter::ensure_directory() const {
    std::error_code ec;
    std::filesystem::create_directories(output_directory_, ec);
    if (ec) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to create " + output_directory_ + ": " + ec.message(),
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::export_run(const RunResult& result) const {
    auto dir = ensure_directory();
    if (dir.is_error())
        return dir;

    auto states = export_daily_states(result);
    if (states.is_error())
        return states;

    auto trades = export_trades(result);
    if (trades.is_error())
        return trades;

    auto risk = export_risk_events(result);
    if (risk.is_error())
        return risk;

    auto metrics = export_metrics(result);
    if (metrics.is_error())
        return metrics;

    INFO("Exported results for " << result.symbol << " to " << output_directory_);
    return Result<void>();
}

Result<void> BacktestCSVExporter::export_daily_states(const RunResult& result) const {
    auto dir = ensure_directory();
    if (dir.is_error())
        return dir;

    const std::string path = path_for("daily_states.csv");
    std::ofstream out(path);
    if (!out.is_open()) {
        return open_failed(path);
    }

    out << "date,open,high,low,close,volume,fast_ma,slow_ma,atr,bb_upper,bb_middle,bb_lower,"
           "signal,position,entry_price,stop_loss,take_profit,trailing_stop,risk_event,"
           "technical_score,fundamental_score,composite_score,market_return,gross_return,cost,"
           "net_return,equity,benchmark_return,benchmark_equity\n";
    out << std::setprecision(10);

    const auto& ind = result.indicators;
    const auto& ret = result.returns;
    for (size_t i = 0; i < result.bars.size(); ++i) {
        const Bar& bar = result.bars[i];
        const StrategyState& s = result.states[i];

        out << core::format_date(bar.timestamp) << ',' << bar.open << ',' << bar.high << ','
            << bar.low << ',' << bar.close << ',' << bar.volume << ',';
        write_optional(out, ind.fast_ma[i]);
        out << ',';
        write_optional(out, ind.slow_ma[i]);
        out << ',';
        write_optional(out, ind.atr[i]);
        out << ',';
        write_optional(out, ind.bb_upper[i]);
        out << ',';
        write_optional(out, ind.bb_middle[i]);
        out << ',';
        write_optional(out, ind.bb_lower[i]);
        out << ',' << s.signal << ',' << s.position << ',' << s.entry_price << ',' << s.stop_loss
            << ',' << s.take_profit << ',' << s.trailing_stop << ','
            << risk_event_to_string(s.risk_event) << ',' << s.technical_score << ','
            << s.fundamental_score << ',' << s.composite_score << ',';
        write_optional(out, ret.market_returns[i]);
        out << ',' << ret.gross_returns[i] << ',' << ret.costs[i] << ',' << ret.net_returns[i]
            << ',' << ret.equity[i] << ',';
        write_optional(out, result.benchmark_returns[i]);
        out << ',' << result.benchmark_equity[i] << '\n';
    }

    if (!out.good()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing " + path,
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::export_trades(const RunResult& result) const {
    auto dir = ensure_directory();
    if (dir.is_error())
        return dir;

    const std::string path = path_for("trades.csv");
    std::ofstream out(path);
    if (!out.is_open()) {
        return open_failed(path);
    }

    out << "date,action,close,signal,position,risk_event,cost,technical_score,composite_score\n";
    out << std::setprecision(10);
    for (const auto& trade : result.trades) {
        out << core::format_date(trade.date) << ',' << (trade.signal == 1 ? "buy" : "sell") << ','
            << trade.close << ',' << trade.signal << ',' << trade.position << ','
            << risk_event_to_string(trade.risk_event) << ',' << trade.cost << ','
            << trade.technical_score << ',' << trade.composite_score << '\n';
    }

    if (!out.good()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing " + path,
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::export_risk_events(const RunResult& result) const {
    auto dir = ensure_directory();
    if (dir.is_error())
        return dir;

    const std::string path = path_for("risk_events.csv");
    std::ofstream out(path);
    if (!out.is_open()) {
        return open_failed(path);
    }

    out << "date,event,entry_price,trigger_price,change_pct\n";
    out << std::setprecision(10);
    for (const auto& record : result.risk_events) {
        out << core::format_date(record.date) << ',' << risk_event_to_string(record.event) << ','
            << record.entry_price << ',' << record.trigger_price << ',' << record.change_pct
            << '\n';
    }

    if (!out.good()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing " + path,
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::export_metrics(const RunResult& result) const {
    auto dir = ensure_directory();
    if (dir.is_error())
        return dir;

    nlohmann::json j;
    j["symbol"] = result.symbol;
    j["performance"] = result.metrics.to_json();
    j["benchmark"] = {{"source", result.benchmark_source},
                      {"strategy_return", result.total_return},
                      {"benchmark_return", result.benchmark_return},
                      {"excess_return", result.excess_return}};

    const auto& assessment = result.fundamental_assessment;
    j["fundamentals"] = {{"roe", result.fundamentals.roe},
                         {"revenue_growth", result.fundamentals.revenue_growth},
                         {"profit_growth", result.fundamentals.profit_growth},
                         {"cash_flow", result.fundamentals.cash_flow},
                         {"is_default", result.fundamentals.is_default},
                         {"score", assessment.score},
                         {"excluded", assessment.excluded},
                         {"failed_metrics", assessment.failed_metrics},
                         {"score_used", result.fundamental_score}};

    nlohmann::json counts = nlohmann::json::object();
    for (const auto& [event, count] : result.risk_event_counts) {
        counts[risk_event_to_string(event)] = count;
    }
    j["risk_event_counts"] = counts;

    if (result.monte_carlo) {
        j["monte_carlo"] = result.monte_carlo->to_json();
    }

    const std::string path = path_for("metrics.json");
    std::ofstream out(path);
    if (!out.is_open()) {
        return open_failed(path);
    }
    out << std::setw(4) << j << std::endl;

    if (!out.good()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing " + path,
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::export_portfolio(const PortfolioResult& portfolio) const {
    auto dir = ensure_directory();
    if (dir.is_error())
        return dir;

    const std::string path = path_for("portfolio.csv");
    std::ofstream out(path);
    if (!out.is_open()) {
        return open_failed(path);
    }

    out << "rank,symbol,total_return,annualized_return,bar_count\n";
    out << std::setprecision(10);
    for (size_t i = 0; i < portfolio.rankings.size(); ++i) {
        const auto& p = portfolio.rankings[i];
        out << i + 1 << ',' << p.symbol << ',' << p.total_return << ',' << p.annualized_return
            << ',' << p.bar_count << '\n';
    }

    if (!out.good()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing " + path,
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

}  // namespace backtest
}  // namespace quant_ngin
