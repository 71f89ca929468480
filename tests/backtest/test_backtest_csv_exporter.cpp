#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include "core/test_base.hpp"
#include "quant_ngin/backtest/backtest_csv_exporter.hpp"

using namespace quant_ngin;
using namespace quant_ngin::backtest;
using namespace quant_ngin::testing;

class BacktestCSVExporterTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        out_dir_ = std::filesystem::temp_directory_path() / "quant_ngin_exporter_test";
        std::filesystem::remove_all(out_dir_);

        BacktestConfig config;
        config.symbol = "600519";
        config.strategy.risk.take_profit_pct = 10.0;
        config.monte_carlo.enabled = true;
        config.monte_carlo.num_simulations = 20;

        auto result = BacktestEngine(config).run(make_bars(flat_then_rising()),
                                                 FundamentalSnapshot{});
        ASSERT_TRUE(result.is_ok());
        run_ = result.take_value();
    }

    void TearDown() override {
        std::filesystem::remove_all(out_dir_);
        TestBase::TearDown();
    }

    std::vector<std::string> read_lines(const std::string& name) {
        std::ifstream file(out_dir_ / name);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(file, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    std::filesystem::path out_dir_;
    RunResult run_;
};

TEST_F(BacktestCSVExporterTest, ExportRunWritesEveryFile) {
    BacktestCSVExporter exporter(out_dir_.string());
    ASSERT_TRUE(exporter.export_run(run_).is_ok());

    for (const char* name : {"daily_states.csv", "trades.csv", "risk_events.csv", "metrics.json"}) {
        EXPECT_TRUE(std::filesystem::exists(out_dir_ / name)) << name;
    }
}

TEST_F(BacktestCSVExporterTest, DailyStatesHaveOneRowPerBar) {
    BacktestCSVExporter exporter(out_dir_.string());
    ASSERT_TRUE(exporter.export_daily_states(run_).is_ok());

    auto lines = read_lines("daily_states.csv");
    ASSERT_EQ(lines.size(), run_.bars.size() + 1);
    EXPECT_EQ(lines[0].rfind("date,open,high,low,close", 0), 0u);
    // Undefined indicators are empty cells on the seed day
    EXPECT_EQ(lines[1].rfind("2023-01-02,100,101,99,100,1000,,,", 0), 0u);
}

TEST_F(BacktestCSVExporterTest, TradesListEntry) {
    BacktestCSVExporter exporter(out_dir_.string());
    ASSERT_TRUE(exporter.export_trades(run_).is_ok());

    auto lines = read_lines("trades.csv");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[1].find(",buy,102,"), std::string::npos);
}

TEST_F(BacktestCSVExporterTest, MetricsJsonHasAllSections) {
    BacktestCSVExporter exporter(out_dir_.string());
    ASSERT_TRUE(exporter.export_metrics(run_).is_ok());

    std::ifstream file(out_dir_ / "metrics.json");
    nlohmann::json j;
    file >> j;
    EXPECT_EQ(j["symbol"], "600519");
    EXPECT_TRUE(j["performance"].contains("sharpe_ratio"));
    EXPECT_EQ(j["benchmark"]["source"], "buy_and_hold");
    EXPECT_TRUE(j.contains("monte_carlo"));
    EXPECT_TRUE(j["fundamentals"]["is_default"].get<bool>());
}

TEST_F(BacktestCSVExporterTest, PortfolioRanking) {
    PortfolioResult portfolio;
    portfolio.rankings = {{"B", 0.3, 0.3, 80}, {"A", 0.1, 0.1, 80}};

    BacktestCSVExporter exporter(out_dir_.string());
    ASSERT_TRUE(exporter.export_portfolio(portfolio).is_ok());

    auto lines = read_lines("portfolio.csv");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1].rfind("1,B,", 0), 0u);
    EXPECT_EQ(lines[2].rfind("2,A,", 0), 0u);
}

TEST_F(BacktestCSVExporterTest, UnwritableDirectoryIsFileError) {
    std::filesystem::create_directories(out_dir_);
    const auto blocker = out_dir_ / "blocker";
    std::ofstream(blocker) << "x";

    BacktestCSVExporter exporter((blocker / "nested").string());
    auto result = exporter.export_run(run_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_IO_ERROR);
}
