#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "core/test_base.hpp"
#include "quant_ngin/data/csv_data_provider.hpp"

using namespace quant_ngin;
using namespace quant_ngin::testing;

class CSVDataProviderTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        dir_ = std::filesystem::temp_directory_path() / "quant_ngin_csv_provider_test";
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);

        write("600519.csv",
              "date,open,high,low,close,volume\n"
              "2024-01-02,10.0,10.5,9.8,10.2,1000\n"
              "2024-01-03,10.2,10.8,10.1,10.6,1200\n"
              "2024-01-04,10.6,10.9,10.3,10.4,900\n"
              "2024-01-05,10.4,10.7,10.0,10.1,1100\n");
        write("000300.csv",
              "date,close\n"
              "2024-01-02,3400.5\n"
              "2024-01-03,3410.0\n");
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
        TestBase::TearDown();
    }

    void write(const std::string& name, const std::string& content) {
        std::ofstream file(dir_ / name);
        file << content;
    }

    std::filesystem::path dir_;
};

TEST_F(CSVDataProviderTest, ReadsBarsWithinRange) {
    CSVDataProvider provider(dir_.string());
    EXPECT_EQ(provider.name(), "csv");

    auto bars = provider.get_bars("600519", core::make_date(2024, 1, 3), core::make_date(2024, 1, 4));
    ASSERT_TRUE(bars.is_ok()) << bars.error()->what();
    ASSERT_EQ(bars.value().size(), 2u);
    EXPECT_EQ(core::format_date(bars.value()[0].timestamp), "2024-01-03");
    EXPECT_DOUBLE_EQ(bars.value()[0].close, 10.6);
    EXPECT_DOUBLE_EQ(bars.value()[1].volume, 900.0);
    EXPECT_EQ(bars.value()[1].symbol, "600519");
}

TEST_F(CSVDataProviderTest, MissingFileIsDataNotFound) {
    CSVDataProvider provider(dir_.string());
    auto bars = provider.get_bars("999999", core::make_date(2024, 1, 1), core::make_date(2024, 2, 1));
    ASSERT_TRUE(bars.is_error());
    EXPECT_EQ(bars.error()->code(), ErrorCode::DATA_NOT_FOUND);
}

TEST_F(CSVDataProviderTest, ReadsBenchmark) {
    CSVDataProvider provider(dir_.string());
    auto points =
        provider.get_benchmark("000300", core::make_date(2024, 1, 1), core::make_date(2024, 2, 1));
    ASSERT_TRUE(points.is_ok());
    ASSERT_EQ(points.value().size(), 2u);
    EXPECT_DOUBLE_EQ(points.value()[0].close, 3400.5);
}

TEST_F(CSVDataProviderTest, FundamentalsFromJson) {
    write("fundamentals.json", R"({"600519": {"roe": 30.1, "cash_flow": 5.0}})");
    CSVDataProvider provider(dir_.string());

    auto snapshot = provider.get_fundamentals("600519");
    EXPECT_FALSE(snapshot.is_default);
    EXPECT_DOUBLE_EQ(snapshot.roe, 30.1);
    EXPECT_DOUBLE_EQ(snapshot.cash_flow, 5.0);
    EXPECT_DOUBLE_EQ(snapshot.revenue_growth, FundamentalSnapshot::DEFAULT_REVENUE_GROWTH);

    auto unknown = provider.get_fundamentals("000001");
    EXPECT_TRUE(unknown.is_default);
}

TEST_F(CSVDataProviderTest, MissingOrBrokenFundamentalsUseDefaults) {
    CSVDataProvider provider(dir_.string());
    EXPECT_TRUE(provider.get_fundamentals("600519").is_default);

    write("fundamentals.json", "{ broken");
    auto snapshot = provider.get_fundamentals("600519");
    EXPECT_TRUE(snapshot.is_default);
    EXPECT_DOUBLE_EQ(snapshot.roe, FundamentalSnapshot::DEFAULT_ROE);
}
