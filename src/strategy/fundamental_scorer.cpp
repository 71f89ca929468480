// src/strategy/fundamental_scorer.cpp
#include "quant_ngin/strategy/fundamental_scorer.hpp"
#include <iomanip>
#include <sstream>

namespace quant_ngin {

nlohmann::json FundamentalConfig::to_json() const {
    nlohmann::json j;
    j["enabled"] = enabled;
    j["min_roe"] = min_roe;
    j["min_revenue_growth"] = min_revenue_growth;
    j["min_profit_growth"] = min_profit_growth;
    j["min_cash_flow"] = min_cash_flow;
    return j;
}

void FundamentalConfig::from_json(const nlohmann::json& j) {
    if (j.contains("enabled"))
        enabled = j.at("enabled").get<bool>();
    if (j.contains("min_roe"))
        min_roe = j.at("min_roe").get<double>();
    if (j.contains("min_revenue_growth"))
        min_revenue_growth = j.at("min_revenue_growth").get<double>();
    if (j.contains("min_profit_growth"))
        min_profit_growth = j.at("min_profit_growth").get<double>();
    if (j.contains("min_cash_flow"))
        min_cash_flow = j.at("min_cash_flow").get<double>();
}

namespace {

std::string describe(const std::string& name, double value, double threshold) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << name << " " << value << " < " << threshold;
    return ss.str();
}

}  // namespace

FundamentalAssessment score_fundamentals(const FundamentalSnapshot& snapshot,
                                         const FundamentalConfig& config) {
    FundamentalAssessment result;

    result.roe_score = snapshot.roe >= config.min_roe ? 1.0 : 0.0;
    result.growth_score = (snapshot.revenue_growth >= config.min_revenue_growth &&
                           snapshot.profit_growth >= config.min_profit_growth)
                              ? 1.0
                              : 0.0;
    result.cash_score = snapshot.cash_flow >= config.min_cash_flow ? 1.0 : 0.0;
    result.score = (result.roe_score + result.growth_score + result.cash_score) / 3.0;

    if (snapshot.roe < config.min_roe) {
        result.failed_metrics.push_back(describe("ROE", snapshot.roe, config.min_roe));
    }
    if (snapshot.revenue_growth < config.min_revenue_growth) {
        result.failed_metrics.push_back(
            describe("revenue growth", snapshot.revenue_growth, config.min_revenue_growth));
    }
    if (snapshot.profit_growth < config.min_profit_growth) {
        result.failed_metrics.push_back(
            describe("profit growth", snapshot.profit_growth, config.min_profit_growth));
    }
    if (snapshot.cash_flow < config.min_cash_flow) {
        result.failed_metrics.push_back(
            describe("cash flow", snapshot.cash_flow, config.min_cash_flow));
    }
    result.excluded = !result.failed_metrics.empty();

    return result;
}

}  // namespace quant_ngin
