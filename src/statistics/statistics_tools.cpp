// src/statistics/statistics_tools.cpp
#include "quant_ngin/statistics/statistics_tools.hpp"
#include <algorithm>
#include <cmath>

namespace quant_ngin {
namespace statistics {

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return as_eigen(values).mean();
}

double sample_std_dev(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    auto v = as_eigen(values);
    const double m = v.mean();
    const double ss = (v.array() - m).square().sum();
    return std::sqrt(ss / static_cast<double>(values.size() - 1));
}

double population_std_dev(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    auto v = as_eigen(values);
    const double m = v.mean();
    const double ss = (v.array() - m).square().sum();
    return std::sqrt(ss / static_cast<double>(values.size()));
}

double percentile(std::vector<double> values, double pct) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());
    pct = std::clamp(pct, 0.0, 100.0);

    const double rank = pct / 100.0 * static_cast<double>(values.size() - 1);
    const size_t lower = static_cast<size_t>(std::floor(rank));
    const size_t upper = std::min(lower + 1, values.size() - 1);
    const double fraction = rank - static_cast<double>(lower);
    return values[lower] + (values[upper] - values[lower]) * fraction;
}

}  // namespace statistics
}  // namespace quant_ngin
