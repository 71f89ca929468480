// include/quant_ngin/statistics/statistics_tools.hpp
#pragma once

#include <Eigen/Dense>
#include <vector>

namespace quant_ngin {
namespace statistics {

/**
 * @brief Map a std::vector onto an Eigen column vector without copying
 */
inline Eigen::Map<const Eigen::VectorXd> as_eigen(const std::vector<double>& values) {
    return Eigen::Map<const Eigen::VectorXd>(values.data(),
                                             static_cast<Eigen::Index>(values.size()));
}

/**
 * @brief Arithmetic mean, 0 for an empty sample
 */
double mean(const std::vector<double>& values);

/**
 * @brief Sample standard deviation (n - 1 denominator)
 * @return 0 when fewer than two observations are available
 */
double sample_std_dev(const std::vector<double>& values);

/**
 * @brief Population standard deviation (n denominator)
 * @return 0 for an empty sample
 */
double population_std_dev(const std::vector<double>& values);

/**
 * @brief Percentile with linear interpolation between closest ranks
 *
 * Matches the default convention of numpy.percentile: rank = p/100 * (n - 1).
 *
 * @param values Sample (need not be sorted)
 * @param pct Percentile in [0, 100]
 * @return Interpolated percentile, 0 for an empty sample
 */
double percentile(std::vector<double> values, double pct);

}  // namespace statistics
}  // namespace quant_ngin
