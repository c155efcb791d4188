#pragma once

#include <cstddef>
#include <vector>

namespace seasonkit::utils {

/**
 * @brief Arithmetic mean. Returns 0 for an empty vector.
 */
double mean(const std::vector<double> &values);

/**
 * @brief Variance with the given delta degrees of freedom (0 = population, 1 = sample).
 *
 * Returns 0 when fewer than ddof + 1 values are available.
 */
double variance(const std::vector<double> &values, std::size_t ddof = 0);

/**
 * @brief Median of a copy of the data.
 * @throws std::invalid_argument on empty input.
 */
double median(std::vector<double> values);

/**
 * @brief Pearson correlation between values[t] and values[t + lag].
 *
 * Returns 0 when fewer than two pairs overlap or either side is constant.
 */
double lagCorrelation(const std::vector<double> &values, std::size_t lag);

/**
 * @brief Tricube kernel (1 - |u|^3)^3 on |u| < 1, zero elsewhere.
 */
double tricube(double u);

/**
 * @brief Bisquare kernel (1 - u^2)^2 on |u| < 1, zero elsewhere.
 */
double bisquare(double u);

bool allFinite(const std::vector<double> &values);

/**
 * @brief Strength of a decomposition component: max(0, 1 - Var(R) / Var(C + R)).
 * @throws std::invalid_argument If the vectors differ in length.
 */
double componentStrength(const std::vector<double> &component, const std::vector<double> &remainder);

} // namespace seasonkit::utils
