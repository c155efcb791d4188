#pragma once

#include <cstddef>
#include <vector>

namespace seasonkit::smoothing {

/**
 * @brief Averages of every run of `length` consecutive values.
 *
 * The output has x.size() - length + 1 entries; entry i averages x[i .. i+length-1].
 * @throws core::InvalidInputError If length is zero or exceeds the input size.
 */
std::vector<double> movingAverage(const std::vector<double> &x, std::size_t length);

/**
 * @brief STL low-pass cascade: moving averages of length period, period and 3.
 *
 * The result is 2 * period values shorter than the input.
 * @throws core::InvalidInputError If the input is shorter than 2 * period + 1.
 */
std::vector<double> lowPassFilter(const std::vector<double> &x, std::size_t period);

} // namespace seasonkit::smoothing
