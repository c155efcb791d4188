#include "seasonkit/smoothing/moving_average.hpp"
#include "seasonkit/core/errors.hpp"

#include <string>

namespace seasonkit::smoothing {

std::vector<double> movingAverage(const std::vector<double> &x, std::size_t length) {
	const std::size_t n = x.size();
	if (length == 0 || length > n) {
		throw core::InvalidInputError("Moving average length " + std::to_string(length) +
		                              " is invalid for a series of " + std::to_string(n) + " values.");
	}

	const std::size_t count = n - length + 1;
	const double flen = static_cast<double>(length);
	std::vector<double> averages(count);

	double sum = 0.0;
	for (std::size_t i = 0; i < length; ++i) {
		sum += x[i];
	}
	averages[0] = sum / flen;

	// Slide the window one step at a time.
	for (std::size_t j = 1; j < count; ++j) {
		sum += x[j + length - 1] - x[j - 1];
		averages[j] = sum / flen;
	}
	return averages;
}

std::vector<double> lowPassFilter(const std::vector<double> &x, std::size_t period) {
	if (period == 0 || x.size() < 2 * period + 1) {
		throw core::InvalidInputError("Low-pass filter needs at least 2 * period + 1 values.");
	}
	auto first = movingAverage(x, period);
	auto second = movingAverage(first, period);
	return movingAverage(second, 3);
}

} // namespace seasonkit::smoothing
