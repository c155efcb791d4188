#include "seasonkit/utils/golden_section.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace seasonkit::utils {

namespace {

// 1 / golden ratio
constexpr double kInvPhi = 0.6180339887498949;

// NaN objective values never win a comparison.
double sanitize(double value) {
	return std::isnan(value) ? std::numeric_limits<double>::infinity() : value;
}

} // namespace

GoldenSectionMinimizer::Result GoldenSectionMinimizer::minimize(const std::function<double(double)> &objective,
                                                                double lower, double upper,
                                                                const Options &options) const {
	if (!(lower < upper)) {
		throw std::invalid_argument("Golden-section search requires lower < upper.");
	}
	if (!(options.tolerance > 0.0)) {
		throw std::invalid_argument("Golden-section tolerance must be positive.");
	}

	Result result;
	double a = lower;
	double b = upper;
	double c = b - kInvPhi * (b - a);
	double d = a + kInvPhi * (b - a);
	double fc = sanitize(objective(c));
	double fd = sanitize(objective(d));

	for (int iter = 0; iter < options.max_iterations; ++iter) {
		result.iterations = iter + 1;
		if (b - a < options.tolerance) {
			result.converged = true;
			break;
		}
		if (fc < fd) {
			b = d;
			d = c;
			fd = fc;
			c = b - kInvPhi * (b - a);
			fc = sanitize(objective(c));
		} else {
			a = c;
			c = d;
			fc = fd;
			d = a + kInvPhi * (b - a);
			fd = sanitize(objective(d));
		}
	}
	if (!result.converged && b - a < options.tolerance) {
		result.converged = true;
	}

	if (fc < fd) {
		result.best = c;
		result.value = fc;
	} else {
		result.best = d;
		result.value = fd;
	}
	return result;
}

} // namespace seasonkit::utils
