#pragma once

#include <functional>
#include <limits>

namespace seasonkit::utils {

/**
 * @brief Bounded minimizer for unimodal scalar functions.
 *
 * Golden-section search on [lower, upper]; the bracket shrinks by the
 * inverse golden ratio each iteration until it is narrower than the tolerance.
 */
class GoldenSectionMinimizer {
public:
	struct Options {
		double tolerance = 1e-5;  // absolute width of the final bracket
		int max_iterations = 200;
	};

	struct Result {
		double best = std::numeric_limits<double>::quiet_NaN();
		double value = std::numeric_limits<double>::quiet_NaN();
		int iterations = 0;
		bool converged = false;
	};

	/**
	 * @throws std::invalid_argument If lower >= upper or the tolerance is not positive.
	 */
	Result minimize(const std::function<double(double)> &objective, double lower, double upper,
	                const Options &options) const;
};

} // namespace seasonkit::utils
