#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace seasonkit::smoothing {

/**
 * @brief Settings for one LOESS smoother.
 */
struct LoessOptions {
	std::size_t window = 3;                // neighbourhood size, odd and >= 3
	int degree = 1;                        // local polynomial degree: 0, 1 or 2
	std::size_t jump = 1;                  // fit every jump-th position, interpolate the rest
	std::size_t robustness_iterations = 0; // reweighted refits after the first pass

	/**
	 * @throws core::InvalidInputError If any field is out of range.
	 */
	void validate() const;
};

/**
 * @class LocalRegressionSmoother
 * @brief Locally weighted polynomial regression on an evenly spaced sequence.
 *
 * Each fitted position uses the `window` nearest observations. At the ends of
 * the series the neighbourhood shifts inward instead of shrinking. Neighbours
 * are weighted with the tricube kernel of their distance scaled by the
 * farthest neighbour, multiplied by optional caller weights; zero-weight
 * points drop out of the fit. When the window is longer than the series all
 * points are used and the bandwidth is widened by (window - n) / 2.
 *
 * A position whose neighbourhood carries no weight keeps its input value. A
 * rank-deficient local system is refitted at the next lower degree.
 */
class LocalRegressionSmoother {
public:
	explicit LocalRegressionSmoother(LoessOptions options);

	const LoessOptions &options() const {
		return options_;
	}

	/**
	 * @brief Smooths a whole sequence.
	 * @param y Input values, all finite.
	 * @param weights Empty, or one non-negative weight per value.
	 * @throws core::InvalidInputError On non-finite values or negative weights.
	 * @throws core::MismatchedLengthError If weights and values differ in length.
	 */
	std::vector<double> smooth(const std::vector<double> &y, const std::vector<double> &weights = {}) const;

	/**
	 * @brief Evaluates the local fit at an arbitrary position.
	 *
	 * The neighbourhood is given explicitly as the inclusive index range
	 * [left, right]; the position may lie outside it (extrapolation).
	 * @return The fitted value, or std::nullopt when the neighbourhood carries no weight.
	 * @throws std::out_of_range If the neighbourhood is not inside the series.
	 */
	std::optional<double> fitAt(const std::vector<double> &y, double position, std::size_t left, std::size_t right,
	                            const std::vector<double> &weights = {}) const;

private:
	void smoothPass(const std::vector<double> &y, const std::vector<double> &weights,
	                std::vector<double> &output) const;

	LoessOptions options_;
};

} // namespace seasonkit::smoothing
