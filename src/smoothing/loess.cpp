#include "seasonkit/smoothing/loess.hpp"
#include "seasonkit/core/errors.hpp"
#include "seasonkit/utils/logging.hpp"
#include "seasonkit/utils/statistics.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace {

using seasonkit::core::NumericalInstabilityError;

constexpr double kRankTolerance = 1e-10;

/**
 * Weighted least-squares fit of a polynomial in the scaled offsets; returns the
 * value at offset zero. Rows are scaled by sqrt(weight) and solved with
 * column-pivoting QR so that collinear designs are detected rather than
 * producing garbage.
 */
double solveLocalPolynomial(const std::vector<double> &offsets, const std::vector<double> &weights,
                            const std::vector<double> &values, int degree, double scale) {
	const auto rows = static_cast<Eigen::Index>(offsets.size());
	const auto cols = static_cast<Eigen::Index>(degree + 1);
	if (rows < cols) {
		throw NumericalInstabilityError("Too few weighted points for a degree-" + std::to_string(degree) +
		                                " local fit.");
	}

	Eigen::MatrixXd design(rows, cols);
	Eigen::VectorXd rhs(rows);
	for (Eigen::Index i = 0; i < rows; ++i) {
		const double sw = std::sqrt(weights[static_cast<std::size_t>(i)]);
		const double u = offsets[static_cast<std::size_t>(i)] / scale;
		double term = sw;
		for (Eigen::Index c = 0; c < cols; ++c) {
			design(i, c) = term;
			term *= u;
		}
		rhs(i) = sw * values[static_cast<std::size_t>(i)];
	}

	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(design);
	qr.setThreshold(kRankTolerance);
	if (qr.rank() < cols) {
		throw NumericalInstabilityError("Rank-deficient degree-" + std::to_string(degree) + " local fit.");
	}
	const Eigen::VectorXd coefficients = qr.solve(rhs);
	return coefficients(0);
}

} // namespace

namespace seasonkit::smoothing {

void LoessOptions::validate() const {
	if (window < 3 || window % 2 == 0) {
		throw core::InvalidInputError("LOESS window must be an odd integer >= 3, got " + std::to_string(window) + ".");
	}
	if (degree < 0 || degree > 2) {
		throw core::InvalidInputError("LOESS degree must be 0, 1 or 2, got " + std::to_string(degree) + ".");
	}
	if (jump < 1) {
		throw core::InvalidInputError("LOESS jump must be at least 1.");
	}
}

LocalRegressionSmoother::LocalRegressionSmoother(LoessOptions options) : options_(options) {
	options_.validate();
}

std::optional<double> LocalRegressionSmoother::fitAt(const std::vector<double> &y, double position, std::size_t left,
                                                     std::size_t right, const std::vector<double> &weights) const {
	const std::size_t n = y.size();
	if (left > right || right >= n) {
		throw std::out_of_range("LOESS neighbourhood lies outside the series.");
	}
	const bool use_weights = !weights.empty();

	double h = std::max(position - static_cast<double>(left), static_cast<double>(right) - position);
	if (options_.window > n) {
		h += static_cast<double>((options_.window - n) / 2);
	}
	const double h9 = 0.999 * h;
	const double h1 = 0.001 * h;

	const std::size_t span = right - left + 1;
	std::vector<double> offsets;
	std::vector<double> local_weights;
	std::vector<double> values;
	offsets.reserve(span);
	local_weights.reserve(span);
	values.reserve(span);

	double total = 0.0;
	for (std::size_t j = left; j <= right; ++j) {
		const double offset = static_cast<double>(j) - position;
		const double r = std::abs(offset);
		if (r > h9) {
			continue;
		}
		double w = (r <= h1) ? 1.0 : utils::tricube(r / h);
		if (use_weights) {
			w *= weights[j];
		}
		if (w <= 0.0) {
			continue;
		}
		offsets.push_back(offset);
		local_weights.push_back(w);
		values.push_back(y[j]);
		total += w;
	}

	if (total <= 0.0) {
		return std::nullopt;
	}

	const double scale = (h > 0.0) ? h : 1.0;
	for (int degree = options_.degree; degree > 0; --degree) {
		try {
			return solveLocalPolynomial(offsets, local_weights, values, degree, scale);
		} catch (const core::NumericalInstabilityError &err) {
			SEASONKIT_TRACE("LOESS fit at {} reduced below degree {}: {}", position, degree, err.what());
		}
	}

	double fitted = 0.0;
	for (std::size_t i = 0; i < values.size(); ++i) {
		fitted += local_weights[i] * values[i];
	}
	return fitted / total;
}

void LocalRegressionSmoother::smoothPass(const std::vector<double> &y, const std::vector<double> &weights,
                                         std::vector<double> &output) const {
	const std::size_t n = y.size();
	const std::size_t q = std::min(options_.window, n);
	const std::size_t half = q / 2;
	const std::size_t jump = std::max<std::size_t>(1, std::min(options_.jump, n - 1));

	auto fitIndex = [&](std::size_t i) {
		const std::size_t left = (i > half) ? std::min(i - half, n - q) : 0;
		const std::size_t right = left + q - 1;
		output[i] = fitAt(y, static_cast<double>(i), left, right, weights).value_or(y[i]);
	};

	for (std::size_t i = 0; i < n; i += jump) {
		fitIndex(i);
	}
	if (jump == 1) {
		return;
	}

	const std::size_t last = ((n - 1) / jump) * jump;
	if (last != n - 1) {
		fitIndex(n - 1);
	}

	// Linear interpolation between evaluated positions
	auto interpolate = [&](std::size_t from, std::size_t to) {
		const double delta = (output[to] - output[from]) / static_cast<double>(to - from);
		for (std::size_t j = from + 1; j < to; ++j) {
			output[j] = output[from] + delta * static_cast<double>(j - from);
		}
	};
	for (std::size_t i = 0; i + jump <= last; i += jump) {
		interpolate(i, i + jump);
	}
	if (last != n - 1) {
		interpolate(last, n - 1);
	}
}

std::vector<double> LocalRegressionSmoother::smooth(const std::vector<double> &y,
                                                    const std::vector<double> &weights) const {
	const std::size_t n = y.size();
	if (!weights.empty() && weights.size() != n) {
		throw core::MismatchedLengthError("LOESS weights must match the series length.");
	}
	if (!utils::allFinite(y)) {
		throw core::InvalidInputError("LOESS input contains non-finite values.");
	}
	for (double w : weights) {
		if (!(w >= 0.0) || !std::isfinite(w)) {
			throw core::InvalidInputError("LOESS weights must be finite and non-negative.");
		}
	}

	std::vector<double> output(y);
	if (n < 2) {
		return output;
	}

	smoothPass(y, weights, output);
	if (options_.robustness_iterations == 0) {
		return output;
	}

	std::vector<double> combined(n);
	std::vector<double> abs_residuals(n);
	for (std::size_t iter = 0; iter < options_.robustness_iterations; ++iter) {
		for (std::size_t i = 0; i < n; ++i) {
			abs_residuals[i] = std::abs(y[i] - output[i]);
		}
		const double scale = 6.0 * utils::median(abs_residuals);
		if (scale <= 0.0) {
			SEASONKIT_DEBUG("LOESS robustness iterations stopped after {}: exact fit.", iter);
			break;
		}
		for (std::size_t i = 0; i < n; ++i) {
			const double base = weights.empty() ? 1.0 : weights[i];
			combined[i] = base * utils::tricube(abs_residuals[i] / scale);
		}
		smoothPass(y, combined, output);
	}
	return output;
}

} // namespace seasonkit::smoothing
