#include "seasonkit/transform/box_cox.hpp"
#include "seasonkit/core/errors.hpp"
#include "seasonkit/utils/golden_section.hpp"
#include "seasonkit/utils/logging.hpp"
#include "seasonkit/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace seasonkit::transform {

namespace {

constexpr double kLambdaEpsilon = std::numeric_limits<double>::epsilon();

} // namespace

BoxCox::BoxCox()
    : auto_lambda_(false), season_length_(2), lower_(kDefaultLowerLambda), upper_(kDefaultUpperLambda) {
}

BoxCox &BoxCox::withLambda(double lambda) {
	if (!std::isfinite(lambda)) {
		throw core::InvalidInputError("BoxCox lambda must be finite.");
	}
	state_ = BoxCoxState{lambda, BoxCoxState::Source::Fixed};
	auto_lambda_ = false;
	return *this;
}

BoxCox &BoxCox::withAutoLambda(std::size_t season_length) {
	season_length_ = std::max<std::size_t>(2, season_length);
	auto_lambda_ = true;
	state_.reset();
	return *this;
}

BoxCox &BoxCox::withLambdaBounds(double lower, double upper) {
	if (!(lower < upper)) {
		throw core::InvalidInputError("BoxCox lambda bounds must satisfy lower < upper.");
	}
	lower_ = lower;
	upper_ = upper;
	return *this;
}

void BoxCox::fit(const std::vector<double> &data) {
	requirePositive(data);
	if (auto_lambda_) {
		const double lambda = guerreroLambda(data, season_length_, lower_, upper_);
		state_ = BoxCoxState{lambda, BoxCoxState::Source::Guerrero};
		SEASONKIT_DEBUG("BoxCox lambda {:.6f} selected by Guerrero's method (block length {}).", lambda,
		                season_length_);
		return;
	}
	ensureLambda();
}

void BoxCox::transform(std::vector<double> &data) const {
	ensureLambda();
	requirePositive(data);

	const double lambda = state_->lambda;
	if (std::abs(lambda) < kLambdaEpsilon) {
		for (double &value : data) {
			value = std::log(value);
		}
		return;
	}
	for (double &value : data) {
		value = (std::pow(value, lambda) - 1.0) / lambda;
	}
}

void BoxCox::inverseTransform(std::vector<double> &data) const {
	ensureLambda();

	const double lambda = state_->lambda;
	if (std::abs(lambda) < kLambdaEpsilon) {
		for (double &value : data) {
			value = std::exp(value);
		}
		return;
	}
	for (double &value : data) {
		const double base = lambda * value + 1.0;
		if (base > 0.0) {
			value = std::pow(base, 1.0 / lambda);
		} else {
			// Outside the image of the forward transform: take the limit.
			value = (lambda > 0.0) ? 0.0 : std::numeric_limits<double>::infinity();
		}
	}
}

double BoxCox::lambda() const {
	ensureLambda();
	return state_->lambda;
}

BoxCoxState BoxCox::state() const {
	ensureLambda();
	return *state_;
}

double BoxCox::guerreroLambda(const std::vector<double> &data, std::size_t season_length, double lower,
                              double upper) {
	requirePositive(data);
	const std::size_t period = std::max<std::size_t>(2, season_length);
	const std::size_t blocks = data.size() / period;
	if (blocks < 2) {
		throw core::InvalidInputError("Guerrero's method needs at least two complete blocks of " +
		                              std::to_string(period) + " values.");
	}

	// Trailing complete blocks only.
	const std::size_t offset = data.size() - blocks * period;
	std::vector<double> block_means(blocks);
	std::vector<double> block_sds(blocks);
	std::vector<double> block(period);
	for (std::size_t b = 0; b < blocks; ++b) {
		const auto begin = data.begin() + static_cast<std::ptrdiff_t>(offset + b * period);
		std::copy(begin, begin + static_cast<std::ptrdiff_t>(period), block.begin());
		block_means[b] = utils::mean(block);
		block_sds[b] = std::sqrt(utils::variance(block, 1));
	}

	if (std::all_of(block_sds.begin(), block_sds.end(), [](double sd) { return sd <= 0.0; })) {
		SEASONKIT_DEBUG("Guerrero's method: every block is constant, keeping lambda = 1.");
		return 1.0;
	}

	std::vector<double> ratios(blocks);
	auto coefficientOfVariation = [&](double lambda) {
		for (std::size_t b = 0; b < blocks; ++b) {
			ratios[b] = block_sds[b] / std::pow(block_means[b], 1.0 - lambda);
		}
		const double m = utils::mean(ratios);
		return std::sqrt(utils::variance(ratios, 1)) / m;
	};

	utils::GoldenSectionMinimizer minimizer;
	utils::GoldenSectionMinimizer::Options options;
	options.tolerance = 1e-6;
	const auto result = minimizer.minimize(coefficientOfVariation, lower, upper, options);
	return result.best;
}

void BoxCox::requirePositive(const std::vector<double> &data) {
	for (double value : data) {
		if (!std::isfinite(value) || value <= 0.0) {
			throw core::InvalidInputError("BoxCox requires strictly positive, finite data.");
		}
	}
}

void BoxCox::ensureLambda() const {
	if (!state_.has_value()) {
		throw std::runtime_error("BoxCox lambda must be set or fitted before transform");
	}
}

} // namespace seasonkit::transform
