#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace seasonkit::transform {

/**
 * @brief The lambda a Box-Cox transform was applied with, and where it came from.
 */
struct BoxCoxState {
	enum class Source { Fixed, Guerrero };

	double lambda = 1.0;
	Source source = Source::Fixed;
};

/**
 * @class BoxCox
 * @brief Box-Cox power transform for strictly positive data.
 *
 * y' = (y^lambda - 1) / lambda, or ln(y) for lambda = 0. The lambda is either
 * fixed up front or chosen in fit() with Guerrero's method: the data is cut
 * into consecutive blocks of `season_length` values (the trailing complete
 * blocks), and lambda minimises the coefficient of variation of
 * sd_i / mean_i^(1 - lambda) across blocks.
 */
class BoxCox {
public:
	static constexpr double kDefaultLowerLambda = -1.0;
	static constexpr double kDefaultUpperLambda = 2.0;

	BoxCox();

	BoxCox &withLambda(double lambda);
	BoxCox &withAutoLambda(std::size_t season_length);
	BoxCox &withLambdaBounds(double lower, double upper);

	void fit(const std::vector<double> &data);
	void transform(std::vector<double> &data) const;
	void inverseTransform(std::vector<double> &data) const;

	void fitTransform(std::vector<double> &data) {
		fit(data);
		transform(data);
	}

	[[nodiscard]] bool isFitted() const noexcept {
		return state_.has_value();
	}

	/**
	 * @throws std::runtime_error If no lambda is available yet.
	 */
	double lambda() const;
	BoxCoxState state() const;

	/**
	 * @brief Guerrero's lambda for the data.
	 * @throws core::InvalidInputError On non-positive values or fewer than two complete blocks.
	 */
	static double guerreroLambda(const std::vector<double> &data, std::size_t season_length,
	                             double lower = kDefaultLowerLambda, double upper = kDefaultUpperLambda);

private:
	static void requirePositive(const std::vector<double> &data);
	void ensureLambda() const;

	std::optional<BoxCoxState> state_;
	bool auto_lambda_;
	std::size_t season_length_;
	double lower_;
	double upper_;
};

} // namespace seasonkit::transform
