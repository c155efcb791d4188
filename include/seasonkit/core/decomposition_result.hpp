#pragma once

#include "seasonkit/core/time_series.hpp"
#include "seasonkit/transform/box_cox.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace seasonkit::core {

/**
 * @brief One extracted seasonal component.
 */
struct SeasonalComponent {
	std::size_t period = 0;
	std::size_t window = 0;
	std::string name;  // "seasonal_<period>"
	std::vector<double> values;

	static std::string nameFor(std::size_t period) {
		return "seasonal_" + std::to_string(period);
	}
};

/**
 * @brief Everything a decomposition run produces, handed to DecompositionResult.
 */
struct DecompositionParts {
	std::vector<TimeSeries::TimePoint> timestamps;
	std::string name;
	TimeSeries::Metadata metadata;
	std::vector<double> observed;
	std::vector<double> adjusted;  // series in decomposition space; empty means same as observed
	std::vector<double> trend;
	std::vector<SeasonalComponent> seasonal;
	std::vector<double> residual;
	std::vector<double> weights;
	std::optional<transform::BoxCoxState> box_cox;
	std::vector<double> original_scale;  // inverse Box-Cox output; empty without a transform
};

/**
 * @class DecompositionResult
 * @brief Immutable trend / seasonal / residual decomposition of one series.
 *
 * Components live in decomposition space: for every index
 * adjusted()[i] == trend()[i] + sum_k seasonal(k)[i] + residual()[i], where
 * adjusted() is the Box-Cox transformed input (or the input itself when no
 * transform was applied). originalScale() holds the inverse-transformed
 * reconstruction when a transform was used.
 */
class DecompositionResult {
public:
	/**
	 * @throws MismatchedLengthError If any sequence differs in length from observed.
	 */
	explicit DecompositionResult(DecompositionParts parts);

	std::size_t size() const {
		return observed_.size();
	}

	const std::vector<TimeSeries::TimePoint> &timestamps() const {
		return timestamps_;
	}
	const std::string &name() const {
		return name_;
	}
	const TimeSeries::Metadata &metadata() const {
		return metadata_;
	}

	const std::vector<double> &observed() const {
		return observed_;
	}
	const std::vector<double> &adjusted() const {
		return adjusted_;
	}
	const std::vector<double> &trend() const {
		return trend_;
	}
	const std::vector<double> &residual() const {
		return residual_;
	}
	const std::vector<double> &weights() const {
		return weights_;
	}

	const std::vector<SeasonalComponent> &seasonalComponents() const {
		return seasonal_;
	}
	std::size_t seasonalCount() const {
		return seasonal_.size();
	}
	std::vector<std::size_t> periods() const;

	/**
	 * @throws std::out_of_range If the index is not a component index.
	 */
	const std::vector<double> &seasonal(std::size_t index) const;

	/**
	 * @brief Component by name, e.g. "seasonal_24".
	 * @throws std::out_of_range If no component carries that name.
	 */
	const std::vector<double> &seasonal(const std::string &name) const;

	/**
	 * @brief Sum of all seasonal components.
	 */
	std::vector<double> seasonalTotal() const;

	/**
	 * @brief adjusted() minus every seasonal component.
	 */
	std::vector<double> seasonallyAdjusted() const;

	const std::optional<transform::BoxCoxState> &boxCox() const {
		return box_cox_;
	}
	const std::vector<double> &originalScale() const {
		return original_scale_;
	}

	double trendStrength() const;
	double seasonalStrength(std::size_t index) const;

private:
	std::vector<TimeSeries::TimePoint> timestamps_;
	std::string name_;
	TimeSeries::Metadata metadata_;
	std::vector<double> observed_;
	std::vector<double> adjusted_;
	std::vector<double> trend_;
	std::vector<SeasonalComponent> seasonal_;
	std::vector<double> residual_;
	std::vector<double> weights_;
	std::optional<transform::BoxCoxState> box_cox_;
	std::vector<double> original_scale_;
};

} // namespace seasonkit::core
