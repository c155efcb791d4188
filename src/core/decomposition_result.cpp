#include "seasonkit/core/decomposition_result.hpp"
#include "seasonkit/utils/statistics.hpp"

#include <stdexcept>

namespace seasonkit::core {

namespace {

void requireLength(const std::vector<double> &values, std::size_t expected, const std::string &what) {
	if (values.size() != expected) {
		throw MismatchedLengthError("Decomposition " + what + " has " + std::to_string(values.size()) +
		                            " values, expected " + std::to_string(expected) + ".");
	}
}

} // namespace

DecompositionResult::DecompositionResult(DecompositionParts parts)
    : timestamps_(std::move(parts.timestamps)), name_(std::move(parts.name)), metadata_(std::move(parts.metadata)),
      observed_(std::move(parts.observed)), adjusted_(std::move(parts.adjusted)), trend_(std::move(parts.trend)),
      seasonal_(std::move(parts.seasonal)), residual_(std::move(parts.residual)), weights_(std::move(parts.weights)),
      box_cox_(parts.box_cox), original_scale_(std::move(parts.original_scale)) {
	const std::size_t n = observed_.size();
	if (adjusted_.empty()) {
		adjusted_ = observed_;
	}
	if (weights_.empty()) {
		weights_.assign(n, 1.0);
	}
	if (!timestamps_.empty() && timestamps_.size() != n) {
		throw MismatchedLengthError("Decomposition timestamps must match the observed length.");
	}
	requireLength(adjusted_, n, "adjusted series");
	requireLength(trend_, n, "trend");
	requireLength(residual_, n, "residual");
	requireLength(weights_, n, "weights");
	for (const auto &component : seasonal_) {
		requireLength(component.values, n, component.name);
	}
	if (box_cox_) {
		requireLength(original_scale_, n, "original-scale series");
	}
}

std::vector<std::size_t> DecompositionResult::periods() const {
	std::vector<std::size_t> result;
	result.reserve(seasonal_.size());
	for (const auto &component : seasonal_) {
		result.push_back(component.period);
	}
	return result;
}

const std::vector<double> &DecompositionResult::seasonal(std::size_t index) const {
	if (index >= seasonal_.size()) {
		throw std::out_of_range("Seasonal component index " + std::to_string(index) + " out of range.");
	}
	return seasonal_[index].values;
}

const std::vector<double> &DecompositionResult::seasonal(const std::string &name) const {
	for (const auto &component : seasonal_) {
		if (component.name == name) {
			return component.values;
		}
	}
	throw std::out_of_range("No seasonal component named '" + name + "'.");
}

std::vector<double> DecompositionResult::seasonalTotal() const {
	std::vector<double> total(size(), 0.0);
	for (const auto &component : seasonal_) {
		for (std::size_t i = 0; i < total.size(); ++i) {
			total[i] += component.values[i];
		}
	}
	return total;
}

std::vector<double> DecompositionResult::seasonallyAdjusted() const {
	auto adjusted = adjusted_;
	const auto total = seasonalTotal();
	for (std::size_t i = 0; i < adjusted.size(); ++i) {
		adjusted[i] -= total[i];
	}
	return adjusted;
}

double DecompositionResult::trendStrength() const {
	return utils::componentStrength(trend_, residual_);
}

double DecompositionResult::seasonalStrength(std::size_t index) const {
	return utils::componentStrength(seasonal(index), residual_);
}

} // namespace seasonkit::core
