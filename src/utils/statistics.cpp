#include "seasonkit/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace seasonkit::utils {

double mean(const std::vector<double> &values) {
	if (values.empty()) {
		return 0.0;
	}
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double variance(const std::vector<double> &values, std::size_t ddof) {
	if (values.size() <= ddof) {
		return 0.0;
	}
	const double m = mean(values);
	double accum = 0.0;
	for (double v : values) {
		const double diff = v - m;
		accum += diff * diff;
	}
	return accum / static_cast<double>(values.size() - ddof);
}

double median(std::vector<double> values) {
	if (values.empty()) {
		throw std::invalid_argument("Cannot compute median of empty vector");
	}

	const std::size_t n = values.size();
	const std::size_t mid = n / 2;
	std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());

	if (n % 2 == 1) {
		return values[mid];
	}
	// Even count: average with the largest element of the lower half.
	const double lower_max = *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid));
	return (lower_max + values[mid]) / 2.0;
}

double lagCorrelation(const std::vector<double> &values, std::size_t lag) {
	const std::size_t n = values.size();
	if (lag >= n || n - lag < 2) {
		return 0.0;
	}
	const std::size_t pairs = n - lag;
	double mean_lead = 0.0;
	double mean_lag = 0.0;
	for (std::size_t t = 0; t < pairs; ++t) {
		mean_lead += values[t];
		mean_lag += values[t + lag];
	}
	mean_lead /= static_cast<double>(pairs);
	mean_lag /= static_cast<double>(pairs);

	double cov = 0.0;
	double var_lead = 0.0;
	double var_lag = 0.0;
	for (std::size_t t = 0; t < pairs; ++t) {
		const double a = values[t] - mean_lead;
		const double b = values[t + lag] - mean_lag;
		cov += a * b;
		var_lead += a * a;
		var_lag += b * b;
	}
	if (var_lead <= 0.0 || var_lag <= 0.0) {
		return 0.0;
	}
	return cov / std::sqrt(var_lead * var_lag);
}

double tricube(double u) {
	const double a = std::abs(u);
	if (a >= 1.0) {
		return 0.0;
	}
	const double t = 1.0 - a * a * a;
	return t * t * t;
}

double bisquare(double u) {
	const double a = std::abs(u);
	if (a >= 1.0) {
		return 0.0;
	}
	const double t = 1.0 - a * a;
	return t * t;
}

bool allFinite(const std::vector<double> &values) {
	return std::all_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); });
}

double componentStrength(const std::vector<double> &component, const std::vector<double> &remainder) {
	if (component.size() != remainder.size()) {
		throw std::invalid_argument("Component and remainder must have the same length.");
	}
	std::vector<double> combined(component.size());
	for (std::size_t i = 0; i < component.size(); ++i) {
		combined[i] = component[i] + remainder[i];
	}
	const double var_total = variance(combined, 1);
	if (var_total <= 0.0) {
		return 0.0;
	}
	return std::max(0.0, 1.0 - variance(remainder, 1) / var_total);
}

} // namespace seasonkit::utils
