#include "seasonkit/seasonality/stl.hpp"
#include "seasonkit/core/errors.hpp"
#include "seasonkit/smoothing/moving_average.hpp"
#include "seasonkit/utils/logging.hpp"
#include "seasonkit/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace {

using seasonkit::core::InvalidInputError;
using seasonkit::core::InvalidPeriodError;

std::size_t requirePeriod(std::size_t period) {
    if (period < 2) {
        throw InvalidPeriodError("Seasonal period must be at least 2, got " + std::to_string(period) + ".");
    }
    return period;
}

std::size_t requireOddWindow(const char* name, std::size_t window) {
    if (window < 3 || window % 2 == 0) {
        throw InvalidInputError(std::string(name) + " window must be an odd integer >= 3, got " +
                                std::to_string(window) + ".");
    }
    return window;
}

void requireDegree(const char* name, int degree) {
    if (degree < 0 || degree > 2) {
        throw InvalidInputError(std::string(name) + " must be 0, 1 or 2, got " + std::to_string(degree) + ".");
    }
}

// Largest option value that converts to std::size_t exactly.
constexpr double kMaxCountOption = 9007199254740992.0;  // 2^53

std::size_t requireCount(const std::string& key, double value) {
    if (!std::isfinite(value) || value < 0.0 || value > kMaxCountOption || std::floor(value) != value) {
        throw InvalidInputError("STL option '" + key + "' must be a non-negative integer.");
    }
    return static_cast<std::size_t>(value);
}

int requireDegreeOption(const std::string& key, double value) {
    if (value != 0.0 && value != 1.0 && value != 2.0) {
        throw InvalidInputError("STL option '" + key + "' must be 0, 1 or 2.");
    }
    return static_cast<int>(value);
}

bool requireFlag(const std::string& key, double value) {
    if (value != 0.0 && value != 1.0) {
        throw InvalidInputError("STL option '" + key + "' must be 0 or 1.");
    }
    return value == 1.0;
}

seasonkit::smoothing::LoessOptions loessOptions(std::size_t window, int degree, std::size_t jump) {
    seasonkit::smoothing::LoessOptions options;
    options.window = window;
    options.degree = degree;
    options.jump = jump;
    return options;
}

} // namespace

namespace seasonkit::seasonality {

StlConfig StlConfig::fromOptions(const OptionMap& options) {
    StlConfig config;
    for (const auto& [key, value] : options) {
        if (key == "trend") {
            config.trend = requireCount(key, value);
        } else if (key == "low_pass") {
            config.low_pass = requireCount(key, value);
        } else if (key == "seasonal_deg") {
            config.seasonal_deg = requireDegreeOption(key, value);
        } else if (key == "trend_deg") {
            config.trend_deg = requireDegreeOption(key, value);
        } else if (key == "low_pass_deg") {
            config.low_pass_deg = requireDegreeOption(key, value);
        } else if (key == "robust") {
            config.robust = requireFlag(key, value);
        } else if (key == "seasonal_jump") {
            config.seasonal_jump = requireCount(key, value);
        } else if (key == "trend_jump") {
            config.trend_jump = requireCount(key, value);
        } else if (key == "low_pass_jump") {
            config.low_pass_jump = requireCount(key, value);
        } else if (key == "inner_iter") {
            config.inner_iter = requireCount(key, value);
        } else if (key == "outer_iter") {
            config.outer_iter = requireCount(key, value);
        } else {
            throw InvalidInputError("Unknown STL option '" + key + "'.");
        }
    }
    config.validate();
    return config;
}

void StlConfig::validate() const {
    if (trend) {
        requireOddWindow("Trend", *trend);
    }
    if (low_pass) {
        requireOddWindow("Low-pass", *low_pass);
    }
    requireDegree("seasonal_deg", seasonal_deg);
    requireDegree("trend_deg", trend_deg);
    requireDegree("low_pass_deg", low_pass_deg);
    if (seasonal_jump < 1 || trend_jump < 1 || low_pass_jump < 1) {
        throw InvalidInputError("STL jumps must be at least 1.");
    }
    if (inner_iter && *inner_iter < 1) {
        throw InvalidInputError("STL inner_iter must be at least 1.");
    }
}

STLDecomposition::Builder& STLDecomposition::Builder::withPeriod(std::size_t period) {
    period_ = period;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withSeasonalSmoother(std::size_t window) {
    seasonal_smoother_ = window;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withTrendSmoother(std::size_t window) {
    config_.trend = window;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withLowPassSmoother(std::size_t window) {
    config_.low_pass = window;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withSeasonalDegree(int degree) {
    config_.seasonal_deg = degree;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withTrendDegree(int degree) {
    config_.trend_deg = degree;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withLowPassDegree(int degree) {
    config_.low_pass_deg = degree;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withJumps(std::size_t seasonal_jump,
                                                               std::size_t trend_jump,
                                                               std::size_t low_pass_jump) {
    config_.seasonal_jump = seasonal_jump;
    config_.trend_jump = trend_jump;
    config_.low_pass_jump = low_pass_jump;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withInnerIterations(std::size_t iterations) {
    config_.inner_iter = iterations;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withOuterIterations(std::size_t iterations) {
    config_.outer_iter = iterations;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withRobust(bool robust) {
    config_.robust = robust;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withConfig(StlConfig config) {
    config_ = config;
    return *this;
}

STLDecomposition STLDecomposition::Builder::build() const {
    return STLDecomposition(period_, seasonal_smoother_, config_);
}

STLDecomposition::Builder STLDecomposition::builder() {
    return Builder();
}

std::size_t STLDecomposition::defaultTrendWindow(std::size_t period, std::size_t seasonal_window) {
    const double ratio = 1.5 * static_cast<double>(period) /
                         (1.0 - 1.5 / static_cast<double>(seasonal_window));
    auto window = static_cast<std::size_t>(std::ceil(ratio));
    window = std::max<std::size_t>(window, 3);
    return (window % 2 == 0) ? window + 1 : window;
}

std::size_t STLDecomposition::defaultLowPassWindow(std::size_t period) {
    const std::size_t window = period + 1;
    return (window % 2 == 0) ? window + 1 : window;
}

STLDecomposition::STLDecomposition(std::size_t seasonal_period,
                                   std::size_t seasonal_smoother,
                                   StlConfig config)
    : seasonal_period_(requirePeriod(seasonal_period)),
      seasonal_smoother_(requireOddWindow("Seasonal", seasonal_smoother)),
      trend_smoother_(config.trend.value_or(defaultTrendWindow(seasonal_period_, seasonal_smoother_))),
      low_pass_smoother_(config.low_pass.value_or(defaultLowPassWindow(seasonal_period_))),
      config_(config),
      seasonal_loess_(loessOptions(seasonal_smoother_, config.seasonal_deg, config.seasonal_jump)),
      trend_loess_(loessOptions(trend_smoother_, config.trend_deg, config.trend_jump)),
      low_pass_loess_(loessOptions(low_pass_smoother_, config.low_pass_deg, config.low_pass_jump)) {
    config_.validate();
    if (low_pass_smoother_ <= seasonal_period_) {
        throw InvalidInputError("Low-pass window must be larger than the period (" +
                                std::to_string(seasonal_period_) + ").");
    }
}

void STLDecomposition::fit(const core::TimeSeries& ts) {
    fit(ts.getValues());
}

void STLDecomposition::fit(const std::vector<double>& values) {
    const std::size_t n = values.size();
    if (n < 2 * seasonal_period_) {
        throw InvalidPeriodError("Series of " + std::to_string(n) + " values is shorter than two cycles of period " +
                                 std::to_string(seasonal_period_) + ".");
    }
    if (!utils::allFinite(values)) {
        throw InvalidInputError("STL input contains non-finite values.");
    }

    remainder_.clear();
    trend_.assign(n, 0.0);
    seasonal_.assign(n, 0.0);
    weights_.assign(n, 1.0);

    const std::size_t outer = config_.outerIterations();
    bool use_weights = false;
    for (std::size_t k = 0;; ++k) {
        innerLoop(values, use_weights);
        if (k >= outer) {
            break;
        }
        updateRobustnessWeights(values);
        use_weights = true;
    }

    remainder_.resize(n);
    for (std::size_t i = 0; i < n; ++i) {
        remainder_[i] = values[i] - trend_[i] - seasonal_[i];
    }

    SEASONKIT_DEBUG("STL decomposition performed with seasonal period {} (windows {}/{}/{}, {} inner x {} outer).",
                    seasonal_period_, seasonal_smoother_, trend_smoother_, low_pass_smoother_,
                    config_.innerIterations(), outer);
}

void STLDecomposition::innerLoop(const std::vector<double>& values, bool use_weights) {
    const std::size_t n = values.size();
    std::vector<double> detrended(n);
    std::vector<double> cycle(n + 2 * seasonal_period_);
    std::vector<double> deseasonalized(n);
    const std::vector<double> no_weights;

    for (std::size_t pass = 0; pass < config_.innerIterations(); ++pass) {
        for (std::size_t i = 0; i < n; ++i) {
            detrended[i] = values[i] - trend_[i];
        }

        smoothCycleSubseries(detrended, use_weights, cycle);

        // Remove the low-frequency part the subseries smoothing picked up.
        const auto low_pass = low_pass_loess_.smooth(smoothing::lowPassFilter(cycle, seasonal_period_));
        for (std::size_t i = 0; i < n; ++i) {
            seasonal_[i] = cycle[seasonal_period_ + i] - low_pass[i];
            deseasonalized[i] = values[i] - seasonal_[i];
        }

        trend_ = trend_loess_.smooth(deseasonalized, use_weights ? weights_ : no_weights);
    }
}

void STLDecomposition::smoothCycleSubseries(const std::vector<double>& detrended,
                                            bool use_weights,
                                            std::vector<double>& cycle) const {
    const std::size_t n = detrended.size();
    const std::size_t p = seasonal_period_;
    std::vector<double> sub;
    std::vector<double> sub_weights;
    sub.reserve(n / p + 1);

    for (std::size_t phase = 0; phase < p; ++phase) {
        const std::size_t k = (n - phase - 1) / p + 1;
        sub.resize(k);
        for (std::size_t i = 0; i < k; ++i) {
            sub[i] = detrended[i * p + phase];
        }
        sub_weights.clear();
        if (use_weights) {
            sub_weights.resize(k);
            for (std::size_t i = 0; i < k; ++i) {
                sub_weights[i] = weights_[i * p + phase];
            }
        }

        const auto smoothed = seasonal_loess_.smooth(sub, sub_weights);

        // One cycle of extrapolation on either side.
        const std::size_t right_edge = std::min(seasonal_smoother_, k) - 1;
        const std::size_t left_edge = (k > seasonal_smoother_) ? k - seasonal_smoother_ : 0;
        const double before = seasonal_loess_.fitAt(sub, -1.0, 0, right_edge, sub_weights).value_or(smoothed.front());
        const double after = seasonal_loess_.fitAt(sub, static_cast<double>(k), left_edge, k - 1, sub_weights)
                                 .value_or(smoothed.back());

        cycle[phase] = before;
        for (std::size_t i = 0; i < k; ++i) {
            cycle[(i + 1) * p + phase] = smoothed[i];
        }
        cycle[(k + 1) * p + phase] = after;
    }
}

void STLDecomposition::updateRobustnessWeights(const std::vector<double>& values) {
    const std::size_t n = values.size();
    std::vector<double> abs_residuals(n);
    for (std::size_t i = 0; i < n; ++i) {
        abs_residuals[i] = std::abs(values[i] - trend_[i] - seasonal_[i]);
    }

    const double cmad = 6.0 * utils::median(abs_residuals);
    const double c9 = 0.999 * cmad;
    const double c1 = 0.001 * cmad;
    for (std::size_t i = 0; i < n; ++i) {
        const double r = abs_residuals[i];
        if (r <= c1) {
            weights_[i] = 1.0;
        } else if (r <= c9) {
            weights_[i] = utils::bisquare(r / cmad);
        } else {
            weights_[i] = 0.0;
        }
    }
}

void STLDecomposition::ensureFitted() const {
    if (seasonal_.empty() || remainder_.empty()) {
        throw std::runtime_error("STL decomposition not fitted.");
    }
}

double STLDecomposition::seasonalStrength() const {
    ensureFitted();
    return utils::componentStrength(seasonal_, remainder_);
}

double STLDecomposition::trendStrength() const {
    ensureFitted();
    return utils::componentStrength(trend_, remainder_);
}

} // namespace seasonkit::seasonality
