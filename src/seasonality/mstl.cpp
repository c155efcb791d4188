#include "seasonkit/seasonality/mstl.hpp"
#include "seasonkit/core/errors.hpp"
#include "seasonkit/transform/box_cox.hpp"
#include "seasonkit/utils/logging.hpp"
#include "seasonkit/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_set>

namespace seasonkit::seasonality {

void MstlConfig::validate() const {
    if (periods.empty()) {
        throw core::InvalidPeriodError("MSTL requires at least one seasonal period.");
    }
    std::unordered_set<std::size_t> seen;
    for (std::size_t period : periods) {
        if (period < 2) {
            throw core::InvalidPeriodError("Seasonal period must be at least 2, got " + std::to_string(period) + ".");
        }
        if (!seen.insert(period).second) {
            throw core::InvalidPeriodError("Seasonal period " + std::to_string(period) + " is listed twice.");
        }
    }

    if (!windows.empty()) {
        if (windows.size() != periods.size()) {
            throw core::MismatchedLengthError("MSTL got " + std::to_string(periods.size()) + " periods but " +
                                              std::to_string(windows.size()) + " windows.");
        }
        for (std::size_t i = 0; i < windows.size(); ++i) {
            const std::size_t window = windows[i];
            if (window % 2 == 0) {
                throw core::InvalidInputError("Seasonal window " + std::to_string(window) + " must be odd.");
            }
            if (window < periods[i] + 1) {
                throw core::InvalidInputError("Seasonal window " + std::to_string(window) + " for period " +
                                              std::to_string(periods[i]) + " must be at least period + 1.");
            }
        }
    }

    if (iterations && *iterations < 1) {
        throw core::InvalidInputError("MSTL iterations must be at least 1.");
    }
    if (box_cox == BoxCoxMode::Fixed && !std::isfinite(box_cox_lambda)) {
        throw core::InvalidInputError("Box-Cox lambda must be finite.");
    }
    stl.validate();
}

std::vector<std::size_t> MstlConfig::resolvedWindows() const {
    if (!windows.empty()) {
        return windows;
    }
    // Defaults follow the period's rank by size, not its position in the list.
    std::vector<std::size_t> result(periods.size());
    for (std::size_t i = 0; i < periods.size(); ++i) {
        const auto rank = static_cast<std::size_t>(
            std::count_if(periods.begin(), periods.end(), [&](std::size_t p) { return p < periods[i]; }));
        result[i] = defaultWindow(rank);
    }
    return result;
}

std::size_t MstlConfig::resolvedIterations() const {
    return iterations.value_or(periods.size() > 1 ? 2 : 1);
}

MSTLDecomposition::Builder& MSTLDecomposition::Builder::withPeriods(std::vector<std::size_t> periods) {
    config_.periods = std::move(periods);
    return *this;
}

MSTLDecomposition::Builder& MSTLDecomposition::Builder::withWindows(std::vector<std::size_t> windows) {
    config_.windows = std::move(windows);
    return *this;
}

MSTLDecomposition::Builder& MSTLDecomposition::Builder::withIterations(std::size_t iterations) {
    config_.iterations = iterations;
    return *this;
}

MSTLDecomposition::Builder& MSTLDecomposition::Builder::withBoxCoxLambda(double lambda) {
    config_.box_cox = BoxCoxMode::Fixed;
    config_.box_cox_lambda = lambda;
    return *this;
}

MSTLDecomposition::Builder& MSTLDecomposition::Builder::withAutoBoxCox() {
    config_.box_cox = BoxCoxMode::Auto;
    return *this;
}

MSTLDecomposition::Builder& MSTLDecomposition::Builder::withBoxCoxInverse(BoxCoxInverse target) {
    config_.box_cox_inverse = target;
    return *this;
}

MSTLDecomposition::Builder& MSTLDecomposition::Builder::withStlConfig(StlConfig config) {
    config_.stl = config;
    return *this;
}

MSTLDecomposition::Builder& MSTLDecomposition::Builder::withRobust(bool robust) {
    config_.stl.robust = robust;
    return *this;
}

MSTLDecomposition MSTLDecomposition::Builder::build() const {
    return MSTLDecomposition(config_);
}

MSTLDecomposition::Builder MSTLDecomposition::builder() {
    return Builder();
}

MSTLDecomposition::MSTLDecomposition(MstlConfig config)
    : config_(std::move(config)) {
    config_.validate();
    windows_ = config_.resolvedWindows();
    iterations_ = config_.resolvedIterations();

    stl_decomposers_.reserve(config_.periods.size());
    for (std::size_t i = 0; i < config_.periods.size(); ++i) {
        stl_decomposers_.emplace_back(config_.periods[i], windows_[i], config_.stl);
    }
}

core::DecompositionResult MSTLDecomposition::decompose(const core::TimeSeries& ts) {
    return run(ts.getValues(), ts.getTimestamps(), ts.name(), ts.metadata());
}

core::DecompositionResult MSTLDecomposition::decompose(const std::vector<double>& values) {
    return run(values, {}, {}, {});
}

core::DecompositionResult MSTLDecomposition::run(const std::vector<double>& values,
                                                 std::vector<core::TimeSeries::TimePoint> timestamps,
                                                 std::string name,
                                                 core::TimeSeries::Metadata metadata) {
    const std::size_t n = values.size();
    if (n == 0) {
        throw core::InvalidInputError("Cannot decompose an empty series.");
    }
    if (!utils::allFinite(values)) {
        throw core::InvalidInputError("MSTL input contains non-finite values.");
    }
    const auto& periods = config_.periods;
    const std::size_t max_period = *std::max_element(periods.begin(), periods.end());
    if (n < 2 * max_period) {
        throw core::InvalidPeriodError("Series of " + std::to_string(n) +
                                       " values is shorter than two cycles of period " +
                                       std::to_string(max_period) + ".");
    }

    std::vector<double> working(values);
    std::optional<transform::BoxCoxState> box_cox_state;
    transform::BoxCox box_cox;
    if (config_.box_cox != BoxCoxMode::Disabled) {
        if (config_.box_cox == BoxCoxMode::Fixed) {
            box_cox.withLambda(config_.box_cox_lambda);
        } else {
            box_cox.withAutoLambda(*std::min_element(periods.begin(), periods.end()));
        }
        box_cox.fitTransform(working);
        box_cox_state = box_cox.state();
        SEASONKIT_DEBUG("MSTL applied Box-Cox transform with lambda {:.6f}.", box_cox_state->lambda);
    }

    const std::size_t k = periods.size();
    std::vector<std::vector<double>> seasonal(k, std::vector<double>(n, 0.0));
    std::vector<double> deseasonalized(working);

    for (std::size_t pass = 0; pass < iterations_; ++pass) {
        for (std::size_t idx = 0; idx < k; ++idx) {
            // Put this period's previous estimate back before re-extracting it.
            for (std::size_t i = 0; i < n; ++i) {
                deseasonalized[i] += seasonal[idx][i];
            }

            auto& stl = stl_decomposers_[idx];
            stl.fit(deseasonalized);
            seasonal[idx] = stl.seasonal();

            for (std::size_t i = 0; i < n; ++i) {
                deseasonalized[i] -= seasonal[idx][i];
            }
        }
        SEASONKIT_DEBUG("MSTL pass {}/{} complete.", pass + 1, iterations_);
    }

    const auto& last_stl = stl_decomposers_.back();
    core::DecompositionParts parts;
    parts.trend = last_stl.trend();
    parts.weights = last_stl.weights();
    parts.residual.resize(n);
    for (std::size_t i = 0; i < n; ++i) {
        parts.residual[i] = deseasonalized[i] - parts.trend[i];
    }

    if (box_cox_state) {
        parts.original_scale = parts.trend;
        for (std::size_t i = 0; i < n; ++i) {
            for (std::size_t idx = 0; idx < k; ++idx) {
                parts.original_scale[i] += seasonal[idx][i];
            }
            if (config_.box_cox_inverse == BoxCoxInverse::Reconstructed) {
                parts.original_scale[i] += parts.residual[i];
            }
        }
        box_cox.inverseTransform(parts.original_scale);
    }

    parts.seasonal.reserve(k);
    for (std::size_t idx = 0; idx < k; ++idx) {
        core::SeasonalComponent component;
        component.period = periods[idx];
        component.window = windows_[idx];
        component.name = core::SeasonalComponent::nameFor(periods[idx]);
        component.values = std::move(seasonal[idx]);
        parts.seasonal.push_back(std::move(component));
    }

    parts.timestamps = std::move(timestamps);
    parts.name = std::move(name);
    parts.metadata = std::move(metadata);
    parts.observed = values;
    parts.adjusted = std::move(working);
    parts.box_cox = box_cox_state;

    SEASONKIT_INFO("MSTL decomposition completed with {} seasonalities and {} iterations.", k, iterations_);
    return core::DecompositionResult(std::move(parts));
}

core::DecompositionResult decompose(const core::TimeSeries& series, const MstlConfig& config) {
    MSTLDecomposition decomposer(config);
    return decomposer.decompose(series);
}

} // namespace seasonkit::seasonality
