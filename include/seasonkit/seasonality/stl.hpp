#pragma once

#include "seasonkit/core/time_series.hpp"
#include "seasonkit/smoothing/loess.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace seasonkit::seasonality {

/**
 * @brief STL settings shared by every period of an MSTL run.
 *
 * Unset windows and iteration counts are derived from the period, the
 * seasonal window and the robust flag when a decomposer is constructed.
 */
struct StlConfig {
    std::optional<std::size_t> trend;     // trend LOESS window (odd)
    std::optional<std::size_t> low_pass;  // low-pass LOESS window (odd, > period)
    int seasonal_deg = 1;
    int trend_deg = 1;
    int low_pass_deg = 1;
    bool robust = false;
    std::size_t seasonal_jump = 1;
    std::size_t trend_jump = 1;
    std::size_t low_pass_jump = 1;
    std::optional<std::size_t> inner_iter;  // default: 2 if robust, else 5
    std::optional<std::size_t> outer_iter;  // default: 15 if robust, else 0

    using OptionMap = std::map<std::string, double>;

    /**
     * @brief Builds a config from key/value options.
     *
     * Recognised keys: trend, low_pass, seasonal_deg, trend_deg, low_pass_deg,
     * robust, seasonal_jump, trend_jump, low_pass_jump, inner_iter, outer_iter.
     * @throws core::InvalidInputError On unknown keys or invalid values.
     */
    static StlConfig fromOptions(const OptionMap &options);

    /**
     * @throws core::InvalidInputError If any explicit setting is out of range.
     */
    void validate() const;

    std::size_t innerIterations() const {
        return inner_iter.value_or(robust ? 2 : 5);
    }

    std::size_t outerIterations() const {
        return outer_iter.value_or(robust ? 15 : 0);
    }
};

/**
 * @class STLDecomposition
 * @brief Seasonal-trend decomposition of one seasonal period using LOESS.
 *
 * Classical inner/outer loop: the inner loop alternates cycle-subseries
 * smoothing, low-pass removal and trend smoothing; the outer loop derives
 * bisquare robustness weights from the remainder and reruns the inner loop
 * with them.
 */
class STLDecomposition {
public:
    class Builder {
    public:
        Builder& withPeriod(std::size_t period);
        Builder& withSeasonalSmoother(std::size_t window);
        Builder& withTrendSmoother(std::size_t window);
        Builder& withLowPassSmoother(std::size_t window);
        Builder& withSeasonalDegree(int degree);
        Builder& withTrendDegree(int degree);
        Builder& withLowPassDegree(int degree);
        Builder& withJumps(std::size_t seasonal_jump, std::size_t trend_jump, std::size_t low_pass_jump);
        Builder& withInnerIterations(std::size_t iterations);
        Builder& withOuterIterations(std::size_t iterations);
        Builder& withRobust(bool robust);
        Builder& withConfig(StlConfig config);
        STLDecomposition build() const;

    private:
        std::size_t period_ = 12;
        std::size_t seasonal_smoother_ = 7;
        StlConfig config_;
    };

    static Builder builder();

    /**
     * @throws core::InvalidPeriodError If period < 2.
     * @throws core::InvalidInputError If a window, degree, jump or iteration count is invalid.
     */
    explicit STLDecomposition(std::size_t seasonal_period,
                              std::size_t seasonal_smoother = 7,
                              StlConfig config = {});

    /**
     * @throws core::InvalidPeriodError If the series holds fewer than two full periods.
     * @throws core::InvalidInputError If the series contains non-finite values.
     */
    void fit(const core::TimeSeries& ts);
    void fit(const std::vector<double>& values);

    const std::vector<double>& trend() const { return trend_; }
    const std::vector<double>& seasonal() const { return seasonal_; }
    const std::vector<double>& remainder() const { return remainder_; }
    const std::vector<double>& weights() const { return weights_; }

    double seasonalStrength() const;
    double trendStrength() const;

    std::size_t seasonalPeriod() const { return seasonal_period_; }
    std::size_t seasonalWindow() const { return seasonal_smoother_; }
    std::size_t trendWindow() const { return trend_smoother_; }
    std::size_t lowPassWindow() const { return low_pass_smoother_; }
    const StlConfig& config() const { return config_; }

    /**
     * @brief Default trend window: next odd integer >= 1.5 p / (1 - 1.5 / seasonal).
     */
    static std::size_t defaultTrendWindow(std::size_t period, std::size_t seasonal_window);

    /**
     * @brief Default low-pass window: the next odd integer above the period.
     */
    static std::size_t defaultLowPassWindow(std::size_t period);

private:
    void innerLoop(const std::vector<double>& values, bool use_weights);
    void smoothCycleSubseries(const std::vector<double>& detrended, bool use_weights, std::vector<double>& cycle) const;
    void updateRobustnessWeights(const std::vector<double>& values);
    void ensureFitted() const;

    std::size_t seasonal_period_;
    std::size_t seasonal_smoother_;
    std::size_t trend_smoother_;
    std::size_t low_pass_smoother_;
    StlConfig config_;

    smoothing::LocalRegressionSmoother seasonal_loess_;
    smoothing::LocalRegressionSmoother trend_loess_;
    smoothing::LocalRegressionSmoother low_pass_loess_;

    std::vector<double> trend_;
    std::vector<double> seasonal_;
    std::vector<double> remainder_;
    std::vector<double> weights_;
};

} // namespace seasonkit::seasonality
