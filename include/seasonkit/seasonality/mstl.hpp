#pragma once

#include "seasonkit/core/decomposition_result.hpp"
#include "seasonkit/core/time_series.hpp"
#include "seasonkit/seasonality/stl.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace seasonkit::seasonality {

enum class BoxCoxMode {
    Disabled,
    Fixed,  // use MstlConfig::box_cox_lambda
    Auto    // Guerrero's method with the smallest period as block length
};

/**
 * @brief What the inverse Box-Cox transform is applied to.
 */
enum class BoxCoxInverse {
    Fitted,        // trend + seasonal components
    Reconstructed  // trend + seasonal components + residual
};

/**
 * @brief Complete MSTL configuration.
 */
struct MstlConfig {
    std::vector<std::size_t> periods;
    std::vector<std::size_t> windows;       // empty: 7 + 4 * r, r = 1-based rank of the period by size
    std::optional<std::size_t> iterations;  // empty: 2 with several periods, 1 otherwise
    BoxCoxMode box_cox = BoxCoxMode::Disabled;
    double box_cox_lambda = 1.0;
    BoxCoxInverse box_cox_inverse = BoxCoxInverse::Fitted;
    StlConfig stl;

    /**
     * @throws core::InvalidPeriodError On missing, duplicate or too small periods.
     * @throws core::MismatchedLengthError If windows are given but not one per period.
     * @throws core::InvalidInputError On invalid windows, iterations or lambda.
     */
    void validate() const;

    std::vector<std::size_t> resolvedWindows() const;
    std::size_t resolvedIterations() const;

    /**
     * @brief Default seasonal window for the period of 0-based size rank `rank`
     * (11 for the shortest period, 15 for the next, ...).
     */
    static std::size_t defaultWindow(std::size_t rank) {
        return 7 + 4 * (rank + 1);
    }
};

/**
 * @class MSTLDecomposition
 * @brief Multiple seasonal-trend decomposition by repeated STL passes.
 *
 * Each pass visits the periods in the configured order. For each period the
 * components of all other periods are removed from the working series, STL
 * is run with that period's window, and the period's component and the trend
 * are replaced by the STL output. The order is part of the result: a period
 * always sees the residual left by the periods before it in the same pass.
 */
class MSTLDecomposition {
public:
    class Builder {
    public:
        Builder& withPeriods(std::vector<std::size_t> periods);
        Builder& withWindows(std::vector<std::size_t> windows);
        Builder& withIterations(std::size_t iterations);
        Builder& withBoxCoxLambda(double lambda);
        Builder& withAutoBoxCox();
        Builder& withBoxCoxInverse(BoxCoxInverse target);
        Builder& withStlConfig(StlConfig config);
        Builder& withRobust(bool robust);
        MSTLDecomposition build() const;

    private:
        MstlConfig config_;
    };

    static Builder builder();

    /**
     * @brief Validates the configuration and prepares one STL decomposer per period.
     */
    explicit MSTLDecomposition(MstlConfig config);

    /**
     * @throws core::InvalidPeriodError If the series is shorter than two cycles of the largest period.
     * @throws core::InvalidInputError On empty or non-finite input, or non-positive input under Box-Cox.
     */
    core::DecompositionResult decompose(const core::TimeSeries& ts);
    core::DecompositionResult decompose(const std::vector<double>& values);

    const MstlConfig& config() const { return config_; }
    const std::vector<std::size_t>& windows() const { return windows_; }
    std::size_t iterations() const { return iterations_; }

private:
    core::DecompositionResult run(const std::vector<double>& values,
                                  std::vector<core::TimeSeries::TimePoint> timestamps,
                                  std::string name,
                                  core::TimeSeries::Metadata metadata);

    MstlConfig config_;
    std::vector<std::size_t> windows_;
    std::size_t iterations_;
    std::vector<STLDecomposition> stl_decomposers_;
};

/**
 * @brief One-shot MSTL decomposition of a series.
 */
core::DecompositionResult decompose(const core::TimeSeries& series, const MstlConfig& config);

} // namespace seasonkit::seasonality
