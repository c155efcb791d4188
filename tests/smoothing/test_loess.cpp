#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "seasonkit/core/errors.hpp"
#include "seasonkit/smoothing/loess.hpp"

#include <cmath>
#include <limits>
#include <vector>

using seasonkit::core::InvalidInputError;
using seasonkit::core::MismatchedLengthError;
using seasonkit::smoothing::LocalRegressionSmoother;
using seasonkit::smoothing::LoessOptions;

namespace {

std::vector<double> line(std::size_t n, double intercept, double slope) {
	std::vector<double> values(n);
	for (std::size_t i = 0; i < n; ++i) {
		values[i] = intercept + slope * static_cast<double>(i);
	}
	return values;
}

LoessOptions options(std::size_t window, int degree, std::size_t jump = 1, std::size_t robustness = 0) {
	LoessOptions opts;
	opts.window = window;
	opts.degree = degree;
	opts.jump = jump;
	opts.robustness_iterations = robustness;
	return opts;
}

void expectSeriesNear(const std::vector<double> &lhs, const std::vector<double> &rhs, double eps) {
	REQUIRE(lhs.size() == rhs.size());
	for (std::size_t i = 0; i < lhs.size(); ++i) {
		CAPTURE(i, lhs[i], rhs[i]);
		REQUIRE(std::abs(lhs[i] - rhs[i]) <= eps);
	}
}

} // namespace

TEST_CASE("LOESS reproduces polynomials up to its degree", "[smoothing][loess]") {
	SECTION("linear data with degree 1") {
		const auto data = line(30, 2.0, 0.5);
		LocalRegressionSmoother smoother(options(7, 1));
		expectSeriesNear(smoother.smooth(data), data, 1e-9);
	}

	SECTION("quadratic data with degree 2") {
		std::vector<double> data(40);
		for (std::size_t i = 0; i < data.size(); ++i) {
			const double t = static_cast<double>(i);
			data[i] = 1.0 + 0.1 * t + 0.05 * t * t;
		}
		LocalRegressionSmoother smoother(options(9, 2));
		expectSeriesNear(smoother.smooth(data), data, 1e-8);
	}

	SECTION("constant data with degree 0") {
		const std::vector<double> data(15, 4.25);
		LocalRegressionSmoother smoother(options(5, 0));
		expectSeriesNear(smoother.smooth(data), data, 1e-12);
	}
}

TEST_CASE("LOESS interpolates between jumped positions", "[smoothing][loess]") {
	const auto data = line(23, -1.0, 0.25);
	LocalRegressionSmoother smoother(options(7, 1, 4));
	expectSeriesNear(smoother.smooth(data), data, 1e-9);
}

TEST_CASE("LOESS handles windows longer than the series", "[smoothing][loess]") {
	const auto data = line(5, 3.0, -2.0);
	LocalRegressionSmoother smoother(options(9, 1));
	expectSeriesNear(smoother.smooth(data), data, 1e-9);
}

TEST_CASE("LOESS extrapolates outside its neighbourhood", "[smoothing][loess]") {
	const auto data = line(10, 1.0, 2.0);
	LocalRegressionSmoother smoother(options(5, 1));
	const auto before = smoother.fitAt(data, -1.0, 0, 4);
	REQUIRE(before.has_value());
	REQUIRE(*before == Catch::Approx(-1.0).margin(1e-9));

	const auto after = smoother.fitAt(data, 10.0, 5, 9);
	REQUIRE(after.has_value());
	REQUIRE(*after == Catch::Approx(21.0).margin(1e-9));
}

TEST_CASE("LOESS keeps input values where all weights vanish", "[smoothing][loess]") {
	const std::vector<double> data{1.0, 5.0, 2.0, 8.0, 3.0};
	LocalRegressionSmoother smoother(options(3, 1));
	expectSeriesNear(smoother.smooth(data, std::vector<double>(data.size(), 0.0)), data, 0.0);
	REQUIRE_FALSE(smoother.fitAt(data, 2.0, 1, 3, std::vector<double>(data.size(), 0.0)).has_value());
}

TEST_CASE("LOESS robustness iterations suppress an outlier", "[smoothing][loess]") {
	const std::size_t n = 40;
	const std::size_t spike = 20;
	const auto truth = line(n, 2.0, 0.5);
	auto data = truth;
	for (std::size_t i = 0; i < n; ++i) {
		data[i] += std::sin(1.7 * static_cast<double>(i));
	}
	data[spike] += 100.0;

	LocalRegressionSmoother plain(options(21, 1));
	LocalRegressionSmoother robust(options(21, 1, 1, 4));
	const auto plain_fit = plain.smooth(data);
	const auto robust_fit = robust.smooth(data);

	REQUIRE(std::abs(plain_fit[spike - 1] - truth[spike - 1]) > 5.0);
	REQUIRE(std::abs(robust_fit[spike - 1] - truth[spike - 1]) < 1.0);
	REQUIRE(std::abs(robust_fit[spike + 1] - truth[spike + 1]) < 1.0);
}

TEST_CASE("LOESS validates its options and inputs", "[smoothing][loess][error]") {
	REQUIRE_THROWS_AS(LocalRegressionSmoother(options(4, 1)), InvalidInputError);
	REQUIRE_THROWS_AS(LocalRegressionSmoother(options(1, 1)), InvalidInputError);
	REQUIRE_THROWS_AS(LocalRegressionSmoother(options(5, 3)), InvalidInputError);
	REQUIRE_THROWS_AS(LocalRegressionSmoother(options(5, 1, 0)), InvalidInputError);

	LocalRegressionSmoother smoother(options(5, 1));
	const auto data = line(10, 0.0, 1.0);
	REQUIRE_THROWS_AS(smoother.smooth(data, {1.0, 1.0}), MismatchedLengthError);
	REQUIRE_THROWS_AS(smoother.smooth(data, std::vector<double>(10, -1.0)), InvalidInputError);

	auto gappy = data;
	gappy[3] = std::numeric_limits<double>::quiet_NaN();
	REQUIRE_THROWS_AS(smoother.smooth(gappy), InvalidInputError);
}
