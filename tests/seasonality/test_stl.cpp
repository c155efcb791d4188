#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "seasonkit/core/errors.hpp"
#include "seasonkit/seasonality/stl.hpp"
#include "seasonkit/utils/statistics.hpp"
#include "common/time_series_helpers.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using seasonkit::core::InvalidInputError;
using seasonkit::core::InvalidPeriodError;
using seasonkit::seasonality::STLDecomposition;
using seasonkit::seasonality::StlConfig;
using tests::helpers::rms;
using tests::helpers::rmsDifference;

namespace {

std::vector<double> buildTrendSeasonSeries(std::size_t length, std::size_t period, double amplitude = 1.0) {
	return tests::helpers::buildSeasonalSeries(length, 0.05, {{period, amplitude}});
}

} // namespace

TEST_CASE("STL decomposition extracts seasonal strength", "[seasonality][stl]") {
	const std::size_t period = 12;
	const auto data = buildTrendSeasonSeries(period * 6, period);
	auto ts = tests::helpers::makeUnivariateSeries(data);

	auto stl = STLDecomposition::builder()
	               .withPeriod(period)
	               .withSeasonalSmoother(period + 1)
	               .withTrendSmoother(period * 2 + 1)
	               .withRobust(false)
	               .build();
	stl.fit(ts);

	REQUIRE(stl.seasonalStrength() > 0.7);
	REQUIRE(stl.trendStrength() > 0.2);
}

TEST_CASE("STL recovers a linear trend and a sinusoid", "[seasonality][stl]") {
	const std::size_t period = 12;
	const std::size_t n = period * 12;
	const auto data = buildTrendSeasonSeries(n, period, 2.0);

	STLDecomposition stl(period, 13);
	stl.fit(data);

	std::vector<double> true_trend(n);
	std::vector<double> true_seasonal(n);
	for (std::size_t t = 0; t < n; ++t) {
		true_trend[t] = 0.05 * static_cast<double>(t);
		true_seasonal[t] = tests::helpers::sineWave(t, period, 2.0);
	}
	REQUIRE(rmsDifference(stl.trend(), true_trend) < 1e-6);
	REQUIRE(rmsDifference(stl.seasonal(), true_seasonal) < 1e-6);
	REQUIRE(rms(stl.remainder()) < 1e-6);
}

TEST_CASE("STL components add back to the input", "[seasonality][stl]") {
	const auto data = tests::helpers::buildSeasonalSeries(96, 0.1, {{7, 1.5}}, 0.4);
	STLDecomposition stl(7, 9);
	stl.fit(data);

	REQUIRE(stl.trend().size() == data.size());
	REQUIRE(stl.seasonal().size() == data.size());
	for (std::size_t i = 0; i < data.size(); ++i) {
		REQUIRE(stl.trend()[i] + stl.seasonal()[i] + stl.remainder()[i] == Catch::Approx(data[i]).margin(1e-9));
		REQUIRE(stl.weights()[i] == 1.0);
	}
}

TEST_CASE("STL robust mode down-weights an outlier", "[seasonality][stl]") {
	const std::size_t spike = 50;
	auto data = tests::helpers::buildSeasonalSeries(120, 0.05, {{12, 2.0}}, 0.2);
	data[spike] += 20.0;

	auto stl = STLDecomposition::builder().withPeriod(12).withSeasonalSmoother(13).withRobust(true).build();
	REQUIRE(stl.config().innerIterations() == 2);
	REQUIRE(stl.config().outerIterations() == 15);
	stl.fit(data);

	REQUIRE(stl.weights()[spike] < 0.1);
	REQUIRE(seasonkit::utils::median(stl.weights()) > 0.5);
	REQUIRE(stl.remainder()[spike] > 15.0);
}

TEST_CASE("STL jumps and quadratic fits stay exact on clean data", "[seasonality][stl]") {
	const std::size_t period = 12;
	const auto data = buildTrendSeasonSeries(period * 10, period, 2.0);

	STLDecomposition reference(period, 13);
	reference.fit(data);

	auto jumped = STLDecomposition::builder().withPeriod(period).withSeasonalSmoother(13).withJumps(2, 3, 2).build();
	jumped.fit(data);
	REQUIRE(rmsDifference(jumped.seasonal(), reference.seasonal()) < 1e-6);
	REQUIRE(rmsDifference(jumped.trend(), reference.trend()) < 1e-6);

	auto quadratic = STLDecomposition::builder()
	                     .withPeriod(period)
	                     .withSeasonalSmoother(13)
	                     .withSeasonalDegree(2)
	                     .withTrendDegree(2)
	                     .build();
	quadratic.fit(data);
	REQUIRE(rms(quadratic.remainder()) < 1e-6);
}

TEST_CASE("STL derives default windows", "[seasonality][stl]") {
	REQUIRE(STLDecomposition::defaultTrendWindow(12, 7) == 23);
	REQUIRE(STLDecomposition::defaultTrendWindow(12, 13) == 21);
	REQUIRE(STLDecomposition::defaultLowPassWindow(12) == 13);
	REQUIRE(STLDecomposition::defaultLowPassWindow(7) == 9);

	const auto stl = STLDecomposition::builder().build();
	REQUIRE(stl.seasonalPeriod() == 12);
	REQUIRE(stl.seasonalWindow() == 7);
	REQUIRE(stl.trendWindow() == 23);
	REQUIRE(stl.lowPassWindow() == 13);
	REQUIRE(stl.config().innerIterations() == 5);
	REQUIRE(stl.config().outerIterations() == 0);
}

TEST_CASE("StlConfig parses option maps", "[seasonality][stl]") {
	const auto config = StlConfig::fromOptions({{"trend", 25.0}, {"robust", 1.0}, {"inner_iter", 3.0}});
	REQUIRE(config.trend.has_value());
	REQUIRE(*config.trend == 25);
	REQUIRE(config.robust);
	REQUIRE(config.innerIterations() == 3);
	REQUIRE(config.outerIterations() == 15);

	REQUIRE_THROWS_AS(StlConfig::fromOptions({{"seasonal_window", 7.0}}), InvalidInputError);
	REQUIRE_THROWS_AS(StlConfig::fromOptions({{"trend", 24.5}}), InvalidInputError);
	REQUIRE_THROWS_AS(StlConfig::fromOptions({{"trend", 24.0}}), InvalidInputError);
	REQUIRE_THROWS_AS(StlConfig::fromOptions({{"trend_deg", 3.0}}), InvalidInputError);
	REQUIRE_THROWS_AS(StlConfig::fromOptions({{"inner_iter", 0.0}}), InvalidInputError);
	REQUIRE_THROWS_AS(StlConfig::fromOptions({{"seasonal_deg", 1e20}}), InvalidInputError);
	REQUIRE_THROWS_AS(StlConfig::fromOptions({{"seasonal_deg", 4294967297.0}}), InvalidInputError);
	REQUIRE_THROWS_AS(StlConfig::fromOptions({{"low_pass_deg", -1.0}}), InvalidInputError);
	REQUIRE_THROWS_AS(StlConfig::fromOptions({{"trend", 1e20}}), InvalidInputError);
	REQUIRE_THROWS_AS(StlConfig::fromOptions({{"outer_iter", 1e300}}), InvalidInputError);
	REQUIRE_THROWS_AS(StlConfig::fromOptions({{"robust", 0.5}}), InvalidInputError);
	REQUIRE_THROWS_AS(StlConfig::fromOptions({{"robust", std::numeric_limits<double>::quiet_NaN()}}),
	                  InvalidInputError);
	REQUIRE_FALSE(StlConfig::fromOptions({{"robust", 0.0}}).robust);
	REQUIRE(StlConfig::fromOptions({{"trend_deg", 2.0}}).trend_deg == 2);
}

TEST_CASE("STL requires sufficient history", "[seasonality][stl][error]") {
	auto ts = tests::helpers::makeUnivariateSeries({1.0, 2.0, 3.0});
	auto stl = STLDecomposition::builder().withPeriod(4).withSeasonalSmoother(5).withTrendSmoother(7).build();
	REQUIRE_THROWS_AS(stl.fit(ts), InvalidPeriodError);

	STLDecomposition monthly(12, 7);
	REQUIRE_THROWS_AS(monthly.fit(std::vector<double>(23, 1.0)), InvalidPeriodError);
	REQUIRE_NOTHROW(monthly.fit(std::vector<double>(24, 1.0)));
}

TEST_CASE("STL validates its settings", "[seasonality][stl][error]") {
	REQUIRE_THROWS_AS(STLDecomposition(1, 7), InvalidPeriodError);
	REQUIRE_THROWS_AS(STLDecomposition(12, 6), InvalidInputError);
	REQUIRE_THROWS_AS(STLDecomposition(12, 1), InvalidInputError);
	REQUIRE_THROWS_AS(STLDecomposition::builder().withPeriod(12).withLowPassSmoother(11).build(), InvalidInputError);
	REQUIRE_THROWS_AS(STLDecomposition::builder().withTrendSmoother(22).build(), InvalidInputError);

	STLDecomposition stl(4, 5);
	REQUIRE_THROWS_AS(stl.seasonalStrength(), std::runtime_error);
	REQUIRE_THROWS_AS(stl.trendStrength(), std::runtime_error);
	REQUIRE(stl.trend().empty());
	REQUIRE(stl.seasonal().empty());
	REQUIRE(stl.remainder().empty());
	REQUIRE(stl.weights().empty());
	auto gappy = std::vector<double>(12, 1.0);
	gappy[5] = std::numeric_limits<double>::quiet_NaN();
	REQUIRE_THROWS_AS(stl.fit(gappy), InvalidInputError);
}
