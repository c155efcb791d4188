#include <catch2/catch_test_macros.hpp>

#include "seasonkit/seasonality/mstl.hpp"
#include "seasonkit/utils/statistics.hpp"
#include "common/time_series_helpers.hpp"

#include <cmath>
#include <random>
#include <vector>

using seasonkit::seasonality::MSTLDecomposition;
using seasonkit::utils::lagCorrelation;

namespace {

// Quadratic trend with daily and weekly cycles on an hourly grid.
std::vector<double> buildHourlyLoad(std::size_t length) {
	std::mt19937 rng(7);
	std::normal_distribution<double> noise(0.0, 0.5);
	std::vector<double> data(length);
	for (std::size_t t = 0; t < length; ++t) {
		const double x = static_cast<double>(t);
		data[t] = 0.0001 * x * x + tests::helpers::sineWave(t, 24, 5.0) + tests::helpers::sineWave(t, 168, 10.0) +
		          noise(rng);
	}
	return data;
}

} // namespace

TEST_CASE("Hourly series splits into daily and weekly cycles", "[integration][mstl]") {
	const auto data = buildHourlyLoad(999);
	auto ts = tests::helpers::makeUnivariateSeries(data, "hourly_load");

	auto mstl = MSTLDecomposition::builder().withPeriods({24, 168}).build();
	const auto result = mstl.decompose(ts);

	REQUIRE(result.size() == data.size());
	REQUIRE(result.name() == "hourly_load");
	REQUIRE(result.periods() == std::vector<std::size_t>{24, 168});

	const auto &daily = result.seasonal("seasonal_24");
	const auto &weekly = result.seasonal("seasonal_168");
	REQUIRE(lagCorrelation(daily, 24) > 0.9);
	REQUIRE(lagCorrelation(weekly, 168) > 0.9);

	// The quadratic trend rises over the sample.
	const auto &trend = result.trend();
	REQUIRE(trend.back() - trend.front() > 50.0);
	std::size_t rising = 0;
	for (std::size_t i = 1; i < trend.size(); ++i) {
		if (trend[i] > trend[i - 1]) {
			++rising;
		}
	}
	REQUIRE(rising > trend.size() / 2);

	const auto total = result.seasonalTotal();
	for (std::size_t i = 0; i < data.size(); ++i) {
		REQUIRE(std::abs(trend[i] + total[i] + result.residual()[i] - data[i]) < 1e-8);
	}
	REQUIRE(result.seasonalStrength(0) > 0.5);
	REQUIRE(result.seasonalStrength(1) > 0.5);
}
