#include <catch2/catch_test_macros.hpp>

#include "seasonkit/core/time_series.hpp"
#include "common/time_series_helpers.hpp"

#include <chrono>
#include <limits>
#include <vector>

using seasonkit::core::InvalidInputError;
using seasonkit::core::MismatchedLengthError;
using seasonkit::core::TimeSeries;

TEST_CASE("TimeSeries stores values and labels", "[core][time_series]") {
	const auto timestamps = tests::helpers::makeTimestamps(3);
	TimeSeries series(timestamps, {1.0, 2.0, 3.0}, "load", {{"unit", "MW"}});

	REQUIRE(series.size() == 3);
	REQUIRE_FALSE(series.isEmpty());
	REQUIRE(series.getValues()[2] == 3.0);
	REQUIRE(series.getTimestamps() == timestamps);
	REQUIRE(series.name() == "load");
	REQUIRE(series.metadata().at("unit") == "MW");
	REQUIRE_FALSE(series.frequency().has_value());

	series.setName("demand");
	REQUIRE(series.name() == "demand");
}

TEST_CASE("TimeSeries rejects mismatched and unordered timestamps", "[core][time_series][error]") {
	const auto timestamps = tests::helpers::makeTimestamps(3);
	REQUIRE_THROWS_AS(TimeSeries(timestamps, {1.0, 2.0}), MismatchedLengthError);

	auto unordered = timestamps;
	std::swap(unordered[0], unordered[1]);
	REQUIRE_THROWS_AS(TimeSeries(unordered, {1.0, 2.0, 3.0}), InvalidInputError);

	auto duplicated = timestamps;
	duplicated[2] = duplicated[1];
	REQUIRE_THROWS_AS(TimeSeries(duplicated, {1.0, 2.0, 3.0}), InvalidInputError);
}

TEST_CASE("TimeSeries::fromValues builds evenly spaced timestamps", "[core][time_series]") {
	const auto series = TimeSeries::fromValues({4.0, 5.0, 6.0, 7.0}, std::chrono::seconds{60});
	REQUIRE(series.size() == 4);
	REQUIRE(series.getTimestamps()[3] - series.getTimestamps()[0] == std::chrono::seconds{180});
	REQUIRE(series.frequency().has_value());
	REQUIRE(*series.frequency() == std::chrono::seconds{60});
}

TEST_CASE("TimeSeries reports missing values", "[core][time_series]") {
	auto series = TimeSeries::fromValues({1.0, 2.0});
	REQUIRE_FALSE(series.hasMissingValues());
	auto gappy = TimeSeries::fromValues({1.0, std::numeric_limits<double>::quiet_NaN()});
	REQUIRE(gappy.hasMissingValues());
}
