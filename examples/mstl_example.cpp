#include "seasonkit/core/time_series.hpp"
#include "seasonkit/seasonality/mstl.hpp"
#include "seasonkit/utils/logging.hpp"

#include <chrono>
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace seasonkit;

namespace {

constexpr double kPi = 3.14159265358979323846;

// AirPassengers dataset (full 144 months)
std::vector<double> airPassengersData() {
	return {
		112., 118., 132., 129., 121., 135., 148., 148., 136., 119., 104., 118.,
		115., 126., 141., 135., 125., 149., 170., 170., 158., 133., 114., 140.,
		145., 150., 178., 163., 172., 178., 199., 199., 184., 162., 146., 166.,
		171., 180., 193., 181., 183., 218., 230., 242., 209., 191., 172., 194.,
		196., 196., 236., 235., 229., 243., 264., 272., 237., 211., 180., 201.,
		204., 188., 235., 227., 234., 264., 302., 293., 259., 229., 203., 229.,
		242., 233., 267., 269., 270., 315., 364., 347., 312., 274., 237., 278.,
		284., 277., 317., 313., 318., 374., 413., 405., 355., 306., 271., 306.,
		315., 301., 356., 348., 355., 422., 465., 467., 404., 347., 305., 336.,
		340., 318., 362., 348., 363., 435., 491., 505., 404., 359., 310., 337.,
		360., 342., 406., 396., 420., 472., 548., 559., 463., 407., 362., 405.,
		417., 391., 419., 461., 472., 535., 622., 606., 508., 461., 390., 432.
	};
}

// Hourly load: daily and weekly cycles on a slowly rising level
std::vector<double> generateHourlyData(int n) {
	std::vector<double> data(n);
	for (int i = 0; i < n; ++i) {
		double daily = 5.0 * std::sin(2.0 * kPi * i / 24.0);
		double weekly = 10.0 * std::sin(2.0 * kPi * i / 168.0);
		double trend = 0.0001 * i * i;
		data[i] = 100.0 + trend + daily + weekly;
	}
	return data;
}

void printHeader(const std::string& title) {
	std::cout << "\n" << std::string(80, '=') << "\n";
	std::cout << title << "\n";
	std::cout << std::string(80, '=') << "\n\n";
}

void printComponents(const core::DecompositionResult& result, std::size_t rows) {
	std::cout << std::left << std::setw(8) << "t" << std::setw(12) << "observed" << std::setw(12) << "trend";
	for (const auto& component : result.seasonalComponents()) {
		std::cout << std::setw(14) << component.name;
	}
	std::cout << std::setw(12) << "residual" << "\n";

	std::cout << std::fixed << std::setprecision(3);
	for (std::size_t i = 0; i < rows && i < result.size(); ++i) {
		std::cout << std::setw(8) << i << std::setw(12) << result.adjusted()[i] << std::setw(12) << result.trend()[i];
		for (const auto& component : result.seasonalComponents()) {
			std::cout << std::setw(14) << component.values[i];
		}
		std::cout << std::setw(12) << result.residual()[i] << "\n";
	}
}

void printStrengths(const core::DecompositionResult& result) {
	std::cout << "\nTrend strength: " << result.trendStrength() << "\n";
	for (std::size_t i = 0; i < result.seasonalCount(); ++i) {
		std::cout << result.seasonalComponents()[i].name << " strength: " << result.seasonalStrength(i) << "\n";
	}
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::info);

	try {
		printHeader("Hourly series: daily (24) and weekly (168) cycles");
		auto hourly = core::TimeSeries::fromValues(generateHourlyData(24 * 7 * 6), std::chrono::hours{1});
		hourly.setName("hourly_load");
		auto mstl = seasonality::MSTLDecomposition::builder().withPeriods({24, 168}).build();
		const auto hourly_result = mstl.decompose(hourly);
		printComponents(hourly_result, 12);
		printStrengths(hourly_result);

		printHeader("AirPassengers: monthly cycle with a Box-Cox transform");
		auto passengers = core::TimeSeries::fromValues(airPassengersData(), std::chrono::hours{24 * 30});
		passengers.setName("air_passengers");
		auto monthly = seasonality::MSTLDecomposition::builder()
		                   .withPeriods({12})
		                   .withAutoBoxCox()
		                   .withBoxCoxInverse(seasonality::BoxCoxInverse::Fitted)
		                   .build();
		const auto passengers_result = monthly.decompose(passengers);
		std::cout << "Box-Cox lambda: " << passengers_result.boxCox()->lambda << "\n\n";
		printComponents(passengers_result, 12);
		printStrengths(passengers_result);
	} catch (const std::exception& ex) {
		SEASONKIT_ERROR("Decomposition failed: {}", ex.what());
		return 1;
	}
	return 0;
}
