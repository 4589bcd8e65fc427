#include "stl-decomp/core/time_series.hpp"
#include "stl-decomp/seasonality/stl.hpp"
#include "stl-decomp/utils/logging.hpp"

#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace stldecomp;

namespace {

// AirPassengers dataset (first 6 years)
std::vector<double> airPassengersData() {
	return {
		112., 118., 132., 129., 121., 135., 148., 148., 136., 119., 104., 118.,
		115., 126., 141., 135., 125., 149., 170., 170., 158., 133., 114., 140.,
		145., 150., 178., 163., 172., 178., 199., 199., 184., 162., 146., 166.,
		171., 180., 193., 181., 183., 218., 230., 242., 209., 191., 172., 194.,
		196., 196., 236., 235., 229., 243., 264., 272., 237., 211., 180., 201.,
		204., 188., 235., 227., 234., 264., 302., 293., 259., 229., 203., 229.
	};
}

core::TimeSeries createMonthlySeries(const std::vector<double>& data) {
	std::vector<core::TimeSeries::TimePoint> timestamps;
	timestamps.reserve(data.size());
	const auto start = core::TimeSeries::TimePoint{};
	for (std::size_t i = 0; i < data.size(); ++i) {
		timestamps.push_back(start + std::chrono::hours(24 * 30 * static_cast<long>(i)));
	}
	return core::TimeSeries(std::move(timestamps), data);
}

void printHeader(const std::string& title) {
	std::cout << "\n" << std::string(72, '=') << "\n";
	std::cout << title << "\n";
	std::cout << std::string(72, '=') << "\n\n";
}

void printComponents(const seasonality::STLDecomposition& stl, const std::vector<double>& data) {
	std::cout << std::setw(6) << "t" << std::setw(11) << "value" << std::setw(11) << "trend"
	          << std::setw(11) << "seasonal" << std::setw(11) << "remainder" << std::setw(9) << "weight" << "\n";
	for (std::size_t i = 0; i < data.size(); ++i) {
		std::cout << std::setw(6) << i << std::fixed << std::setprecision(2)
		          << std::setw(11) << data[i]
		          << std::setw(11) << stl.trend()[i]
		          << std::setw(11) << stl.seasonal()[i]
		          << std::setw(11) << stl.remainder()[i]
		          << std::setw(9) << std::setprecision(3) << stl.weights()[i] << "\n";
	}
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::debug);

	auto data = airPassengersData();
	// A data-entry error in month 30
	data[30] += 250.0;
	const auto series = createMonthlySeries(data);

	printHeader("Non-robust STL (period 12)");
	auto stl = seasonality::STLDecomposition::builder()
	               .withPeriod(12)
	               .withSeasonalWidth(7)
	               .build();
	stl.fit(series);
	std::cout << "Seasonal strength: " << std::setprecision(3) << stl.seasonalStrength() << "\n";
	std::cout << "Trend strength:    " << stl.trendStrength() << "\n";
	std::cout << "Remainder at the outlier: " << std::setprecision(2) << stl.remainder()[30] << "\n";

	printHeader("Robust STL (1 inner, 15 outer iterations)");
	auto robust = seasonality::STLDecomposition::builder()
	                  .withPeriod(12)
	                  .withSeasonalWidth(7)
	                  .withRobust(true)
	                  .build();
	robust.fit(series);
	printComponents(robust, data);

	printHeader("Strictly periodic diagnostic");
	const auto periodic = seasonality::STLDecomposition::periodicDecomposition(data, 12);
	for (std::size_t i = 0; i < 12; ++i) {
		std::cout << "phase " << std::setw(2) << i << ": " << std::setprecision(2) << periodic.seasonal()[i] << "\n";
	}

	return 0;
}
