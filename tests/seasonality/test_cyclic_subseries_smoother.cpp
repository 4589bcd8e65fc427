#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "stl-decomp/errors.hpp"
#include "stl-decomp/seasonality/cyclic_subseries_smoother.hpp"
#include "stl-decomp/smoothing/loess_settings.hpp"
#include "common/time_series_helpers.hpp"

#include <cmath>
#include <optional>
#include <vector>

using stldecomp::seasonality::CyclicSubSeriesSmoother;
using stldecomp::smoothing::LoessSettings;

namespace {

constexpr std::size_t kPeriod = 24;

// Two periods of a sinusoid whose amplitude drops by one per period.
std::vector<double> trendingSinusoid() {
	std::vector<double> data(2 * kPeriod);
	const double dx = 2.0 * M_PI / static_cast<double>(kPeriod);
	for (std::size_t i = 0; i < data.size(); ++i) {
		const double amplitude = 10.0 - static_cast<double>(i / kPeriod);
		data[i] = amplitude * std::sin(static_cast<double>(i) * dx);
	}
	return data;
}

void checkExtrapolation(std::size_t backward, std::size_t forward) {
	const auto data = trendingSinusoid();
	CyclicSubSeriesSmoother smoother(LoessSettings(7, 1, 1), data.size(), kPeriod, backward, forward);
	std::vector<double> extended(smoother.extendedLength());
	REQUIRE(extended.size() == data.size() + (backward + forward) * kPeriod);

	smoother.smooth(data, extended);

	const double dx = 2.0 * M_PI / static_cast<double>(kPeriod);
	for (std::size_t i = 0; i < extended.size(); ++i) {
		const double amplitude = 10.0 + static_cast<double>(backward) - static_cast<double>(i / kPeriod);
		const double expected = amplitude * std::sin(static_cast<double>(i) * dx);
		INFO("point " << i);
		REQUIRE(extended[i] == Catch::Approx(expected).margin(1e-9));
	}
}

} // namespace

TEST_CASE("Cyclic sub-series extrapolate one period each way", "[seasonality][cyclic_subseries]") {
	checkExtrapolation(1, 1);
}

TEST_CASE("Cyclic sub-series extrapolate four periods forward", "[seasonality][cyclic_subseries]") {
	checkExtrapolation(0, 4);
}

TEST_CASE("Cyclic sub-series extrapolate two periods each way", "[seasonality][cyclic_subseries]") {
	checkExtrapolation(2, 2);
}

TEST_CASE("Cyclic sub-series of unequal length are reassembled in order", "[seasonality][cyclic_subseries]") {
	// 3 periods of 4 plus 2 extra points: phases 0 and 1 hold 4 points, 2 and 3 hold 3.
	const std::size_t period = 4;
	std::vector<double> data(14);
	for (std::size_t i = 0; i < data.size(); ++i) {
		data[i] = static_cast<double>(i % period) + 0.5 * static_cast<double>(i / period);
	}

	CyclicSubSeriesSmoother smoother(LoessSettings(3, 1, 1), data.size(), period, 1, 1);
	std::vector<double> extended(smoother.extendedLength());
	REQUIRE(extended.size() == 22);
	smoother.smooth(data, extended);

	// Each sub-series is linear, so smoothing and extrapolation are exact.
	for (std::size_t i = 0; i < extended.size(); ++i) {
		const double cycle = static_cast<double>(i / period) - 1.0;
		const double expected = static_cast<double>(i % period) + 0.5 * cycle;
		INFO("point " << i);
		REQUIRE(extended[i] == Catch::Approx(expected).margin(1e-9));
	}
}

TEST_CASE("Cyclic sub-series weights are floored", "[seasonality][cyclic_subseries]") {
	auto data = trendingSinusoid();
	const auto noise = tests::helpers::gaussianNoise(data.size(), 0.5, 9);
	for (std::size_t i = 0; i < data.size(); ++i) {
		data[i] += noise[i];
	}

	CyclicSubSeriesSmoother smoother(LoessSettings(7, 1, 1), data.size(), kPeriod, 1, 1);
	std::vector<double> unweighted(smoother.extendedLength());
	std::vector<double> zero_weighted(smoother.extendedLength());

	smoother.smooth(data, unweighted);
	// Uniform zero weights become a uniform floor, which normalises away.
	smoother.smooth(data, zero_weighted, std::vector<double>(data.size(), 0.0));

	for (std::size_t i = 0; i < unweighted.size(); ++i) {
		REQUIRE(zero_weighted[i] == Catch::Approx(unweighted[i]).margin(1e-9));
	}
}

TEST_CASE("Cyclic sub-series smoother validates shapes", "[seasonality][cyclic_subseries][error]") {
	const LoessSettings settings(7, 1, 1);
	REQUIRE_THROWS_AS(CyclicSubSeriesSmoother(settings, 10, 12, 1, 1), stldecomp::InputShapeError);
	REQUIRE_THROWS_AS(CyclicSubSeriesSmoother(settings, 10, 0, 1, 1), stldecomp::ConfigurationError);

	CyclicSubSeriesSmoother smoother(settings, 10, 2, 1, 1);
	REQUIRE(smoother.extendedLength() == 14);

	const std::vector<double> data(10, 1.0);
	std::vector<double> too_short(13);
	REQUIRE_THROWS_AS(smoother.smooth(data, too_short), stldecomp::InputShapeError);

	std::vector<double> extended(14);
	const std::vector<double> wrong_length(9, 1.0);
	REQUIRE_THROWS_AS(smoother.smooth(wrong_length, extended), stldecomp::InputShapeError);
	REQUIRE_THROWS_AS(smoother.smooth(data, extended, std::vector<double>(3, 1.0)), stldecomp::InputShapeError);

	REQUIRE_NOTHROW(smoother.smooth(data, extended));
	for (double value : extended) {
		REQUIRE(value == Catch::Approx(1.0));
	}
}
