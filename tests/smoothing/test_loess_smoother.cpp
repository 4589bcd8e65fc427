#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "stl-decomp/smoothing/loess_settings.hpp"
#include "stl-decomp/smoothing/loess_smoother.hpp"
#include "common/regression_helpers.hpp"
#include "common/time_series_helpers.hpp"

#include <vector>

using stldecomp::smoothing::LoessSettings;
using stldecomp::smoothing::LoessSmoother;

namespace {

std::vector<double> linearData(std::size_t length) {
	std::vector<double> data(length);
	for (std::size_t i = 0; i < length; ++i) {
		data[i] = 1.5 + 0.75 * static_cast<double>(i);
	}
	return data;
}

} // namespace

TEST_CASE("LoessSmoother reproduces linear data for every jump", "[smoothing][loess_smoother]") {
	const auto data = linearData(20);
	for (std::size_t jump = 1; jump <= 5; ++jump) {
		LoessSmoother smoother(LoessSettings(7, 1, jump), data);
		const auto &smoothed = smoother.smooth();
		REQUIRE(smoothed.size() == data.size());
		for (std::size_t i = 0; i < data.size(); ++i) {
			REQUIRE(smoothed[i] == Catch::Approx(data[i]).margin(1e-9));
		}
	}
}

TEST_CASE("LoessSmoother interpolates linearly between jumps", "[smoothing][loess_smoother]") {
	// Evaluated points lie on the parabola; skipped midpoints are the chord
	// average, which overshoots x^2 / 2 by exactly 0.5.
	std::vector<double> data(11);
	for (std::size_t i = 0; i < data.size(); ++i) {
		const double x = static_cast<double>(i);
		data[i] = 0.5 * x * x;
	}

	LoessSmoother smoother(LoessSettings(1001, 2, 2), data);
	const auto &smoothed = smoother.smooth();
	for (std::size_t i = 0; i < data.size(); i += 2) {
		REQUIRE(smoothed[i] == Catch::Approx(data[i]).margin(1e-8));
	}
	for (std::size_t i = 1; i < data.size(); i += 2) {
		REQUIRE(smoothed[i] == Catch::Approx(data[i] + 0.5).margin(1e-8));
	}
}

TEST_CASE("LoessSmoother always evaluates the last point", "[smoothing][loess_smoother]") {
	std::vector<double> data(12);
	for (std::size_t i = 0; i < data.size(); ++i) {
		const double x = static_cast<double>(i);
		data[i] = 0.5 * x * x;
	}

	// Jump 5 evaluates 0, 5, 10 and then 11 explicitly.
	LoessSmoother smoother(LoessSettings(1001, 2, 5), data);
	const auto &smoothed = smoother.smooth();
	REQUIRE(smoother.jump() == 5);
	REQUIRE(smoothed[10] == Catch::Approx(data[10]).margin(1e-8));
	REQUIRE(smoothed[11] == Catch::Approx(data[11]).margin(1e-8));
}

TEST_CASE("LoessSmoother caps the jump at the series length", "[smoothing][loess_smoother]") {
	const auto data = linearData(4);
	LoessSmoother smoother(LoessSettings(3, 1, 10), data);
	REQUIRE(smoother.jump() == 3);
	const auto &smoothed = smoother.smooth();
	for (std::size_t i = 0; i < data.size(); ++i) {
		REQUIRE(smoothed[i] == Catch::Approx(data[i]).margin(1e-9));
	}
}

TEST_CASE("LoessSmoother with width covering the data is a global fit", "[smoothing][loess_smoother]") {
	auto data = tests::helpers::gaussianNoise(40, 1.0, 3);
	for (std::size_t i = 0; i < data.size(); ++i) {
		data[i] += 0.5 * static_cast<double>(i);
	}
	const auto coefficients = tests::helpers::polyfit(data, 1);

	LoessSmoother smoother(LoessSettings(100001, 1, 1), data);
	const auto &smoothed = smoother.smooth();
	for (std::size_t i = 0; i < data.size(); ++i) {
		REQUIRE(smoothed[i] == Catch::Approx(tests::helpers::polyval(coefficients, static_cast<double>(i))).margin(1e-8));
	}
}

TEST_CASE("LoessSmoother slides a window of fixed width", "[smoothing][loess_smoother]") {
	const auto data = linearData(30);
	LoessSmoother smoother(LoessSettings(9, 1, 1), data);
	REQUIRE(smoother.windowLeft(0) == 0);
	REQUIRE(smoother.windowLeft(4) == 0);
	REQUIRE(smoother.windowLeft(5) == 1);
	REQUIRE(smoother.windowLeft(15) == 11);
	REQUIRE(smoother.windowLeft(29) == 21);
}

TEST_CASE("LoessSmoother falls back to raw values when weights vanish", "[smoothing][loess_smoother]") {
	const auto data = tests::helpers::gaussianNoise(25, 1.0, 5);
	LoessSmoother smoother(LoessSettings(7, 1, 1), data, std::vector<double>(data.size(), 0.0));
	const auto &smoothed = smoother.smooth();
	for (std::size_t i = 0; i < data.size(); ++i) {
		REQUIRE(smoothed[i] == data[i]);
	}
}

TEST_CASE("LoessSmoother passes a single point through", "[smoothing][loess_smoother]") {
	const std::vector<double> data{42.0};
	LoessSmoother smoother(LoessSettings(7), data);
	const auto &smoothed = smoother.smooth();
	REQUIRE(smoothed.size() == 1);
	REQUIRE(smoothed[0] == 42.0);
}
