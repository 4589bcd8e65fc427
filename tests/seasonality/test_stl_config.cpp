#include <catch2/catch_test_macros.hpp>

#include "stl-decomp/errors.hpp"
#include "stl-decomp/seasonality/stl_config.hpp"

using stldecomp::ConfigurationError;
using stldecomp::InputShapeError;
using stldecomp::seasonality::LowPassMode;
using stldecomp::seasonality::StlConfig;
using stldecomp::seasonality::defaultTrendWidth;
using stldecomp::seasonality::resolveParameters;
using stldecomp::smoothing::LoessDegree;

namespace {

StlConfig monthlyConfig() {
	StlConfig config;
	config.periodicity = 12;
	config.seasonal_width = 7;
	return config;
}

} // namespace

TEST_CASE("resolveParameters applies defaults", "[seasonality][stl_config]") {
	const auto parameters = resolveParameters(monthlyConfig(), 72);

	REQUIRE(parameters.periodicity == 12);
	REQUIRE(parameters.inner_iterations == 2);
	REQUIRE(parameters.outer_iterations == 0);

	REQUIRE(parameters.seasonal.width() == 7);
	REQUIRE(parameters.seasonal.degree() == LoessDegree::Linear);
	REQUIRE(parameters.seasonal.jump() == 1);

	// (int)(1.5 * 12 / (1 - 1.5 / 7) + 0.5)
	REQUIRE(parameters.trend.width() == 23);
	REQUIRE(parameters.trend.degree() == LoessDegree::Linear);
	REQUIRE(parameters.trend.jump() == 3);

	REQUIRE(parameters.lowpass.width() == 13);
	REQUIRE(parameters.lowpass.degree() == LoessDegree::Linear);
	REQUIRE(parameters.lowpass.jump() == 2);

	REQUIRE_FALSE(parameters.periodic);
	REQUIRE_FALSE(parameters.post_trend_smoothing);
	REQUIRE(parameters.lowpass_mode == LowPassMode::Eroding);
}

TEST_CASE("defaultTrendWidth follows the stability bound", "[seasonality][stl_config]") {
	REQUIRE(defaultTrendWidth(12, 7) == 23);
	REQUIRE(defaultTrendWidth(7, 7) == 13);
	REQUIRE(defaultTrendWidth(12, 7201) == 18);
}

TEST_CASE("resolveParameters honours explicit values", "[seasonality][stl_config]") {
	auto config = monthlyConfig();
	config.seasonal_degree = 2;
	config.seasonal_jump = 3;
	config.trend_width = 31;
	config.trend_degree = 0;
	config.trend_jump = 1;
	config.lowpass_width = 15;
	config.lowpass_degree = 2;
	config.lowpass_jump = 4;
	config.post_trend_smoothing = true;
	config.lowpass_mode = LowPassMode::EdgeFilled;

	const auto parameters = resolveParameters(config, 72);
	REQUIRE(parameters.seasonal.degree() == LoessDegree::Quadratic);
	REQUIRE(parameters.seasonal.jump() == 3);
	REQUIRE(parameters.trend.width() == 31);
	REQUIRE(parameters.trend.degree() == LoessDegree::Flat);
	REQUIRE(parameters.trend.jump() == 1);
	REQUIRE(parameters.lowpass.width() == 15);
	REQUIRE(parameters.lowpass.degree() == LoessDegree::Quadratic);
	REQUIRE(parameters.lowpass.jump() == 4);
	REQUIRE(parameters.post_trend_smoothing);
	REQUIRE(parameters.lowpass_mode == LowPassMode::EdgeFilled);
}

TEST_CASE("resolveParameters iteration presets", "[seasonality][stl_config]") {
	auto config = monthlyConfig();
	config.robust = true;
	auto parameters = resolveParameters(config, 72);
	REQUIRE(parameters.inner_iterations == 1);
	REQUIRE(parameters.outer_iterations == 15);

	config.outer_iterations = 5;
	parameters = resolveParameters(config, 72);
	REQUIRE(parameters.inner_iterations == 1);
	REQUIRE(parameters.outer_iterations == 5);

	config.robust = false;
	config.inner_iterations = 3;
	parameters = resolveParameters(config, 72);
	REQUIRE(parameters.inner_iterations == 3);
	REQUIRE(parameters.outer_iterations == 5);

	config.inner_iterations = 0;
	REQUIRE_THROWS_AS(resolveParameters(config, 72), ConfigurationError);
}

TEST_CASE("resolveParameters periodic seasonal", "[seasonality][stl_config]") {
	StlConfig config;
	config.periodicity = 12;
	config.periodic = true;

	const auto parameters = resolveParameters(config, 72);
	REQUIRE(parameters.periodic);
	REQUIRE(parameters.seasonal.width() == 7201);
	REQUIRE(parameters.seasonal.degree() == LoessDegree::Flat);
	REQUIRE(parameters.trend.width() == 19);

	SECTION("consistent explicit values are accepted") {
		config.seasonal_width = 7200;
		config.seasonal_degree = 0;
		REQUIRE_NOTHROW(resolveParameters(config, 72));
	}

	SECTION("conflicting degree") {
		config.seasonal_degree = 1;
		REQUIRE_THROWS_AS(resolveParameters(config, 72), ConfigurationError);
	}

	SECTION("conflicting width") {
		config.seasonal_width = 7;
		REQUIRE_THROWS_AS(resolveParameters(config, 72), ConfigurationError);
	}

	SECTION("any jump") {
		config.seasonal_jump = 1;
		REQUIRE_THROWS_AS(resolveParameters(config, 72), ConfigurationError);
	}
}

TEST_CASE("resolveParameters flat and linear trends", "[seasonality][stl_config]") {
	auto config = monthlyConfig();
	config.flat_trend = true;
	auto parameters = resolveParameters(config, 72);
	REQUIRE(parameters.trend.width() == 86401);
	REQUIRE(parameters.trend.degree() == LoessDegree::Flat);

	config.flat_trend = false;
	config.linear_trend = true;
	parameters = resolveParameters(config, 72);
	REQUIRE(parameters.trend.width() == 86401);
	REQUIRE(parameters.trend.degree() == LoessDegree::Linear);

	SECTION("trend jump conflicts") {
		config.trend_jump = 2;
		REQUIRE_THROWS_AS(resolveParameters(config, 72), ConfigurationError);
	}

	SECTION("trend degree conflicts") {
		config.trend_degree = 0;
		REQUIRE_THROWS_AS(resolveParameters(config, 72), ConfigurationError);
	}

	SECTION("trend width conflicts") {
		config.trend_width = 25;
		REQUIRE_THROWS_AS(resolveParameters(config, 72), ConfigurationError);
	}

	SECTION("flat and linear conflict") {
		config.flat_trend = true;
		REQUIRE_THROWS_AS(resolveParameters(config, 72), ConfigurationError);
	}
}

TEST_CASE("resolveParameters rejects incomplete configurations", "[seasonality][stl_config][error]") {
	StlConfig missing_period;
	missing_period.seasonal_width = 7;
	REQUIRE_THROWS_AS(resolveParameters(missing_period, 72), ConfigurationError);

	auto short_period = monthlyConfig();
	short_period.periodicity = 1;
	REQUIRE_THROWS_AS(resolveParameters(short_period, 72), ConfigurationError);

	StlConfig missing_width;
	missing_width.periodicity = 12;
	REQUIRE_THROWS_AS(resolveParameters(missing_width, 72), ConfigurationError);

	auto bad_degree = monthlyConfig();
	bad_degree.trend_degree = 3;
	REQUIRE_THROWS_AS(resolveParameters(bad_degree, 72), ConfigurationError);
}

TEST_CASE("resolveParameters needs more than two periods of data", "[seasonality][stl_config][error]") {
	REQUIRE_THROWS_AS(resolveParameters(monthlyConfig(), 24), InputShapeError);
	REQUIRE_NOTHROW(resolveParameters(monthlyConfig(), 25));
}
