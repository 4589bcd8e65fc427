#pragma once

#include "stl-decomp/seasonality/lowpass_filter.hpp"
#include "stl-decomp/smoothing/loess_settings.hpp"
#include <cstddef>
#include <optional>

namespace stldecomp::seasonality {

/**
 * Optional knobs of an STL decomposition. Unset values are filled in by
 * resolveParameters().
 */
struct StlConfig {
    std::optional<std::size_t> periodicity;

    std::optional<std::size_t> seasonal_width;
    std::optional<int> seasonal_degree;
    std::optional<std::size_t> seasonal_jump;

    std::optional<std::size_t> trend_width;
    std::optional<int> trend_degree;
    std::optional<std::size_t> trend_jump;

    std::optional<std::size_t> lowpass_width;
    int lowpass_degree = 1;
    std::optional<std::size_t> lowpass_jump;

    std::optional<std::size_t> inner_iterations;
    std::optional<std::size_t> outer_iterations;

    bool robust = false;
    bool periodic = false;
    bool flat_trend = false;
    bool linear_trend = false;
    bool post_trend_smoothing = false;
    LowPassMode lowpass_mode = LowPassMode::Eroding;
};

/**
 * Fully resolved parameters consumed by SeasonalTrendLoess.
 */
struct StlParameters {
    std::size_t periodicity;
    std::size_t inner_iterations;
    std::size_t outer_iterations;
    smoothing::LoessSettings seasonal;
    smoothing::LoessSettings trend;
    smoothing::LoessSettings lowpass;
    bool periodic = false;
    bool post_trend_smoothing = false;
    LowPassMode lowpass_mode = LowPassMode::Eroding;
};

/**
 * @brief Applies defaults to @p config for a series of @p data_length points.
 *
 * Rules:
 * - periodicity is required and at least 2.
 * - Iterations default to 2 inner / 0 outer; robust switches to 1 / 15.
 *   Explicit counts win over either preset. At least one inner iteration.
 * - periodic forces seasonal width 100 * n and degree 0 and cannot be
 *   combined with a seasonal jump or with a different width or degree.
 *   Otherwise a seasonal width is required and the degree defaults to 1.
 * - flat_trend / linear_trend force trend width 100 * p * n and degree 0 / 1
 *   and cannot be combined with a trend jump, a different width or degree,
 *   or with each other.
 * - The trend width defaults to (int)(1.5 p / (1 - 1.5 / seasonal width) + 0.5),
 *   the trend degree to 1, the low-pass width to p.
 *
 * @throws ConfigurationError If the configuration is incomplete or contradictory.
 * @throws InputShapeError If data_length is not greater than 2 * periodicity.
 */
StlParameters resolveParameters(const StlConfig& config, std::size_t data_length);

/// Default trend width for the given periodicity and (adjusted) seasonal width.
std::size_t defaultTrendWidth(std::size_t periodicity, std::size_t seasonal_width);

} // namespace stldecomp::seasonality
