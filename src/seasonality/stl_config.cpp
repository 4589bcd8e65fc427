#include "stl-decomp/seasonality/stl_config.hpp"
#include "stl-decomp/errors.hpp"
#include <string>

namespace {

using stldecomp::ConfigurationError;
using stldecomp::smoothing::LoessSettings;

constexpr std::size_t kMassiveWidthFactor = 100;

LoessSettings buildSettings(std::size_t width, int degree, const std::optional<std::size_t>& jump) {
    if (jump) {
        return LoessSettings(width, degree, *jump);
    }
    return LoessSettings(width, degree);
}

void checkForcedSmoother(const char* flag,
                         const char* component,
                         const std::optional<std::size_t>& width,
                         const std::optional<int>& degree,
                         const std::optional<std::size_t>& jump,
                         std::size_t forced_width,
                         int forced_degree) {
    if (jump) {
        throw ConfigurationError(std::string(component) + " jump cannot be combined with " + flag + ".");
    }
    if (width && *width != forced_width) {
        throw ConfigurationError(std::string(component) + " width cannot be combined with " + flag + ".");
    }
    if (degree && *degree != forced_degree) {
        throw ConfigurationError(std::string(component) + " degree cannot be combined with " + flag + ".");
    }
}

} // namespace

namespace stldecomp::seasonality {

std::size_t defaultTrendWidth(std::size_t periodicity, std::size_t seasonal_width) {
    const double p = static_cast<double>(periodicity);
    const double ns = static_cast<double>(seasonal_width);
    return static_cast<std::size_t>(1.5 * p / (1.0 - 1.5 / ns) + 0.5);
}

StlParameters resolveParameters(const StlConfig& config, std::size_t data_length) {
    if (!config.periodicity) {
        throw ConfigurationError("Periodicity must be set.");
    }
    const std::size_t period = *config.periodicity;
    if (period < 2) {
        throw ConfigurationError("Periodicity must be at least 2, but is " + std::to_string(period) + ".");
    }
    if (data_length <= 2 * period) {
        throw InputShapeError("Series must hold more than " + std::to_string(2 * period) + " points, but holds " +
                              std::to_string(data_length) + ".");
    }

    std::size_t inner = config.robust ? 1 : 2;
    std::size_t outer = config.robust ? 15 : 0;
    if (config.inner_iterations) {
        inner = *config.inner_iterations;
    }
    if (config.outer_iterations) {
        outer = *config.outer_iterations;
    }
    if (inner == 0) {
        throw ConfigurationError("At least one inner iteration is required.");
    }

    // Seasonal
    const std::size_t massive_seasonal_width = kMassiveWidthFactor * data_length;
    std::size_t seasonal_width = 0;
    int seasonal_degree = 1;
    if (config.periodic) {
        checkForcedSmoother("periodic", "Seasonal", config.seasonal_width, config.seasonal_degree,
                            config.seasonal_jump, massive_seasonal_width, 0);
        seasonal_width = massive_seasonal_width;
        seasonal_degree = 0;
    } else {
        if (!config.seasonal_width) {
            throw ConfigurationError("Seasonal width must be set unless the decomposition is periodic.");
        }
        seasonal_width = *config.seasonal_width;
        seasonal_degree = config.seasonal_degree.value_or(1);
    }
    LoessSettings seasonal = buildSettings(seasonal_width, seasonal_degree, config.seasonal_jump);

    // Trend
    if (config.flat_trend && config.linear_trend) {
        throw ConfigurationError("Flat and linear trend cannot both be requested.");
    }
    const std::size_t massive_trend_width = kMassiveWidthFactor * period * data_length;
    std::size_t trend_width = 0;
    int trend_degree = 1;
    if (config.flat_trend || config.linear_trend) {
        const int forced_degree = config.flat_trend ? 0 : 1;
        checkForcedSmoother(config.flat_trend ? "flat trend" : "linear trend", "Trend", config.trend_width,
                            config.trend_degree, config.trend_jump, massive_trend_width, forced_degree);
        trend_width = massive_trend_width;
        trend_degree = forced_degree;
    } else {
        trend_degree = config.trend_degree.value_or(1);
        trend_width = config.trend_width ? *config.trend_width : defaultTrendWidth(period, seasonal.width());
    }
    LoessSettings trend = buildSettings(trend_width, trend_degree, config.trend_jump);

    // Low-pass
    LoessSettings lowpass = buildSettings(config.lowpass_width.value_or(period), config.lowpass_degree,
                                          config.lowpass_jump);

    return StlParameters{period,
                         inner,
                         outer,
                         seasonal,
                         trend,
                         lowpass,
                         config.periodic,
                         config.post_trend_smoothing,
                         config.lowpass_mode};
}

} // namespace stldecomp::seasonality
