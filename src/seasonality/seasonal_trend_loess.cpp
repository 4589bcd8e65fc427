#include "stl-decomp/seasonality/seasonal_trend_loess.hpp"
#include "stl-decomp/errors.hpp"
#include "stl-decomp/seasonality/cyclic_subseries_smoother.hpp"
#include "stl-decomp/seasonality/lowpass_filter.hpp"
#include "stl-decomp/seasonality/robustness_weights.hpp"
#include "stl-decomp/smoothing/loess_smoother.hpp"
#include "stl-decomp/utils/logging.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <utility>

namespace {

using stldecomp::smoothing::LoessSettings;
using stldecomp::smoothing::LoessSmoother;

void computeRemainder(const std::vector<double>& data,
                      const std::vector<double>& trend,
                      const std::vector<double>& seasonal,
                      std::vector<double>& remainder) {
    for (std::size_t i = 0; i < data.size(); ++i) {
        remainder[i] = data[i] - trend[i] - seasonal[i];
    }
}

void smoothInPlace(const LoessSettings& settings,
                   std::vector<double>& values,
                   const std::optional<std::vector<double>>& weights) {
    LoessSmoother smoother(settings, values, weights);
    const auto& smoothed = smoother.smooth();
    std::copy(smoothed.begin(), smoothed.end(), values.begin());
}

void enforcePeriodicity(std::vector<double>& seasonal, std::size_t periodicity) {
    for (std::size_t phase = 0; phase < periodicity && phase < seasonal.size(); ++phase) {
        double sum = 0.0;
        std::size_t count = 0;
        for (std::size_t j = phase; j < seasonal.size(); j += periodicity) {
            sum += seasonal[j];
            ++count;
        }
        const double mean = sum / static_cast<double>(count);
        for (std::size_t j = phase; j < seasonal.size(); j += periodicity) {
            seasonal[j] = mean;
        }
    }
}

} // namespace

namespace stldecomp::seasonality {

SeasonalTrendLoess::SeasonalTrendLoess(StlParameters parameters)
    : parameters_(std::move(parameters)) {
    if (parameters_.periodicity < 2) {
        throw ConfigurationError("Periodicity must be at least 2, but is " +
                                 std::to_string(parameters_.periodicity) + ".");
    }
    if (parameters_.inner_iterations == 0) {
        throw ConfigurationError("At least one inner iteration is required.");
    }
}

Decomposition SeasonalTrendLoess::decompose(const core::TimeSeries& series) const {
    return decompose(series.getValues());
}

Decomposition SeasonalTrendLoess::decompose(const std::vector<double>& data) const {
    const std::size_t n = data.size();
    const std::size_t period = parameters_.periodicity;
    if (n <= 2 * period) {
        throw InputShapeError("Series must hold more than " + std::to_string(2 * period) + " points, but holds " +
                              std::to_string(n) + ".");
    }

    STLDECOMP_INFO("STL decomposition of {} points with period {} ({} inner, {} outer iterations)", n, period,
                   parameters_.inner_iterations, parameters_.outer_iterations);

    std::vector<double> trend(n, 0.0);
    std::vector<double> seasonal(n, 0.0);
    std::vector<double> remainder(n, 0.0);
    std::vector<double> weights(n, 1.0);
    std::vector<double> detrend(n, 0.0);
    std::vector<double> extended_seasonal(n + 2 * period, 0.0);

    CyclicSubSeriesSmoother cyclic_smoother(parameters_.seasonal, n, period, 1, 1);
    const LowPassFilter lowpass_filter(period, parameters_.lowpass, parameters_.lowpass_mode);

    std::size_t outer_iteration = 0;
    while (true) {
        std::optional<std::vector<double>> residual_weights;
        if (outer_iteration > 0) {
            residual_weights = weights;
        }

        for (std::size_t k = 0; k < parameters_.inner_iterations; ++k) {
            for (std::size_t i = 0; i < n; ++i) {
                detrend[i] = data[i] - trend[i];
            }
            cyclic_smoother.smooth(detrend, extended_seasonal, residual_weights);

            const std::vector<double> deseasonalised = lowpass_filter.filter(extended_seasonal);
            for (std::size_t i = 0; i < n; ++i) {
                seasonal[i] = extended_seasonal[period + i] - deseasonalised[i];
                trend[i] = data[i] - seasonal[i];
            }
            smoothInPlace(parameters_.trend, trend, residual_weights);
        }
        computeRemainder(data, trend, seasonal, remainder);

        if (++outer_iteration > parameters_.outer_iterations) {
            break;
        }

        weights = robustnessWeights(remainder);
        STLDECOMP_DEBUG("STL outer iteration {}: {} of {} points fully down-weighted", outer_iteration,
                        std::count(weights.begin(), weights.end(), 0.0), n);
    }

    if (parameters_.post_trend_smoothing) {
        const auto width = static_cast<std::size_t>(1.5 * static_cast<double>(parameters_.trend.width()) + 1.0);
        const LoessSettings post_settings(width, static_cast<int>(parameters_.trend.degree()));
        std::optional<std::vector<double>> residual_weights;
        if (parameters_.outer_iterations > 0) {
            residual_weights = weights;
        }
        smoothInPlace(post_settings, trend, residual_weights);
        computeRemainder(data, trend, seasonal, remainder);
    }

    if (parameters_.periodic) {
        enforcePeriodicity(seasonal, period);
        computeRemainder(data, trend, seasonal, remainder);
    }

    return Decomposition(data, std::move(trend), std::move(seasonal), std::move(weights));
}

Decomposition decompose(const std::vector<double>& series,
                        std::size_t periodicity,
                        std::size_t inner_iterations,
                        std::size_t outer_iterations,
                        const smoothing::LoessSettings& seasonal,
                        const smoothing::LoessSettings& trend,
                        const smoothing::LoessSettings& lowpass,
                        bool enforce_strict_periodicity) {
    StlParameters parameters{periodicity,
                             inner_iterations,
                             outer_iterations,
                             seasonal,
                             trend,
                             lowpass,
                             enforce_strict_periodicity,
                             false,
                             LowPassMode::Eroding};
    return SeasonalTrendLoess(std::move(parameters)).decompose(series);
}

} // namespace stldecomp::seasonality
