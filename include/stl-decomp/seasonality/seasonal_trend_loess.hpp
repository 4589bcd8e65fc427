#pragma once

#include "stl-decomp/core/time_series.hpp"
#include "stl-decomp/seasonality/decomposition.hpp"
#include "stl-decomp/seasonality/stl_config.hpp"
#include "stl-decomp/smoothing/loess_settings.hpp"
#include <cstddef>
#include <vector>

namespace stldecomp::seasonality {

/**
 * @class SeasonalTrendLoess
 * @brief The STL iteration of Cleveland et al. (1990).
 *
 * Each inner pass detrends the data, smooths the cyclic sub-series
 * (extrapolated one period each way), removes the low-pass component and
 * smooths the deseasonalised trend. After the inner passes the remainder is
 * computed; while outer iterations remain, bisquare robustness weights are
 * derived from it and the inner passes are repeated with those weights.
 *
 * The object only holds parameters, so decompose() may be called concurrently.
 */
class SeasonalTrendLoess {
public:
    /**
     * @throws ConfigurationError If the periodicity is below 2 or there are no inner iterations.
     */
    explicit SeasonalTrendLoess(StlParameters parameters);

    /**
     * @throws InputShapeError If data does not hold more than 2 * periodicity points.
     */
    Decomposition decompose(const std::vector<double>& data) const;

    /**
     * @brief Decomposes the values of @p series positionally.
     */
    Decomposition decompose(const core::TimeSeries& series) const;

    const StlParameters& parameters() const { return parameters_; }

private:
    StlParameters parameters_;
};

/**
 * @brief One-shot decomposition with explicit smoother settings.
 *
 * @param enforce_strict_periodicity Replace the seasonal value of every phase
 *        by its mean over all periods after the iteration.
 */
Decomposition decompose(const std::vector<double>& series,
                        std::size_t periodicity,
                        std::size_t inner_iterations,
                        std::size_t outer_iterations,
                        const smoothing::LoessSettings& seasonal,
                        const smoothing::LoessSettings& trend,
                        const smoothing::LoessSettings& lowpass,
                        bool enforce_strict_periodicity = false);

} // namespace stldecomp::seasonality
