#include "stl-decomp/seasonality/robustness_weights.hpp"
#include "stl-decomp/utils/logging.hpp"
#include "stl-decomp/utils/statistics.hpp"
#include "stl-decomp/utils/weighting.hpp"
#include <cmath>

namespace stldecomp::seasonality {

std::vector<double> robustnessWeights(const std::vector<double>& remainder) {
    std::vector<double> abs_remainder(remainder.size());
    for (std::size_t i = 0; i < remainder.size(); ++i) {
        abs_remainder[i] = std::abs(remainder[i]);
    }

    std::vector<double> scratch = abs_remainder;
    const double six_mad = 6.0 * utils::median(scratch);

    std::vector<double> weights(remainder.size(), 1.0);
    if (!(six_mad > 0.0) || !std::isfinite(six_mad)) {
        STLDECOMP_WARN("Robustness scale is {} (median absolute remainder is degenerate); using unit weights",
                       six_mad);
        return weights;
    }

    const double c999 = 0.999 * six_mad;
    const double c001 = 0.001 * six_mad;
    for (std::size_t i = 0; i < remainder.size(); ++i) {
        const double r = abs_remainder[i];
        if (r <= c001) {
            weights[i] = 1.0;
        } else if (r <= c999) {
            weights[i] = utils::bisquare(r / six_mad);
        } else {
            weights[i] = 0.0;
        }
    }
    return weights;
}

} // namespace stldecomp::seasonality
