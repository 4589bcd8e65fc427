#pragma once

#include <vector>

namespace stldecomp::seasonality {

/**
 * @brief Bisquare robustness weights from the remainder.
 *
 * With h = 6 * median(|r|), a point gets weight 1 if |r| <= 0.001 h,
 * (1 - (|r| / h)^2)^2 if |r| <= 0.999 h and 0 otherwise. If h is zero (or not
 * finite) every weight is 1 and a warning is logged.
 *
 * @throws std::invalid_argument If remainder is empty.
 */
std::vector<double> robustnessWeights(const std::vector<double>& remainder);

} // namespace stldecomp::seasonality
