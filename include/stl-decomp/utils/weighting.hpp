#pragma once

#include <cmath>

namespace stldecomp::utils {

inline double square(double value) {
	return value * value;
}

inline double cube(double value) {
	return value * value * value;
}

/**
 * @brief Tri-cube kernel used for Loess neighbourhood weights.
 * @return (1 - |u|^3)^3 for |u| < 1, 0 otherwise.
 */
inline double tricube(double u) {
	const double a = std::abs(u);
	return (a < 1.0) ? cube(1.0 - cube(a)) : 0.0;
}

/**
 * @brief Bisquare kernel used for robustness weights.
 * @return (1 - u^2)^2 for |u| < 1, 0 otherwise.
 */
inline double bisquare(double u) {
	const double a = std::abs(u);
	return (a < 1.0) ? square(1.0 - square(a)) : 0.0;
}

} // namespace stldecomp::utils
