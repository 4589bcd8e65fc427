#pragma once

#include <cstddef>
#include <vector>

namespace stldecomp::utils {

/**
 * @brief Returns the n-th smallest element (0-based) using selection.
 *
 * @param data Input data, reordered in place.
 * @throws std::invalid_argument If data is empty or n is out of range.
 */
double nthOrderStatistic(std::vector<double> &data, std::size_t n);

/**
 * @brief Compute median of a vector
 *
 * Even-length input yields the average of the two central order statistics.
 *
 * @param data Input data (reordered by the selection)
 * @return Median value
 * @throws std::invalid_argument If data is empty.
 */
double median(std::vector<double> &data);

double mean(const std::vector<double> &data);

/**
 * @brief Population variance; 0 for empty input.
 */
double variance(const std::vector<double> &data);

/**
 * @brief Rolling mean over a window of @p window points.
 *
 * The result has data.size() - window + 1 elements; element i is the mean of
 * data[i .. i + window - 1].
 *
 * @throws ConfigurationError If window is zero.
 * @throws InputShapeError If window exceeds the data length.
 */
std::vector<double> simpleMovingAverage(const std::vector<double> &data, std::size_t window);

/**
 * @brief Same-length moving average with shifted centre and trailing backfill.
 *
 * The first window - 1 slots hold the running prefix sums divided by window,
 * the rest hold the rolling mean. The result is shifted left by window / 2 and
 * the last window / 2 slots are filled by peeling values off the final window
 * average with shrinking divisors.
 *
 * @throws ConfigurationError If window is zero.
 * @throws InputShapeError If window exceeds the data length.
 */
std::vector<double> edgeFilledMovingAverage(const std::vector<double> &data, std::size_t window);

} // namespace stldecomp::utils
