#include "stl-decomp/utils/statistics.hpp"
#include "stl-decomp/errors.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

namespace stldecomp::utils {

namespace {

void checkWindow(const std::vector<double> &data, std::size_t window) {
	if (window == 0) {
		throw ConfigurationError("Moving average window must be positive.");
	}
	if (window > data.size()) {
		throw InputShapeError("Moving average window " + std::to_string(window) + " exceeds data length " +
		                      std::to_string(data.size()) + ".");
	}
}

} // namespace

double nthOrderStatistic(std::vector<double> &data, std::size_t n) {
	if (data.empty()) {
		throw std::invalid_argument("Cannot select from an empty vector");
	}
	if (n >= data.size()) {
		throw std::invalid_argument("Order statistic index exceeds the data length");
	}
	std::nth_element(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(n), data.end());
	return data[n];
}

double median(std::vector<double> &data) {
	if (data.empty()) {
		throw std::invalid_argument("Cannot compute median of empty vector");
	}

	const std::size_t n = data.size();
	const std::size_t mid = n / 2;
	std::nth_element(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(mid), data.end());

	if (n % 2 == 1) {
		return data[mid];
	}
	// The lower central statistic is the largest element of the left partition.
	const double lower_max = *std::max_element(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(mid));
	return (lower_max + data[mid]) / 2.0;
}

double mean(const std::vector<double> &data) {
	if (data.empty()) {
		return 0.0;
	}
	return std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
}

double variance(const std::vector<double> &data) {
	if (data.empty()) {
		return 0.0;
	}
	const double m = mean(data);
	double accum = 0.0;
	for (double v : data) {
		const double diff = v - m;
		accum += diff * diff;
	}
	return accum / static_cast<double>(data.size());
}

std::vector<double> simpleMovingAverage(const std::vector<double> &data, std::size_t window) {
	checkWindow(data, window);
	const std::size_t length = data.size();
	const double w = static_cast<double>(window);

	std::vector<double> result(length - window + 1);

	double window_sum = 0.0;
	for (std::size_t i = 0; i < window; ++i) {
		window_sum += data[i];
	}
	result[0] = window_sum / w;

	// Roll forward: drop data[i - 1], pick up data[i + window - 1].
	for (std::size_t i = 1; i < result.size(); ++i) {
		window_sum += data[i + window - 1] - data[i - 1];
		result[i] = window_sum / w;
	}
	return result;
}

std::vector<double> edgeFilledMovingAverage(const std::vector<double> &data, std::size_t window) {
	checkWindow(data, window);
	const std::size_t length = data.size();
	const double w = static_cast<double>(window);
	const std::size_t edge = window / 2;

	std::vector<double> result(length);
	double average = 0.0;
	for (std::size_t i = 0; i < window; ++i) {
		average += data[i] / w;
		result[i] = average;
	}
	for (std::size_t i = window; i < length; ++i) {
		average -= data[i - window] / w;
		average += data[i] / w;
		result[i] = average;
	}

	for (std::size_t i = 0; i + edge < length; ++i) {
		result[i] = result[i + edge];
	}

	for (std::size_t i = 0; i < edge; ++i) {
		average -= data[length - 1 - i - edge] / static_cast<double>(edge - i);
		result[length - 1 - i] = average;
	}
	return result;
}

} // namespace stldecomp::utils
