#pragma once

#include "stl-decomp/errors.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stldecomp::core {

/**
 * @class TimeSeries
 * @brief A univariate sequence of observations with strictly increasing timestamps.
 *
 * Timestamps and values are kept in separate vectors for cache-efficient
 * numerical processing. The decomposition treats the values positionally, so
 * the timestamps only need to be ordered; regular spacing can be checked with
 * inferFrequency().
 */
class TimeSeries {
public:
	using TimePoint = std::chrono::system_clock::time_point;
	using Value = double;

	/**
	 * @brief Constructs a TimeSeries object.
	 * @param timestamps A vector of time points.
	 * @param values A vector of corresponding values.
	 * @throws InputShapeError If the sizes differ or the timestamps are not strictly increasing.
	 */
	TimeSeries(std::vector<TimePoint> timestamps, std::vector<Value> values)
	    : timestamps_(std::move(timestamps)), values_(std::move(values)) {
		if (timestamps_.size() != values_.size()) {
			throw InputShapeError("Timestamps (" + std::to_string(timestamps_.size()) + ") and values (" +
			                      std::to_string(values_.size()) + ") must have the same size.");
		}
		validateTimestampOrder();
	}

	const std::vector<TimePoint> &getTimestamps() const {
		return timestamps_;
	}

	const std::vector<Value> &getValues() const {
		return values_;
	}

	std::size_t size() const {
		return values_.size();
	}

	bool empty() const {
		return values_.empty();
	}

	/**
	 * @brief Returns the common spacing if every step matches within tolerance.
	 */
	std::optional<std::chrono::nanoseconds>
	inferFrequency(std::chrono::nanoseconds tolerance = std::chrono::nanoseconds{0}) const {
		if (timestamps_.size() < 2) {
			return std::nullopt;
		}
		const auto normalized_tolerance = (tolerance >= std::chrono::nanoseconds::zero()) ? tolerance : -tolerance;
		const auto base_diff =
		    std::chrono::duration_cast<std::chrono::nanoseconds>(timestamps_[1] - timestamps_[0]);
		for (std::size_t i = 2; i < timestamps_.size(); ++i) {
			const auto diff =
			    std::chrono::duration_cast<std::chrono::nanoseconds>(timestamps_[i] - timestamps_[i - 1]);
			const auto delta = diff > base_diff ? diff - base_diff : base_diff - diff;
			if (delta > normalized_tolerance) {
				return std::nullopt;
			}
		}
		return base_diff;
	}

	bool isRegular(std::chrono::nanoseconds tolerance = std::chrono::nanoseconds{0}) const {
		return size() < 2 || inferFrequency(tolerance).has_value();
	}

private:
	void validateTimestampOrder() const {
		for (std::size_t i = 1; i < timestamps_.size(); ++i) {
			if (!(timestamps_[i] > timestamps_[i - 1])) {
				throw InputShapeError("TimeSeries timestamps must be strictly increasing and unique (index " +
				                      std::to_string(i) + ").");
			}
		}
	}

	std::vector<TimePoint> timestamps_;
	std::vector<Value> values_;
};

} // namespace stldecomp::core
