#pragma once

#include "stl-decomp/smoothing/loess_interpolator.hpp"
#include "stl-decomp/smoothing/loess_settings.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace stldecomp::smoothing {

/**
 * @class LoessSmoother
 * @brief Smooths a whole series with a sliding Loess window.
 *
 * Every jump-th point is evaluated exactly; the points in between are linearly
 * interpolated. The last point is always evaluated. Each evaluated point uses
 * a window of width points centred on it and clamped to the series bounds, or
 * the whole series if the width covers it. Evaluations run in parallel when
 * OpenMP is available.
 */
class LoessSmoother {
public:
	/**
	 * @param settings Width, degree and jump. The jump is capped at n - 1.
	 * @param data Series to smooth; must outlive the smoother.
	 * @param external_weights Optional per-point weights (same length as data).
	 */
	LoessSmoother(const LoessSettings &settings, const std::vector<double> &data,
	              std::optional<std::vector<double>> external_weights = std::nullopt);

	LoessSmoother(const LoessSettings &, std::vector<double> &&,
	              std::optional<std::vector<double>> = std::nullopt) = delete;

	/**
	 * @brief Runs the smoother.
	 * @return The smoothed series, same length as the input.
	 */
	const std::vector<double> &smooth();

	const std::vector<double> &smoothed() const { return smoothed_; }
	const std::vector<double> &data() const { return interpolator_.data(); }
	std::size_t width() const { return interpolator_.width(); }
	std::size_t jump() const { return jump_; }

	/**
	 * @brief The underlying interpolator, e.g. for extrapolating past the ends.
	 */
	LoessInterpolator &interpolator() { return interpolator_; }

	/**
	 * @brief First index of the window used to evaluate point i.
	 */
	std::size_t windowLeft(std::size_t i) const;

private:
	void interpolateSkipped();

	LoessInterpolator interpolator_;
	std::size_t jump_;
	std::vector<double> smoothed_;
};

} // namespace stldecomp::smoothing
