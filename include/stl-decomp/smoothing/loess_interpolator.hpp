#pragma once

#include "stl-decomp/smoothing/loess_settings.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace stldecomp::smoothing {

/**
 * @class LoessInterpolator
 * @brief Weighted local polynomial regression evaluated at a single abscissa.
 *
 * Given data on the regular grid {left, left + 1, ..., right}, smooth()
 * returns the value of a degree 0, 1 or 2 weighted least-squares fit at an
 * arbitrary x, which may lie outside [left, right] for extrapolation. The
 * regression is recast as a linear operation on the data: neighbourhood
 * weights are computed with the tri-cube kernel, normalised, and then
 * corrected for the requested degree so that their dot product with the data
 * yields the fitted value.
 *
 * The interpolator keeps a reference to the data, which must outlive it, and a
 * weight workspace that is reused across calls. Copies get their own
 * workspace, so one copy per thread may evaluate concurrently.
 */
class LoessInterpolator {
public:
	/**
	 * @param width Smoothing width in points. Widths larger than the data
	 *        inflate the neighbourhood so that its shape follows the width.
	 * @param degree Degree of the local polynomial.
	 * @param data Values on the grid 0..n-1.
	 * @param external_weights Optional per-point weights, multiplied into the
	 *        neighbourhood weights. All weights count as 1 when absent.
	 * @throws ConfigurationError If width is zero.
	 * @throws InputShapeError If data is empty or the weights do not match the data length.
	 */
	LoessInterpolator(std::size_t width, LoessDegree degree, const std::vector<double> &data,
	                  std::optional<std::vector<double>> external_weights = std::nullopt);

	/**
	 * @throws ConfigurationError If degree is outside [0, 2].
	 */
	LoessInterpolator(std::size_t width, int degree, const std::vector<double> &data,
	                  std::optional<std::vector<double>> external_weights = std::nullopt);

	LoessInterpolator(std::size_t, LoessDegree, std::vector<double> &&,
	                  std::optional<std::vector<double>> = std::nullopt) = delete;
	LoessInterpolator(std::size_t, int, std::vector<double> &&,
	                  std::optional<std::vector<double>> = std::nullopt) = delete;

	/**
	 * @brief Computes the Loess estimate at x from the points in [left, right].
	 * @return The fitted value, or std::nullopt if the total neighbourhood
	 *         weight is zero. Callers fall back to the raw value in that case.
	 * @throws std::out_of_range If the window is empty or exceeds the data.
	 */
	std::optional<double> smooth(double x, std::size_t left, std::size_t right);

	std::size_t width() const { return width_; }
	LoessDegree degree() const { return degree_; }
	const std::vector<double> &data() const { return data_; }
	const std::optional<std::vector<double>> &externalWeights() const { return external_weights_; }

private:
	enum class State {
		WeightFailed,
		LinearFailed,
		LinearOk
	};

	State computeNeighbourhoodWeights(double x, std::size_t left, std::size_t right);
	void updateWeights(double x, std::size_t left, std::size_t right);
	void updateLinearWeights(double x, std::size_t left, std::size_t right);
	void updateQuadraticWeights(double x, std::size_t left, std::size_t right);

	std::size_t width_;
	LoessDegree degree_;
	const std::vector<double> &data_;
	std::optional<std::vector<double>> external_weights_;
	std::vector<double> weights_;
};

} // namespace stldecomp::smoothing
