#pragma once

#include <cstddef>

namespace stldecomp::smoothing {

/**
 * @brief Degree of the local polynomial fitted by a Loess smoother.
 */
enum class LoessDegree {
	Flat = 0,
	Linear = 1,
	Quadratic = 2
};

/**
 * @brief Converts an integer degree to LoessDegree.
 * @throws ConfigurationError If degree is not 0, 1 or 2.
 */
LoessDegree toLoessDegree(int degree);

/**
 * @class LoessSettings
 * @brief Width, degree and jump of one Loess pass.
 *
 * The width is forced to be odd and at least 3 on construction.
 */
class LoessSettings {
public:
	/**
	 * @throws ConfigurationError If width or jump is zero or degree is outside [0, 2].
	 */
	LoessSettings(std::size_t width, int degree, std::size_t jump);

	/**
	 * @brief Uses a jump of roughly 10% of the (adjusted) width.
	 */
	LoessSettings(std::size_t width, int degree);

	/**
	 * @brief Linear smoother with a jump of roughly 10% of the width.
	 */
	explicit LoessSettings(std::size_t width);

	std::size_t width() const { return width_; }
	LoessDegree degree() const { return degree_; }
	std::size_t jump() const { return jump_; }

	static std::size_t adjustWidth(std::size_t width);
	static std::size_t defaultJump(std::size_t adjusted_width);

private:
	std::size_t width_;
	LoessDegree degree_;
	std::size_t jump_;
};

} // namespace stldecomp::smoothing
