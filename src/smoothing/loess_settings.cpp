#include "stl-decomp/smoothing/loess_settings.hpp"
#include "stl-decomp/errors.hpp"

#include <algorithm>
#include <string>

namespace stldecomp::smoothing {

namespace {

std::size_t checkedWidth(std::size_t width) {
    if (width == 0) {
        throw ConfigurationError("Loess width must be positive.");
    }
    return LoessSettings::adjustWidth(width);
}

} // namespace

LoessDegree toLoessDegree(int degree) {
    switch (degree) {
    case 0:
        return LoessDegree::Flat;
    case 1:
        return LoessDegree::Linear;
    case 2:
        return LoessDegree::Quadratic;
    default:
        throw ConfigurationError("Loess degree must be within [0, 2], but is " + std::to_string(degree) + ".");
    }
}

std::size_t LoessSettings::adjustWidth(std::size_t width) {
    width = std::max<std::size_t>(3, width);
    return (width % 2 == 0) ? width + 1 : width;
}

std::size_t LoessSettings::defaultJump(std::size_t adjusted_width) {
    return std::max<std::size_t>(1, static_cast<std::size_t>(0.1 * static_cast<double>(adjusted_width) + 0.9));
}

LoessSettings::LoessSettings(std::size_t width, int degree, std::size_t jump)
    : width_(checkedWidth(width)),
      degree_(toLoessDegree(degree)),
      jump_(jump) {
    if (jump_ == 0) {
        throw ConfigurationError("Loess jump must be positive.");
    }
}

LoessSettings::LoessSettings(std::size_t width, int degree)
    : width_(checkedWidth(width)),
      degree_(toLoessDegree(degree)),
      jump_(defaultJump(width_)) {}

LoessSettings::LoessSettings(std::size_t width)
    : LoessSettings(width, 1) {}

} // namespace stldecomp::smoothing
