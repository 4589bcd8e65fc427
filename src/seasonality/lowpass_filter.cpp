#include "stl-decomp/seasonality/lowpass_filter.hpp"
#include "stl-decomp/errors.hpp"
#include "stl-decomp/smoothing/loess_smoother.hpp"
#include "stl-decomp/utils/statistics.hpp"
#include <string>

namespace stldecomp::seasonality {

LowPassFilter::LowPassFilter(std::size_t periodicity,
                             const smoothing::LoessSettings& settings,
                             LowPassMode mode)
    : periodicity_(periodicity), settings_(settings), mode_(mode) {
    if (periodicity_ == 0) {
        throw ConfigurationError("Periodicity must be positive.");
    }
}

std::vector<double> LowPassFilter::filter(const std::vector<double>& extended) const {
    if (extended.size() <= 2 * periodicity_) {
        throw InputShapeError("Low-pass filter needs more than " + std::to_string(2 * periodicity_) +
                              " points, got " + std::to_string(extended.size()) + ".");
    }
    const std::size_t n = extended.size() - 2 * periodicity_;

    if (mode_ == LowPassMode::Eroding) {
        // n + 2p -> n + p + 1 -> n + 2 -> n
        const auto pass1 = utils::simpleMovingAverage(extended, periodicity_);
        const auto pass2 = utils::simpleMovingAverage(pass1, periodicity_);
        const auto pass3 = utils::simpleMovingAverage(pass2, 3);
        smoothing::LoessSmoother smoother(settings_, pass3);
        return smoother.smooth();
    }

    const auto pass1 = utils::edgeFilledMovingAverage(extended, periodicity_);
    const auto pass2 = utils::edgeFilledMovingAverage(pass1, periodicity_);
    const auto pass3 = utils::edgeFilledMovingAverage(pass2, 3);
    smoothing::LoessSmoother smoother(settings_, pass3);
    const auto& smoothed = smoother.smooth();

    const auto first = smoothed.begin() + static_cast<std::ptrdiff_t>(periodicity_);
    return std::vector<double>(first, first + static_cast<std::ptrdiff_t>(n));
}

} // namespace stldecomp::seasonality
