#pragma once

#include "stl-decomp/smoothing/loess_settings.hpp"
#include <cstddef>
#include <vector>

namespace stldecomp::seasonality {

/**
 * @brief Moving-average flavour used by the low-pass filter.
 *
 * Eroding: each average of window w drops w - 1 points, so the cascade on the
 * extended seasonal (n + 2p points) ends at exactly n points.
 * EdgeFilled: same-length averages with trailing backfill; the central n
 * points of the result are kept.
 */
enum class LowPassMode {
    Eroding,
    EdgeFilled
};

/**
 * Low-pass filter of the STL inner loop: moving averages of window p, p and 3
 * followed by a Loess pass.
 */
class LowPassFilter {
public:
    LowPassFilter(std::size_t periodicity,
                  const smoothing::LoessSettings& settings,
                  LowPassMode mode = LowPassMode::Eroding);

    /**
     * @param extended Extended seasonal of n + 2 * periodicity points.
     * @return The low-frequency component, n points.
     * @throws InputShapeError If extended holds fewer than 2 * periodicity + 1 points.
     */
    std::vector<double> filter(const std::vector<double>& extended) const;

    std::size_t periodicity() const { return periodicity_; }
    LowPassMode mode() const { return mode_; }

private:
    std::size_t periodicity_;
    smoothing::LoessSettings settings_;
    LowPassMode mode_;
};

} // namespace stldecomp::seasonality
