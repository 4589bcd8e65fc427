#include "stl-decomp/smoothing/loess_smoother.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace stldecomp::smoothing {

LoessSmoother::LoessSmoother(const LoessSettings &settings, const std::vector<double> &data,
                             std::optional<std::vector<double>> external_weights)
    : interpolator_(settings.width(), settings.degree(), data, std::move(external_weights)),
      jump_(std::max<std::size_t>(1, std::min(settings.jump(), data.size() - 1))),
      smoothed_(data.size(), 0.0) {}

std::size_t LoessSmoother::windowLeft(std::size_t i) const {
    const std::size_t n = data().size();
    const std::size_t w = width();
    if (w >= n) {
        return 0;
    }
    const std::size_t half_width = (w + 1) / 2;
    if (i + 1 < half_width) {
        return 0;
    }
    return std::min(i + 1 - half_width, n - w);
}

const std::vector<double> &LoessSmoother::smooth() {
    const std::vector<double> &values = data();
    const std::size_t n = values.size();

    if (n == 1) {
        smoothed_[0] = values[0];
        return smoothed_;
    }

    const std::size_t span = std::min(width(), n);
    const auto evaluations = static_cast<std::ptrdiff_t>((n - 1) / jump_ + 1);

#pragma omp parallel
    {
        // The interpolator owns a weight workspace, so every thread needs its own.
        LoessInterpolator local(interpolator_);

#pragma omp for schedule(static)
        for (std::ptrdiff_t k = 0; k < evaluations; ++k) {
            const std::size_t i = static_cast<std::size_t>(k) * jump_;
            const std::size_t left = windowLeft(i);
            const auto y = local.smooth(static_cast<double>(i), left, left + span - 1);
            smoothed_[i] = y ? *y : values[i];
        }
    }

    if (jump_ != 1) {
        interpolateSkipped();
    }

    return smoothed_;
}

void LoessSmoother::interpolateSkipped() {
    const std::vector<double> &values = data();
    const std::size_t n = values.size();

    for (std::size_t i = 0; i + jump_ < n; i += jump_) {
        const double slope = (smoothed_[i + jump_] - smoothed_[i]) / static_cast<double>(jump_);
        for (std::size_t j = i + 1; j < i + jump_; ++j) {
            smoothed_[j] = smoothed_[i] + slope * static_cast<double>(j - i);
        }
    }

    const std::size_t last = n - 1;
    const std::size_t last_smoothed = (last / jump_) * jump_;
    if (last_smoothed == last) {
        return;
    }

    // The last point reuses the window of the last regular evaluation.
    const std::size_t left = windowLeft(last_smoothed);
    const std::size_t right = left + std::min(width(), n) - 1;
    const auto y = interpolator_.smooth(static_cast<double>(last), left, right);
    smoothed_[last] = y ? *y : values[last];

    if (last_smoothed + 1 != last) {
        const double slope = (smoothed_[last] - smoothed_[last_smoothed]) / static_cast<double>(last - last_smoothed);
        for (std::size_t j = last_smoothed + 1; j < last; ++j) {
            smoothed_[j] = smoothed_[last_smoothed] + slope * static_cast<double>(j - last_smoothed);
        }
    }
}

} // namespace stldecomp::smoothing
