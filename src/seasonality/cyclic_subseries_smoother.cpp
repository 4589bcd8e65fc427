#include "stl-decomp/seasonality/cyclic_subseries_smoother.hpp"
#include "stl-decomp/errors.hpp"
#include "stl-decomp/smoothing/loess_smoother.hpp"
#include <algorithm>
#include <string>
#include <utility>

namespace {

constexpr double kMinimumSubSeriesWeight = 0.001;

} // namespace

namespace stldecomp::seasonality {

CyclicSubSeriesSmoother::CyclicSubSeriesSmoother(const smoothing::LoessSettings& settings,
                                                 std::size_t data_length,
                                                 std::size_t periodicity,
                                                 std::size_t backward_periods,
                                                 std::size_t forward_periods)
    : settings_(settings),
      data_length_(data_length),
      periodicity_(periodicity),
      backward_periods_(backward_periods),
      forward_periods_(forward_periods),
      periods_(0),
      remainder_(0) {
    if (periodicity_ == 0) {
        throw ConfigurationError("Periodicity must be positive.");
    }
    if (data_length_ < periodicity_) {
        throw InputShapeError("Cyclic sub-series smoothing needs at least one full period: " +
                              std::to_string(data_length_) + " points for periodicity " +
                              std::to_string(periodicity_) + ".");
    }

    periods_ = data_length_ / periodicity_;
    remainder_ = data_length_ % periodicity_;

    raw_sub_series_.resize(periodicity_);
    sub_series_weights_.resize(periodicity_);
    smoothed_sub_series_.resize(periodicity_);
    for (std::size_t p = 0; p < periodicity_; ++p) {
        const std::size_t length = subSeriesLength(p);
        raw_sub_series_[p].assign(length, 0.0);
        sub_series_weights_[p].assign(length, 1.0);
        smoothed_sub_series_[p].assign(backward_periods_ + length + forward_periods_, 0.0);
    }
}

void CyclicSubSeriesSmoother::smooth(const std::vector<double>& raw,
                                     std::vector<double>& extended,
                                     const std::optional<std::vector<double>>& weights) {
    if (raw.size() != data_length_) {
        throw InputShapeError("Expected " + std::to_string(data_length_) + " data points, got " +
                              std::to_string(raw.size()) + ".");
    }
    if (weights && weights->size() != data_length_) {
        throw InputShapeError("Expected " + std::to_string(data_length_) + " weights, got " +
                              std::to_string(weights->size()) + ".");
    }
    if (extended.size() != extendedLength()) {
        throw InputShapeError("Extended buffer must hold " + std::to_string(extendedLength()) +
                              " points, but holds " + std::to_string(extended.size()) + ".");
    }

    extractSubSeries(raw, weights);

    for (std::size_t p = 0; p < periodicity_; ++p) {
        smoothSubSeries(p, weights.has_value());
    }

    for (std::size_t p = 0; p < periodicity_; ++p) {
        const auto& smoothed = smoothed_sub_series_[p];
        for (std::size_t i = 0; i < smoothed.size(); ++i) {
            extended[i * periodicity_ + p] = smoothed[i];
        }
    }
}

void CyclicSubSeriesSmoother::extractSubSeries(const std::vector<double>& raw,
                                               const std::optional<std::vector<double>>& weights) {
    for (std::size_t p = 0; p < periodicity_; ++p) {
        const std::size_t length = subSeriesLength(p);
        for (std::size_t i = 0; i < length; ++i) {
            raw_sub_series_[p][i] = raw[i * periodicity_ + p];
            if (weights) {
                sub_series_weights_[p][i] = std::max((*weights)[i * periodicity_ + p], kMinimumSubSeriesWeight);
            }
        }
    }
}

void CyclicSubSeriesSmoother::smoothSubSeries(std::size_t phase, bool use_weights) {
    const auto& raw = raw_sub_series_[phase];
    auto& smoothed = smoothed_sub_series_[phase];
    const std::size_t length = raw.size();
    const std::size_t width = settings_.width();

    std::optional<std::vector<double>> weights;
    if (use_weights) {
        weights = sub_series_weights_[phase];
    }

    smoothing::LoessSmoother smoother(settings_, raw, std::move(weights));
    const auto& values = smoother.smooth();
    std::copy(values.begin(), values.end(), smoothed.begin() + static_cast<std::ptrdiff_t>(backward_periods_));

    auto& interpolator = smoother.interpolator();

    // Backward: leftmost width points, evaluated at -1, -2, ...
    {
        const std::size_t left = 0;
        const std::size_t right = std::min(width, length) - 1;
        const double fallback = smoothed[backward_periods_];
        for (std::size_t i = 1; i <= backward_periods_; ++i) {
            const auto y = interpolator.smooth(-static_cast<double>(i), left, right);
            smoothed[backward_periods_ - i] = y ? *y : fallback;
        }
    }

    // Forward: rightmost width points, evaluated at length, length + 1, ...
    {
        const std::size_t right = length - 1;
        const std::size_t left = length > width ? length - width : 0;
        const double fallback = smoothed[backward_periods_ + right];
        for (std::size_t i = 1; i <= forward_periods_; ++i) {
            const auto y = interpolator.smooth(static_cast<double>(right + i), left, right);
            smoothed[backward_periods_ + right + i] = y ? *y : fallback;
        }
    }
}

} // namespace stldecomp::seasonality
