#include "stl-decomp/seasonality/decomposition.hpp"
#include "stl-decomp/errors.hpp"
#include "stl-decomp/smoothing/loess_settings.hpp"
#include "stl-decomp/smoothing/loess_smoother.hpp"
#include "stl-decomp/utils/statistics.hpp"
#include <algorithm>
#include <string>
#include <utility>

namespace {

double strength(const std::vector<double>& component, const std::vector<double>& remainder) {
    std::vector<double> combined(component.size());
    for (std::size_t i = 0; i < component.size(); ++i) {
        combined[i] = component[i] + remainder[i];
    }
    const double var_combined = stldecomp::utils::variance(combined);
    if (var_combined <= 0.0) {
        return 0.0;
    }
    return 1.0 - (stldecomp::utils::variance(remainder) / var_combined);
}

} // namespace

namespace stldecomp::seasonality {

Decomposition::Decomposition(std::vector<double> data,
                             std::vector<double> trend,
                             std::vector<double> seasonal,
                             std::vector<double> weights)
    : data_(std::move(data)),
      trend_(std::move(trend)),
      seasonal_(std::move(seasonal)),
      weights_(std::move(weights)) {
    const std::size_t n = data_.size();
    if (trend_.size() != n || seasonal_.size() != n || weights_.size() != n) {
        throw InputShapeError("Decomposition components must all hold " + std::to_string(n) + " points.");
    }
    updateRemainder();
}

double Decomposition::seasonalStrength() const {
    return strength(seasonal_, remainder_);
}

double Decomposition::trendStrength() const {
    return strength(trend_, remainder_);
}

Decomposition Decomposition::withSmoothedSeasonal(std::size_t width, bool restore_end_points) const {
    Decomposition result(*this);
    if (result.seasonal_.empty()) {
        return result;
    }

    // Interpolating between jumps would clip the peaks the quadratic fit keeps.
    const smoothing::LoessSettings settings(width, 2, 1);
    smoothing::LoessSmoother smoother(settings, seasonal_);
    const auto& smoothed = smoother.smooth();

    std::copy(smoothed.begin(), smoothed.end(), result.seasonal_.begin());
    if (restore_end_points) {
        result.seasonal_.front() = seasonal_.front();
        result.seasonal_.back() = seasonal_.back();
    }
    result.updateRemainder();
    return result;
}

void Decomposition::updateRemainder() {
    remainder_.resize(data_.size());
    for (std::size_t i = 0; i < data_.size(); ++i) {
        remainder_[i] = data_[i] - trend_[i] - seasonal_[i];
    }
}

} // namespace stldecomp::seasonality
