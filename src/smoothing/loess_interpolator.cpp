#include "stl-decomp/smoothing/loess_interpolator.hpp"
#include "stl-decomp/errors.hpp"
#include "stl-decomp/utils/weighting.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace stldecomp::smoothing {

LoessInterpolator::LoessInterpolator(std::size_t width, LoessDegree degree, const std::vector<double> &data,
                                     std::optional<std::vector<double>> external_weights)
    : width_(width),
      degree_(degree),
      data_(data),
      external_weights_(std::move(external_weights)),
      weights_(data.size(), 0.0) {
    if (width_ == 0) {
        throw ConfigurationError("Loess width must be positive.");
    }
    if (data_.empty()) {
        throw InputShapeError("Loess interpolation requires at least one data point.");
    }
    if (external_weights_ && external_weights_->size() != data_.size()) {
        throw InputShapeError(std::to_string(data_.size()) + " data points have been provided, but " +
                              std::to_string(external_weights_->size()) + " external weights.");
    }
}

LoessInterpolator::LoessInterpolator(std::size_t width, int degree, const std::vector<double> &data,
                                     std::optional<std::vector<double>> external_weights)
    : LoessInterpolator(width, toLoessDegree(degree), data, std::move(external_weights)) {}

std::optional<double> LoessInterpolator::smooth(double x, std::size_t left, std::size_t right) {
    if (left > right || right >= data_.size()) {
        throw std::out_of_range("Loess window [" + std::to_string(left) + ", " + std::to_string(right) +
                                "] is not within the data.");
    }

    const State state = computeNeighbourhoodWeights(x, left, right);
    if (state == State::WeightFailed) {
        return std::nullopt;
    }
    if (state == State::LinearOk) {
        updateWeights(x, left, right);
    }

    double ys = 0.0;
    for (std::size_t i = left; i <= right; ++i) {
        ys += weights_[i] * data_[i];
    }
    return ys;
}

LoessInterpolator::State LoessInterpolator::computeNeighbourhoodWeights(double x, std::size_t left,
                                                                        std::size_t right) {
    const std::size_t n = data_.size();
    double lambda = std::max(x - static_cast<double>(left), static_cast<double>(right) - x);

    // Ordinarily lambda ~ width / 2. With width > n only n points are ever
    // available, so widen lambda to keep the kernel shape driven by the width.
    if (width_ > n) {
        lambda += static_cast<double>((width_ - n) / 2);
    }

    const double l999 = 0.999 * lambda;
    const double l001 = 0.001 * lambda;

    double total_weight = 0.0;
    for (std::size_t i = left; i <= right; ++i) {
        const double delta = std::abs(x - static_cast<double>(i));
        double weight = 0.0;
        if (delta <= l999) {
            weight = (delta <= l001) ? 1.0 : utils::tricube(delta / lambda);
            if (external_weights_) {
                weight *= (*external_weights_)[i];
            }
            total_weight += weight;
        }
        weights_[i] = weight;
    }

    if (total_weight <= 0.0) {
        return State::WeightFailed;
    }

    for (std::size_t i = left; i <= right; ++i) {
        weights_[i] /= total_weight;
    }

    return (lambda > 0.0) ? State::LinearOk : State::LinearFailed;
}

void LoessInterpolator::updateWeights(double x, std::size_t left, std::size_t right) {
    switch (degree_) {
    case LoessDegree::Flat:
        break;
    case LoessDegree::Linear:
        updateLinearWeights(x, left, right);
        break;
    case LoessDegree::Quadratic:
        updateQuadraticWeights(x, left, right);
        break;
    }
}

void LoessInterpolator::updateLinearWeights(double x, std::size_t left, std::size_t right) {
    double x_mean = 0.0;
    for (std::size_t i = left; i <= right; ++i) {
        x_mean += static_cast<double>(i) * weights_[i];
    }

    double x2_mean = 0.0;
    for (std::size_t i = left; i <= right; ++i) {
        x2_mean += weights_[i] * utils::square(static_cast<double>(i) - x_mean);
    }

    // Only fit a slope if the points are spread out enough; otherwise the
    // weights stay as they are, i.e. a weighted moving average.
    const double range = static_cast<double>(data_.size() - 1);
    if (x2_mean > 0.000001 * utils::square(range)) {
        const double beta = (x - x_mean) / x2_mean;
        for (std::size_t i = left; i <= right; ++i) {
            weights_[i] *= (1.0 + beta * (static_cast<double>(i) - x_mean));
        }
    }
}

void LoessInterpolator::updateQuadraticWeights(double x, std::size_t left, std::size_t right) {
    double x1_mean = 0.0;
    double x2_mean = 0.0;
    double x3_mean = 0.0;
    double x4_mean = 0.0;
    for (std::size_t i = left; i <= right; ++i) {
        const double xi = static_cast<double>(i);
        const double x1w = xi * weights_[i];
        const double x2w = xi * x1w;
        const double x3w = xi * x2w;
        const double x4w = xi * x3w;
        x1_mean += x1w;
        x2_mean += x2w;
        x3_mean += x3w;
        x4_mean += x4w;
    }

    const double m2 = x2_mean - x1_mean * x1_mean;
    const double m3 = x3_mean - x2_mean * x1_mean;
    const double m4 = x4_mean - x2_mean * x2_mean;

    const double denominator = m2 * m4 - m3 * m3;
    const double range = static_cast<double>(data_.size() - 1);

    if (denominator > 0.000001 * range * range) {
        const double beta2 = m4 / denominator;
        const double beta3 = m3 / denominator;
        const double beta4 = m2 / denominator;

        const double x1 = x - x1_mean;
        const double x2 = x * x - x2_mean;

        const double a1 = beta2 * x1 - beta3 * x2;
        const double a2 = beta4 * x2 - beta3 * x1;

        for (std::size_t i = left; i <= right; ++i) {
            const double xi = static_cast<double>(i);
            weights_[i] *= (1.0 + a1 * (xi - x1_mean) + a2 * (xi * xi - x2_mean));
        }
    }
}

} // namespace stldecomp::smoothing
