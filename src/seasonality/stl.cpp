#include "stl-decomp/seasonality/stl.hpp"
#include "stl-decomp/errors.hpp"
#include "stl-decomp/seasonality/seasonal_trend_loess.hpp"
#include "stl-decomp/smoothing/loess_settings.hpp"
#include "stl-decomp/utils/logging.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace {

int checkedDegree(int degree) {
    // Validates early so the builder fails where the bad value was given.
    return static_cast<int>(stldecomp::smoothing::toLoessDegree(degree));
}

stldecomp::seasonality::Decomposition periodicDiagnostic(const std::vector<double>& data,
                                                        std::size_t periodicity,
                                                        std::size_t outer_iterations) {
    stldecomp::seasonality::StlConfig config;
    config.periodicity = periodicity;
    config.seasonal_width = 100 * data.size();
    config.seasonal_degree = 0;
    config.inner_iterations = 1;
    config.outer_iterations = outer_iterations;
    const auto parameters = stldecomp::seasonality::resolveParameters(config, data.size());
    return stldecomp::seasonality::SeasonalTrendLoess(parameters).decompose(data);
}

} // namespace

namespace stldecomp::seasonality {

STLDecomposition::Builder& STLDecomposition::Builder::withPeriod(std::size_t period) {
    config_.periodicity = period;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withSeasonalWidth(std::size_t width) {
    config_.seasonal_width = width;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withSeasonalDegree(int degree) {
    config_.seasonal_degree = checkedDegree(degree);
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withSeasonalJump(std::size_t jump) {
    config_.seasonal_jump = jump;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withTrendWidth(std::size_t width) {
    config_.trend_width = width;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withTrendDegree(int degree) {
    config_.trend_degree = checkedDegree(degree);
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withTrendJump(std::size_t jump) {
    config_.trend_jump = jump;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withLowpassWidth(std::size_t width) {
    config_.lowpass_width = width;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withLowpassDegree(int degree) {
    config_.lowpass_degree = checkedDegree(degree);
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withLowpassJump(std::size_t jump) {
    config_.lowpass_jump = jump;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withInnerIterations(std::size_t iterations) {
    config_.inner_iterations = iterations;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withOuterIterations(std::size_t iterations) {
    config_.outer_iterations = iterations;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withRobust(bool robust) {
    config_.robust = robust;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withPeriodic(bool periodic) {
    config_.periodic = periodic;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withFlatTrend() {
    config_.flat_trend = true;
    config_.linear_trend = false;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withLinearTrend() {
    config_.flat_trend = false;
    config_.linear_trend = true;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withPostTrendSmoothing(bool enabled) {
    config_.post_trend_smoothing = enabled;
    return *this;
}

STLDecomposition::Builder& STLDecomposition::Builder::withLowPassMode(LowPassMode mode) {
    config_.lowpass_mode = mode;
    return *this;
}

STLDecomposition STLDecomposition::Builder::build() const {
    return STLDecomposition(config_);
}

STLDecomposition::Builder STLDecomposition::builder() {
    return Builder{};
}

STLDecomposition::STLDecomposition(StlConfig config)
    : config_(std::move(config)) {
    if (!config_.periodicity) {
        throw ConfigurationError("STL requires a seasonal period.");
    }
    if (*config_.periodicity < 2) {
        throw ConfigurationError("STL seasonal period must be at least 2, but is " +
                                 std::to_string(*config_.periodicity) + ".");
    }
}

void STLDecomposition::fit(const stldecomp::core::TimeSeries& ts) {
    if (!ts.isRegular()) {
        STLDECOMP_WARN("STL input timestamps are not evenly spaced; decomposing positionally");
    }
    fit(ts.getValues());
}

void STLDecomposition::fit(const std::vector<double>& values) {
    const auto parameters = resolveParameters(config_, values.size());
    decomposition_ = SeasonalTrendLoess(parameters).decompose(values);

    STLDECOMP_DEBUG("STL fit complete: seasonal strength {:.3f}, trend strength {:.3f}",
                    decomposition_->seasonalStrength(), decomposition_->trendStrength());
}

const Decomposition& STLDecomposition::fitted() const {
    if (!decomposition_) {
        throw std::runtime_error("STL decomposition not fitted.");
    }
    return *decomposition_;
}

const std::vector<double>& STLDecomposition::trend() const {
    return fitted().trend();
}

const std::vector<double>& STLDecomposition::seasonal() const {
    return fitted().seasonal();
}

const std::vector<double>& STLDecomposition::remainder() const {
    return fitted().remainder();
}

const std::vector<double>& STLDecomposition::weights() const {
    return fitted().weights();
}

const Decomposition& STLDecomposition::decomposition() const {
    return fitted();
}

double STLDecomposition::seasonalStrength() const {
    return fitted().seasonalStrength();
}

double STLDecomposition::trendStrength() const {
    return fitted().trendStrength();
}

Decomposition STLDecomposition::periodicDecomposition(const std::vector<double>& data, std::size_t periodicity) {
    return periodicDiagnostic(data, periodicity, 0);
}

Decomposition STLDecomposition::robustPeriodicDecomposition(const std::vector<double>& data,
                                                            std::size_t periodicity) {
    return periodicDiagnostic(data, periodicity, 1);
}

} // namespace stldecomp::seasonality
