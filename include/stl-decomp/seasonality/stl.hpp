#pragma once

#include "stl-decomp/core/time_series.hpp"
#include "stl-decomp/seasonality/decomposition.hpp"
#include "stl-decomp/seasonality/lowpass_filter.hpp"
#include "stl-decomp/seasonality/stl_config.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace stldecomp::seasonality {

class STLDecomposition {
public:
    class Builder {
    public:
        Builder& withPeriod(std::size_t period);

        Builder& withSeasonalWidth(std::size_t width);
        Builder& withSeasonalDegree(int degree);
        Builder& withSeasonalJump(std::size_t jump);

        Builder& withTrendWidth(std::size_t width);
        Builder& withTrendDegree(int degree);
        Builder& withTrendJump(std::size_t jump);

        Builder& withLowpassWidth(std::size_t width);
        Builder& withLowpassDegree(int degree);
        Builder& withLowpassJump(std::size_t jump);

        Builder& withInnerIterations(std::size_t iterations);
        Builder& withOuterIterations(std::size_t iterations);
        // 1 inner / 15 outer iterations when enabled, 2 / 0 otherwise.
        Builder& withRobust(bool robust);

        Builder& withPeriodic(bool periodic = true);
        Builder& withFlatTrend();
        Builder& withLinearTrend();
        Builder& withPostTrendSmoothing(bool enabled = true);
        Builder& withLowPassMode(LowPassMode mode);

        /**
         * @throws ConfigurationError If the period is missing or below 2, or the
         *         degree is outside [0, 2].
         */
        STLDecomposition build() const;

    private:
        StlConfig config_;
    };

    static Builder builder();

    /**
     * @brief Configuration is resolved against the series length on fit().
     * @throws ConfigurationError If the periodicity is missing or below 2.
     */
    explicit STLDecomposition(StlConfig config);

    void fit(const stldecomp::core::TimeSeries& ts);
    void fit(const std::vector<double>& values);

    const std::vector<double>& trend() const;
    const std::vector<double>& seasonal() const;
    const std::vector<double>& remainder() const;
    const std::vector<double>& weights() const;
    const Decomposition& decomposition() const;

    double seasonalStrength() const;
    double trendStrength() const;

    std::size_t seasonalPeriod() const { return *config_.periodicity; }
    const StlConfig& config() const { return config_; }

    /**
     * @brief Non-robust decomposition with a strictly periodic seasonal.
     *
     * One inner iteration with a degree 0 seasonal smoother spanning 100 times
     * the data, so every phase gets the mean of its sub-series. Meant for
     * diagnostics.
     */
    static Decomposition periodicDecomposition(const std::vector<double>& data, std::size_t periodicity);

    /// As periodicDecomposition() with one robustness iteration.
    static Decomposition robustPeriodicDecomposition(const std::vector<double>& data, std::size_t periodicity);

private:
    const Decomposition& fitted() const;

    StlConfig config_;
    std::optional<Decomposition> decomposition_;
};

} // namespace stldecomp::seasonality
