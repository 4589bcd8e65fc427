#pragma once

#include "stl-decomp/smoothing/loess_settings.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace stldecomp::seasonality {

/**
 * Smooths each cyclic sub-series of a series and extrapolates it a number of
 * periods before and after the data.
 *
 * For n = m * periodicity + r, the first r sub-series hold m + 1 points and the
 * remaining ones m points. The smoothed sub-series are interleaved back into an
 * extended array of n + (backward + forward) * periodicity points, where the
 * original data starts at offset backward * periodicity.
 */
class CyclicSubSeriesSmoother {
public:
    CyclicSubSeriesSmoother(const smoothing::LoessSettings& settings,
                            std::size_t data_length,
                            std::size_t periodicity,
                            std::size_t backward_periods,
                            std::size_t forward_periods);

    /**
     * @param raw Series of data_length points.
     * @param extended Output, pre-sized to extendedLength().
     * @param weights Optional robustness weights for raw; floored at 0.001.
     */
    void smooth(const std::vector<double>& raw,
                std::vector<double>& extended,
                const std::optional<std::vector<double>>& weights = std::nullopt);

    std::size_t extendedLength() const {
        return data_length_ + (backward_periods_ + forward_periods_) * periodicity_;
    }

    std::size_t dataLength() const { return data_length_; }
    std::size_t periodicity() const { return periodicity_; }

private:
    std::size_t subSeriesLength(std::size_t phase) const {
        return phase < remainder_ ? periods_ + 1 : periods_;
    }

    void extractSubSeries(const std::vector<double>& raw,
                          const std::optional<std::vector<double>>& weights);
    void smoothSubSeries(std::size_t phase, bool use_weights);

    smoothing::LoessSettings settings_;
    std::size_t data_length_;
    std::size_t periodicity_;
    std::size_t backward_periods_;
    std::size_t forward_periods_;
    std::size_t periods_;
    std::size_t remainder_;

    std::vector<std::vector<double>> raw_sub_series_;
    std::vector<std::vector<double>> sub_series_weights_;
    std::vector<std::vector<double>> smoothed_sub_series_;
};

} // namespace stldecomp::seasonality
