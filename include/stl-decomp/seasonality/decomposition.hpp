#pragma once

#include <cstddef>
#include <vector>

namespace stldecomp::seasonality {

/**
 * Result of an STL decomposition: the input and its trend, seasonal and
 * remainder components together with the final robustness weights.
 *
 * remainder[i] == data[i] - trend[i] - seasonal[i] holds for every i.
 */
class Decomposition {
public:
    /**
     * @throws InputShapeError If the component lengths differ.
     */
    Decomposition(std::vector<double> data,
                  std::vector<double> trend,
                  std::vector<double> seasonal,
                  std::vector<double> weights);

    const std::vector<double>& data() const { return data_; }
    const std::vector<double>& trend() const { return trend_; }
    const std::vector<double>& seasonal() const { return seasonal_; }
    const std::vector<double>& remainder() const { return remainder_; }
    const std::vector<double>& weights() const { return weights_; }
    std::size_t size() const { return data_.size(); }

    /// 1 - Var(R) / Var(S + R); 0 if Var(S + R) is not positive.
    double seasonalStrength() const;
    /// 1 - Var(R) / Var(T + R); 0 if Var(T + R) is not positive.
    double trendStrength() const;

    /**
     * @brief Copy with the seasonal component smoothed by a quadratic Loess (jump 1).
     *
     * The width is made odd and at least 3. The smoother tends to over-modify
     * the end points, so they can be restored from the unsmoothed seasonal.
     */
    Decomposition withSmoothedSeasonal(std::size_t width, bool restore_end_points = true) const;

private:
    void updateRemainder();

    std::vector<double> data_;
    std::vector<double> trend_;
    std::vector<double> seasonal_;
    std::vector<double> remainder_;
    std::vector<double> weights_;
};

} // namespace stldecomp::seasonality
