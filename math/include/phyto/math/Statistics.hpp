/**
 * @file Statistics.hpp
 * @brief Moment-based statistics over finite real sequences.
 * @author MasterLaplace
 *
 * Provides the mean, central moments, variance, standard deviation,
 * skewness, excess kurtosis and successive differences used by every
 * transform and by the feature ensemble.
 *
 * Every function that divides by the sample size or the variance reports a
 * kDomainError instead of producing NaN or Inf.
 *
 * @see FeatureEnsemble
 */

#pragma once

#ifndef PHYTO_MATH_STATISTICS_HPP
    #define PHYTO_MATH_STATISTICS_HPP

#include <phyto/core/Error.hpp>
#include <phyto/core/Types.hpp>

#include <span>
#include <vector>

namespace phyto::math {

/**
 * @brief Pure-function statistical utilities for temporal signals.
 */
class Statistics {
public:
    Statistics() = delete;

    /**
     * @brief Arithmetic mean.
     * @return kDomainError for an empty sequence
     */
    [[nodiscard]] static core::Expected<double> mean(std::span<const double> x);

    /**
     * @brief Mean of absolute values.
     * @return kDomainError for an empty sequence
     */
    [[nodiscard]] static core::Expected<double> meanAbsolute(std::span<const double> x);

    /**
     * @brief n-th central moment: average of (x_i - mean)^n.
     *
     * @param x     Input values
     * @param order Moment order (0 yields 1)
     * @return kDomainError for an empty sequence
     */
    [[nodiscard]] static core::Expected<double> moment(std::span<const double> x, unsigned order);

    /**
     * @brief Population variance, identical to moment(x, 2).
     */
    [[nodiscard]] static core::Expected<double> variance(std::span<const double> x);

    /**
     * @brief Population standard deviation.
     */
    [[nodiscard]] static core::Expected<double> stdev(std::span<const double> x);

    /**
     * @brief moment(x, 3) / variance^1.5.
     * @return kDomainError for an empty or constant sequence
     */
    [[nodiscard]] static core::Expected<double> skewness(std::span<const double> x);

    /**
     * @brief Excess kurtosis: moment(x, 4) / variance^2 - 3.
     * @return kDomainError for an empty or constant sequence
     */
    [[nodiscard]] static core::Expected<double> kurtosis(std::span<const double> x);

    /**
     * @brief Successive first differences x[i+1] - x[i].
     *
     * @return A sequence one element shorter than @p x (empty when
     *         @p x has fewer than two elements)
     */
    [[nodiscard]] static std::vector<double> differential(std::span<const double> x);
};

} // namespace phyto::math

#endif // PHYTO_MATH_STATISTICS_HPP
