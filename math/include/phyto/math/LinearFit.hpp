/**
 * @file LinearFit.hpp
 * @brief Least-squares straight-line fit over uniformly sampled data.
 * @author MasterLaplace
 */

#pragma once

#ifndef PHYTO_MATH_LINEAR_FIT_HPP
    #define PHYTO_MATH_LINEAR_FIT_HPP

#include <phyto/core/Error.hpp>

#include <span>

namespace phyto::math {

/**
 * @brief Line y = slope * t + intercept.
 */
struct LineFit {
    double slope = 0.0;
    double intercept = 0.0;

    [[nodiscard]] double at(double t) const noexcept { return slope * t + intercept; }
};

/**
 * @brief Fits a line to @p y sampled at t = 0, 1, ..., n-1.
 *
 * Solved with a column-pivoting Householder QR on the n x 2 design matrix.
 *
 * @return kDegenerateSignal when fewer than two points are supplied
 */
[[nodiscard]] core::Expected<LineFit> fitLine(std::span<const double> y);

} // namespace phyto::math

#endif // PHYTO_MATH_LINEAR_FIT_HPP
