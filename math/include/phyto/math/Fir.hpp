/**
 * @file Fir.hpp
 * @brief Windowed-sinc FIR design and zero-phase polyphase decimation.
 * @author MasterLaplace
 *
 * The decimator follows the classic anti-aliasing recipe: a Hamming
 * windowed-sinc low-pass of order 20 * factor with its cutoff at the new
 * Nyquist frequency, applied without phase delay, then every factor-th
 * sample is kept.
 */

#pragma once

#ifndef PHYTO_MATH_FIR_HPP
    #define PHYTO_MATH_FIR_HPP

#include <phyto/core/Types.hpp>

#include <span>
#include <vector>

namespace phyto::math {

/**
 * @brief Designs a linear-phase low-pass FIR filter.
 *
 * @param taps   Number of coefficients (odd for a type I filter)
 * @param cutoff Cutoff frequency relative to Nyquist, in (0, 1]
 * @return Coefficients normalised to unit gain at DC
 */
[[nodiscard]] std::vector<double> designLowpassFir(core::usize taps, double cutoff);

/**
 * @brief Filters @p x with @p h centred on each kept sample and downsamples.
 *
 * Samples outside the input are treated as zero.
 *
 * @param x      Input signal
 * @param h      Symmetric FIR coefficients
 * @param factor Downsampling factor (>= 1)
 * @return ceil(x.size() / factor) output samples
 */
[[nodiscard]] std::vector<double> decimateFir(
    std::span<const double> x,
    std::span<const double> h,
    core::usize factor);

} // namespace phyto::math

#endif // PHYTO_MATH_FIR_HPP
