/**
 * @file Fft.hpp
 * @brief Discrete Fourier transform of real sequences.
 * @author MasterLaplace
 *
 * Power-of-two lengths use an in-place radix-2 Cooley-Tukey transform;
 * any other length falls back to the direct O(n^2) DFT so that the
 * spectrum is always exact for the given length (no zero padding).
 */

#pragma once

#ifndef PHYTO_MATH_FFT_HPP
    #define PHYTO_MATH_FFT_HPP

#include <complex>
#include <span>
#include <vector>

namespace phyto::math {

using Complex = std::complex<double>;

/**
 * @brief Spectrum of a real input restricted to non-negative frequencies.
 *
 * @param x Real input of length n
 * @return n / 2 + 1 complex bins (empty for an empty input)
 */
[[nodiscard]] std::vector<Complex> realFft(std::span<const double> x);

} // namespace phyto::math

#endif // PHYTO_MATH_FFT_HPP
