/**
 * @file Fft.cpp
 * @brief Radix-2 FFT with a direct DFT fallback.
 * @author MasterLaplace
 */

#include "phyto/math/Fft.hpp"

#include <bit>
#include <cmath>
#include <cstdint>
#include <numbers>

namespace phyto::math {

namespace {

void bitReversalPermutation(std::vector<Complex> &x)
{
    const auto N = static_cast<std::uint32_t>(x.size());
    std::uint32_t j = 0;

    for (std::uint32_t i = 1; i < N; ++i) {
        std::uint32_t bit = N >> 1;
        for (; j & bit; bit >>= 1) {
            j ^= bit;
        }
        j ^= bit;
        if (i < j) {
            std::swap(x[i], x[j]);
        }
    }
}

void butterflyPass(std::vector<Complex> &x)
{
    const auto N = static_cast<std::uint32_t>(x.size());

    for (std::uint32_t len = 2; len <= N; len <<= 1) {
        const double angle = -2.0 * std::numbers::pi / static_cast<double>(len);
        const Complex wlen(std::cos(angle), std::sin(angle));

        for (std::uint32_t i = 0; i < N; i += len) {
            Complex w(1.0, 0.0);
            const std::uint32_t halfLen = len / 2;

            for (std::uint32_t k = 0; k < halfLen; ++k) {
                const Complex u = x[i + k];
                const Complex v = x[i + k + halfLen] * w;
                x[i + k] = u + v;
                x[i + k + halfLen] = u - v;
                w *= wlen;
            }
        }
    }
}

std::vector<Complex> directDft(std::span<const double> x, std::size_t bins)
{
    const std::size_t n = x.size();
    std::vector<Complex> out(bins);

    for (std::size_t k = 0; k < bins; ++k) {
        Complex acc(0.0, 0.0);
        for (std::size_t t = 0; t < n; ++t) {
            // reduce k*t mod n first to keep the angle small
            const double angle = -2.0 * std::numbers::pi
                * static_cast<double>((k * t) % n) / static_cast<double>(n);
            acc += x[t] * Complex(std::cos(angle), std::sin(angle));
        }
        out[k] = acc;
    }

    return out;
}

} // namespace

std::vector<Complex> realFft(std::span<const double> x)
{
    if (x.empty())
        return {};

    const std::size_t n = x.size();
    const std::size_t bins = n / 2 + 1;

    if (!std::has_single_bit(n))
        return directDft(x, bins);

    std::vector<Complex> buffer(x.begin(), x.end());
    bitReversalPermutation(buffer);
    butterflyPass(buffer);
    buffer.resize(bins);
    return buffer;
}

} // namespace phyto::math
