/**
 * @file Fir.cpp
 * @brief Implementation of FIR design and decimation.
 */

#include "phyto/math/Fir.hpp"

#include <cmath>
#include <numbers>
#include <numeric>

namespace phyto::math {

namespace {

double sinc(double x) noexcept
{
    if (x == 0.0)
        return 1.0;
    const double px = std::numbers::pi * x;
    return std::sin(px) / px;
}

} // namespace

std::vector<double> designLowpassFir(core::usize taps, double cutoff)
{
    if (taps == 0)
        return {};
    if (taps == 1)
        return {1.0};

    std::vector<double> h(taps);
    const double alpha = 0.5 * static_cast<double>(taps - 1);
    const double nMinus1 = static_cast<double>(taps - 1);

    for (core::usize n = 0; n < taps; ++n) {
        const double t = static_cast<double>(n);
        const double hamming = 0.54 - 0.46 * std::cos(2.0 * std::numbers::pi * t / nMinus1);
        h[n] = cutoff * sinc(cutoff * (t - alpha)) * hamming;
    }

    const double gain = std::accumulate(h.begin(), h.end(), 0.0);
    for (double &c : h)
        c /= gain;

    return h;
}

std::vector<double> decimateFir(
    std::span<const double> x,
    std::span<const double> h,
    core::usize factor)
{
    if (x.empty() || factor == 0)
        return {};

    const auto n = static_cast<core::isize>(x.size());
    const auto taps = static_cast<core::isize>(h.size());
    const core::isize half = (taps - 1) / 2;
    const core::usize outLen = (x.size() + factor - 1) / factor;

    std::vector<double> y(outLen, 0.0);
    for (core::usize k = 0; k < outLen; ++k) {
        const auto centre = static_cast<core::isize>(k * factor) + half;
        double acc = 0.0;
        for (core::isize j = 0; j < taps; ++j) {
            const core::isize idx = centre - j;
            if (idx >= 0 && idx < n)
                acc += h[static_cast<core::usize>(j)] * x[static_cast<core::usize>(idx)];
        }
        y[k] = acc;
    }

    return y;
}

} // namespace phyto::math
