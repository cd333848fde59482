/**
 * @file Wavelet.cpp
 * @brief Implementation of the Daubechies decomposition.
 */

#include "phyto/math/Wavelet.hpp"

#include <phyto/core/Log.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

namespace phyto::math {

namespace {

struct FilterBank {
    std::string_view name;
    std::vector<double> decLo;
};

const std::array<FilterBank, 5> &filterBanks()
{
    static const std::array<FilterBank, 5> kBanks = {{
        {"haar", {0.7071067811865476, 0.7071067811865476}},
        {"db1",  {0.7071067811865476, 0.7071067811865476}},
        {"db2",  {-0.12940952255126037, 0.2241438680420134,
                  0.8365163037378079, 0.48296291314453416}},
        {"db3",  {0.03522629188570953, -0.08544127388202666,
                  -0.13501102001025458, 0.45987750211849154,
                  0.8068915093110925, 0.33267055295008263}},
        {"db4",  {-0.010597401785069032, 0.0328830116668852,
                  0.030841381835560764, -0.18703481171909309,
                  -0.027983769416859854, 0.6308807679298589,
                  0.7148465705529157, 0.2303778133088965}},
    }};
    return kBanks;
}

/// Half-sample symmetric reflection of an index into [0, n).
core::usize reflect(core::isize idx, core::usize n) noexcept
{
    const auto period = static_cast<core::isize>(2 * n);
    core::isize m = idx % period;
    if (m < 0)
        m += period;
    if (m >= static_cast<core::isize>(n))
        m = period - 1 - m;
    return static_cast<core::usize>(m);
}

std::vector<double> downsamplingConvolution(
    std::span<const double> x,
    const std::vector<double> &filter)
{
    const core::usize n = x.size();
    const core::usize f = filter.size();
    const core::usize outLen = (n + f - 1) / 2;

    std::vector<double> out(outLen, 0.0);
    for (core::usize o = 0; o < outLen; ++o) {
        const auto i = static_cast<core::isize>(2 * o + 1);
        double acc = 0.0;
        for (core::usize j = 0; j < f; ++j)
            acc += filter[j] * x[reflect(i - static_cast<core::isize>(j), n)];
        out[o] = acc;
    }
    return out;
}

} // namespace

Wavelet::Wavelet(std::string name, std::vector<double> decLo)
    : _name(std::move(name)), _decLo(std::move(decLo)), _decHi(_decLo.size())
{
    // dec_hi is the reversed quadrature mirror of the low-pass filter
    const core::usize f = _decLo.size();
    for (core::usize i = 0; i < f; ++i) {
        const core::usize src = f - 1 - i;
        const double sign = (src % 2 == 0) ? 1.0 : -1.0;
        _decHi[i] = sign * _decLo[src];
    }
}

core::Expected<Wavelet> Wavelet::byName(std::string_view name)
{
    for (const auto &bank : filterBanks()) {
        if (bank.name == name)
            return Wavelet(std::string(name), bank.decLo);
    }
    return core::makeError(core::ErrorCode::kInvalidArgument,
        "unknown wavelet '" + std::string(name) + "'");
}

core::usize Wavelet::maxLevel(core::usize n) const noexcept
{
    const core::usize f = filterLength();
    if (f < 2 || n < f - 1)
        return 0;
    return static_cast<core::usize>(
        std::floor(std::log2(static_cast<double>(n) / static_cast<double>(f - 1))));
}

DwtLevel Wavelet::dwt(std::span<const double> x) const
{
    if (x.empty())
        return {};
    return DwtLevel{
        .approximation = downsamplingConvolution(x, _decLo),
        .detail = downsamplingConvolution(x, _decHi),
    };
}

core::Expected<std::vector<std::vector<double>>> Wavelet::decompose(
    std::span<const double> x, core::usize level) const
{
    if (level == 0) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "wavelet decomposition level must be >= 1");
    }

    if (x.empty())
        return core::makeError(core::ErrorCode::kEmptyInput, "cannot decompose an empty signal");

    // levels past the limit are boundary-dominated but still defined
    const core::usize limit = maxLevel(x.size());
    if (level > limit && core::Log::enabled(core::LogLevel::kDebug)) {
        core::Log::debug("dsp", "level " + std::to_string(level) + " exceeds the useful depth "
            + std::to_string(limit) + " of " + _name + " on " + std::to_string(x.size()) + " points");
    }

    std::vector<std::vector<double>> details;
    details.reserve(level);

    std::vector<double> approx(x.begin(), x.end());
    for (core::usize l = 0; l < level; ++l) {
        DwtLevel step = dwt(approx);
        details.push_back(std::move(step.detail));
        approx = std::move(step.approximation);
    }

    std::vector<std::vector<double>> coeffs;
    coeffs.reserve(level + 1);
    coeffs.push_back(std::move(approx));
    for (auto it = details.rbegin(); it != details.rend(); ++it)
        coeffs.push_back(std::move(*it));

    return coeffs;
}

} // namespace phyto::math
