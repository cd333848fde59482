/**
 * @file Spectral.cpp
 * @brief Implementation of Fourier and DiscreteWavelet.
 * @author MasterLaplace
 */

#include "phyto/dsp/Spectral.hpp"

#include <phyto/math/Fft.hpp>

namespace phyto::dsp {

using core::ErrorCode;
using core::Expected;
using core::makeError;
using core::usize;

// ─── Fourier ─────────────────────────────────────────────────────────────────

Expected<Fourier> Fourier::create()
{
    return Fourier{};
}

Expected<Sample> Fourier::extract(const Sample &input) const
{
    PHYTO_TRY_VOID(expectReal(input, name()));
    if (input.empty())
        return makeError(ErrorCode::kEmptyInput, "Fourier on an empty sample");

    const RealMatrix &x = input.real();
    const auto bins = static_cast<Eigen::Index>(input.length() / 2 + 1);
    ComplexMatrix out(bins, x.cols());

    for (Eigen::Index ch = 0; ch < x.cols(); ++ch) {
        const auto spectrum = math::realFft(channelSpan(x, ch));
        for (Eigen::Index k = 0; k < bins; ++k)
            out(k, ch) = spectrum[static_cast<usize>(k)];
    }
    return Sample(std::move(out));
}

// ─── DiscreteWavelet ─────────────────────────────────────────────────────────

Expected<DiscreteWavelet> DiscreteWavelet::create(std::string_view kind, usize level, usize drop, bool concat)
{
    auto wavelet = PHYTO_TRY(math::Wavelet::byName(kind));
    if (level == 0)
        return makeError(ErrorCode::kInvalidArgument, "DiscreteWavelet level must be at least 1");
    if (drop >= level) {
        return makeError(ErrorCode::kInvalidArgument,
            "DiscreteWavelet drop " + std::to_string(drop) + " must be below level "
            + std::to_string(level));
    }
    return DiscreteWavelet(std::move(wavelet), level, drop, concat);
}

Expected<Sample> DiscreteWavelet::extract(const Sample &input) const
{
    PHYTO_TRY_VOID(expectReal(input, name()));
    const RealMatrix &x = input.real();
    const usize kept = keptBands();

    // bands[b] collects band b of every channel.
    SegmentList bands(kept);
    for (Eigen::Index ch = 0; ch < x.cols(); ++ch) {
        const auto coeffs = PHYTO_TRY(_wavelet.decompose(channelSpan(x, ch), _level));
        for (usize b = 0; b < kept; ++b) {
            const auto &band = coeffs[b];
            const auto rows = static_cast<Eigen::Index>(band.size());
            if (ch == 0)
                bands[b].resize(rows, x.cols());
            bands[b].col(ch) = Eigen::Map<const Eigen::VectorXd>(band.data(), rows);
        }
    }

    if (!_concat)
        return Sample(std::move(bands));

    Eigen::Index total = 0;
    for (const auto &band : bands)
        total += band.rows();

    RealMatrix out(total, x.cols());
    Eigen::Index offset = 0;
    for (const auto &band : bands) {
        out.middleRows(offset, band.rows()) = band;
        offset += band.rows();
    }
    return Sample(std::move(out));
}

} // namespace phyto::dsp
