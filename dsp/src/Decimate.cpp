/**
 * @file Decimate.cpp
 * @brief Implementation of Decimate and DecimateWindow.
 * @author MasterLaplace
 */

#include "phyto/dsp/Decimate.hpp"

#include <phyto/math/Fir.hpp>

namespace phyto::dsp {

using core::ErrorCode;
using core::Expected;
using core::makeError;
using core::usize;

// ─── Decimate ────────────────────────────────────────────────────────────────

Expected<Decimate> Decimate::create(usize factor)
{
    if (factor == 0)
        return makeError(ErrorCode::kInvalidArgument, "Decimate factor must be at least 1");

    if (factor == 1)
        return Decimate(1, {});

    auto taps = math::designLowpassFir(core::kFirOrderPerFactor * factor + 1,
                                       1.0 / static_cast<double>(factor));
    return Decimate(factor, std::move(taps));
}

Expected<Sample> Decimate::extract(const Sample &input) const
{
    PHYTO_TRY_VOID(expectReal(input, name()));
    if (_factor == 1)
        return input;
    if (input.empty())
        return makeError(ErrorCode::kEmptyInput, "Decimate on an empty sample");

    const RealMatrix &x = input.real();
    const auto outLen = static_cast<Eigen::Index>((input.length() + _factor - 1) / _factor);
    RealMatrix out(outLen, x.cols());

    for (Eigen::Index ch = 0; ch < x.cols(); ++ch) {
        const auto y = math::decimateFir(channelSpan(x, ch), _taps, _factor);
        out.col(ch) = Eigen::Map<const Eigen::VectorXd>(y.data(), outLen);
    }
    return Sample(std::move(out));
}

// ─── DecimateWindow ──────────────────────────────────────────────────────────

Expected<DecimateWindow> DecimateWindow::create(InnerOp inner, usize scaleCount)
{
    PHYTO_TRY_VOID(expectValid(inner, "DecimateWindow"));
    if (scaleCount == 0 || scaleCount > core::kDecimationScaleCount) {
        return makeError(ErrorCode::kInvalidArgument,
            "DecimateWindow scale count must be in [1, "
            + std::to_string(core::kDecimationScaleCount) + "], got " + std::to_string(scaleCount));
    }

    std::vector<Decimate> bank;
    bank.reserve(scaleCount);
    for (usize e = 0; e < scaleCount; ++e)
        bank.push_back(PHYTO_TRY(Decimate::create(usize{1} << e)));

    return DecimateWindow(std::move(inner), std::move(bank));
}

Expected<Sample> DecimateWindow::extract(const Sample &input) const
{
    std::vector<Sample> results;
    results.reserve(_bank.size());
    for (const auto &decimate : _bank) {
        const Sample scaled = PHYTO_TRY(decimate.extract(input));
        results.push_back(PHYTO_TRY(_inner(scaled)));
    }
    return concatenate(results, name());
}

} // namespace phyto::dsp
