/**
 * @file Preprocess.cpp
 * @brief Implementation of the time-domain conditioning transforms.
 * @author MasterLaplace
 */

#include "phyto/dsp/Preprocess.hpp"

#include <phyto/math/LinearFit.hpp>

#include <algorithm>
#include <cmath>

namespace phyto::dsp {

using core::ErrorCode;
using core::Expected;
using core::makeError;
using core::usize;

namespace {

Expected<Sample> keepRows(const Sample &input, usize first, usize count, std::string_view stage)
{
    if (count == 0) {
        return makeError(ErrorCode::kEmptyInput,
            std::string(stage) + " leaves no data in " + input.shapeString());
    }
    return Sample(RealMatrix(input.real().middleRows(
        static_cast<Eigen::Index>(first), static_cast<Eigen::Index>(count))));
}

} // namespace

// ─── MeanSubtract ────────────────────────────────────────────────────────────

Expected<MeanSubtract> MeanSubtract::create()
{
    return MeanSubtract{};
}

Expected<Sample> MeanSubtract::extract(const Sample &input) const
{
    PHYTO_TRY_VOID(expectReal(input, name()));
    if (input.empty())
        return makeError(ErrorCode::kEmptyInput, "MeanSubtract on an empty sample");

    const RealMatrix &x = input.real();
    RealMatrix out = x.rowwise() - x.colwise().mean();
    return Sample(std::move(out));
}

// ─── Clip ────────────────────────────────────────────────────────────────────

Expected<Clip> Clip::create(double fraction)
{
    if (!(fraction > 0.0 && fraction <= 1.0)) {
        return makeError(ErrorCode::kInvalidArgument,
            "Clip fraction must be in (0, 1], got " + std::to_string(fraction));
    }
    return Clip(fraction);
}

Expected<Sample> Clip::extract(const Sample &input) const
{
    PHYTO_TRY_VOID(expectReal(input, name()));
    const auto keep = static_cast<usize>(std::floor(static_cast<double>(input.length()) * _fraction));
    return keepRows(input, 0, keep, name());
}

// ─── Detrend ─────────────────────────────────────────────────────────────────

Expected<Detrend> Detrend::create(usize windowOffset)
{
    if (windowOffset == 0)
        return makeError(ErrorCode::kInvalidArgument, "Detrend window offset must be positive");
    return Detrend(windowOffset);
}

Expected<Sample> Detrend::extract(const Sample &input) const
{
    PHYTO_TRY_VOID(expectReal(input, name()));

    const usize len = input.length();
    if (len < _windowOffset + 2) {
        return makeError(ErrorCode::kShapeMismatch,
            "Detrend baseline of " + input.shapeString() + " with window offset "
            + std::to_string(_windowOffset) + " has fewer than 2 points");
    }

    const usize baseline = len - _windowOffset;
    const RealMatrix &x = input.real();
    RealMatrix out(x.rows(), x.cols());

    for (Eigen::Index ch = 0; ch < x.cols(); ++ch) {
        const auto line = PHYTO_TRY(math::fitLine(channelSpan(x, ch).first(baseline)));
        for (Eigen::Index t = 0; t < x.rows(); ++t)
            out(t, ch) = x(t, ch) - line.at(static_cast<double>(t));
    }
    return Sample(std::move(out));
}

// ─── PostStimulus ────────────────────────────────────────────────────────────

Expected<PostStimulus> PostStimulus::create(core::i64 offset, usize windowOffset)
{
    if (windowOffset == 0)
        return makeError(ErrorCode::kInvalidArgument, "PostStimulus window offset must be positive");
    return PostStimulus(offset, windowOffset);
}

usize PostStimulus::startIndex(usize length) const noexcept
{
    const auto len = static_cast<core::i64>(length);
    core::i64 start = _offset - static_cast<core::i64>(_windowOffset);
    if (start < 0)
        start += len;
    return static_cast<usize>(std::clamp<core::i64>(start, 0, len));
}

Expected<Sample> PostStimulus::extract(const Sample &input) const
{
    PHYTO_TRY_VOID(expectReal(input, name()));
    const usize start = startIndex(input.length());
    return keepRows(input, start, input.length() - start, name());
}

// ─── PreStimulus ─────────────────────────────────────────────────────────────

Expected<PreStimulus> PreStimulus::create(usize windowOffset)
{
    if (windowOffset == 0)
        return makeError(ErrorCode::kInvalidArgument, "PreStimulus window offset must be positive");
    return PreStimulus(windowOffset);
}

Expected<Sample> PreStimulus::extract(const Sample &input) const
{
    PHYTO_TRY_VOID(expectReal(input, name()));
    const usize len = input.length();
    return keepRows(input, 0, len > _windowOffset ? len - _windowOffset : 0, name());
}

} // namespace phyto::dsp
