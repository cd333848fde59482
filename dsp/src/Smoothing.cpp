/**
 * @file Smoothing.cpp
 * @brief Implementation of MovingAvg and Noise.
 * @author MasterLaplace
 */

#include "phyto/dsp/Smoothing.hpp"

namespace phyto::dsp {

using core::ErrorCode;
using core::Expected;
using core::makeError;
using core::usize;

std::vector<double> runningMean(std::span<const double> x, usize n)
{
    if (n == 0 || n > x.size())
        return {};

    std::vector<double> avg(x.size() - n + 1);
    const double scale = 1.0 / static_cast<double>(n);

    double sum = 0.0;
    for (usize i = 0; i < n; ++i)
        sum += x[i];
    avg[0] = sum * scale;

    for (usize i = 1; i < avg.size(); ++i) {
        sum += x[i + n - 1] - x[i - 1];
        avg[i] = sum * scale;
    }
    return avg;
}

// ─── MovingAvg ───────────────────────────────────────────────────────────────

Expected<MovingAvg> MovingAvg::create(usize width)
{
    if (width == 0)
        return makeError(ErrorCode::kInvalidArgument, "MovingAvg width must be at least 1");
    return MovingAvg(width);
}

Expected<Sample> MovingAvg::extract(const Sample &input) const
{
    PHYTO_TRY_VOID(expectReal(input, name()));
    if (_width > input.length()) {
        return makeError(ErrorCode::kShapeMismatch,
            "MovingAvg width " + std::to_string(_width) + " exceeds " + input.shapeString());
    }

    const RealMatrix &x = input.real();
    const auto outLen = static_cast<Eigen::Index>(input.length() - _width + 1);
    RealMatrix out(outLen, x.cols());

    for (Eigen::Index ch = 0; ch < x.cols(); ++ch) {
        const auto avg = runningMean(channelSpan(x, ch), _width);
        out.col(ch) = Eigen::Map<const Eigen::VectorXd>(avg.data(), outLen);
    }
    return Sample(std::move(out));
}

// ─── Noise ───────────────────────────────────────────────────────────────────

Expected<Noise> Noise::create(usize width)
{
    if (width == 0)
        return makeError(ErrorCode::kInvalidArgument, "Noise width must be at least 1");
    return Noise(width);
}

Expected<Sample> Noise::extract(const Sample &input) const
{
    PHYTO_TRY_VOID(expectReal(input, name()));
    if (_width >= input.length()) {
        return makeError(ErrorCode::kShapeMismatch,
            "Noise width " + std::to_string(_width) + " leaves no residual in " + input.shapeString());
    }

    const RealMatrix &x = input.real();
    const usize outLen = input.length() - _width;
    const usize centre = _width / 2;
    RealMatrix out(static_cast<Eigen::Index>(outLen), x.cols());

    for (Eigen::Index ch = 0; ch < x.cols(); ++ch) {
        const auto column = channelSpan(x, ch);
        const auto avg = runningMean(column, _width);
        for (usize i = 0; i < outLen; ++i)
            out(static_cast<Eigen::Index>(i), ch) = column[i + centre] - avg[i];
    }
    return Sample(std::move(out));
}

} // namespace phyto::dsp
