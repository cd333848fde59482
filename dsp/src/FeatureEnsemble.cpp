/**
 * @file FeatureEnsemble.cpp
 * @brief Implementation of the statistical feature ensemble.
 * @author MasterLaplace
 */

#include "phyto/dsp/FeatureEnsemble.hpp"

#include <phyto/math/Statistics.hpp>

#include <cmath>

namespace phyto::dsp {

using core::ErrorCode;
using core::Expected;
using core::makeError;
using math::Statistics;

Expected<EnsembleVector> ensembleOf(std::span<const double> x)
{
    if (x.size() < core::kEnsembleMinPoints) {
        return makeError(ErrorCode::kDegenerateSignal,
            "feature ensemble needs at least " + std::to_string(core::kEnsembleMinPoints)
            + " points, got " + std::to_string(x.size()));
    }

    const auto d1 = Statistics::differential(x);
    const auto d2 = Statistics::differential(d1);

    const double varX  = PHYTO_TRY(Statistics::variance(x));
    const double varD1 = PHYTO_TRY(Statistics::variance(d1));
    const double varD2 = PHYTO_TRY(Statistics::variance(d2));

    if (varX == 0.0)
        return makeError(ErrorCode::kDegenerateSignal, "feature ensemble on a constant signal");
    if (varD1 == 0.0)
        return makeError(ErrorCode::kDegenerateSignal, "feature ensemble on a signal with constant slope");

    const double mobility = std::sqrt(varD1 / varX);
    const double complexity = std::sqrt(varD2 / varD1) / mobility;

    const double mean     = PHYTO_TRY(Statistics::mean(x));
    const double diff     = PHYTO_TRY(Statistics::meanAbsolute(d1));
    const double noise    = PHYTO_TRY(Statistics::meanAbsolute(d2));
    const double skewness = PHYTO_TRY(Statistics::skewness(x));
    const double kurtosis = PHYTO_TRY(Statistics::kurtosis(x));

    return EnsembleVector{mean, diff, noise, varX, varD1, varD2, mobility, complexity, skewness, kurtosis};
}

Expected<FeatureEnsemble> FeatureEnsemble::create()
{
    return FeatureEnsemble{};
}

Expected<Sample> FeatureEnsemble::extract(const Sample &input) const
{
    PHYTO_TRY_VOID(expectReal(input, name()));

    const RealMatrix &x = input.real();
    constexpr auto block = static_cast<Eigen::Index>(core::kEnsembleFeatureCount);
    RealMatrix out(block * x.cols(), 1);

    for (Eigen::Index ch = 0; ch < x.cols(); ++ch) {
        const auto features = PHYTO_TRY(ensembleOf(channelSpan(x, ch)));
        out.col(0).segment(ch * block, block) = Eigen::Map<const Eigen::VectorXd>(features.data(), block);
    }
    return Sample(std::move(out));
}

} // namespace phyto::dsp
