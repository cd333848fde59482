/**
 * @file FeatureEnsemble.hpp
 * @brief Statistical fingerprint of a signal window.
 * @author MasterLaplace
 *
 * For every channel the ensemble computes, in this order:
 *
 *  | # | Feature                                          |
 *  |---|--------------------------------------------------|
 *  | 0 | mean(x)                                          |
 *  | 1 | mean |x'|                                        |
 *  | 2 | mean |x''|                                       |
 *  | 3 | var(x)                                           |
 *  | 4 | var(x')                                          |
 *  | 5 | var(x'')                                         |
 *  | 6 | Hjorth mobility   sqrt(var(x') / var(x))         |
 *  | 7 | Hjorth complexity sqrt(var(x'') / var(x')) / mob |
 *  | 8 | skewness                                         |
 *  | 9 | excess kurtosis                                  |
 *
 * x' and x'' are the first and second differentials. Channel blocks are
 * stacked channel-major into a single-column sample of 10 * channels rows.
 */

#pragma once

#ifndef PHYTO_DSP_FEATURE_ENSEMBLE_HPP
    #define PHYTO_DSP_FEATURE_ENSEMBLE_HPP

#include "phyto/dsp/ITransform.hpp"

#include <phyto/core/Constants.hpp>

#include <array>
#include <span>

namespace phyto::dsp {

using EnsembleVector = std::array<double, core::kEnsembleFeatureCount>;

/**
 * @brief Computes the ensemble of one channel.
 *
 * @return The 10 features, or kDegenerateSignal for fewer than 3 points or a
 *         zero variance of the signal or its first differential
 */
[[nodiscard]] core::Expected<EnsembleVector> ensembleOf(std::span<const double> x);

class FeatureEnsemble final : public ITransform {
public:
    [[nodiscard]] static core::Expected<FeatureEnsemble> create();

    [[nodiscard]] core::Expected<Sample> extract(const Sample &input) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "FeatureEnsemble"; }

private:
    FeatureEnsemble() = default;
};

} // namespace phyto::dsp

#endif // PHYTO_DSP_FEATURE_ENSEMBLE_HPP
