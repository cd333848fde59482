/**
 * @file FeaturePipeline.hpp
 * @brief Canonical feature pipeline factory.
 *
 * The canonical chain is:
 *
 * @code
 *   ElectrodeAvg | ElectrodeDiff
 *     -> Detrend(windowOffset)
 *     -> PostStimulus(postOffset, windowOffset)
 *     -> [DecimateWindow(...)]             (multi-scale only)
 *     -> Window(FeatureEnsemble, N, hanning)
 *     -> StandardScaler
 * @endcode
 *
 * In the multi-scale variant the windowed ensemble runs at every decimation
 * scale and the per-scale features are concatenated.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PHYTO_FEATURE_FEATURE_PIPELINE_HPP
    #define PHYTO_FEATURE_FEATURE_PIPELINE_HPP

    #include "PipelineConfig.hpp"

    #include <phyto/dsp/Pipeline.hpp>

namespace phyto::feature {

/**
 * @brief Builds the canonical pipeline described by @p config.
 */
[[nodiscard]] core::Expected<dsp::Pipeline> buildFeaturePipeline(const PipelineConfig &config);

} // namespace phyto::feature

#endif // PHYTO_FEATURE_FEATURE_PIPELINE_HPP
