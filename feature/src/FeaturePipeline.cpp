/**
 * @file FeaturePipeline.cpp
 * @brief Canonical feature pipeline factory implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <phyto/feature/FeaturePipeline.hpp>

#include <phyto/core/Log.hpp>
#include <phyto/dsp/Decimate.hpp>
#include <phyto/dsp/Electrode.hpp>
#include <phyto/dsp/FeatureEnsemble.hpp>
#include <phyto/dsp/Preprocess.hpp>
#include <phyto/dsp/StandardScaler.hpp>
#include <phyto/dsp/Windowing.hpp>

namespace phyto::feature {

core::Expected<dsp::Pipeline> buildFeaturePipeline(const PipelineConfig &config)
{
    auto ensemble = PHYTO_TRY(dsp::makeShared<dsp::FeatureEnsemble>());

    auto builder = dsp::Pipeline::builder();
    if (config.electrodeMode() == ElectrodeMode::kAverage)
        builder.add<dsp::ElectrodeAvg>();
    else
        builder.add<dsp::ElectrodeDiff>();

    builder.add<dsp::Detrend>(config.windowOffset())
           .add<dsp::PostStimulus>(config.postOffset(), config.windowOffset());

    if (config.multiScale()) {
        auto window = PHYTO_TRY(dsp::makeShared<dsp::Window>(
            dsp::InnerOp(ensemble), config.windowCount(), config.hanning()));
        builder.add<dsp::DecimateWindow>(dsp::InnerOp(window), config.scaleCount());
    } else {
        builder.add<dsp::Window>(dsp::InnerOp(ensemble), config.windowCount(), config.hanning());
    }

    builder.add<dsp::StandardScaler>();

    core::Log::debug("feature", "pipeline: electrodes=" + std::string(electrodeModeName(config.electrodeMode()))
        + " windowOffset=" + std::to_string(config.windowOffset())
        + " postOffset=" + std::to_string(config.postOffset())
        + " windows=" + std::to_string(config.windowCount())
        + (config.multiScale() ? " scales=" + std::to_string(config.scaleCount()) : std::string{}));

    return builder.build();
}

} // namespace phyto::feature
