/**
 * @file Pipeline.cpp
 * @brief Implementation of Pipeline and PipelineBuilder.
 * @author MasterLaplace
 */

#include "phyto/dsp/Pipeline.hpp"

#include <phyto/core/Log.hpp>

#include <algorithm>

namespace phyto::dsp {

using core::Expected;
using core::ExpectedVoid;

// ─── PipelineBuilder ─────────────────────────────────────────────────────────

PipelineBuilder &PipelineBuilder::add(std::unique_ptr<ITransform> stage)
{
    if (_error)
        return *this;

    if (!stage) {
        _error = core::Error(core::ErrorCode::kInvalidArgument, "pipeline stage is null");
        return *this;
    }
    _stages.push_back(std::move(stage));
    return *this;
}

Expected<Pipeline> PipelineBuilder::build()
{
    if (_error) {
        core::Log::error("dsp", "pipeline construction failed: " + _error->format());
        return std::unexpected(std::move(*_error));
    }
    return Pipeline(std::move(_stages));
}

// ─── Pipeline ────────────────────────────────────────────────────────────────

Pipeline::Pipeline(std::vector<std::unique_ptr<ITransform>> stages)
    : _stages(std::move(stages))
{
}

PipelineBuilder Pipeline::builder()
{
    return PipelineBuilder{};
}

ExpectedVoid Pipeline::fit(std::span<const Sample> batch, std::span<const std::string> labels)
{
    const auto lastTrainable = std::ranges::find_if(_stages.rbegin(), _stages.rend(),
        [](const auto &stage) { return stage->isTrainable(); });
    if (lastTrainable == _stages.rend())
        return {};

    const auto stop = static_cast<core::usize>(std::distance(lastTrainable, _stages.rend()));

    LabeledBatch current;
    current.samples.assign(batch.begin(), batch.end());
    current.labels.assign(labels.begin(), labels.end());

    for (core::usize k = 0; k < stop; ++k) {
        PHYTO_TRY_VOID(_stages[k]->fit(current.samples, current.labels));
        if (k + 1 < stop)
            current = PHYTO_TRY(_stages[k]->apply(current));
    }
    return {};
}

Expected<LabeledBatch> Pipeline::fitApply(const LabeledBatch &batch, const ApplyOptions &options)
{
    LabeledBatch current = batch;
    for (auto &stage : _stages) {
        if (stage->isTrainable()) {
            PHYTO_TRY_VOID(stage->fit(current.samples, current.labels));
            core::Log::debug("dsp", std::string(stage->name()) + ": fitted on "
                + std::to_string(current.size()) + " datapoints");
        }
        current = PHYTO_TRY(stage->apply(current, options));
    }
    return current;
}

Expected<Sample> Pipeline::extract(const Sample &input) const
{
    Sample current = input;
    for (const auto &stage : _stages)
        current = PHYTO_TRY(stage->extract(current));
    return current;
}

std::string_view Pipeline::name() const noexcept
{
    return "Pipeline";
}

bool Pipeline::isTrainable() const noexcept
{
    return std::ranges::any_of(_stages, [](const auto &stage) { return stage->isTrainable(); });
}

core::usize Pipeline::stageCount() const noexcept
{
    return _stages.size();
}

bool Pipeline::empty() const noexcept
{
    return _stages.empty();
}

} // namespace phyto::dsp
