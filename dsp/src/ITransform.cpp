/**
 * @file ITransform.cpp
 * @brief Batch application shared by every transform.
 * @author MasterLaplace
 */

#include "phyto/dsp/ITransform.hpp"

#include <phyto/concurrency/ThreadPool.hpp>
#include <phyto/core/Log.hpp>

namespace phyto::dsp {

using core::ErrorCategory;
using core::ErrorCode;
using core::Expected;
using core::ExpectedVoid;
using core::makeError;

namespace {

ExpectedVoid validateUniformShape(std::span<const Sample> batch, std::string_view stage)
{
    for (core::usize i = 1; i < batch.size(); ++i) {
        if (!batch[i].sameShape(batch.front())) {
            return makeError(ErrorCode::kShapeMismatch,
                std::string(stage) + ": sample " + std::to_string(i) + " is "
                + batch[i].shapeString() + " but sample 0 is " + batch.front().shapeString());
        }
    }
    return {};
}

std::vector<Expected<Sample>> runSequential(const ITransform &transform, std::span<const Sample> batch)
{
    std::vector<Expected<Sample>> outputs;
    outputs.reserve(batch.size());
    for (const auto &sample : batch)
        outputs.push_back(transform.extract(sample));
    return outputs;
}

std::vector<Expected<Sample>> runPooled(
    const ITransform &transform,
    std::span<const Sample> batch,
    concurrency::ThreadPool &pool)
{
    return pool.map(batch.size(), [&](core::usize i) { return transform.extract(batch[i]); });
}

} // namespace

ExpectedVoid ITransform::fit(std::span<const Sample> /*batch*/, std::span<const std::string> /*labels*/)
{
    return {};
}

Expected<BatchResult> ITransform::apply(std::span<const Sample> batch, const ApplyOptions &options) const
{
    PHYTO_TRY_VOID(validateUniformShape(batch, name()));

    auto outputs = (options.pool != nullptr && batch.size() > 1)
        ? runPooled(*this, batch, *options.pool)
        : runSequential(*this, batch);

    BatchResult result;
    result.samples.reserve(outputs.size());
    result.sourceIndices.reserve(outputs.size());

    for (core::usize i = 0; i < outputs.size(); ++i) {
        auto &out = outputs[i];
        if (out.has_value()) [[likely]] {
            result.samples.push_back(std::move(*out));
            result.sourceIndices.push_back(i);
            continue;
        }

        const auto &err = out.error();
        if (options.policy == DegeneratePolicy::kDrop && err.category() == ErrorCategory::kDegenerate) {
            core::Log::warn("dsp", std::string(name()) + ": dropping datapoint "
                + std::to_string(i) + ": " + err.message());
            continue;
        }

        core::Log::error("dsp", std::string(name()) + ": datapoint "
            + std::to_string(i) + " failed: " + err.format());
        return std::unexpected(std::move(out.error()));
    }

    if (result.samples.size() != batch.size()) {
        core::Log::info("dsp", std::string(name()) + ": kept " + std::to_string(result.samples.size())
            + " of " + std::to_string(batch.size()) + " datapoints");
    }

    return result;
}

Expected<LabeledBatch> ITransform::apply(const LabeledBatch &batch, const ApplyOptions &options) const
{
    if (!batch.labels.empty() && batch.labels.size() != batch.samples.size()) {
        return makeError(ErrorCode::kShapeMismatch,
            std::string(name()) + ": " + std::to_string(batch.samples.size()) + " samples but "
            + std::to_string(batch.labels.size()) + " labels");
    }

    BatchResult result = PHYTO_TRY(apply(batch.samples, options));

    LabeledBatch out;
    out.samples = std::move(result.samples);
    if (!batch.labels.empty()) {
        out.labels.reserve(result.sourceIndices.size());
        for (const core::usize idx : result.sourceIndices)
            out.labels.push_back(batch.labels[idx]);
    }
    return out;
}

} // namespace phyto::dsp
