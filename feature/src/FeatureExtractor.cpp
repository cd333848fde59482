/**
 * @file FeatureExtractor.cpp
 * @brief FeatureExtractor implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <phyto/feature/FeatureExtractor.hpp>
#include <phyto/feature/FeaturePipeline.hpp>

#include <phyto/core/Log.hpp>

namespace phyto::feature {

using core::ErrorCode;
using core::Expected;
using core::makeError;

Expected<FeatureSet> toFeatureSet(const dsp::LabeledBatch &batch)
{
    FeatureSet set;
    set.y = batch.labels;
    if (batch.samples.empty())
        return set;

    const Eigen::VectorXd first = PHYTO_TRY(batch.samples.front().flatten());
    set.X.resize(static_cast<Eigen::Index>(batch.size()), first.size());
    set.X.row(0) = first.transpose();

    for (core::usize i = 1; i < batch.size(); ++i) {
        const Eigen::VectorXd row = PHYTO_TRY(batch.samples[i].flatten());
        if (row.size() != first.size()) {
            return makeError(ErrorCode::kShapeMismatch,
                "datapoint " + std::to_string(i) + " has " + std::to_string(row.size())
                + " features, expected " + std::to_string(first.size()));
        }
        set.X.row(static_cast<Eigen::Index>(i)) = row.transpose();
    }
    return set;
}

FeatureExtractor::FeatureExtractor(PipelineConfig config, dsp::Pipeline pipeline,
                                   std::unique_ptr<concurrency::ThreadPool> pool)
    : _config(config), _pipeline(std::move(pipeline)), _pool(std::move(pool))
{
}

Expected<FeatureExtractor> FeatureExtractor::create(PipelineConfig config)
{
    auto pipeline = PHYTO_TRY(buildFeaturePipeline(config));

    std::unique_ptr<concurrency::ThreadPool> pool;
    if (config.threads() != 1) {
        pool = std::make_unique<concurrency::ThreadPool>(config.threads());
        core::Log::info("feature", "using " + std::to_string(pool->threadCount()) + " worker threads");
    }

    return FeatureExtractor(config, std::move(pipeline), std::move(pool));
}

dsp::ApplyOptions FeatureExtractor::options() const noexcept
{
    dsp::ApplyOptions opts;
    opts.policy = _config.policy();
    opts.pool = _pool.get();
    return opts;
}

Expected<FeatureSet> FeatureExtractor::fitTransform(const dsp::LabeledBatch &training)
{
    if (training.samples.empty())
        return makeError(ErrorCode::kEmptyInput, "no training datapoints");

    auto features = PHYTO_TRY(_pipeline.fitApply(training, options()));
    _fitted = true;

    auto set = PHYTO_TRY(toFeatureSet(features));
    core::Log::info("feature", "training features: " + std::to_string(set.rows()) + " x "
        + std::to_string(set.cols()));
    return set;
}

Expected<FeatureSet> FeatureExtractor::transform(const dsp::LabeledBatch &batch) const
{
    if (!_fitted)
        return makeError(ErrorCode::kNotFitted, "feature extractor applied before fitTransform");

    auto features = PHYTO_TRY(_pipeline.apply(batch, options()));
    auto set = PHYTO_TRY(toFeatureSet(features));
    core::Log::info("feature", "transformed features: " + std::to_string(set.rows()) + " x "
        + std::to_string(set.cols()));
    return set;
}

} // namespace phyto::feature
