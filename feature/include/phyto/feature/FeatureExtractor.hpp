/**
 * @file FeatureExtractor.hpp
 * @brief Drives the feature pipeline over labeled batches.
 *
 * The extractor owns the pipeline and, when configured with more than one
 * thread, a ThreadPool for batch application. fitTransform() is called once
 * on the training split; transform() is then applied to validation and test
 * splits with the statistics learned from training.
 *
 * @code
 *   auto config = PipelineConfig::Builder{}.windowCount(3).build();
 *   auto extractor = FeatureExtractor::create(*config);
 *   auto train = extractor->fitTransform(trainingBatch);
 *   auto test  = extractor->transform(testBatch);
 * @endcode
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PHYTO_FEATURE_FEATURE_EXTRACTOR_HPP
    #define PHYTO_FEATURE_FEATURE_EXTRACTOR_HPP

    #include "PipelineConfig.hpp"

    #include <phyto/concurrency/ThreadPool.hpp>
    #include <phyto/dsp/Pipeline.hpp>

    #include <Eigen/Dense>

    #include <memory>

namespace phyto::feature {

/**
 * @brief Feature matrix (one row per datapoint) and its label vector.
 */
struct FeatureSet {
    Eigen::MatrixXd X;
    dsp::Labels y;

    [[nodiscard]] core::usize rows() const noexcept { return static_cast<core::usize>(X.rows()); }
    [[nodiscard]] core::usize cols() const noexcept { return static_cast<core::usize>(X.cols()); }
};

/**
 * @brief Stacks the flattened samples of @p batch as matrix rows.
 *
 * @return kShapeMismatch when the samples flatten to different lengths
 */
[[nodiscard]] core::Expected<FeatureSet> toFeatureSet(const dsp::LabeledBatch &batch);

class FeatureExtractor final {
public:
    [[nodiscard]] static core::Expected<FeatureExtractor> create(PipelineConfig config);

    FeatureExtractor(const FeatureExtractor &) = delete;
    FeatureExtractor &operator=(const FeatureExtractor &) = delete;
    FeatureExtractor(FeatureExtractor &&) = default;
    FeatureExtractor &operator=(FeatureExtractor &&) = default;
    ~FeatureExtractor() = default;

    /**
     * @brief Fits the pipeline on @p training and returns its features.
     */
    [[nodiscard]] core::Expected<FeatureSet> fitTransform(const dsp::LabeledBatch &training);

    /**
     * @brief Applies the fitted pipeline without refitting.
     *
     * @return kNotFitted before fitTransform()
     */
    [[nodiscard]] core::Expected<FeatureSet> transform(const dsp::LabeledBatch &batch) const;

    [[nodiscard]] bool fitted() const noexcept { return _fitted; }
    [[nodiscard]] const PipelineConfig &config() const noexcept { return _config; }
    [[nodiscard]] const dsp::Pipeline &pipeline() const noexcept { return _pipeline; }

private:
    FeatureExtractor(PipelineConfig config, dsp::Pipeline pipeline,
                     std::unique_ptr<concurrency::ThreadPool> pool);

    [[nodiscard]] dsp::ApplyOptions options() const noexcept;

    PipelineConfig _config;
    dsp::Pipeline _pipeline;
    std::unique_ptr<concurrency::ThreadPool> _pool;
    bool _fitted = false;
};

} // namespace phyto::feature

#endif // PHYTO_FEATURE_FEATURE_EXTRACTOR_HPP
