/**
 * @file Pipeline.hpp
 * @brief Fluent Builder for composing sequential transforms.
 * @author MasterLaplace
 *
 * The Pipeline chains ITransform instances sequentially: each stage
 * receives the output of the previous one. Processing short-circuits on the
 * first error, propagating the std::unexpected through the chain.
 *
 * @code
 *   auto pipeline = Pipeline::builder()
 *       .add<ElectrodeAvg>()
 *       .add<Detrend>(100)
 *       .add<PostStimulus>(60, 100)
 *       .add<StandardScaler>()
 *       .build();
 *
 *   auto features = pipeline->fitApply(training);
 * @endcode
 *
 * @see ITransform
 */

#pragma once

#ifndef PHYTO_DSP_PIPELINE_HPP
    #define PHYTO_DSP_PIPELINE_HPP

#include "phyto/dsp/ITransform.hpp"

#include <concepts>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace phyto::dsp {

class Pipeline;

/**
 * @brief Fluent builder that accumulates transforms for a Pipeline.
 *
 * add<T>(args...) forwards to T::create(args...). The first configuration
 * error is kept and reported by build(); later add() calls are ignored.
 */
class PipelineBuilder {
public:
    /**
     * @brief Creates and appends a transform of type T.
     *
     * @tparam T    A concrete class derived from ITransform with a static create()
     * @tparam Args Argument types for T::create
     * @param args  Arguments forwarded to T::create
     * @return Reference to this builder (for chaining)
     */
    template <typename T, typename... Args>
        requires std::derived_from<T, ITransform>
    PipelineBuilder &add(Args &&...args)
    {
        if (_error)
            return *this;

        auto stage = T::create(std::forward<Args>(args)...);
        if (!stage) {
            _error = std::move(stage.error());
            return *this;
        }
        _stages.push_back(std::make_unique<T>(std::move(*stage)));
        return *this;
    }

    /**
     * @brief Appends an already constructed transform (e.g. a nested Pipeline).
     */
    PipelineBuilder &add(std::unique_ptr<ITransform> stage);

    /**
     * @brief Finalizes construction.
     *
     * @return The Pipeline, or the first configuration error recorded by add()
     */
    [[nodiscard]] core::Expected<Pipeline> build();

private:
    std::vector<std::unique_ptr<ITransform>> _stages;
    std::optional<core::Error> _error;
};

/**
 * @brief An ordered chain of transforms, itself usable as a transform.
 *
 * Immutable after build() except for fit(). Thread-safe for concurrent
 * extract() calls once fitted.
 */
class Pipeline final : public ITransform {
public:
    Pipeline(Pipeline &&) = default;
    Pipeline &operator=(Pipeline &&) = default;

    /**
     * @brief Returns a PipelineBuilder for fluent stage composition.
     */
    [[nodiscard]] static PipelineBuilder builder();

    /**
     * @brief Fits stage k on the output of stages 0..k-1 over @p batch.
     */
    [[nodiscard]] core::ExpectedVoid fit(
        std::span<const Sample> batch,
        std::span<const std::string> labels) override;

    /**
     * @brief Fits every trainable stage and returns the transformed training batch.
     *
     * Datapoints dropped by the degenerate policy in an early stage are
     * excluded from the fit of later stages, and their labels with them.
     */
    [[nodiscard]] core::Expected<LabeledBatch> fitApply(
        const LabeledBatch &batch,
        const ApplyOptions &options = {});

    /**
     * @brief Runs the input through every stage sequentially.
     */
    [[nodiscard]] core::Expected<Sample> extract(const Sample &input) const override;

    [[nodiscard]] std::string_view name() const noexcept override;

    [[nodiscard]] bool isTrainable() const noexcept override;

    [[nodiscard]] core::usize stageCount() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    /// Precondition: index < stageCount().
    [[nodiscard]] const ITransform &stage(core::usize index) const { return *_stages[index]; }

private:
    friend class PipelineBuilder;

    explicit Pipeline(std::vector<std::unique_ptr<ITransform>> stages);

    std::vector<std::unique_ptr<ITransform>> _stages;
};

} // namespace phyto::dsp

#endif // PHYTO_DSP_PIPELINE_HPP
