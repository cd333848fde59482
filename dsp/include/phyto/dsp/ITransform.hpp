/**
 * @file ITransform.hpp
 * @brief Abstract interface for a single signal transform.
 * @author MasterLaplace
 *
 * Every signal operation (detrending, decimation, windowing, wavelet
 * decomposition, feature ensembles, scaling...) implements this interface.
 * Transforms are composed sequentially by the Pipeline class using the
 * Builder pattern.
 *
 * @see Pipeline
 */

#pragma once

#ifndef PHYTO_DSP_ITRANSFORM_HPP
    #define PHYTO_DSP_ITRANSFORM_HPP

#include "phyto/dsp/Sample.hpp"

#include <phyto/core/Error.hpp>
#include <phyto/core/Types.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace phyto::concurrency {
class ThreadPool;
}

namespace phyto::dsp {

/**
 * @brief What to do when a single datapoint yields a degenerate signal
 *        (empty segment, zero variance, domain error).
 *
 * Shape and configuration errors always abort the batch.
 */
enum class DegeneratePolicy : core::u8 {
    kPropagate,
    kDrop
};

struct ApplyOptions {
    DegeneratePolicy policy = DegeneratePolicy::kPropagate;
    /// Optional worker pool; samples are processed sequentially when null.
    concurrency::ThreadPool *pool = nullptr;
};

/**
 * @brief Output of a batch application.
 *
 * sourceIndices[i] is the index in the input batch of samples[i]; it is
 * the identity unless datapoints were dropped.
 */
struct BatchResult {
    Batch samples;
    std::vector<core::usize> sourceIndices;
};

/**
 * @brief A batch with its parallel label vector.
 */
struct LabeledBatch {
    Batch samples;
    Labels labels;

    [[nodiscard]] core::usize size() const noexcept { return samples.size(); }
};

/**
 * @brief A transform from Sample to Sample.
 *
 * Contract:
 *  - configuration is validated by the concrete class's create() factory
 *    and is immutable afterwards;
 *  - extract() must not modify shared state, so a fitted transform can be
 *    applied from several threads at once;
 *  - name() returns a stable, non-empty identifier for diagnostics.
 */
class ITransform {
public:
    virtual ~ITransform() = default;

    ITransform(const ITransform &) = delete;
    ITransform &operator=(const ITransform &) = delete;
    ITransform(ITransform &&) = default;
    ITransform &operator=(ITransform &&) = default;

    /**
     * @brief Learns batch statistics. No-op unless overridden.
     *
     * @param batch  Training samples
     * @param labels Parallel labels (may be empty for unsupervised fits)
     */
    [[nodiscard]] virtual core::ExpectedVoid fit(
        std::span<const Sample> batch,
        std::span<const std::string> labels);

    /**
     * @brief Transforms a single sample.
     *
     * @param input The sample to transform (not modified)
     * @return A new Sample on success, or an Error describing the failure
     */
    [[nodiscard]] virtual core::Expected<Sample> extract(const Sample &input) const = 0;

    /**
     * @brief Returns a human-readable name for this transform.
     */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /**
     * @brief True when fit() learns state that extract() depends on.
     */
    [[nodiscard]] virtual bool isTrainable() const noexcept { return false; }

    /**
     * @brief Maps extract() over a batch, preserving order.
     *
     * Fails with kShapeMismatch when the batch is not uniformly shaped.
     */
    [[nodiscard]] core::Expected<BatchResult> apply(
        std::span<const Sample> batch,
        const ApplyOptions &options = {}) const;

    /**
     * @brief Maps extract() over a labeled batch, keeping labels aligned.
     */
    [[nodiscard]] core::Expected<LabeledBatch> apply(
        const LabeledBatch &batch,
        const ApplyOptions &options = {}) const;

protected:
    ITransform() = default;
};

} // namespace phyto::dsp

#endif // PHYTO_DSP_ITRANSFORM_HPP
