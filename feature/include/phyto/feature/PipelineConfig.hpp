/**
 * @file PipelineConfig.hpp
 * @brief Feature pipeline configuration (Builder pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PHYTO_FEATURE_PIPELINE_CONFIG_HPP
    #define PHYTO_FEATURE_PIPELINE_CONFIG_HPP

    #include <phyto/core/Constants.hpp>
    #include <phyto/core/Error.hpp>
    #include <phyto/core/Types.hpp>
    #include <phyto/dsp/ITransform.hpp>

    #include <optional>
    #include <string_view>

namespace phyto::feature {

/** @brief How the two electrodes of a plant are combined. */
enum class ElectrodeMode : core::u8 {
    kAverage,
    kDifference
};

[[nodiscard]] constexpr std::string_view electrodeModeName(ElectrodeMode mode) noexcept
{
    return mode == ElectrodeMode::kAverage ? "avg" : "diff";
}

/** @brief Immutable feature pipeline configuration. */
class PipelineConfig
{
public:
    /** @brief Fluent builder for PipelineConfig; build() validates. */
    class Builder
    {
    public:
        Builder& windowOffset(core::usize samples) noexcept;
        Builder& postOffset(core::i64 samples) noexcept;
        Builder& windowCount(core::usize n) noexcept;
        Builder& hanning(bool enabled) noexcept;
        Builder& multiScale(bool enabled) noexcept;
        Builder& scaleCount(core::usize n) noexcept;
        Builder& electrodeMode(ElectrodeMode mode) noexcept;
        Builder& policy(dsp::DegeneratePolicy policy) noexcept;
        Builder& threads(core::u32 n) noexcept;

        /**
         * Without an explicit scaleCount, the multi-scale bank goes as deep
         * as the post-stimulus segment still fills every window with enough
         * points for the feature ensemble.
         *
         * @return The configuration, or kInvalidArgument for a zero window
         *         offset, a zero window count, a scale count outside [1, 9]
         *         or one too deep for the post-stimulus segment
         */
        [[nodiscard]] core::Expected<PipelineConfig> build() const;

    private:
        core::usize _windowOffset{core::kDefaultWindowOffset};
        core::i64 _postOffset{core::kDefaultPostOffset};
        core::usize _windowCount{core::kDefaultWindowCount};
        bool _hanning{false};
        bool _multiScale{false};
        std::optional<core::usize> _scaleCount;
        ElectrodeMode _electrodeMode{ElectrodeMode::kAverage};
        dsp::DegeneratePolicy _policy{dsp::DegeneratePolicy::kPropagate};
        core::u32 _threads{1};
    };

    [[nodiscard]] core::usize           windowOffset()  const noexcept { return _windowOffset; }
    [[nodiscard]] core::i64             postOffset()    const noexcept { return _postOffset; }
    [[nodiscard]] core::usize           windowCount()   const noexcept { return _windowCount; }
    [[nodiscard]] bool                  hanning()       const noexcept { return _hanning; }
    [[nodiscard]] bool                  multiScale()    const noexcept { return _multiScale; }
    [[nodiscard]] core::usize           scaleCount()    const noexcept { return _scaleCount; }
    [[nodiscard]] ElectrodeMode         electrodeMode() const noexcept { return _electrodeMode; }
    [[nodiscard]] dsp::DegeneratePolicy policy()        const noexcept { return _policy; }
    /**
     * @brief Rows PostStimulus keeps, when they do not depend on the
     *        datapoint length (postOffset below windowOffset).
     */
    [[nodiscard]] std::optional<core::usize> postStimulusLength() const noexcept;

    /// Worker threads for batch application; 1 runs sequentially, 0 uses every core.
    [[nodiscard]] core::u32             threads()       const noexcept { return _threads; }

private:
    friend class Builder;

    core::usize _windowOffset{core::kDefaultWindowOffset};
    core::i64 _postOffset{core::kDefaultPostOffset};
    core::usize _windowCount{core::kDefaultWindowCount};
    bool _hanning{false};
    bool _multiScale{false};
    core::usize _scaleCount{core::kDecimationScaleCount};
    ElectrodeMode _electrodeMode{ElectrodeMode::kAverage};
    dsp::DegeneratePolicy _policy{dsp::DegeneratePolicy::kPropagate};
    core::u32 _threads{1};
};

/**
 * @brief Number of scales 1, 2, 4, ... whose decimated @p segment still
 *        splits into @p windowCount windows of kEnsembleMinPoints points;
 *        at least 1, at most kDecimationScaleCount.
 */
[[nodiscard]] core::usize fittingScaleCount(core::usize segment, core::usize windowCount) noexcept;

} // namespace phyto::feature

#endif // PHYTO_FEATURE_PIPELINE_CONFIG_HPP
