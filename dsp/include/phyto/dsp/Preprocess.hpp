/**
 * @file Preprocess.hpp
 * @brief Time-domain conditioning transforms applied before feature extraction.
 * @author MasterLaplace
 *
 * Every transform here works channel by channel on a real sample. The
 * stimulus window (the trailing samples of a datapoint that follow the
 * stimulus) is an explicit constructor parameter.
 */

#pragma once

#ifndef PHYTO_DSP_PREPROCESS_HPP
    #define PHYTO_DSP_PREPROCESS_HPP

#include "phyto/dsp/ITransform.hpp"

namespace phyto::dsp {

/**
 * @brief Subtracts each channel's mean.
 */
class MeanSubtract final : public ITransform {
public:
    [[nodiscard]] static core::Expected<MeanSubtract> create();

    [[nodiscard]] core::Expected<Sample> extract(const Sample &input) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "MeanSubtract"; }

private:
    MeanSubtract() = default;
};

/**
 * @brief Keeps the leading floor(len * fraction) points.
 */
class Clip final : public ITransform {
public:
    /**
     * @param fraction Portion of the signal to keep, in (0, 1]
     */
    [[nodiscard]] static core::Expected<Clip> create(double fraction);

    [[nodiscard]] core::Expected<Sample> extract(const Sample &input) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "Clip"; }

    [[nodiscard]] double fraction() const noexcept { return _fraction; }

private:
    explicit Clip(double fraction) : _fraction(fraction) {}

    double _fraction;
};

/**
 * @brief Removes the linear trend of the pre-stimulus baseline.
 *
 * A least-squares line is fitted on the first len - windowOffset points of
 * each channel, extrapolated over the whole sample and subtracted.
 * A baseline shorter than two points is a shape error.
 */
class Detrend final : public ITransform {
public:
    [[nodiscard]] static core::Expected<Detrend> create(core::usize windowOffset);

    [[nodiscard]] core::Expected<Sample> extract(const Sample &input) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "Detrend"; }

private:
    explicit Detrend(core::usize windowOffset) : _windowOffset(windowOffset) {}

    core::usize _windowOffset;
};

/**
 * @brief Discards the pre-stimulus data.
 *
 * Keeps x[offset - windowOffset:], where a negative start counts from the
 * end of the sample and is clamped to [0, len]. With offset == windowOffset
 * the whole sample is kept; with offset == 0 only the stimulus window is.
 */
class PostStimulus final : public ITransform {
public:
    [[nodiscard]] static core::Expected<PostStimulus> create(core::i64 offset, core::usize windowOffset);

    [[nodiscard]] core::Expected<Sample> extract(const Sample &input) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "PostStimulus"; }

    /**
     * @brief First kept row for a sample of @p length rows.
     */
    [[nodiscard]] core::usize startIndex(core::usize length) const noexcept;

private:
    PostStimulus(core::i64 offset, core::usize windowOffset)
        : _offset(offset), _windowOffset(windowOffset) {}

    core::i64 _offset;
    core::usize _windowOffset;
};

/**
 * @brief Keeps only the pre-stimulus data, as a negative control.
 *
 * A classifier that still performs well on this output is learning the
 * experimental context rather than the response to the stimulus.
 */
class PreStimulus final : public ITransform {
public:
    [[nodiscard]] static core::Expected<PreStimulus> create(core::usize windowOffset);

    [[nodiscard]] core::Expected<Sample> extract(const Sample &input) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "PreStimulus"; }

private:
    explicit PreStimulus(core::usize windowOffset) : _windowOffset(windowOffset) {}

    core::usize _windowOffset;
};

} // namespace phyto::dsp

#endif // PHYTO_DSP_PREPROCESS_HPP
