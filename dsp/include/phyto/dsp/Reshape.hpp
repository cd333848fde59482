/**
 * @file Reshape.hpp
 * @brief Structural transforms: per-channel mapping, transposition, splitting.
 * @author MasterLaplace
 */

#pragma once

#ifndef PHYTO_DSP_RESHAPE_HPP
    #define PHYTO_DSP_RESHAPE_HPP

#include "phyto/dsp/InnerOp.hpp"

#include <optional>

namespace phyto::dsp {

/**
 * @brief Applies an inner operation to every channel column separately and
 *        places the results side by side.
 *
 * Every per-channel result must be real and all must share the same number
 * of rows, otherwise the datapoint fails with kShapeMismatch.
 */
class MapChannels final : public ITransform {
public:
    [[nodiscard]] static core::Expected<MapChannels> create(InnerOp inner);

    [[nodiscard]] core::Expected<Sample> extract(const Sample &input) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "MapChannels"; }

private:
    explicit MapChannels(InnerOp inner) : _inner(std::move(inner)) {}

    InnerOp _inner;
};

/**
 * @brief Swaps the time and channel axes of a real or complex sample.
 */
class Transpose final : public ITransform {
public:
    [[nodiscard]] static core::Expected<Transpose> create();

    [[nodiscard]] core::Expected<Sample> extract(const Sample &input) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "Transpose"; }

private:
    Transpose() = default;
};

/**
 * @brief Partitions a sample into equal contiguous chunks along time.
 *
 * Exactly one of @p steps (chunk length) and @p divs (number of chunks) is
 * given. Without an inner operation the chunks are returned as a segments
 * sample; with one, the inner results are concatenated.
 * A length that does not divide evenly is a shape error.
 */
class Split final : public ITransform {
public:
    [[nodiscard]] static core::Expected<Split> create(
        std::optional<core::usize> steps,
        std::optional<core::usize> divs,
        std::optional<InnerOp> inner = std::nullopt);

    [[nodiscard]] core::Expected<Sample> extract(const Sample &input) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "Split"; }

private:
    Split(std::optional<core::usize> steps, std::optional<core::usize> divs, std::optional<InnerOp> inner)
        : _steps(steps), _divs(divs), _inner(std::move(inner)) {}

    [[nodiscard]] core::Expected<core::usize> chunkLength(core::usize length) const;

    std::optional<core::usize> _steps;
    std::optional<core::usize> _divs;
    std::optional<InnerOp> _inner;
};

} // namespace phyto::dsp

#endif // PHYTO_DSP_RESHAPE_HPP
