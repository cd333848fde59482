/**
 * @file Decimate.hpp
 * @brief Anti-aliased downsampling and the multi-scale decimation bank.
 * @author MasterLaplace
 */

#pragma once

#ifndef PHYTO_DSP_DECIMATE_HPP
    #define PHYTO_DSP_DECIMATE_HPP

#include "phyto/dsp/InnerOp.hpp"

#include <phyto/core/Constants.hpp>

#include <vector>

namespace phyto::dsp {

/**
 * @brief Low-pass FIR filter (order 20 * factor, Hamming window) followed by
 *        keeping every factor-th point, per channel.
 *
 * A factor of 1 returns the input unchanged. The filter is designed once at
 * construction; output length is ceil(len / factor).
 */
class Decimate final : public ITransform {
public:
    [[nodiscard]] static core::Expected<Decimate> create(core::usize factor);

    [[nodiscard]] core::Expected<Sample> extract(const Sample &input) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "Decimate"; }

    [[nodiscard]] core::usize factor() const noexcept { return _factor; }

private:
    Decimate(core::usize factor, std::vector<double> taps)
        : _factor(factor), _taps(std::move(taps)) {}

    core::usize _factor;
    std::vector<double> _taps;
};

/**
 * @brief Applies an inner operation to the sample decimated at 1, 2, 4, ...
 *        and concatenates the results along the time axis.
 *
 * The default bank has 9 scales (1..256).
 */
class DecimateWindow final : public ITransform {
public:
    /**
     * @param inner      Operation applied at every scale
     * @param scaleCount Number of power-of-two scales, in [1, 9]
     */
    [[nodiscard]] static core::Expected<DecimateWindow> create(
        InnerOp inner, core::usize scaleCount = core::kDecimationScaleCount);

    [[nodiscard]] core::Expected<Sample> extract(const Sample &input) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "DecimateWindow"; }

    [[nodiscard]] core::usize scaleCount() const noexcept { return _bank.size(); }

private:
    DecimateWindow(InnerOp inner, std::vector<Decimate> bank)
        : _inner(std::move(inner)), _bank(std::move(bank)) {}

    InnerOp _inner;
    std::vector<Decimate> _bank;
};

} // namespace phyto::dsp

#endif // PHYTO_DSP_DECIMATE_HPP
