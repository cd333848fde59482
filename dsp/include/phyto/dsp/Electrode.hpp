/**
 * @file Electrode.hpp
 * @brief Combination of the two electrodes attached to one plant.
 * @author MasterLaplace
 *
 * Both transforms reduce a time x 2 sample to a single-channel sample and
 * reject any other channel count with kChannelCountMismatch.
 */

#pragma once

#ifndef PHYTO_DSP_ELECTRODE_HPP
    #define PHYTO_DSP_ELECTRODE_HPP

#include "phyto/dsp/ITransform.hpp"

namespace phyto::dsp {

/**
 * @brief (ch0 + ch1) / 2
 */
class ElectrodeAvg final : public ITransform {
public:
    [[nodiscard]] static core::Expected<ElectrodeAvg> create();

    [[nodiscard]] core::Expected<Sample> extract(const Sample &input) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "ElectrodeAvg"; }

private:
    ElectrodeAvg() = default;
};

/**
 * @brief ch0 - ch1
 */
class ElectrodeDiff final : public ITransform {
public:
    [[nodiscard]] static core::Expected<ElectrodeDiff> create();

    [[nodiscard]] core::Expected<Sample> extract(const Sample &input) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "ElectrodeDiff"; }

private:
    ElectrodeDiff() = default;
};

} // namespace phyto::dsp

#endif // PHYTO_DSP_ELECTRODE_HPP
