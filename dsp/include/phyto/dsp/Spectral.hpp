/**
 * @file Spectral.hpp
 * @brief Frequency and time-frequency decompositions.
 * @author MasterLaplace
 *
 * Fourier produces a complex sample of the non-negative frequency bins.
 * DiscreteWavelet produces the coarse coefficient bands of a multilevel
 * Daubechies decomposition, either concatenated or as separate segments.
 */

#pragma once

#ifndef PHYTO_DSP_SPECTRAL_HPP
    #define PHYTO_DSP_SPECTRAL_HPP

#include "phyto/dsp/ITransform.hpp"

#include <phyto/math/Wavelet.hpp>

namespace phyto::dsp {

/**
 * @brief Real-input DFT per channel, len / 2 + 1 complex bins.
 */
class Fourier final : public ITransform {
public:
    [[nodiscard]] static core::Expected<Fourier> create();

    [[nodiscard]] core::Expected<Sample> extract(const Sample &input) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "Fourier"; }

private:
    Fourier() = default;
};

/**
 * @brief Multilevel wavelet decomposition keeping the coarsest bands.
 *
 * The decomposition to depth L yields [cA_L, cD_L, ..., cD_1]; the arrays
 * at positions [0, L - D) are kept. With @p concat they are stacked along
 * time into one real sample, otherwise each band is one segment.
 *
 * @code
 *   auto dwt = DiscreteWavelet::create("db2", 4, 1, true);
 * @endcode
 */
class DiscreteWavelet final : public ITransform {
public:
    /**
     * @param kind   Wavelet name ("haar", "db1".."db4")
     * @param level  Decomposition depth L (>= 1)
     * @param drop   D, must satisfy D < L
     * @param concat Concatenate the kept bands
     */
    [[nodiscard]] static core::Expected<DiscreteWavelet> create(
        std::string_view kind, core::usize level, core::usize drop, bool concat = true);

    [[nodiscard]] core::Expected<Sample> extract(const Sample &input) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "DiscreteWavelet"; }

    [[nodiscard]] core::usize keptBands() const noexcept { return _level - _drop; }

private:
    DiscreteWavelet(math::Wavelet wavelet, core::usize level, core::usize drop, bool concat)
        : _wavelet(std::move(wavelet)), _level(level), _drop(drop), _concat(concat) {}

    math::Wavelet _wavelet;
    core::usize _level;
    core::usize _drop;
    bool _concat;
};

} // namespace phyto::dsp

#endif // PHYTO_DSP_SPECTRAL_HPP
