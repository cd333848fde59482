/**
 * @file Smoothing.hpp
 * @brief Moving-average smoothing and the residual noise it leaves.
 * @author MasterLaplace
 *
 * Both transforms use a running-sum accumulator (add the entering point,
 * subtract the leaving one) so one pass is linear in the sample length.
 * Over their common region they satisfy x[i + n/2] == avg[i] + noise[i].
 */

#pragma once

#ifndef PHYTO_DSP_SMOOTHING_HPP
    #define PHYTO_DSP_SMOOTHING_HPP

#include "phyto/dsp/ITransform.hpp"

#include <span>
#include <vector>

namespace phyto::dsp {

/**
 * @brief Mean of every full window: avg[i] = mean(x[i .. i + n - 1]).
 *
 * @return len - n + 1 values (empty when n > len)
 */
[[nodiscard]] std::vector<double> runningMean(std::span<const double> x, core::usize n);

/**
 * @brief Moving average of width n, length len - n + 1.
 */
class MovingAvg final : public ITransform {
public:
    [[nodiscard]] static core::Expected<MovingAvg> create(core::usize width);

    [[nodiscard]] core::Expected<Sample> extract(const Sample &input) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "MovingAvg"; }

private:
    explicit MovingAvg(core::usize width) : _width(width) {}

    core::usize _width;
};

/**
 * @brief Residual x[i + n/2] - avg[i] for i < len - n.
 */
class Noise final : public ITransform {
public:
    [[nodiscard]] static core::Expected<Noise> create(core::usize width);

    [[nodiscard]] core::Expected<Sample> extract(const Sample &input) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "Noise"; }

private:
    explicit Noise(core::usize width) : _width(width) {}

    core::usize _width;
};

} // namespace phyto::dsp

#endif // PHYTO_DSP_SMOOTHING_HPP
