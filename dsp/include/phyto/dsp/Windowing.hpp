/**
 * @file Windowing.hpp
 * @brief Overlapping sliding windows with an optional Hann taper.
 * @author MasterLaplace
 *
 * Window splits a sample into roughly N half-overlapping windows, applies an
 * inner operation to each and concatenates the per-window results. With a
 * FeatureEnsemble inner operation this yields one feature block per window.
 *
 * @see InnerOp
 */

#pragma once

#ifndef PHYTO_DSP_WINDOWING_HPP
    #define PHYTO_DSP_WINDOWING_HPP

#include "phyto/dsp/InnerOp.hpp"

#include <vector>

namespace phyto::dsp {

/**
 * @brief Hann (raised cosine) coefficients w[n] = 0.5 * (1 - cos(2 pi n / (M - 1))).
 *
 * A length of 1 yields {1.0}.
 */
[[nodiscard]] std::vector<double> hannWindow(core::usize length);

/**
 * @brief Geometry of the windows laid over a sample.
 */
struct WindowLayout {
    core::usize size = 0;
    core::usize stride = 0;
    core::usize count = 0;
};

/**
 * @brief Sliding-window transform.
 *
 * Window size is floor(2 * len / (N + 1)) and the stride is size / 2;
 * windows start at 0, stride, 2 * stride, ... while they fit entirely in the
 * sample. N = 1 gives a single window covering the whole sample.
 *
 * @code
 *   auto ensemble = makeShared<FeatureEnsemble>();
 *   auto window = Window::create(InnerOp(*ensemble), 3, false);
 * @endcode
 */
class Window final : public ITransform {
public:
    /**
     * @param inner   Operation applied to every window
     * @param count   Nominal number of windows N (>= 1)
     * @param hanning Multiply each window by a Hann taper before @p inner
     */
    [[nodiscard]] static core::Expected<Window> create(InnerOp inner, core::usize count, bool hanning);

    [[nodiscard]] core::Expected<Sample> extract(const Sample &input) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "Window"; }

    /**
     * @brief Window geometry for a sample of @p length rows.
     *
     * @return The layout, or kShapeMismatch when the window size is below 2
     */
    [[nodiscard]] core::Expected<WindowLayout> layout(core::usize length) const;

private:
    Window(InnerOp inner, core::usize count, bool hanning)
        : _inner(std::move(inner)), _count(count), _hanning(hanning) {}

    InnerOp _inner;
    core::usize _count;
    bool _hanning;
};

} // namespace phyto::dsp

#endif // PHYTO_DSP_WINDOWING_HPP
