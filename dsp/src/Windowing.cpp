/**
 * @file Windowing.cpp
 * @brief Implementation of the Hann taper and the sliding-window transform.
 * @author MasterLaplace
 */

#include "phyto/dsp/Windowing.hpp"

#include <cmath>
#include <numbers>

namespace phyto::dsp {

using core::ErrorCode;
using core::Expected;
using core::makeError;
using core::usize;

std::vector<double> hannWindow(usize length)
{
    if (length == 0)
        return {};
    if (length == 1)
        return {1.0};

    std::vector<double> w(length);
    const double denom = static_cast<double>(length - 1);
    for (usize n = 0; n < length; ++n)
        w[n] = 0.5 * (1.0 - std::cos(2.0 * std::numbers::pi * static_cast<double>(n) / denom));
    return w;
}

Expected<Window> Window::create(InnerOp inner, usize count, bool hanning)
{
    PHYTO_TRY_VOID(expectValid(inner, "Window"));
    if (count == 0)
        return makeError(ErrorCode::kInvalidArgument, "Window count must be at least 1");
    return Window(std::move(inner), count, hanning);
}

Expected<WindowLayout> Window::layout(usize length) const
{
    WindowLayout geometry;
    geometry.size = 2 * length / (_count + 1);
    if (geometry.size < 2) {
        return makeError(ErrorCode::kShapeMismatch,
            "Window size for " + std::to_string(length) + " points and "
            + std::to_string(_count) + " windows is below 2");
    }
    geometry.stride = geometry.size / 2;
    geometry.count = (length - geometry.size) / geometry.stride + 1;
    return geometry;
}

Expected<Sample> Window::extract(const Sample &input) const
{
    PHYTO_TRY_VOID(expectReal(input, name()));
    const WindowLayout geometry = PHYTO_TRY(layout(input.length()));

    const RealMatrix &x = input.real();
    const auto size = static_cast<Eigen::Index>(geometry.size);

    Eigen::VectorXd taper;
    if (_hanning) {
        const auto w = hannWindow(geometry.size);
        taper = Eigen::Map<const Eigen::VectorXd>(w.data(), size);
    }

    std::vector<Sample> results;
    results.reserve(geometry.count);
    for (usize i = 0; i < geometry.count; ++i) {
        const auto start = static_cast<Eigen::Index>(i * geometry.stride);
        RealMatrix window = x.middleRows(start, size);
        if (_hanning)
            window = window.array().colwise() * taper.array();
        results.push_back(PHYTO_TRY(_inner(Sample(std::move(window)))));
    }
    return concatenate(results, name());
}

} // namespace phyto::dsp
