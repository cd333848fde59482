/**
 * @file InnerOp.hpp
 * @brief Operation nested inside a higher-order transform.
 * @author MasterLaplace
 *
 * Window, DecimateWindow, Split and MapChannels apply an inner operation to
 * pieces of their input. The inner operation is either another transform
 * (shared, immutable) or a plain function; the choice is made once when
 * the InnerOp is constructed.
 *
 * @code
 *   auto ensemble = makeShared<FeatureEnsemble>();
 *   auto window = Window::create(InnerOp(*ensemble), 3, false);
 *
 *   InnerOp square([](const Sample &s) -> core::Expected<Sample> {
 *       return Sample(RealMatrix(s.real().array().square()));
 *   }, "square");
 * @endcode
 */

#pragma once

#ifndef PHYTO_DSP_INNER_OP_HPP
    #define PHYTO_DSP_INNER_OP_HPP

#include "phyto/dsp/ITransform.hpp"

#include <concepts>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace phyto::dsp {

using SampleFn = std::function<core::Expected<Sample>(const Sample &)>;

class InnerOp {
public:
    /**
     * @brief Wraps a shared transform.
     */
    InnerOp(std::shared_ptr<const ITransform> transform);

    /**
     * @brief Wraps a raw function.
     *
     * @param fn    Callable mapping a Sample to a Sample
     * @param label Name used in diagnostics
     */
    InnerOp(SampleFn fn, std::string label = "fn");

    /**
     * @brief True when the wrapped transform or function is callable.
     */
    [[nodiscard]] bool valid() const noexcept;

    [[nodiscard]] core::Expected<Sample> operator()(const Sample &input) const;

    [[nodiscard]] std::string_view name() const noexcept { return _label; }

private:
    std::variant<std::shared_ptr<const ITransform>, SampleFn> _op;
    std::string _label;
};

/**
 * @brief Fails with kInvalidArgument when @p op is not callable.
 */
[[nodiscard]] core::ExpectedVoid expectValid(const InnerOp &op, std::string_view owner);

/**
 * @brief Creates a transform through T::create and shares it immutably.
 */
template <typename T, typename... Args>
    requires std::derived_from<T, ITransform>
[[nodiscard]] core::Expected<std::shared_ptr<const T>> makeShared(Args &&...args)
{
    T transform = PHYTO_TRY(T::create(std::forward<Args>(args)...));
    return std::make_shared<const T>(std::move(transform));
}

} // namespace phyto::dsp

#endif // PHYTO_DSP_INNER_OP_HPP
