/**
 * @file InnerOp.cpp
 * @brief Implementation of the inner-operation sum type.
 * @author MasterLaplace
 */

#include "phyto/dsp/InnerOp.hpp"

namespace phyto::dsp {

InnerOp::InnerOp(std::shared_ptr<const ITransform> transform)
    : _op(std::move(transform))
{
    const auto &ptr = std::get<std::shared_ptr<const ITransform>>(_op);
    _label = ptr ? std::string(ptr->name()) : "null";
}

InnerOp::InnerOp(SampleFn fn, std::string label)
    : _op(std::move(fn)), _label(std::move(label))
{
}

bool InnerOp::valid() const noexcept
{
    return std::visit([](const auto &op) { return static_cast<bool>(op); }, _op);
}

core::Expected<Sample> InnerOp::operator()(const Sample &input) const
{
    if (const auto *transform = std::get_if<std::shared_ptr<const ITransform>>(&_op))
        return (*transform)->extract(input);
    return std::get<SampleFn>(_op)(input);
}

core::ExpectedVoid expectValid(const InnerOp &op, std::string_view owner)
{
    if (!op.valid()) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::string(owner) + " requires a callable inner operation");
    }
    return {};
}

} // namespace phyto::dsp
