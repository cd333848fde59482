/**
 * @file StandardScaler.cpp
 * @brief Implementation of the standard scaler.
 * @author MasterLaplace
 */

#include "phyto/dsp/StandardScaler.hpp"

#include <phyto/core/Log.hpp>

namespace phyto::dsp {

using core::ErrorCode;
using core::Expected;
using core::ExpectedVoid;
using core::makeError;

Expected<StandardScaler> StandardScaler::create()
{
    return StandardScaler{};
}

ExpectedVoid StandardScaler::fit(std::span<const Sample> batch, std::span<const std::string> /*labels*/)
{
    if (batch.empty())
        return makeError(ErrorCode::kEmptyInput, "StandardScaler fit on an empty batch");

    const Eigen::VectorXd first = PHYTO_TRY(batch.front().flatten());
    const Eigen::Index dim = first.size();
    Eigen::MatrixXd features(static_cast<Eigen::Index>(batch.size()), dim);
    features.row(0) = first.transpose();

    for (std::size_t i = 1; i < batch.size(); ++i) {
        const Eigen::VectorXd row = PHYTO_TRY(batch[i].flatten());
        if (row.size() != dim) {
            return makeError(ErrorCode::kShapeMismatch,
                "StandardScaler sample " + std::to_string(i) + " has " + std::to_string(row.size())
                + " features, expected " + std::to_string(dim));
        }
        features.row(static_cast<Eigen::Index>(i)) = row.transpose();
    }

    _mean = features.colwise().mean().transpose();
    const Eigen::MatrixXd centred = features.rowwise() - _mean.transpose();
    _variance = centred.array().square().colwise().mean().transpose();
    _scale = _variance.array().sqrt();
    for (Eigen::Index j = 0; j < dim; ++j) {
        if (_scale(j) == 0.0)
            _scale(j) = 1.0;
    }
    _fitted = true;

    core::Log::debug("dsp", "StandardScaler fitted " + std::to_string(dim) + " features on "
        + std::to_string(batch.size()) + " samples");
    return {};
}

Expected<Sample> StandardScaler::extract(const Sample &input) const
{
    if (!_fitted)
        return makeError(ErrorCode::kNotFitted, "StandardScaler applied before fit");

    const Eigen::VectorXd x = PHYTO_TRY(input.flatten());
    if (x.size() != _mean.size()) {
        return makeError(ErrorCode::kShapeMismatch,
            "StandardScaler expects " + std::to_string(_mean.size()) + " features, got "
            + std::to_string(x.size()));
    }

    RealMatrix out = ((x - _mean).array() / _scale.array()).matrix();
    return Sample(std::move(out));
}

} // namespace phyto::dsp
