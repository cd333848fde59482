/**
 * @file StandardScaler.hpp
 * @brief Per-feature standardization fitted on training data only.
 * @author MasterLaplace
 *
 * fit() learns each feature's mean and population variance from a batch of
 * feature vectors; extract() maps a vector to (x - mean) / sqrt(variance).
 * Features with zero variance keep a scale of 1. Applying the scaler never
 * modifies the fitted statistics, so validation and test splits are
 * transformed with the training statistics.
 */

#pragma once

#ifndef PHYTO_DSP_STANDARD_SCALER_HPP
    #define PHYTO_DSP_STANDARD_SCALER_HPP

#include "phyto/dsp/ITransform.hpp"

namespace phyto::dsp {

class StandardScaler final : public ITransform {
public:
    [[nodiscard]] static core::Expected<StandardScaler> create();

    /**
     * @brief Learns per-feature statistics; every sample is flattened into
     *        one feature vector.
     */
    [[nodiscard]] core::ExpectedVoid fit(
        std::span<const Sample> batch,
        std::span<const std::string> labels) override;

    /**
     * @return The standardized single-column vector, kNotFitted before fit()
     *         or kShapeMismatch when the dimension differs from the fit.
     */
    [[nodiscard]] core::Expected<Sample> extract(const Sample &input) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "StandardScaler"; }
    [[nodiscard]] bool isTrainable() const noexcept override { return true; }

    [[nodiscard]] bool fitted() const noexcept { return _fitted; }
    [[nodiscard]] const Eigen::VectorXd &mean() const noexcept { return _mean; }
    [[nodiscard]] const Eigen::VectorXd &variance() const noexcept { return _variance; }

private:
    StandardScaler() = default;

    Eigen::VectorXd _mean;
    Eigen::VectorXd _variance;
    Eigen::VectorXd _scale;
    bool _fitted = false;
};

} // namespace phyto::dsp

#endif // PHYTO_DSP_STANDARD_SCALER_HPP
