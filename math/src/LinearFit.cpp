/**
 * @file LinearFit.cpp
 * @brief Implementation of the least-squares line fit.
 */

#include "phyto/math/LinearFit.hpp"

#include <Eigen/Dense>

#include <string>

namespace phyto::math {

core::Expected<LineFit> fitLine(std::span<const double> y)
{
    if (y.size() < 2) {
        return core::makeError(core::ErrorCode::kDegenerateSignal,
            "line fit needs at least 2 points, got " + std::to_string(y.size()));
    }

    const auto n = static_cast<Eigen::Index>(y.size());

    Eigen::MatrixXd design(n, 2);
    design.col(0) = Eigen::VectorXd::LinSpaced(n, 0.0, static_cast<double>(n - 1));
    design.col(1).setOnes();

    const Eigen::Map<const Eigen::VectorXd> target(y.data(), n);
    const Eigen::Vector2d params = design.colPivHouseholderQr().solve(target);

    return LineFit{.slope = params(0), .intercept = params(1)};
}

} // namespace phyto::math
