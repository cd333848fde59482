/**
 * @file Statistics.cpp
 * @brief Implementation of the moment-based statistics.
 */

#include "phyto/math/Statistics.hpp"

#include <cmath>
#include <numeric>

namespace phyto::math {

using core::ErrorCode;
using core::Expected;
using core::makeError;

Expected<double> Statistics::mean(std::span<const double> x)
{
    if (x.empty())
        return makeError(ErrorCode::kDomainError, "mean of an empty sequence");

    return std::accumulate(x.begin(), x.end(), 0.0) / static_cast<double>(x.size());
}

Expected<double> Statistics::meanAbsolute(std::span<const double> x)
{
    if (x.empty())
        return makeError(ErrorCode::kDomainError, "mean of an empty sequence");

    double sum = 0.0;
    for (const double v : x)
        sum += std::abs(v);

    return sum / static_cast<double>(x.size());
}

Expected<double> Statistics::moment(std::span<const double> x, unsigned order)
{
    const double m = PHYTO_TRY(mean(x));

    double sum = 0.0;
    for (const double v : x)
        sum += std::pow(v - m, static_cast<double>(order));

    return sum / static_cast<double>(x.size());
}

Expected<double> Statistics::variance(std::span<const double> x)
{
    return moment(x, 2);
}

Expected<double> Statistics::stdev(std::span<const double> x)
{
    return std::sqrt(PHYTO_TRY(variance(x)));
}

Expected<double> Statistics::skewness(std::span<const double> x)
{
    const double var = PHYTO_TRY(variance(x));
    if (var == 0.0)
        return makeError(ErrorCode::kDomainError, "skewness of a constant sequence");

    const double m3 = PHYTO_TRY(moment(x, 3));
    return m3 / std::pow(var, 1.5);
}

Expected<double> Statistics::kurtosis(std::span<const double> x)
{
    const double var = PHYTO_TRY(variance(x));
    if (var == 0.0)
        return makeError(ErrorCode::kDomainError, "kurtosis of a constant sequence");

    const double m4 = PHYTO_TRY(moment(x, 4));
    return m4 / (var * var) - 3.0;
}

std::vector<double> Statistics::differential(std::span<const double> x)
{
    if (x.size() < 2)
        return {};

    std::vector<double> diff(x.size() - 1);
    for (core::usize i = 0; i + 1 < x.size(); ++i)
        diff[i] = x[i + 1] - x[i];
    return diff;
}

} // namespace phyto::math
