/**
 * @file TestWavelet.cpp
 * @brief Unit tests for phyto::math::Wavelet.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "phyto/math/Wavelet.hpp"

#include <cmath>
#include <vector>

using namespace phyto;
using namespace phyto::math;
using Catch::Matchers::WithinAbs;

TEST_CASE("Wavelet::byName knows the Daubechies family", "[math][wavelet]")
{
    REQUIRE(Wavelet::byName("haar").has_value());
    REQUIRE(Wavelet::byName("db4")->filterLength() == 8);

    auto unknown = Wavelet::byName("coif9");
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error().code() == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("Haar dwt of a short ramp", "[math][wavelet]")
{
    auto haar = Wavelet::byName("haar");
    REQUIRE(haar.has_value());

    const auto level = haar->dwt(std::vector<double>{1.0, 2.0, 3.0, 4.0});
    const double r2 = std::sqrt(2.0);

    REQUIRE(level.approximation.size() == 2);
    REQUIRE_THAT(level.approximation[0], WithinAbs(3.0 / r2, 1e-12));
    REQUIRE_THAT(level.approximation[1], WithinAbs(7.0 / r2, 1e-12));
    REQUIRE_THAT(level.detail[0], WithinAbs(-1.0 / r2, 1e-12));
    REQUIRE_THAT(level.detail[1], WithinAbs(-1.0 / r2, 1e-12));
}

TEST_CASE("Wavelet::decompose orders coarsest first", "[math][wavelet]")
{
    auto db2 = Wavelet::byName("db2");
    REQUIRE(db2.has_value());

    std::vector<double> x(64);
    for (std::size_t i = 0; i < x.size(); ++i)
        x[i] = std::sin(0.3 * static_cast<double>(i));

    auto coeffs = db2->decompose(x, 3);
    REQUIRE(coeffs.has_value());
    REQUIRE(coeffs->size() == 4);

    // floor((n + 3) / 2) per level: 64 -> 33 -> 18 -> 10
    REQUIRE((*coeffs)[0].size() == 10);
    REQUIRE((*coeffs)[1].size() == 10);
    REQUIRE((*coeffs)[2].size() == 18);
    REQUIRE((*coeffs)[3].size() == 33);
}

TEST_CASE("Wavelet::decompose computes levels past the maximum", "[math][wavelet]")
{
    auto db4 = Wavelet::byName("db4");
    REQUIRE(db4.has_value());

    const std::vector<double> x(20, 1.0);
    REQUIRE(db4->maxLevel(x.size()) == 1);

    // floor((n + 7) / 2) per level: 20 -> 13 -> 10
    auto coeffs = db4->decompose(x, 2);
    REQUIRE(coeffs.has_value());
    REQUIRE(coeffs->size() == 3);
    REQUIRE((*coeffs)[0].size() == 10);
    REQUIRE((*coeffs)[1].size() == 10);
    REQUIRE((*coeffs)[2].size() == 13);

    // a constant signal has no detail under symmetric extension
    for (double d : (*coeffs)[2])
        REQUIRE_THAT(d, WithinAbs(0.0, 1e-12));

    auto empty = db4->decompose(std::vector<double>{}, 1);
    REQUIRE_FALSE(empty.has_value());
    REQUIRE(empty.error().code() == core::ErrorCode::kEmptyInput);
}
