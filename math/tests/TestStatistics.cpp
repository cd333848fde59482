/**
 * @file TestStatistics.cpp
 * @brief Unit tests for phyto::math::Statistics.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "phyto/math/Statistics.hpp"

#include <cmath>
#include <vector>

using namespace phyto;
using namespace phyto::math;
using Catch::Matchers::WithinAbs;

TEST_CASE("Statistics::mean averages values", "[math][statistics]")
{
    const std::vector<double> x = {1.0, 2.0, 3.0, 4.0};

    auto m = Statistics::mean(x);
    REQUIRE(m.has_value());
    REQUIRE_THAT(*m, WithinAbs(2.5, 1e-12));
}

TEST_CASE("Statistics reject empty input with a domain error", "[math][statistics]")
{
    const std::vector<double> empty;

    SECTION("mean")
    {
        auto m = Statistics::mean(empty);
        REQUIRE_FALSE(m.has_value());
        REQUIRE(m.error().code() == core::ErrorCode::kDomainError);
    }

    SECTION("variance")
    {
        REQUIRE_FALSE(Statistics::variance(empty).has_value());
    }

    SECTION("meanAbsolute")
    {
        REQUIRE_FALSE(Statistics::meanAbsolute(empty).has_value());
    }
}

TEST_CASE("Statistics::variance equals the second central moment", "[math][statistics]")
{
    const std::vector<double> x = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};

    auto var = Statistics::variance(x);
    auto m2 = Statistics::moment(x, 2);
    REQUIRE(var.has_value());
    REQUIRE(m2.has_value());

    REQUIRE_THAT(*var, WithinAbs(*m2, 1e-12));
    REQUIRE_THAT(*var, WithinAbs(4.0, 1e-12));
    REQUIRE_THAT(*Statistics::stdev(x), WithinAbs(2.0, 1e-12));
}

TEST_CASE("Statistics::skewness and kurtosis of known sequences", "[math][statistics]")
{
    SECTION("symmetric sequence has zero skew")
    {
        const std::vector<double> x = {-2.0, -1.0, 0.0, 1.0, 2.0};
        REQUIRE_THAT(*Statistics::skewness(x), WithinAbs(0.0, 1e-12));
        // m4 = 6.8, var = 2 -> 6.8 / 4 - 3
        REQUIRE_THAT(*Statistics::kurtosis(x), WithinAbs(-1.3, 1e-12));
    }

    SECTION("right tail gives positive skew")
    {
        const std::vector<double> x = {0.0, 0.0, 0.0, 0.0, 10.0};
        REQUIRE(*Statistics::skewness(x) > 0.0);
    }
}

TEST_CASE("Statistics raise on constant sequences", "[math][statistics]")
{
    const std::vector<double> flat(16, 3.5);

    auto var = Statistics::variance(flat);
    REQUIRE(var.has_value());
    REQUIRE(*var == 0.0);

    auto skew = Statistics::skewness(flat);
    REQUIRE_FALSE(skew.has_value());
    REQUIRE(skew.error().code() == core::ErrorCode::kDomainError);

    auto kurt = Statistics::kurtosis(flat);
    REQUIRE_FALSE(kurt.has_value());
    REQUIRE(kurt.error().category() == core::ErrorCategory::kDegenerate);
}

TEST_CASE("Statistics::differential returns successive differences", "[math][statistics]")
{
    const std::vector<double> x = {1.0, 4.0, 9.0, 16.0};

    const auto d = Statistics::differential(x);
    REQUIRE(d == std::vector<double>{3.0, 5.0, 7.0});

    const auto d2 = Statistics::differential(d);
    REQUIRE(d2 == std::vector<double>{2.0, 2.0});

    REQUIRE(Statistics::differential(std::vector<double>{1.0}).empty());
}
