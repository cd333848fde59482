/**
 * @file TestSample.cpp
 * @brief Unit tests for phyto::dsp::Sample and its helpers.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "phyto/dsp/Sample.hpp"

#include <vector>

using namespace phyto;
using namespace phyto::dsp;
using Catch::Matchers::WithinAbs;

TEST_CASE("Sample::fromRows builds a time x channel matrix", "[dsp][sample]")
{
    auto sample = Sample::fromRows({{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}});

    REQUIRE(sample.has_value());
    REQUIRE(sample->isReal());
    REQUIRE(sample->length() == 3);
    REQUIRE(sample->channelCount() == 2);
    REQUIRE(sample->real()(2, 1) == 6.0);
    REQUIRE(sample->shapeString() == "real[3x2]");
}

TEST_CASE("Sample::fromRows rejects ragged rows", "[dsp][sample]")
{
    auto sample = Sample::fromRows({{1.0, 2.0}, {3.0}});

    REQUIRE_FALSE(sample.has_value());
    REQUIRE(sample.error().code() == core::ErrorCode::kChannelCountMismatch);
}

TEST_CASE("Sample::flatten is column-major", "[dsp][sample]")
{
    SECTION("real")
    {
        const Sample sample(RealMatrix{{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}});
        auto flat = sample.flatten();

        REQUIRE(flat.has_value());
        REQUIRE(flat->size() == 6);
        REQUIRE((*flat)(1) == 3.0);
        REQUIRE((*flat)(3) == 2.0);
    }

    SECTION("segments")
    {
        const Sample sample(SegmentList{RealMatrix{{1.0}, {2.0}}, RealMatrix{{3.0}, {4.0}, {5.0}}});
        auto flat = sample.flatten();

        REQUIRE(sample.length() == 5);
        REQUIRE(flat.has_value());
        REQUIRE(flat->size() == 5);
        REQUIRE((*flat)(4) == 5.0);
    }

    SECTION("complex is rejected")
    {
        const Sample sample(ComplexMatrix(ComplexMatrix::Zero(4, 1)));
        REQUIRE_FALSE(sample.flatten().has_value());
    }
}

TEST_CASE("sameShape compares kind, length and channels", "[dsp][sample]")
{
    const Sample a(RealMatrix(RealMatrix::Zero(10, 2)));
    const Sample b(RealMatrix(RealMatrix::Ones(10, 2)));
    const Sample c(RealMatrix(RealMatrix::Zero(11, 2)));
    const Sample d(ComplexMatrix(ComplexMatrix::Zero(10, 2)));

    REQUIRE(a.sameShape(b));
    REQUIRE_FALSE(a.sameShape(c));
    REQUIRE_FALSE(a.sameShape(d));
}

TEST_CASE("concatenate stacks parts along time", "[dsp][sample]")
{
    SECTION("real parts keep their channels")
    {
        const std::vector<Sample> parts = {
            Sample(RealMatrix{{1.0, 10.0}, {2.0, 20.0}}),
            Sample(RealMatrix{{3.0, 30.0}}),
        };
        auto out = concatenate(parts, "test");

        REQUIRE(out.has_value());
        REQUIRE(out->length() == 3);
        REQUIRE(out->channelCount() == 2);
        REQUIRE(out->real()(2, 1) == 30.0);
    }

    SECTION("channel counts must agree")
    {
        const std::vector<Sample> parts = {
            Sample(RealMatrix(RealMatrix::Zero(2, 2))),
            Sample(RealMatrix(RealMatrix::Zero(2, 1))),
        };
        auto out = concatenate(parts, "test");

        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().code() == core::ErrorCode::kChannelCountMismatch);
    }

    SECTION("complex cannot mix with real")
    {
        const std::vector<Sample> parts = {
            Sample(RealMatrix(RealMatrix::Zero(2, 1))),
            Sample(ComplexMatrix(ComplexMatrix::Zero(2, 1))),
        };
        auto out = concatenate(parts, "test");

        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().code() == core::ErrorCode::kShapeMismatch);
    }

    SECTION("segments are flattened into one column")
    {
        const std::vector<Sample> parts = {
            Sample(SegmentList{RealMatrix{{1.0}}, RealMatrix{{2.0}, {3.0}}}),
            Sample(RealMatrix{{4.0}}),
        };
        auto out = concatenate(parts, "test");

        REQUIRE(out.has_value());
        REQUIRE(out->isReal());
        REQUIRE(out->length() == 4);
        REQUIRE_THAT(out->real()(3, 0), WithinAbs(4.0, 1e-12));
    }

    SECTION("no parts")
    {
        auto out = concatenate(std::span<const Sample>{}, "test");
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().code() == core::ErrorCode::kEmptyInput);
    }
}
