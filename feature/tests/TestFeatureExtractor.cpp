/**
 * @file TestFeatureExtractor.cpp
 * @brief Unit tests for the feature pipeline configuration and extractor.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "phyto/feature/FeatureExtractor.hpp"
#include "phyto/feature/FeaturePipeline.hpp"

#include <cmath>
#include <random>

using namespace phyto;
using namespace phyto::feature;
using Catch::Matchers::WithinAbs;

static dsp::Sample datapoint(unsigned seed, bool withStep)
{
    std::mt19937 rng(seed);
    std::normal_distribution<double> noise(0.0, 0.5);

    dsp::RealMatrix m(200, 2);
    for (Eigen::Index t = 0; t < 200; ++t) {
        const double response = (withStep && t >= 100)
            ? 4.0 * (1.0 - std::exp(-static_cast<double>(t - 100) / 8.0))
            : 0.0;
        m(t, 0) = response + noise(rng);
        m(t, 1) = 0.5 * response + noise(rng);
    }
    return dsp::Sample(std::move(m));
}

static dsp::LabeledBatch makeBatch(unsigned firstSeed, std::size_t count)
{
    dsp::LabeledBatch batch;
    for (std::size_t i = 0; i < count; ++i) {
        const bool stimulus = (i % 2) == 0;
        batch.samples.push_back(datapoint(firstSeed + static_cast<unsigned>(i), stimulus));
        batch.labels.push_back(stimulus ? "ozone" : "null");
    }
    return batch;
}

TEST_CASE("PipelineConfig::Builder validates its fields", "[feature][config]")
{
    SECTION("defaults")
    {
        auto config = PipelineConfig::Builder{}.build();
        REQUIRE(config.has_value());
        REQUIRE(config->windowOffset() == core::kDefaultWindowOffset);
        REQUIRE(config->postOffset() == core::kDefaultPostOffset);
        REQUIRE(config->windowCount() == core::kDefaultWindowCount);
        REQUIRE(config->electrodeMode() == ElectrodeMode::kAverage);
        REQUIRE(config->policy() == dsp::DegeneratePolicy::kPropagate);
    }

    SECTION("invalid values")
    {
        REQUIRE_FALSE(PipelineConfig::Builder{}.windowOffset(0).build().has_value());
        REQUIRE_FALSE(PipelineConfig::Builder{}.windowCount(0).build().has_value());
        REQUIRE_FALSE(PipelineConfig::Builder{}.scaleCount(10).build().has_value());
    }

    SECTION("default scale count fits the post-stimulus segment")
    {
        // 40 points in 3 windows: 40, 20 and 10 points still give 5-point windows
        auto config = PipelineConfig::Builder{}.multiScale(true).build();
        REQUIRE(config.has_value());
        REQUIRE(config->postStimulusLength() == 40u);
        REQUIRE(config->scaleCount() == 3);

        auto longer = PipelineConfig::Builder{}.postOffset(-100).multiScale(true).build();
        REQUIRE(longer->postStimulusLength() == 200u);
        REQUIRE(longer->scaleCount() == 6);
    }

    SECTION("explicit scale count too deep for the segment")
    {
        auto config = PipelineConfig::Builder{}.multiScale(true).scaleCount(4).build();
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().code() == core::ErrorCode::kInvalidArgument);
    }
}

TEST_CASE("fittingScaleCount stops before windows get too short", "[feature][config]")
{
    REQUIRE(fittingScaleCount(40, 3) == 3);
    REQUIRE(fittingScaleCount(6, 3) == 1);
    REQUIRE(fittingScaleCount(2, 3) == 1);
    REQUIRE(fittingScaleCount(100000, 1) == core::kDecimationScaleCount);
}

TEST_CASE("buildFeaturePipeline lays out the canonical stages", "[feature][pipeline]")
{
    SECTION("single scale")
    {
        auto config = PipelineConfig::Builder{}.electrodeMode(ElectrodeMode::kDifference).build();
        auto pipeline = buildFeaturePipeline(*config);
        REQUIRE(pipeline.has_value());
        REQUIRE(pipeline->stageCount() == 5);
        REQUIRE(pipeline->stage(0).name() == "ElectrodeDiff");
        REQUIRE(pipeline->stage(1).name() == "Detrend");
        REQUIRE(pipeline->stage(2).name() == "PostStimulus");
        REQUIRE(pipeline->stage(3).name() == "Window");
        REQUIRE(pipeline->stage(4).name() == "StandardScaler");
    }

    SECTION("multi-scale")
    {
        auto config = PipelineConfig::Builder{}.multiScale(true).build();
        auto pipeline = buildFeaturePipeline(*config);
        REQUIRE(pipeline.has_value());
        REQUIRE(pipeline->stage(0).name() == "ElectrodeAvg");
        REQUIRE(pipeline->stage(3).name() == "DecimateWindow");
    }
}

TEST_CASE("FeatureExtractor produces one standardized row per datapoint", "[feature][extractor]")
{
    auto config = PipelineConfig::Builder{}.windowOffset(100).postOffset(60).windowCount(3).build();
    REQUIRE(config.has_value());

    auto extractor = FeatureExtractor::create(*config);
    REQUIRE(extractor.has_value());

    SECTION("transform before fit")
    {
        auto test = extractor->transform(makeBatch(100, 2));
        REQUIRE_FALSE(test.has_value());
        REQUIRE(test.error().code() == core::ErrorCode::kNotFitted);
    }

    SECTION("training split is centred, test split uses training statistics")
    {
        const auto training = makeBatch(1, 8);
        auto train = extractor->fitTransform(training);
        REQUIRE(train.has_value());
        REQUIRE(extractor->fitted());

        // 40 post-stimulus points, 3 windows of 20, 10 features each.
        REQUIRE(train->rows() == 8);
        REQUIRE(train->cols() == 30);
        REQUIRE(train->y == training.labels);
        for (Eigen::Index c = 0; c < train->X.cols(); ++c)
            REQUIRE_THAT(train->X.col(c).mean(), WithinAbs(0.0, 1e-9));

        auto test = extractor->transform(makeBatch(50, 4));
        REQUIRE(test.has_value());
        REQUIRE(test->rows() == 4);
        REQUIRE(test->cols() == 30);
    }
}

TEST_CASE("FeatureExtractor drops degenerate datapoints on request", "[feature][extractor]")
{
    auto training = makeBatch(1, 6);
    training.samples.push_back(dsp::Sample(dsp::RealMatrix(dsp::RealMatrix::Zero(200, 2))));
    training.labels.push_back("flat");

    SECTION("propagate")
    {
        auto extractor = FeatureExtractor::create(*PipelineConfig::Builder{}.build());
        auto train = extractor->fitTransform(training);
        REQUIRE_FALSE(train.has_value());
        REQUIRE(train.error().category() == core::ErrorCategory::kDegenerate);
    }

    SECTION("drop")
    {
        auto config = PipelineConfig::Builder{}.policy(dsp::DegeneratePolicy::kDrop).build();
        auto extractor = FeatureExtractor::create(*config);
        auto train = extractor->fitTransform(training);
        REQUIRE(train.has_value());
        REQUIRE(train->rows() == 6);
        REQUIRE(train->y.size() == 6);
        REQUIRE(train->y.back() == "null");
    }
}

TEST_CASE("Multi-scale features concatenate every scale", "[feature][extractor]")
{
    auto config = PipelineConfig::Builder{}
        .postOffset(100)
        .multiScale(true)
        .scaleCount(3)
        .build();
    auto extractor = FeatureExtractor::create(*config);
    REQUIRE(extractor.has_value());

    auto train = extractor->fitTransform(makeBatch(10, 6));
    REQUIRE(train.has_value());
    REQUIRE(train->cols() == 3 * 3 * 10);
}

TEST_CASE("Multi-scale defaults extract the canonical datapoint", "[feature][extractor]")
{
    auto config = PipelineConfig::Builder{}.multiScale(true).build();
    REQUIRE(config.has_value());
    auto extractor = FeatureExtractor::create(*config);
    REQUIRE(extractor.has_value());

    auto train = extractor->fitTransform(makeBatch(30, 6));
    REQUIRE(train.has_value());
    REQUIRE(train->cols() == 3 * 3 * core::kEnsembleFeatureCount);
}

TEST_CASE("Threaded extraction matches sequential extraction", "[feature][extractor]")
{
    auto sequential = FeatureExtractor::create(*PipelineConfig::Builder{}.threads(1).build());
    auto threaded = FeatureExtractor::create(*PipelineConfig::Builder{}.threads(3).build());
    REQUIRE(sequential.has_value());
    REQUIRE(threaded.has_value());

    const auto training = makeBatch(20, 10);
    auto a = sequential->fitTransform(training);
    auto b = threaded->fitTransform(training);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(a->X == b->X);
    REQUIRE(a->y == b->y);
}
