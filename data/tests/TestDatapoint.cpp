/**
 * @file TestDatapoint.cpp
 * @brief Unit tests for datapoint generation and dataset reshaping.
 */

#include <catch2/catch_test_macros.hpp>

#include "phyto/data/Datapoint.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <vector>

using namespace phyto;
using namespace phyto::data;

static Recording ramp(core::usize length, std::vector<Stimulus> stimuli, std::string name = "ramp-0")
{
    Recording r;
    r.name = std::move(name);
    r.readings.resize(static_cast<Eigen::Index>(length), 2);
    for (Eigen::Index t = 0; t < r.readings.rows(); ++t) {
        r.readings(t, 0) = static_cast<double>(t);
        r.readings(t, 1) = static_cast<double>(t) + 1000.0;
    }
    r.stimuli = std::move(stimuli);
    return r;
}

static dsp::LabeledBatch tagged(const std::vector<std::string> &labels)
{
    dsp::LabeledBatch batch;
    for (std::size_t i = 0; i < labels.size(); ++i) {
        const std::vector<double> value{static_cast<double>(i)};
        batch.samples.push_back(dsp::Sample::fromVector(value));
        batch.labels.push_back(labels[i]);
    }
    return batch;
}

static double tag(const dsp::Sample &sample)
{
    return sample.real()(0, 0);
}

TEST_CASE("DatapointConfig::Builder", "[data][config]")
{
    auto config = DatapointConfig::Builder{}.build();
    REQUIRE(config.has_value());
    REQUIRE(config->preStimulus() == core::kDefaultPreStimulus);
    REQUIRE(config->windowOffset() == core::kDefaultWindowOffset);
    REQUIRE_FALSE(config->includeNull());
    REQUIRE(config->segmentLength() == 200);

    REQUIRE_FALSE(DatapointConfig::Builder{}.windowOffset(0).build().has_value());
}

TEST_CASE("generateDatapoints cuts segments around stimuli", "[data][datapoint]")
{
    const auto config = *DatapointConfig::Builder{}.preStimulus(100).windowOffset(100).build();

    SECTION("segments outside the recording are skipped")
    {
        const auto recording = ramp(1000, {{"water", 300}, {"ozone", 650}, {"NaCL", 50}, {"H2SO", 950}});
        const auto batch = generateDatapoints(recording, config);

        REQUIRE(batch.size() == 2);
        REQUIRE(batch.labels == dsp::Labels{"water", "ozone"});
        REQUIRE(batch.samples[0].length() == 200);
        REQUIRE(batch.samples[0].channelCount() == 2);
        REQUIRE(batch.samples[0].real()(0, 0) == 200.0);
        REQUIRE(batch.samples[0].real()(199, 1) == 1399.0);
        REQUIRE(batch.samples[1].real()(0, 0) == 550.0);
    }

    SECTION("stimulus at the very edges still fits")
    {
        const auto batch = generateDatapoints(ramp(300, {{"ozone", 100}, {"water", 200}}), config);
        REQUIRE(batch.size() == 2);
        REQUIRE(batch.samples[1].real()(199, 0) == 299.0);
    }

    SECTION("null datapoints are centred in free gaps")
    {
        const auto withNull = *DatapointConfig::Builder{}.includeNull(true).build();
        const auto batch = generateDatapoints(ramp(1000, {{"water", 500}}), withNull);

        REQUIRE(batch.labels == dsp::Labels{"water", "null", "null"});
        REQUIRE(batch.samples[1].real()(0, 0) == 100.0);
        REQUIRE(batch.samples[2].real()(0, 0) == 700.0);
        REQUIRE(batch.samples[2].length() == 200);
    }

    SECTION("gaps too short for a segment give no null datapoint")
    {
        const auto withNull = *DatapointConfig::Builder{}.includeNull(true).build();
        const auto batch = generateDatapoints(ramp(1000, {{"NaCL", 50}, {"water", 300}, {"ozone", 650}, {"H2SO", 950}}), withNull);
        REQUIRE(std::ranges::count(batch.labels, std::string("null")) == 0);
    }

    SECTION("generateAll concatenates recordings and tags their plants")
    {
        const std::vector<Recording> recordings{
            ramp(1000, {{"water", 300}, {"NaCL", 600}}, "exp-0"),
            ramp(1000, {{"ozone", 300}}, "exp-1"),
        };
        const auto datapoints = generateAll(recordings, config);
        REQUIRE(datapoints.batch.labels == dsp::Labels{"water", "NaCL", "ozone"});
        REQUIRE(datapoints.plants == std::vector<std::string>{"exp-0", "exp-0", "exp-1"});
    }
}

TEST_CASE("filterTypes and groupTypes", "[data][datapoint]")
{
    const auto batch = tagged({"a", "b", "c", "a", "b"});

    const std::vector<std::string> keep{"a", "c"};
    const auto filtered = filterTypes(batch, keep);
    REQUIRE(filtered.labels == dsp::Labels{"a", "c", "a"});
    REQUIRE(tag(filtered.samples[2]) == 3.0);

    const auto groups = groupTypes(batch);
    REQUIRE(groups.size() == 3);
    REQUIRE(groups.at("b").size() == 2);
    REQUIRE(tag(groups.at("b")[1]) == 4.0);
}

TEST_CASE("balance down-samples to the rarest label", "[data][datapoint]")
{
    const auto batch = tagged({"a", "a", "a", "b", "b", "c", "c", "c", "c"});

    SECTION("unseeded keeps the first datapoints")
    {
        const auto balanced = balance(batch);
        REQUIRE(balanced.labels == dsp::Labels{"a", "a", "b", "b", "c", "c"});
        REQUIRE(tag(balanced.samples[4]) == 5.0);
        REQUIRE(tag(balanced.samples[5]) == 6.0);
    }

    SECTION("seeded keeps order and counts")
    {
        const auto balanced = balance(batch, 7u);
        REQUIRE(balanced.labels == dsp::Labels{"a", "a", "b", "b", "c", "c"});
        for (std::size_t i = 1; i < balanced.size(); ++i)
            REQUIRE(tag(balanced.samples[i - 1]) < tag(balanced.samples[i]));
        const auto again = balance(batch, 7u);
        REQUIRE(tag(again.samples[5]) == tag(balanced.samples[5]));
    }

    SECTION("empty batch")
    {
        REQUIRE(balance(dsp::LabeledBatch{}).size() == 0);
    }
}

TEST_CASE("splitBatch shuffles then cuts", "[data][datapoint]")
{
    const auto batch = tagged({"a", "b", "a", "b", "a", "b", "a", "b"});

    auto split = splitBatch(batch, 0.75, 42);
    REQUIRE(split.has_value());
    REQUIRE(split->train.size() == 6);
    REQUIRE(split->test.size() == 2);

    std::vector<double> seen;
    for (const auto &s : split->train.samples)
        seen.push_back(tag(s));
    for (const auto &s : split->test.samples)
        seen.push_back(tag(s));
    std::ranges::sort(seen);
    REQUIRE(seen == std::vector<double>{0, 1, 2, 3, 4, 5, 6, 7});

    for (std::size_t i = 0; i < split->train.size(); ++i) {
        const auto index = static_cast<std::size_t>(tag(split->train.samples[i]));
        REQUIRE(split->train.labels[i] == batch.labels[index]);
    }

    REQUIRE_FALSE(splitBatch(batch, 1.5, 42).has_value());
}

TEST_CASE("splitByPlant keeps every plant on one side", "[data][datapoint]")
{
    PlantDatapoints datapoints;
    datapoints.batch = tagged({"a", "b", "a", "b", "a", "b", "a", "b", "a", "b", "a", "b"});
    for (std::size_t i = 0; i < datapoints.size(); ++i)
        datapoints.plants.push_back("exp-" + std::to_string(i % 4));

    auto split = splitByPlant(datapoints, 0.75, 42);
    REQUIRE(split.has_value());
    REQUIRE(split->train.size() == 9);
    REQUIRE(split->test.size() == 3);

    std::set<std::string> trainPlants;
    std::set<std::string> testPlants;
    for (const auto &s : split->train.samples)
        trainPlants.insert(datapoints.plants[static_cast<std::size_t>(tag(s))]);
    for (const auto &s : split->test.samples)
        testPlants.insert(datapoints.plants[static_cast<std::size_t>(tag(s))]);

    REQUIRE(trainPlants.size() == 3);
    REQUIRE(testPlants.size() == 1);
    for (const auto &plant : testPlants)
        REQUIRE_FALSE(trainPlants.contains(plant));

    for (std::size_t i = 0; i < split->test.size(); ++i) {
        const auto index = static_cast<std::size_t>(tag(split->test.samples[i]));
        REQUIRE(split->test.labels[i] == datapoints.batch.labels[index]);
    }

    SECTION("same seed, same plants")
    {
        auto again = splitByPlant(datapoints, 0.75, 42);
        REQUIRE(tag(again->test.samples[0]) == tag(split->test.samples[0]));
    }

    SECTION("plant tags must match the batch")
    {
        datapoints.plants.pop_back();
        auto bad = splitByPlant(datapoints, 0.75, 42);
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error().code() == core::ErrorCode::kShapeMismatch);
    }

    SECTION("fraction outside (0, 1)")
    {
        REQUIRE_FALSE(splitByPlant(datapoints, 1.0, 42).has_value());
    }
}
