/**
 * @file Datapoint.cpp
 * @brief Datapoint generation and dataset reshaping.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <phyto/data/Datapoint.hpp>

#include <phyto/core/Log.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <random>
#include <string>

namespace phyto::data {

using core::ErrorCode;
using core::makeError;
using core::usize;

DatapointConfig::Builder& DatapointConfig::Builder::preStimulus(usize samples) noexcept
{
    _preStimulus = samples;
    return *this;
}

DatapointConfig::Builder& DatapointConfig::Builder::windowOffset(usize samples) noexcept
{
    _windowOffset = samples;
    return *this;
}

DatapointConfig::Builder& DatapointConfig::Builder::includeNull(bool enabled) noexcept
{
    _includeNull = enabled;
    return *this;
}

core::Expected<DatapointConfig> DatapointConfig::Builder::build() const
{
    if (_windowOffset == 0)
        return makeError(ErrorCode::kInvalidArgument, "window offset must be positive");

    DatapointConfig cfg;
    cfg._preStimulus  = _preStimulus;
    cfg._windowOffset = _windowOffset;
    cfg._includeNull  = _includeNull;
    return cfg;
}

namespace {

dsp::Sample cut(const Recording &recording, usize start, usize length)
{
    return dsp::Sample(dsp::RealMatrix(recording.readings.middleRows(
        static_cast<Eigen::Index>(start), static_cast<Eigen::Index>(length))));
}

void appendNullDatapoints(const Recording &recording, const DatapointConfig &config, dsp::LabeledBatch &out)
{
    std::vector<usize> onsets;
    onsets.reserve(recording.stimuli.size());
    for (const auto &stimulus : recording.stimuli)
        onsets.push_back(stimulus.index);
    std::ranges::sort(onsets);

    const usize segment = config.segmentLength();
    const usize len = recording.length();

    for (usize k = 0; k <= onsets.size(); ++k) {
        const usize lo = (k == 0) ? 0 : onsets[k - 1] + config.windowOffset();
        usize hi = len;
        if (k < onsets.size())
            hi = (onsets[k] >= config.preStimulus()) ? onsets[k] - config.preStimulus() : 0;
        hi = std::min(hi, len);

        if (hi <= lo || hi - lo < segment)
            continue;

        const usize start = lo + (hi - lo - segment) / 2;
        out.samples.push_back(cut(recording, start, segment));
        out.labels.emplace_back(kNullStimulus);
    }
}

} // namespace

dsp::LabeledBatch generateDatapoints(const Recording &recording, const DatapointConfig &config)
{
    dsp::LabeledBatch out;
    const usize len = recording.length();
    const usize segment = config.segmentLength();

    for (const auto &stimulus : recording.stimuli) {
        if (stimulus.index < config.preStimulus() || stimulus.index + config.windowOffset() > len) {
            if (core::Log::enabled(core::LogLevel::kDebug))
                core::Log::debug("data", recording.name + ": stimulus '" + stimulus.type + "' at "
                    + std::to_string(stimulus.index) + " does not fit a full segment, skipped");
            continue;
        }
        out.samples.push_back(cut(recording, stimulus.index - config.preStimulus(), segment));
        out.labels.push_back(stimulus.type);
    }

    if (config.includeNull())
        appendNullDatapoints(recording, config, out);

    core::Log::debug("data", recording.name + ": " + std::to_string(out.size()) + " datapoints");
    return out;
}

void PlantDatapoints::append(PlantDatapoints other)
{
    std::ranges::move(other.batch.samples, std::back_inserter(batch.samples));
    std::ranges::move(other.batch.labels, std::back_inserter(batch.labels));
    std::ranges::move(other.plants, std::back_inserter(plants));
}

PlantDatapoints generateAll(std::span<const Recording> recordings, const DatapointConfig &config)
{
    PlantDatapoints all;
    for (const auto &recording : recordings) {
        PlantDatapoints one;
        one.batch = generateDatapoints(recording, config);
        one.plants.assign(one.batch.size(), recording.name);
        all.append(std::move(one));
    }
    return all;
}

dsp::LabeledBatch filterTypes(const dsp::LabeledBatch &batch, std::span<const std::string> labels)
{
    dsp::LabeledBatch out;
    for (usize i = 0; i < batch.size(); ++i) {
        if (std::ranges::find(labels, batch.labels[i]) == labels.end())
            continue;
        out.samples.push_back(batch.samples[i]);
        out.labels.push_back(batch.labels[i]);
    }
    return out;
}

dsp::LabeledBatch balance(const dsp::LabeledBatch &batch, std::optional<core::u32> seed)
{
    std::map<std::string, std::vector<usize>> byLabel;
    for (usize i = 0; i < batch.size(); ++i)
        byLabel[batch.labels[i]].push_back(i);

    if (byLabel.empty())
        return {};

    usize keep = std::numeric_limits<usize>::max();
    for (const auto &[label, indices] : byLabel)
        keep = std::min(keep, indices.size());

    std::vector<bool> kept(batch.size(), false);
    std::optional<std::mt19937> rng;
    if (seed)
        rng.emplace(*seed);

    for (auto &[label, indices] : byLabel) {
        if (rng)
            std::ranges::shuffle(indices, *rng);
        for (usize j = 0; j < keep; ++j)
            kept[indices[j]] = true;
    }

    dsp::LabeledBatch out;
    for (usize i = 0; i < batch.size(); ++i) {
        if (!kept[i])
            continue;
        out.samples.push_back(batch.samples[i]);
        out.labels.push_back(batch.labels[i]);
    }
    core::Log::debug("data", "balanced " + std::to_string(byLabel.size()) + " labels to "
        + std::to_string(keep) + " datapoints each");
    return out;
}

std::map<std::string, dsp::Batch> groupTypes(const dsp::LabeledBatch &batch)
{
    std::map<std::string, dsp::Batch> groups;
    for (usize i = 0; i < batch.size(); ++i)
        groups[batch.labels[i]].push_back(batch.samples[i]);
    return groups;
}

core::Expected<BatchSplit> splitBatch(const dsp::LabeledBatch &batch, double fraction, core::u32 seed)
{
    if (batch.samples.size() != batch.labels.size()) {
        return makeError(ErrorCode::kShapeMismatch,
            std::to_string(batch.samples.size()) + " samples but " + std::to_string(batch.labels.size()) + " labels");
    }

    const auto trainSize = PHYTO_TRY(trainCount(batch.size(), fraction));
    const auto order = shuffledIndices(batch.size(), seed);

    BatchSplit split;
    for (usize i = 0; i < order.size(); ++i) {
        auto &target = (i < trainSize) ? split.train : split.test;
        target.samples.push_back(batch.samples[order[i]]);
        target.labels.push_back(batch.labels[order[i]]);
    }
    return split;
}

core::Expected<BatchSplit> splitByPlant(const PlantDatapoints &datapoints, double fraction, core::u32 seed)
{
    const auto &batch = datapoints.batch;
    if (batch.samples.size() != batch.labels.size() || datapoints.plants.size() != batch.samples.size()) {
        return makeError(ErrorCode::kShapeMismatch,
            std::to_string(batch.samples.size()) + " samples, " + std::to_string(batch.labels.size())
            + " labels and " + std::to_string(datapoints.plants.size()) + " plant tags");
    }

    std::vector<std::string> plants;
    for (const auto &plant : datapoints.plants) {
        if (std::ranges::find(plants, plant) == plants.end())
            plants.push_back(plant);
    }

    const auto trainSize = PHYTO_TRY(trainCount(plants.size(), fraction));
    const auto order = shuffledIndices(plants.size(), seed);

    std::map<std::string, bool> inTrain;
    for (usize i = 0; i < order.size(); ++i)
        inTrain[plants[order[i]]] = i < trainSize;

    BatchSplit split;
    for (usize i = 0; i < batch.size(); ++i) {
        auto &target = inTrain.at(datapoints.plants[i]) ? split.train : split.test;
        target.samples.push_back(batch.samples[i]);
        target.labels.push_back(batch.labels[i]);
    }
    core::Log::debug("data", "split " + std::to_string(plants.size()) + " plants into "
        + std::to_string(trainSize) + " train / " + std::to_string(plants.size() - trainSize) + " test");
    return split;
}

} // namespace phyto::data
