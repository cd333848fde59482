/**
 * @file Datapoint.hpp
 * @brief Cutting recordings into labelled datapoints and reshaping datasets.
 *
 * A datapoint is the segment [t - preStimulus, t + windowOffset) around a
 * stimulus at reading index t, labelled with the stimulus type. Null
 * datapoints of the same length are cut from stimulus-free stretches.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PHYTO_DATA_DATAPOINT_HPP
    #define PHYTO_DATA_DATAPOINT_HPP

    #include "Recording.hpp"

    #include <phyto/core/Constants.hpp>
    #include <phyto/dsp/ITransform.hpp>

    #include <map>
    #include <optional>
    #include <span>
    #include <string>
    #include <vector>

namespace phyto::data {

class DatapointConfig {
public:
    class Builder {
    public:
        Builder &preStimulus(core::usize samples) noexcept;
        Builder &windowOffset(core::usize samples) noexcept;
        Builder &includeNull(bool enabled) noexcept;

        [[nodiscard]] core::Expected<DatapointConfig> build() const;

    private:
        core::usize _preStimulus = core::kDefaultPreStimulus;
        core::usize _windowOffset = core::kDefaultWindowOffset;
        bool _includeNull = false;
    };

    [[nodiscard]] core::usize preStimulus() const noexcept { return _preStimulus; }
    [[nodiscard]] core::usize windowOffset() const noexcept { return _windowOffset; }
    [[nodiscard]] bool includeNull() const noexcept { return _includeNull; }

    /// preStimulus + windowOffset
    [[nodiscard]] core::usize segmentLength() const noexcept { return _preStimulus + _windowOffset; }

private:
    friend class Builder;
    DatapointConfig() = default;

    core::usize _preStimulus = core::kDefaultPreStimulus;
    core::usize _windowOffset = core::kDefaultWindowOffset;
    bool _includeNull = false;
};

/**
 * @brief Cuts every stimulus of @p recording into a labelled datapoint.
 *
 * Stimuli whose segment would leave the recording are skipped. With
 * includeNull, one "null" datapoint is centred in each stimulus-free gap
 * that can hold a whole segment; a gap starts windowOffset samples after
 * the previous stimulus (or at 0) and ends preStimulus samples before the
 * next one (or at the end of the recording).
 */
[[nodiscard]] dsp::LabeledBatch generateDatapoints(const Recording &recording, const DatapointConfig &config);

/**
 * @brief Datapoints tagged with the recording (plant) each one was cut from.
 *
 * plants[i] names the recording of batch.samples[i].
 */
struct PlantDatapoints {
    dsp::LabeledBatch batch;
    std::vector<std::string> plants;

    [[nodiscard]] core::usize size() const noexcept { return batch.size(); }

    void append(PlantDatapoints other);
};

/**
 * @brief generateDatapoints over several recordings, concatenated in order.
 */
[[nodiscard]] PlantDatapoints generateAll(std::span<const Recording> recordings, const DatapointConfig &config);

/**
 * @brief Keeps only datapoints whose label is in @p labels, preserving order.
 */
[[nodiscard]] dsp::LabeledBatch filterTypes(const dsp::LabeledBatch &batch, std::span<const std::string> labels);

/**
 * @brief Down-samples every label to the count of the rarest one.
 *
 * Without a seed the first datapoints of each label are kept; with one,
 * the kept datapoints are drawn by a seeded shuffle. Relative order of the
 * kept datapoints is preserved either way.
 */
[[nodiscard]] dsp::LabeledBatch balance(const dsp::LabeledBatch &batch, std::optional<core::u32> seed = std::nullopt);

/**
 * @brief Groups samples by label.
 */
[[nodiscard]] std::map<std::string, dsp::Batch> groupTypes(const dsp::LabeledBatch &batch);

struct BatchSplit {
    dsp::LabeledBatch train;
    dsp::LabeledBatch test;
};

/**
 * @brief Seeded shuffle of the datapoints, the first fraction going to train.
 *
 * @return kInvalidArgument unless 0 < fraction < 1
 */
[[nodiscard]] core::Expected<BatchSplit> splitBatch(const dsp::LabeledBatch &batch, double fraction, core::u32 seed);

/**
 * @brief Seeded shuffle of the plants, the datapoints of the first fraction
 *        going to train and the rest to test.
 *
 * No plant contributes to both sides. Plants are ordered by first
 * appearance before the shuffle.
 *
 * @return kInvalidArgument unless 0 < fraction < 1, kShapeMismatch when the
 *         plant tags do not match the batch
 */
[[nodiscard]] core::Expected<BatchSplit> splitByPlant(const PlantDatapoints &datapoints, double fraction, core::u32 seed);

} // namespace phyto::data

#endif // PHYTO_DATA_DATAPOINT_HPP
