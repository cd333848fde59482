/**
 * @file Recording.hpp
 * @brief One experiment on one plant: two electrode traces plus stimuli.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PHYTO_DATA_RECORDING_HPP
    #define PHYTO_DATA_RECORDING_HPP

    #include "Stimulus.hpp"

    #include <phyto/core/Error.hpp>
    #include <phyto/dsp/Sample.hpp>

    #include <string>
    #include <vector>

namespace phyto::data {

struct Recording {
    std::string name;
    /// time x 2 electrode readings
    dsp::RealMatrix readings;
    std::vector<Stimulus> stimuli;
    double sampleFreq = 1.0;

    [[nodiscard]] core::usize length() const noexcept { return static_cast<core::usize>(readings.rows()); }
};

/**
 * @brief Splits a multi-electrode recording into one Recording per plant.
 *
 * Consecutive column pairs (0, 1), (2, 3)... become recordings named
 * "<name>-0", "<name>-1"... sharing the same stimuli. A trailing unpaired
 * column is ignored with a warning.
 *
 * @return kChannelCountMismatch when fewer than two columns are given
 */
[[nodiscard]] core::Expected<std::vector<Recording>> pairElectrodes(
    const std::string &name,
    const dsp::RealMatrix &readings,
    const std::vector<Stimulus> &stimuli,
    double sampleFreq);

/**
 * @brief A permutation of [0, count) drawn from std::mt19937 seeded with @p seed.
 */
[[nodiscard]] std::vector<core::usize> shuffledIndices(core::usize count, core::u32 seed);

/**
 * @brief Number of items that go to the training side of a split.
 *
 * @return kInvalidArgument unless 0 < fraction < 1
 */
[[nodiscard]] core::Expected<core::usize> trainCount(core::usize count, double fraction);

struct RecordingSplit {
    std::vector<Recording> train;
    std::vector<Recording> test;
};

/**
 * @brief Shuffles whole recordings and splits them into train and test sets,
 *        so no plant contributes to both.
 */
[[nodiscard]] core::Expected<RecordingSplit> splitRecordings(
    std::vector<Recording> recordings, double fraction, core::u32 seed);

} // namespace phyto::data

#endif // PHYTO_DATA_RECORDING_HPP
