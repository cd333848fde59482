/**
 * @file CsvIo.hpp
 * @brief CSV readers and writers for recordings, datapoints and features.
 *
 * Formats:
 *  - readings:   one row per time step, one column per electrode, comma or
 *                tab separated (empty trailing fields are ignored);
 *  - marks:      header row, then "name, <ignored>, index";
 *  - datapoints: "plant, label, v(t0,c0), v(t0,c1), v(t1,c0), ..." (time-major);
 *  - features:   "split, label, f0, f1, ...".
 *
 * Lines that are empty or start with '#' are skipped on read.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PHYTO_DATA_CSVIO_HPP
    #define PHYTO_DATA_CSVIO_HPP

    #include "Datapoint.hpp"
    #include "Recording.hpp"
    #include "Stimulus.hpp"

    #include <phyto/dsp/ITransform.hpp>

    #include <Eigen/Dense>

    #include <span>
    #include <string>
    #include <vector>

namespace phyto::data {

/**
 * @brief One named block of a features file.
 */
struct FeatureTable {
    std::string split;
    const Eigen::MatrixXd &X;
    const dsp::Labels &y;
};

[[nodiscard]] core::Expected<dsp::RealMatrix> loadReadings(const std::string &path);

/**
 * @return kInvalidArgument for an index that is negative, not finite or too
 *         large to address a reading
 */
[[nodiscard]] core::Expected<std::vector<RawMark>> loadMarks(const std::string &path);

/**
 * @brief Loads a readings/marks pair and splits it into per-plant recordings.
 *
 * Fails with kInvalidArgument when a mark points past the last reading.
 */
[[nodiscard]] core::Expected<std::vector<Recording>> loadRecording(
    const std::string &readingsPath,
    const std::string &marksPath,
    const std::string &name,
    double sampleFreq,
    const StimulusCatalog &catalog);

/**
 * @brief Reads labelled datapoints, reshaping each row to time x @p channels.
 */
[[nodiscard]] core::Expected<PlantDatapoints> loadDatapoints(const std::string &path, core::usize channels);

[[nodiscard]] core::ExpectedVoid saveDatapoints(const std::string &path, const PlantDatapoints &datapoints);

[[nodiscard]] core::ExpectedVoid saveFeatures(const std::string &path, std::span<const FeatureTable> tables);

} // namespace phyto::data

#endif // PHYTO_DATA_CSVIO_HPP
