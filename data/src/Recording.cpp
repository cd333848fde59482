/**
 * @file Recording.cpp
 * @brief Electrode pairing.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <phyto/data/Recording.hpp>

#include <phyto/core/Constants.hpp>
#include <phyto/core/Log.hpp>

#include <algorithm>
#include <numeric>
#include <random>

namespace phyto::data {

core::Expected<std::vector<Recording>> pairElectrodes(
    const std::string &name,
    const dsp::RealMatrix &readings,
    const std::vector<Stimulus> &stimuli,
    double sampleFreq)
{
    constexpr auto pair = static_cast<Eigen::Index>(core::kElectrodesPerPlant);

    if (readings.cols() < pair) {
        return core::makeError(core::ErrorCode::kChannelCountMismatch,
            name + ": " + std::to_string(readings.cols()) + " electrode columns, need at least 2");
    }
    if (readings.cols() % pair != 0) {
        core::Log::warn("data", name + ": ignoring unpaired electrode column "
            + std::to_string(readings.cols() - 1));
    }

    std::vector<Recording> plants;
    plants.reserve(static_cast<core::usize>(readings.cols() / pair));
    for (Eigen::Index p = 0; p + pair <= readings.cols(); p += pair) {
        Recording plant;
        plant.name = name + "-" + std::to_string(p / pair);
        plant.readings = readings.middleCols(p, pair);
        plant.stimuli = stimuli;
        plant.sampleFreq = sampleFreq;
        plants.push_back(std::move(plant));
    }
    return plants;
}

std::vector<core::usize> shuffledIndices(core::usize count, core::u32 seed)
{
    std::vector<core::usize> order(count);
    std::iota(order.begin(), order.end(), core::usize{0});
    std::mt19937 rng(seed);
    std::ranges::shuffle(order, rng);
    return order;
}

core::Expected<core::usize> trainCount(core::usize count, double fraction)
{
    if (!(fraction > 0.0 && fraction < 1.0)) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "train fraction must be in (0, 1), got " + std::to_string(fraction));
    }
    return static_cast<core::usize>(fraction * static_cast<double>(count));
}

core::Expected<RecordingSplit> splitRecordings(
    std::vector<Recording> recordings, double fraction, core::u32 seed)
{
    const auto cut = PHYTO_TRY(trainCount(recordings.size(), fraction));
    const auto order = shuffledIndices(recordings.size(), seed);

    RecordingSplit split;
    split.train.reserve(cut);
    split.test.reserve(recordings.size() - cut);
    for (core::usize i = 0; i < order.size(); ++i) {
        auto &target = (i < cut) ? split.train : split.test;
        target.push_back(std::move(recordings[order[i]]));
    }
    core::Log::debug("data", "split " + std::to_string(recordings.size()) + " recordings into "
        + std::to_string(split.train.size()) + " train / " + std::to_string(split.test.size()) + " test");
    return split;
}

} // namespace phyto::data
