/**
 * @file Electrode.cpp
 * @brief Implementation of the electrode combination transforms.
 * @author MasterLaplace
 */

#include "phyto/dsp/Electrode.hpp"

#include <phyto/core/Constants.hpp>

namespace phyto::dsp {

using core::ErrorCode;
using core::Expected;
using core::makeError;

namespace {

core::ExpectedVoid expectElectrodePair(const Sample &input, std::string_view stage)
{
    PHYTO_TRY_VOID(expectReal(input, stage));
    if (input.channelCount() != core::kElectrodesPerPlant) {
        return makeError(ErrorCode::kChannelCountMismatch,
            std::string(stage) + " requires exactly 2 channels, got " + input.shapeString());
    }
    return {};
}

} // namespace

Expected<ElectrodeAvg> ElectrodeAvg::create()
{
    return ElectrodeAvg{};
}

Expected<Sample> ElectrodeAvg::extract(const Sample &input) const
{
    PHYTO_TRY_VOID(expectElectrodePair(input, name()));
    const RealMatrix &x = input.real();
    return Sample(RealMatrix((x.col(0) + x.col(1)) / 2.0));
}

Expected<ElectrodeDiff> ElectrodeDiff::create()
{
    return ElectrodeDiff{};
}

Expected<Sample> ElectrodeDiff::extract(const Sample &input) const
{
    PHYTO_TRY_VOID(expectElectrodePair(input, name()));
    const RealMatrix &x = input.real();
    return Sample(RealMatrix(x.col(0) - x.col(1)));
}

} // namespace phyto::dsp
