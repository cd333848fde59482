/**
 * @file Constants.hpp
 * @brief Default parameters of the datapoint and feature pipelines.
 *
 * Only defaults live here: every value is threaded explicitly through the
 * configuration objects that consume it.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PHYTO_CORE_CONSTANTS_HPP
    #define PHYTO_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace phyto::core {

/// Trailing samples of a datapoint that follow the stimulus.
inline constexpr usize kDefaultWindowOffset   = 100;
/// Baseline samples kept before the stimulus.
inline constexpr usize kDefaultPreStimulus    = 100;
inline constexpr i64   kDefaultPostOffset     = 60;

inline constexpr usize kDefaultWindowCount    = 3;
inline constexpr usize kElectrodesPerPlant    = 2;

/// Scales used by DecimateWindow: 1, 2, 4, ..., 256.
inline constexpr usize kDecimationScaleCount  = 9;
inline constexpr usize kFirOrderPerFactor     = 20;

inline constexpr usize kEnsembleFeatureCount  = 10;
/// Shortest signal the feature ensemble accepts.
inline constexpr usize kEnsembleMinPoints     = 3;

inline constexpr f64   kDefaultTrainFraction  = 0.75;
inline constexpr u32   kDefaultSeed           = 42;

} // namespace phyto::core

#endif // PHYTO_CORE_CONSTANTS_HPP
