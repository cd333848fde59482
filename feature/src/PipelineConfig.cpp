/**
 * @file PipelineConfig.cpp
 * @brief PipelineConfig::Builder implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <phyto/feature/PipelineConfig.hpp>

#include <algorithm>
#include <string>

namespace phyto::feature {

using core::ErrorCode;
using core::makeError;

PipelineConfig::Builder& PipelineConfig::Builder::windowOffset(core::usize samples) noexcept
{
    _windowOffset = samples;
    return *this;
}

PipelineConfig::Builder& PipelineConfig::Builder::postOffset(core::i64 samples) noexcept
{
    _postOffset = samples;
    return *this;
}

PipelineConfig::Builder& PipelineConfig::Builder::windowCount(core::usize n) noexcept
{
    _windowCount = n;
    return *this;
}

PipelineConfig::Builder& PipelineConfig::Builder::hanning(bool enabled) noexcept
{
    _hanning = enabled;
    return *this;
}

PipelineConfig::Builder& PipelineConfig::Builder::multiScale(bool enabled) noexcept
{
    _multiScale = enabled;
    return *this;
}

PipelineConfig::Builder& PipelineConfig::Builder::scaleCount(core::usize n) noexcept
{
    _scaleCount = n;
    return *this;
}

PipelineConfig::Builder& PipelineConfig::Builder::electrodeMode(ElectrodeMode mode) noexcept
{
    _electrodeMode = mode;
    return *this;
}

PipelineConfig::Builder& PipelineConfig::Builder::policy(dsp::DegeneratePolicy policy) noexcept
{
    _policy = policy;
    return *this;
}

PipelineConfig::Builder& PipelineConfig::Builder::threads(core::u32 n) noexcept
{
    _threads = n;
    return *this;
}

core::usize fittingScaleCount(core::usize segment, core::usize windowCount) noexcept
{
    core::usize count = 0;
    while (count < core::kDecimationScaleCount) {
        const core::usize factor = core::usize{1} << count;
        const core::usize decimated = (segment + factor - 1) / factor;
        if (2 * decimated / (windowCount + 1) < core::kEnsembleMinPoints)
            break;
        ++count;
    }
    return std::max<core::usize>(count, 1);
}

std::optional<core::usize> PipelineConfig::postStimulusLength() const noexcept
{
    const auto wo = static_cast<core::i64>(_windowOffset);
    if (_postOffset >= wo)
        return std::nullopt;
    return static_cast<core::usize>(wo - _postOffset);
}

core::Expected<PipelineConfig> PipelineConfig::Builder::build() const
{
    if (_windowOffset == 0)
        return makeError(ErrorCode::kInvalidArgument, "window offset must be positive");
    if (_windowCount == 0)
        return makeError(ErrorCode::kInvalidArgument, "window count must be at least 1");
    if (_scaleCount && (*_scaleCount == 0 || *_scaleCount > core::kDecimationScaleCount)) {
        return makeError(ErrorCode::kInvalidArgument,
            "scale count must be in [1, " + std::to_string(core::kDecimationScaleCount) + "]");
    }

    PipelineConfig cfg;
    cfg._windowOffset  = _windowOffset;
    cfg._postOffset    = _postOffset;
    cfg._windowCount   = _windowCount;
    cfg._hanning       = _hanning;
    cfg._multiScale    = _multiScale;

    const auto segment = cfg.postStimulusLength();
    const core::usize fitting = segment ? fittingScaleCount(*segment, _windowCount) : core::kDecimationScaleCount;
    if (_multiScale && _scaleCount && segment && *_scaleCount > fitting) {
        return makeError(ErrorCode::kInvalidArgument,
            std::to_string(*_scaleCount) + " scales are too deep for a " + std::to_string(*segment)
            + "-point post-stimulus segment in " + std::to_string(_windowCount) + " windows (at most "
            + std::to_string(fitting) + ")");
    }
    cfg._scaleCount    = _scaleCount.value_or(fitting);
    cfg._electrodeMode = _electrodeMode;
    cfg._policy        = _policy;
    cfg._threads       = _threads;
    return cfg;
}

} // namespace phyto::feature
