// SPDX-License-Identifier: Apache-2.0
#include "VoiceActivityDetector.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

namespace vocatype
{

auto validateVadConfig(const VadConfig& config) -> VoidResult
{
    if (!(config.sensitivity >= 0.0f && config.sensitivity <= 1.0f))
        return makeError(ErrorCode::ConfigError,
                         std::format("VAD sensitivity must be within [0, 1], got {}", config.sensitivity));
    if (!(config.smoothing >= 0.0f && config.smoothing < 1.0f))
        return makeError(ErrorCode::ConfigError,
                         std::format("VAD smoothing must be within [0, 1), got {}", config.smoothing));
    if (config.onsetFrames == 0 || config.releaseFrames == 0)
        return makeError(ErrorCode::ConfigError, "VAD onset and release frame counts must be positive");
    if (!(config.minThreshold > 0.0f && config.minThreshold < config.maxThreshold))
        return makeError(ErrorCode::ConfigError,
                         std::format("VAD thresholds must satisfy 0 < min < max (min={}, max={})",
                                     config.minThreshold,
                                     config.maxThreshold));
    return {};
}

VoiceActivityDetector::VoiceActivityDetector(VadConfig config): _config(config)
{
    _threshold = thresholdForSensitivity(_config, _config.sensitivity);
}

auto VoiceActivityDetector::process(AudioFrame frame) noexcept -> VadResult
{
    auto result = VadResult {};
    result.rms = computeRms(frame);

    _level = _config.smoothing * _level + (1.0f - _config.smoothing) * result.rms;
    result.level = _level;

    if (_level > _threshold)
    {
        _aboveRun = std::min(_aboveRun + 1, std::numeric_limits<std::uint32_t>::max() - 1);
        _belowRun = 0;
    }
    else
    {
        _belowRun = std::min(_belowRun + 1, std::numeric_limits<std::uint32_t>::max() - 1);
        _aboveRun = 0;
    }

    if (!_speech && _aboveRun >= _config.onsetFrames)
    {
        _speech = true;
        result.event = VadEvent::SpeechStart;
    }
    else if (_speech && _belowRun >= _config.releaseFrames)
    {
        _speech = false;
        result.event = VadEvent::SpeechEnd;
    }

    ++_totalFrames;
    if (_speech)
        ++_speechFrames;

    result.isSpeech = _speech;
    return result;
}

void VoiceActivityDetector::setSensitivity(float sensitivity) noexcept
{
    _config.sensitivity = std::clamp(sensitivity, 0.0f, 1.0f);
    _threshold = thresholdForSensitivity(_config, _config.sensitivity);
}

void VoiceActivityDetector::forceSilence() noexcept
{
    _speech = false;
    _aboveRun = 0;
    _belowRun = 0;
}

void VoiceActivityDetector::reset() noexcept
{
    forceSilence();
    _level = 0.0f;
    _totalFrames = 0;
    _speechFrames = 0;
}

auto VoiceActivityDetector::stats() const noexcept -> VadStats
{
    return VadStats {
        .totalFrames = _totalFrames,
        .speechFrames = _speechFrames,
        .speechRatio = _totalFrames ? static_cast<float>(_speechFrames) / static_cast<float>(_totalFrames) : 0.0f,
        .level = _level,
        .threshold = _threshold,
        .isSpeech = _speech,
    };
}

auto VoiceActivityDetector::thresholdForSensitivity(const VadConfig& config, float sensitivity) noexcept -> float
{
    // Geometric interpolation: each step in sensitivity scales the threshold by the same factor.
    auto const s = std::clamp(sensitivity, 0.0f, 1.0f);
    return config.maxThreshold * std::pow(config.minThreshold / config.maxThreshold, s);
}

auto VoiceActivityDetector::computeRms(AudioFrame frame) noexcept -> float
{
    if (frame.empty())
        return 0.0f;

    auto energy = 0.0f;
    for (auto const sample: frame)
        energy += sample * sample;

    return std::sqrt(energy / static_cast<float>(frame.size()));
}

} // namespace vocatype
