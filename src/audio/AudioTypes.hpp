// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace vocatype
{

/// @brief Default capture sample rate (mono float32), as expected by whisper.cpp.
constexpr auto DefaultSampleRate = std::uint32_t { 16000 };

/// @brief Duration of one analysis frame at every sample rate.
constexpr auto FrameDuration = std::chrono::milliseconds { 10 };

/// @brief Number of samples in one analysis frame at the default rate.
constexpr auto FrameSamples = std::size_t { 160 };

/// @brief A read-only view of one captured frame of mono float samples.
using AudioFrame = std::span<const float>;

/// @brief Converts a duration to a sample count at the given rate (truncating).
[[nodiscard]] constexpr auto durationToSamples(std::chrono::microseconds duration, std::uint32_t sampleRate)
    -> std::size_t
{
    if (duration.count() <= 0)
        return 0;
    return static_cast<std::size_t>(duration.count()) * sampleRate / 1'000'000u;
}

/// @brief Number of samples in one analysis frame at @p sampleRate.
[[nodiscard]] constexpr auto frameSamplesFor(std::uint32_t sampleRate) -> std::size_t
{
    return durationToSamples(FrameDuration, sampleRate);
}

/// @brief Converts a sample count to a duration at the given rate.
[[nodiscard]] constexpr auto samplesToDuration(std::size_t samples, std::uint32_t sampleRate)
    -> std::chrono::milliseconds
{
    if (sampleRate == 0)
        return std::chrono::milliseconds { 0 };
    return std::chrono::milliseconds { static_cast<std::int64_t>(samples * 1000u / sampleRate) };
}

/// @brief Why a speech segment was closed.
enum class SegmentEndReason : std::uint8_t
{
    SpeechEnd,   ///< VAD detected sustained silence.
    MaxDuration, ///< The segment reached the configured maximum duration.
    Manual,      ///< Flushed on request (e.g. the dictation hotkey was pressed again).
    Stopped,     ///< The pipeline was stopped while speech was in progress.
};

[[nodiscard]] constexpr auto segmentEndReasonToString(SegmentEndReason reason) -> std::string_view
{
    switch (reason)
    {
        case SegmentEndReason::SpeechEnd: return "speech-end";
        case SegmentEndReason::MaxDuration: return "max-duration";
        case SegmentEndReason::Manual: return "manual";
        case SegmentEndReason::Stopped: return "stopped";
    }
    return "unknown";
}

/// @brief Contiguous span of captured audio between speech boundaries.
///
/// Created by the audio pipeline and consumed exactly once by the transcription engine.
struct SpeechSegment
{
    std::uint64_t id = 0;
    std::vector<float> samples;
    std::uint32_t sampleRate = DefaultSampleRate;
    SegmentEndReason endReason = SegmentEndReason::SpeechEnd;

    [[nodiscard]] auto duration() const -> std::chrono::milliseconds
    {
        return samplesToDuration(samples.size(), sampleRate);
    }

    [[nodiscard]] auto empty() const -> bool { return samples.empty(); }
};

} // namespace vocatype
