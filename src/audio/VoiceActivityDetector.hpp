// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioTypes.hpp>
#include <core/Error.hpp>

#include <cstdint>
#include <optional>

namespace vocatype
{

/// @brief Tunable parameters of the voice activity detector.
struct VadConfig
{
    /// Detection sensitivity in [0, 1]; higher values trigger on quieter speech.
    float sensitivity = 0.5f;

    /// Exponential smoothing coefficient for the frame energy, in [0, 1).
    float smoothing = 0.8f;

    /// Consecutive above-threshold frames required to enter speech.
    std::uint32_t onsetFrames = 3;

    /// Consecutive below-threshold frames required to leave speech.
    std::uint32_t releaseFrames = 10;

    /// RMS threshold used at sensitivity 1.0.
    float minThreshold = 0.001f;

    /// RMS threshold used at sensitivity 0.0.
    float maxThreshold = 0.1f;
};

/// @brief Checks the VAD parameters for consistency.
[[nodiscard]] auto validateVadConfig(const VadConfig& config) -> VoidResult;

/// @brief Speech boundary transition.
enum class VadEvent : std::uint8_t
{
    SpeechStart,
    SpeechEnd,
};

/// @brief Outcome of classifying one frame.
struct VadResult
{
    bool isSpeech = false;
    std::optional<VadEvent> event;
    float rms = 0.0f;
    float level = 0.0f;
};

/// @brief Counters for monitoring.
struct VadStats
{
    std::uint64_t totalFrames = 0;
    std::uint64_t speechFrames = 0;
    float speechRatio = 0.0f;
    float level = 0.0f;
    float threshold = 0.0f;
    bool isSpeech = false;
};

/// @brief Energy-based voice activity detection with smoothing and hysteresis.
///
/// Each frame's RMS energy feeds an exponential moving average. The detector switches to speech
/// once the smoothed level has exceeded the threshold for VadConfig::onsetFrames consecutive frames,
/// and back to silence after VadConfig::releaseFrames consecutive frames at or below it. Every
/// transition produces exactly one event.
///
/// Not thread-safe; owned and driven by the capture callback. process() does not allocate.
class VoiceActivityDetector
{
  public:
    explicit VoiceActivityDetector(VadConfig config = {});

    /// @brief Classifies one frame and reports a transition if one occurred.
    [[nodiscard]] auto process(AudioFrame frame) noexcept -> VadResult;

    /// @brief Changes the sensitivity (clamped to [0, 1]) and recomputes the energy threshold.
    void setSensitivity(float sensitivity) noexcept;

    /// @brief Returns to silence without emitting an event, keeping the smoothed level.
    ///
    /// Used when a segment is closed externally (e.g. maximum duration reached) so that continuing
    /// speech opens a new segment after the onset run.
    void forceSilence() noexcept;

    /// @brief Resets all state, including the smoothed level and statistics.
    void reset() noexcept;

    [[nodiscard]] auto isSpeech() const noexcept -> bool { return _speech; }

    /// @brief Length of the current above-threshold run (frames), i.e. how far back speech began.
    [[nodiscard]] auto aboveRun() const noexcept -> std::uint32_t { return _aboveRun; }

    [[nodiscard]] auto level() const noexcept -> float { return _level; }

    [[nodiscard]] auto threshold() const noexcept -> float { return _threshold; }

    [[nodiscard]] auto config() const noexcept -> const VadConfig& { return _config; }

    [[nodiscard]] auto stats() const noexcept -> VadStats;

    /// @brief Maps a sensitivity in [0, 1] to an RMS threshold (monotonically decreasing).
    [[nodiscard]] static auto thresholdForSensitivity(const VadConfig& config, float sensitivity) noexcept
        -> float;

    /// @brief Root-mean-square energy of a frame (0 for an empty frame).
    [[nodiscard]] static auto computeRms(AudioFrame frame) noexcept -> float;

  private:
    VadConfig _config;
    float _threshold = 0.0f;
    float _level = 0.0f;
    bool _speech = false;
    std::uint32_t _aboveRun = 0;
    std::uint32_t _belowRun = 0;
    std::uint64_t _totalFrames = 0;
    std::uint64_t _speechFrames = 0;
};

} // namespace vocatype
