// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioSource.hpp>
#include <audio/AudioTypes.hpp>
#include <audio/CircularAudioBuffer.hpp>
#include <audio/VoiceActivityDetector.hpp>
#include <core/Error.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace vocatype
{

/// @brief Configuration for the audio pipeline.
struct AudioPipelineConfig
{
    /// Capture rate; must split into whole 10 ms analysis frames.
    std::uint32_t sampleRate = DefaultSampleRate;
    std::string deviceName;
    std::chrono::milliseconds bufferDuration { 30'000 };
    /// Forced segment end; a whole number of frames, at most bufferDuration.
    std::chrono::milliseconds maxSegmentDuration { 15'000 };
    VadConfig vad;
    std::size_t eventQueueCapacity = 64;
};

/// @brief Checks pipeline parameters (including the VAD block) for consistency.
[[nodiscard]] auto validateAudioPipelineConfig(const AudioPipelineConfig& config) -> VoidResult;

/// @brief Live pipeline metrics. Values are sampled from atomics and may be slightly stale.
struct PipelineTelemetry
{
    /// Smoothed input level mapped from -60..0 dBFS onto 0..1.
    float level = 0.0f;
    /// Highest absolute sample value seen since start().
    float peak = 0.0f;
    std::uint64_t framesProcessed = 0;
    /// Segment events that could not be enqueued because the event queue was full.
    std::uint64_t droppedEvents = 0;
    std::uint64_t segmentsEmitted = 0;
    /// Id of the most recently opened (or flushed) segment; 0 before the first one.
    std::uint64_t lastSegmentId = 0;
    bool speechActive = false;
    bool capturing = false;
    BufferStats buffer;
};

/// @brief Callbacks invoked on the pipeline's dispatcher thread, in FIFO order.
struct PipelineCallbacks
{
    std::function<void(std::uint64_t segmentId)> onSpeechStart;
    std::function<void(SpeechSegment segment)> onSpeechEnd;
};

/// @brief Turns a live audio stream into speech segments.
///
/// The capture callback slices device audio into fixed 10 ms frames, appends them to a rolling
/// CircularAudioBuffer and classifies each one with the VoiceActivityDetector. Segment boundaries are
/// handed to a dispatcher thread through a lock-free queue; the dispatcher copies the segment audio
/// out of the buffer and invokes the callbacks. Nothing on the capture path blocks or allocates.
class AudioPipeline
{
  public:
    AudioPipeline();
    ~AudioPipeline();

    AudioPipeline(const AudioPipeline&) = delete;
    AudioPipeline& operator=(const AudioPipeline&) = delete;

    /// @brief Validates the configuration and prepares the buffer and detector.
    /// @param config Pipeline configuration.
    /// @param source The audio input device. Opened on start(), closed on stop().
    /// @param callbacks Segment callbacks.
    /// @return Success, ConfigError or InvalidArgument.
    [[nodiscard]] auto initialize(AudioPipelineConfig config,
                                  std::unique_ptr<AudioSource> source,
                                  PipelineCallbacks callbacks) -> VoidResult;

    /// @brief Opens the audio source and starts capturing.
    /// @return Success, DeviceUnavailable or StreamInitError.
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Stops capturing. An open segment is emitted with reason Stopped before this returns.
    void stop();

    /// @brief Asks the capture thread to close the open segment (reason Manual).
    ///
    /// If no segment is open, an empty segment is emitted instead.
    /// @return false if the pipeline is not capturing (nothing will be emitted).
    auto requestFlush() -> bool;

    /// @brief Changes the detector sensitivity; applied by the capture thread on its next callback.
    void setSensitivity(float sensitivity);

    [[nodiscard]] auto isCapturing() const -> bool;

    [[nodiscard]] auto telemetry() const -> PipelineTelemetry;

    /// @brief Copies the most recent @p duration of captured audio.
    [[nodiscard]] auto recentAudio(std::chrono::milliseconds duration) const -> std::vector<float>;

    [[nodiscard]] auto config() const -> const AudioPipelineConfig&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace vocatype
