// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioTypes.hpp>
#include <core/Error.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace vocatype
{

/// @brief Snapshot of the buffer fill state.
struct BufferStats
{
    std::size_t capacity = 0;
    std::size_t size = 0;
    float usagePercent = 0.0f;
    bool isFull = false;
    std::chrono::milliseconds durationStored { 0 };
    std::uint64_t totalWritten = 0;
};

/// @brief Fixed-capacity ring of PCM samples holding a rolling time window.
///
/// One writer (the capture callback) and any number of readers. Writes never block and never
/// allocate; every push() is published atomically as a whole frame through a sequence counter, so
/// readers either see a frame completely or not at all. Readers only ever receive copies.
///
/// Samples are addressed by their absolute index since construction (or the last clear()).
class CircularAudioBuffer
{
  public:
    /// @brief Creates a buffer holding @p duration of audio at @p sampleRate.
    /// @return The buffer, or InvalidArgument if the resulting capacity is zero.
    [[nodiscard]] static auto create(std::uint32_t sampleRate, std::chrono::milliseconds duration)
        -> Result<std::unique_ptr<CircularAudioBuffer>>;

    CircularAudioBuffer(std::uint32_t sampleRate, std::size_t capacity);

    CircularAudioBuffer(const CircularAudioBuffer&) = delete;
    CircularAudioBuffer& operator=(const CircularAudioBuffer&) = delete;

    /// @brief Appends a frame, overwriting the oldest samples once the buffer is full.
    ///
    /// Writer thread only. A frame longer than the capacity keeps only its newest samples.
    void push(AudioFrame frame) noexcept;

    /// @brief Copies the most recent @p duration of audio (clamped to the available history).
    [[nodiscard]] auto snapshot(std::chrono::milliseconds duration) const -> std::vector<float>;

    /// @brief Copies the most recent @p count samples (clamped to the available history).
    [[nodiscard]] auto snapshotSamples(std::size_t count) const -> std::vector<float>;

    /// @brief Copies the absolute sample range [begin, end), clamped to what is still retained.
    [[nodiscard]] auto copyRange(std::uint64_t begin, std::uint64_t end) const -> std::vector<float>;

    /// @brief Discards all samples. Writer thread only, or while no writer is active.
    void clear() noexcept;

    /// @brief Number of valid samples currently retained.
    [[nodiscard]] auto size() const noexcept -> std::size_t;

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return _capacity; }

    [[nodiscard]] auto sampleRate() const noexcept -> std::uint32_t { return _sampleRate; }

    /// @brief Absolute index one past the newest sample.
    [[nodiscard]] auto totalWritten() const noexcept -> std::uint64_t;

    /// @brief Returns true if at least @p minDuration of audio is retained.
    [[nodiscard]] auto hasSufficientData(std::chrono::milliseconds minDuration) const noexcept -> bool;

    [[nodiscard]] auto stats() const noexcept -> BufferStats;

  private:
    std::uint32_t _sampleRate;
    std::size_t _capacity;
    std::vector<std::atomic<float>> _samples;

    // Odd while a frame is being written.
    std::atomic<std::uint64_t> _sequence { 0 };
    std::atomic<std::uint64_t> _written { 0 };
    // Absolute index of the oldest retained sample (moves forward on clear()).
    std::atomic<std::uint64_t> _origin { 0 };
};

} // namespace vocatype
