// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace vocatype
{

/// @brief Callback invoked with captured audio on the source's real-time thread.
/// @param samples Float32 mono PCM at the rate passed to AudioSource::open().
using AudioCallback = std::function<void(std::span<const float> samples)>;

/// @brief Abstract interface for an audio input device.
///
/// Implementations deliver audio from their own real-time context. The callback must not be
/// invoked after stop() has returned.
class AudioSource
{
  public:
    virtual ~AudioSource() = default;

    /// @brief Resolves and configures the input device.
    /// @param deviceName Case-insensitive substring of the device name; empty selects automatically.
    /// @param sampleRate Requested sample rate (mono float32).
    /// @param callback Receives audio chunks once started.
    /// @return Success, DeviceUnavailable if no input device resolves, or StreamInitError.
    [[nodiscard]] virtual auto open(std::string_view deviceName, std::uint32_t sampleRate, AudioCallback callback)
        -> VoidResult = 0;

    /// @brief Starts delivering audio.
    [[nodiscard]] virtual auto start() -> VoidResult = 0;

    /// @brief Stops delivering audio; blocks until the callback is no longer running.
    virtual void stop() = 0;

    /// @brief Releases the device. The source may be opened again afterwards.
    virtual void close() = 0;

    [[nodiscard]] virtual auto isCapturing() const -> bool = 0;

    /// @brief Name of the opened device, for diagnostics.
    [[nodiscard]] virtual auto deviceName() const -> std::string = 0;
};

} // namespace vocatype
