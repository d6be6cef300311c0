// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioSource.hpp>

#include <memory>
#include <string>
#include <vector>

namespace vocatype
{

/// @brief Describes a capture device found during enumeration.
struct AudioDeviceInfo
{
    std::string name;
    bool isDefault = false;
};

/// @brief Captures audio from the microphone using miniaudio.
///
/// Captures float32 mono PCM at the requested rate with a 10 ms period, suitable for speech
/// recognition and frame-by-frame voice activity detection.
class AudioCapture: public AudioSource
{
  public:
    AudioCapture();
    ~AudioCapture() override;

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    [[nodiscard]] auto open(std::string_view deviceName, std::uint32_t sampleRate, AudioCallback callback)
        -> VoidResult override;
    [[nodiscard]] auto start() -> VoidResult override;
    void stop() override;
    void close() override;
    [[nodiscard]] auto isCapturing() const -> bool override;
    [[nodiscard]] auto deviceName() const -> std::string override;

    /// @brief Lists the available capture devices.
    [[nodiscard]] static auto listDevices() -> Result<std::vector<AudioDeviceInfo>>;

    // Impl must be accessible from the C audio callback
    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace vocatype
