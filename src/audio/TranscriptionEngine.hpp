// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <cstdint>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

namespace vocatype
{

/// @brief Speech-to-text backend consumed by the workflow coordinator.
class TranscriptionEngine
{
  public:
    virtual ~TranscriptionEngine() = default;

    /// @brief Transcribes one speech segment.
    /// @param samples Float32 mono PCM.
    /// @param sampleRate Rate of @p samples in Hz.
    /// @param languageHint ISO 639-1 code, "auto" or empty for the engine default.
    /// @param timeout Upper bound on the call duration.
    /// @param stopToken Aborts the transcription when stop is requested.
    /// @return The text (possibly empty), or Timeout, Cancelled or TranscriptionError.
    [[nodiscard]] virtual auto transcribe(std::span<const float> samples,
                                          std::uint32_t sampleRate,
                                          std::string_view languageHint,
                                          std::chrono::milliseconds timeout,
                                          std::stop_token stopToken) -> Result<std::string> = 0;
};

/// @brief Trims whitespace and drops non-speech markers such as "[BLANK_AUDIO]".
[[nodiscard]] auto normalizeTranscript(std::string_view text) -> std::string;

} // namespace vocatype
