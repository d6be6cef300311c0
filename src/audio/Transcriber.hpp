// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/TranscriptionEngine.hpp>
#include <core/Error.hpp>

#include <memory>
#include <string>

namespace vocatype
{

/// @brief Configuration for the whisper.cpp transcriber.
struct TranscriberConfig
{
    std::string modelPath;
    std::string language = "en";
    int threads = 4;
    bool translate = false;
};

/// @brief Speech-to-text transcription using whisper.cpp.
///
/// Calls are serialized; the whisper context is not reentrant.
class WhisperTranscriber: public TranscriptionEngine
{
  public:
    WhisperTranscriber();
    ~WhisperTranscriber() override;

    WhisperTranscriber(const WhisperTranscriber&) = delete;
    WhisperTranscriber& operator=(const WhisperTranscriber&) = delete;

    /// @brief Loads the whisper model.
    /// @param config Transcriber configuration.
    /// @return Success or a TranscriptionError.
    [[nodiscard]] auto initialize(const TranscriberConfig& config) -> VoidResult;

    /// @brief Transcribes @p samples, which must be at WHISPER_SAMPLE_RATE (16 kHz).
    [[nodiscard]] auto transcribe(std::span<const float> samples,
                                  std::uint32_t sampleRate,
                                  std::string_view languageHint,
                                  std::chrono::milliseconds timeout,
                                  std::stop_token stopToken) -> Result<std::string> override;

    /// @brief Returns true if the model is loaded.
    [[nodiscard]] auto isLoaded() const -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace vocatype
