// SPDX-License-Identifier: Apache-2.0
#include "Transcriber.hpp"

#include <core/Log.hpp>

#include <whisper.h>

#include <format>
#include <mutex>
#include <optional>
#include <string>

namespace vocatype
{

namespace
{

    /// @brief Line buffer for whisper.cpp log continuation messages.
    auto whisperLineBuffer = std::string {};
    auto whisperLineMutex = std::mutex {};

    auto mapGgmlLevel(ggml_log_level level) -> std::optional<log::Level>
    {
        switch (level)
        {
            case GGML_LOG_LEVEL_ERROR: return log::Level::Error;
            case GGML_LOG_LEVEL_WARN: return log::Level::Warning;
            // whisper is chatty at info level; keep it out of the default output
            case GGML_LOG_LEVEL_INFO: return log::Level::Debug;
            case GGML_LOG_LEVEL_DEBUG: return log::Level::Trace;
            default: return std::nullopt;
        }
    }

    /// @brief Forwards whisper.cpp log output to vocatype::log, one complete line at a time.
    void whisperLogCallback(ggml_log_level level, char const* text, void* /*userData*/)
    {
        if (level == GGML_LOG_LEVEL_NONE || text == nullptr)
            return;

        auto lock = std::lock_guard(whisperLineMutex);
        whisperLineBuffer += std::string_view { text };

        while (true)
        {
            auto const nlPos = whisperLineBuffer.find('\n');
            if (nlPos == std::string::npos)
                break;

            auto line = whisperLineBuffer.substr(0, nlPos);
            auto const end = line.find_last_not_of(" \t\r");
            if (end != std::string::npos)
                line = line.substr(0, end + 1);

            if (!line.empty() && line.find_first_not_of(" \t\r") != std::string::npos)
                log::write(mapGgmlLevel(level).value_or(log::Level::Debug), line);

            whisperLineBuffer.erase(0, nlPos + 1);
        }
    }

    struct AbortState
    {
        std::chrono::steady_clock::time_point deadline;
        std::stop_token stopToken;

        [[nodiscard]] auto expired() const -> bool { return std::chrono::steady_clock::now() >= deadline; }
    };

    auto shouldAbort(void* userData) -> bool
    {
        auto const* state = static_cast<const AbortState*>(userData);
        return state->stopToken.stop_requested() || state->expired();
    }

} // namespace

struct WhisperTranscriber::Impl
{
    whisper_context* ctx = nullptr;
    TranscriberConfig config;
    std::mutex mutex;

    ~Impl()
    {
        if (ctx)
            whisper_free(ctx);
    }
};

WhisperTranscriber::WhisperTranscriber(): _impl(std::make_unique<Impl>())
{
}

WhisperTranscriber::~WhisperTranscriber() = default;

auto WhisperTranscriber::initialize(const TranscriberConfig& config) -> VoidResult
{
    _impl->config = config;

    whisper_log_set(whisperLogCallback, nullptr);

    auto params = whisper_context_default_params();
    _impl->ctx = whisper_init_from_file_with_params(config.modelPath.c_str(), params);

    if (!_impl->ctx)
        return makeError(ErrorCode::TranscriptionError,
                         std::format("Failed to load whisper model: {}", config.modelPath));

    log::info("Whisper model loaded: {}", config.modelPath);
    return {};
}

auto WhisperTranscriber::transcribe(std::span<const float> samples,
                                    std::uint32_t sampleRate,
                                    std::string_view languageHint,
                                    std::chrono::milliseconds timeout,
                                    std::stop_token stopToken) -> Result<std::string>
{
    if (!_impl->ctx)
        return makeError(ErrorCode::TranscriptionError, "Whisper model not loaded");
    if (sampleRate != static_cast<std::uint32_t>(WHISPER_SAMPLE_RATE))
        return makeError(ErrorCode::TranscriptionError,
                         std::format("Whisper expects {} Hz audio, got {} Hz", WHISPER_SAMPLE_RATE, sampleRate));
    if (samples.empty())
        return std::string {};

    auto abortState = AbortState {
        .deadline = std::chrono::steady_clock::now() + timeout,
        .stopToken = std::move(stopToken),
    };

    auto lock = std::unique_lock(_impl->mutex);
    if (shouldAbort(&abortState))
        return abortState.stopToken.stop_requested()
                   ? makeError(ErrorCode::Cancelled, "Transcription cancelled")
                   : makeError(ErrorCode::Timeout, "Transcription timed out waiting for the model");

    auto const language = languageHint.empty() ? _impl->config.language : std::string(languageHint);

    auto params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.language = language.c_str();
    params.detect_language = language == "auto";
    params.translate = _impl->config.translate;
    params.n_threads = _impl->config.threads;
    params.print_progress = false;
    params.print_special = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.no_context = true;
    params.single_segment = true;
    params.abort_callback = shouldAbort;
    params.abort_callback_user_data = &abortState;

    auto const startTime = std::chrono::steady_clock::now();
    auto const result = whisper_full(_impl->ctx, params, samples.data(), static_cast<int>(samples.size()));

    if (abortState.stopToken.stop_requested())
        return makeError(ErrorCode::Cancelled, "Transcription cancelled");
    if (result != 0)
    {
        if (abortState.expired())
            return makeError(ErrorCode::Timeout,
                             std::format("Transcription exceeded {} ms", timeout.count()));
        return makeError(ErrorCode::TranscriptionError,
                         std::format("Whisper transcription failed with code: {}", result));
    }

    auto const nSegments = whisper_full_n_segments(_impl->ctx);
    auto text = std::string {};
    for (auto i = 0; i < nSegments; ++i)
    {
        auto const* segmentText = whisper_full_get_segment_text(_impl->ctx, i);
        if (segmentText)
            text += segmentText;
    }

    log::debug("Transcribed {} samples in {} ms",
               samples.size(),
               std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime)
                   .count());
    return normalizeTranscript(text);
}

auto WhisperTranscriber::isLoaded() const -> bool
{
    return _impl->ctx != nullptr;
}

} // namespace vocatype
