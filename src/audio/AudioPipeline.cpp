// SPDX-License-Identifier: Apache-2.0
#include "AudioPipeline.hpp"

#include <core/Log.hpp>
#include <core/SpscQueue.hpp>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <format>
#include <optional>
#include <thread>
#include <vector>

namespace vocatype
{

namespace
{

    /// Boundary notification passed from the capture thread to the dispatcher.
    struct SegmentEvent
    {
        enum class Kind : std::uint8_t
        {
            Start,
            End,
        };

        Kind kind = Kind::Start;
        std::uint64_t id = 0;
        std::uint64_t begin = 0;
        std::uint64_t end = 0;
        SegmentEndReason reason = SegmentEndReason::SpeechEnd;
    };

    constexpr auto MeterFloorDb = -60.0f;

    auto levelToMeter(float level) -> float
    {
        if (level <= 0.0f)
            return 0.0f;
        auto const db = 20.0f * std::log10(level);
        return std::clamp((db - MeterFloorDb) / -MeterFloorDb, 0.0f, 1.0f);
    }

} // namespace

auto validateAudioPipelineConfig(const AudioPipelineConfig& config) -> VoidResult
{
    if (config.sampleRate < 8000 || config.sampleRate > 192000)
        return makeError(ErrorCode::ConfigError, std::format("Unsupported sample rate: {} Hz", config.sampleRate));
    if (config.sampleRate % 100 != 0)
        return makeError(ErrorCode::ConfigError,
                         std::format("Sample rate {} Hz does not split into whole 10 ms frames", config.sampleRate));
    if (config.bufferDuration.count() <= 0)
        return makeError(ErrorCode::ConfigError, "Audio buffer duration must be positive");
    if (config.maxSegmentDuration.count() <= 0)
        return makeError(ErrorCode::ConfigError, "Maximum segment duration must be positive");
    if (config.maxSegmentDuration % FrameDuration != std::chrono::milliseconds::zero())
        return makeError(ErrorCode::ConfigError,
                         std::format("Maximum segment duration ({} ms) must be a multiple of {} ms",
                                     config.maxSegmentDuration.count(),
                                     FrameDuration.count()));
    if (config.maxSegmentDuration > config.bufferDuration)
        return makeError(ErrorCode::ConfigError,
                         std::format("Maximum segment duration ({} ms) exceeds the audio buffer ({} ms)",
                                     config.maxSegmentDuration.count(),
                                     config.bufferDuration.count()));
    if (config.eventQueueCapacity == 0)
        return makeError(ErrorCode::ConfigError, "Segment event queue capacity must be positive");
    return validateVadConfig(config.vad);
}

struct AudioPipeline::Impl
{
    AudioPipelineConfig config;
    PipelineCallbacks callbacks;
    std::unique_ptr<AudioSource> source;
    std::unique_ptr<CircularAudioBuffer> buffer;
    std::unique_ptr<SpscQueue<SegmentEvent>> events;
    std::optional<VoiceActivityDetector> vad;
    std::size_t maxSegmentSamples = 0;
    std::size_t frameSamples = FrameSamples;

    // Capture thread state (touched by the control thread only while the source is stopped).
    std::vector<float> frame;
    std::size_t frameFill = 0;
    bool segmentOpen = false;
    std::uint64_t segmentId = 0;
    std::uint64_t segmentBegin = 0;
    std::uint64_t nextSegmentId = 1;

    // Shared with the control thread.
    std::atomic<bool> capturing = false;
    std::atomic<bool> flushRequested = false;
    std::atomic<float> sensitivity = 0.5f;
    std::atomic<float> level = 0.0f;
    std::atomic<float> peak = 0.0f;
    std::atomic<bool> speechActive = false;
    std::atomic<std::uint64_t> framesProcessed = 0;
    std::atomic<std::uint64_t> droppedEvents = 0;
    std::atomic<std::uint64_t> segmentsEmitted = 0;
    std::atomic<std::uint64_t> lastSegmentId = 0;
    std::atomic<std::uint32_t> wakeups = 0;

    std::jthread dispatcher;

    void enqueue(const SegmentEvent& event) noexcept
    {
        if (!events->push(event))
            droppedEvents.fetch_add(1, std::memory_order_relaxed);
        wakeups.fetch_add(1, std::memory_order_release);
        wakeups.notify_one();
    }

    void openSegment(std::uint64_t begin) noexcept
    {
        segmentOpen = true;
        segmentId = nextSegmentId++;
        lastSegmentId.store(segmentId, std::memory_order_release);
        segmentBegin = begin;
        enqueue(SegmentEvent { .kind = SegmentEvent::Kind::Start, .id = segmentId, .begin = begin });
    }

    void closeSegment(std::uint64_t end, SegmentEndReason reason) noexcept
    {
        segmentOpen = false;
        enqueue(SegmentEvent {
            .kind = SegmentEvent::Kind::End,
            .id = segmentId,
            .begin = segmentBegin,
            .end = end,
            .reason = reason,
        });
    }

    /// Emits an end event without any audio, so a flush always gets an answer.
    void emitEmptySegment(std::uint64_t at) noexcept
    {
        segmentId = nextSegmentId++;
        lastSegmentId.store(segmentId, std::memory_order_release);
        segmentBegin = at;
        closeSegment(at, SegmentEndReason::Manual);
    }

    void processFrame(AudioFrame samples) noexcept
    {
        buffer->push(samples);
        auto const frameEnd = buffer->totalWritten();

        auto framePeak = 0.0f;
        for (auto const sample: samples)
            framePeak = std::max(framePeak, std::abs(sample));
        if (framePeak > peak.load(std::memory_order_relaxed))
            peak.store(framePeak, std::memory_order_relaxed);

        auto const result = vad->process(samples);
        level.store(result.level, std::memory_order_relaxed);
        framesProcessed.fetch_add(1, std::memory_order_relaxed);

        if (segmentOpen && frameEnd - segmentBegin >= maxSegmentSamples)
        {
            closeSegment(segmentBegin + maxSegmentSamples, SegmentEndReason::MaxDuration);
            vad->forceSilence();
        }
        else if (result.event == VadEvent::SpeechStart)
        {
            auto const onset = static_cast<std::uint64_t>(vad->aboveRun()) * frameSamples;
            openSegment(frameEnd > onset ? frameEnd - onset : 0);
        }
        else if (result.event == VadEvent::SpeechEnd && segmentOpen)
        {
            closeSegment(frameEnd, SegmentEndReason::SpeechEnd);
        }

        speechActive.store(vad->isSpeech(), std::memory_order_relaxed);
    }

    void handleAudio(std::span<const float> samples) noexcept
    {
        if (auto const s = sensitivity.load(std::memory_order_relaxed); s != vad->config().sensitivity)
            vad->setSensitivity(s);

        while (!samples.empty())
        {
            auto const take = std::min(samples.size(), frameSamples - frameFill);
            std::copy_n(samples.begin(), take, frame.begin() + static_cast<std::ptrdiff_t>(frameFill));
            frameFill += take;
            samples = samples.subspan(take);

            if (frameFill == frameSamples)
            {
                processFrame(AudioFrame(frame.data(), frame.size()));
                frameFill = 0;
            }
        }

        if (flushRequested.exchange(false, std::memory_order_acq_rel))
            finishSegment(SegmentEndReason::Manual);
    }

    /// Closes the open segment with @p reason, or answers a flush with an empty segment.
    void finishSegment(SegmentEndReason reason) noexcept
    {
        auto const now = buffer->totalWritten();
        if (segmentOpen)
        {
            closeSegment(now, reason);
            vad->forceSilence();
            speechActive.store(false, std::memory_order_relaxed);
        }
        else if (reason == SegmentEndReason::Manual)
        {
            emitEmptySegment(now);
        }
    }

    void dispatch(const SegmentEvent& event)
    {
        if (event.kind == SegmentEvent::Kind::Start)
        {
            log::debug("Speech segment {} started at sample {}", event.id, event.begin);
            if (callbacks.onSpeechStart)
                callbacks.onSpeechStart(event.id);
            return;
        }

        auto segment = SpeechSegment {
            .id = event.id,
            .samples = buffer->copyRange(event.begin, event.end),
            .sampleRate = config.sampleRate,
            .endReason = event.reason,
        };
        segmentsEmitted.fetch_add(1, std::memory_order_relaxed);
        log::debug("Speech segment {} ended ({}, {} ms)",
                   segment.id,
                   segmentEndReasonToString(segment.endReason),
                   segment.duration().count());
        if (callbacks.onSpeechEnd)
            callbacks.onSpeechEnd(std::move(segment));
    }

    void dispatcherLoop(std::stop_token stopToken)
    {
        while (true)
        {
            auto const seen = wakeups.load(std::memory_order_acquire);
            while (auto event = events->pop())
                dispatch(*event);

            if (stopToken.stop_requested())
            {
                while (auto event = events->pop())
                    dispatch(*event);
                return;
            }

            wakeups.wait(seen, std::memory_order_acquire);
        }
    }

    void stopDispatcher()
    {
        if (!dispatcher.joinable())
            return;
        dispatcher.request_stop();
        wakeups.fetch_add(1, std::memory_order_release);
        wakeups.notify_one();
        dispatcher.join();
    }
};

AudioPipeline::AudioPipeline(): _impl(std::make_unique<Impl>())
{
}

AudioPipeline::~AudioPipeline()
{
    stop();
}

auto AudioPipeline::initialize(AudioPipelineConfig config,
                               std::unique_ptr<AudioSource> source,
                               PipelineCallbacks callbacks) -> VoidResult
{
    if (_impl->capturing)
        return makeError(ErrorCode::InvalidArgument, "Audio pipeline is running");
    if (!source)
        return makeError(ErrorCode::InvalidArgument, "Audio pipeline requires an audio source");
    if (auto valid = validateAudioPipelineConfig(config); !valid)
        return valid;

    auto buffer = CircularAudioBuffer::create(config.sampleRate, config.bufferDuration);
    if (!buffer)
        return std::unexpected(buffer.error());

    _impl->buffer = std::move(*buffer);
    _impl->events = std::make_unique<SpscQueue<SegmentEvent>>(config.eventQueueCapacity);
    _impl->vad.emplace(config.vad);
    _impl->sensitivity = config.vad.sensitivity;
    _impl->maxSegmentSamples = durationToSamples(config.maxSegmentDuration, config.sampleRate);
    _impl->frameSamples = frameSamplesFor(config.sampleRate);
    _impl->frame.assign(_impl->frameSamples, 0.0f);
    _impl->source = std::move(source);
    _impl->callbacks = std::move(callbacks);
    _impl->config = std::move(config);

    log::info("Audio pipeline initialized ({} Hz, buffer {} ms, max segment {} ms)",
              _impl->config.sampleRate,
              _impl->config.bufferDuration.count(),
              _impl->config.maxSegmentDuration.count());
    return {};
}

auto AudioPipeline::start() -> VoidResult
{
    if (!_impl->source)
        return makeError(ErrorCode::StreamInitError, "Audio pipeline not initialized");
    if (_impl->capturing)
        return {};

    _impl->buffer->clear();
    _impl->vad->reset();
    _impl->frameFill = 0;
    _impl->segmentOpen = false;
    _impl->flushRequested = false;
    _impl->level = 0.0f;
    _impl->peak = 0.0f;
    _impl->speechActive = false;

    auto opened = _impl->source->open(_impl->config.deviceName,
                                      _impl->config.sampleRate,
                                      [impl = _impl.get()](std::span<const float> samples) {
                                          impl->handleAudio(samples);
                                      });
    if (!opened)
    {
        log::error("Failed to open audio source: {}", opened.error());
        return opened;
    }

    _impl->dispatcher = std::jthread([impl = _impl.get()](std::stop_token stopToken) {
        impl->dispatcherLoop(std::move(stopToken));
    });

    _impl->capturing = true;
    if (auto started = _impl->source->start(); !started)
    {
        _impl->capturing = false;
        _impl->source->close();
        _impl->stopDispatcher();
        log::error("Failed to start audio source: {}", started.error());
        return started;
    }

    log::info("Audio pipeline started on '{}'", _impl->source->deviceName());
    return {};
}

void AudioPipeline::stop()
{
    if (!_impl->capturing.exchange(false))
        return;

    // After stop() returns the capture callback no longer runs, so this thread becomes the producer.
    _impl->source->stop();
    if (_impl->flushRequested.exchange(false))
        _impl->finishSegment(SegmentEndReason::Manual);
    _impl->finishSegment(SegmentEndReason::Stopped);

    _impl->stopDispatcher();
    _impl->source->close();
    _impl->speechActive = false;

    log::info("Audio pipeline stopped ({} frames, {} segments, {} dropped events)",
              _impl->framesProcessed.load(),
              _impl->segmentsEmitted.load(),
              _impl->droppedEvents.load());
}

auto AudioPipeline::requestFlush() -> bool
{
    if (!_impl->capturing)
        return false;
    _impl->flushRequested.store(true, std::memory_order_release);
    return true;
}

void AudioPipeline::setSensitivity(float sensitivity)
{
    _impl->sensitivity.store(std::clamp(sensitivity, 0.0f, 1.0f), std::memory_order_relaxed);
}

auto AudioPipeline::isCapturing() const -> bool
{
    return _impl->capturing;
}

auto AudioPipeline::telemetry() const -> PipelineTelemetry
{
    return PipelineTelemetry {
        .level = levelToMeter(_impl->level.load(std::memory_order_relaxed)),
        .peak = _impl->peak.load(std::memory_order_relaxed),
        .framesProcessed = _impl->framesProcessed.load(std::memory_order_relaxed),
        .droppedEvents = _impl->droppedEvents.load(std::memory_order_relaxed),
        .segmentsEmitted = _impl->segmentsEmitted.load(std::memory_order_relaxed),
        .lastSegmentId = _impl->lastSegmentId.load(std::memory_order_acquire),
        .speechActive = _impl->speechActive.load(std::memory_order_relaxed),
        .capturing = _impl->capturing.load(std::memory_order_relaxed),
        .buffer = _impl->buffer ? _impl->buffer->stats() : BufferStats {},
    };
}

auto AudioPipeline::recentAudio(std::chrono::milliseconds duration) const -> std::vector<float>
{
    if (!_impl->buffer)
        return {};
    return _impl->buffer->snapshot(duration);
}

auto AudioPipeline::config() const -> const AudioPipelineConfig&
{
    return _impl->config;
}

} // namespace vocatype
