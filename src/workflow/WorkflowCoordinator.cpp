// SPDX-License-Identifier: Apache-2.0
#include "WorkflowCoordinator.hpp"

#include <ai/Prompts.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <format>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <variant>

namespace vocatype
{

namespace
{

    using Clock = std::chrono::steady_clock;

    /// Longest the coordinator sleeps when nothing is scheduled.
    constexpr auto IdleWait = std::chrono::seconds(1);
    constexpr auto TranscriptionTarget = std::chrono::milliseconds(200);

    struct SpeechStartedEvent
    {
        std::uint64_t segmentId = 0;
    };

    struct SpeechEndedEvent
    {
        SpeechSegment segment;
    };

    struct JobOutcome
    {
        std::string text;
        std::string provider;
    };

    struct ProcessingFinishedEvent
    {
        std::uint64_t generation = 0;
        Result<JobOutcome> outcome;
    };

    using Event = std::variant<TriggerEvent, SpeechStartedEvent, SpeechEndedEvent, ProcessingFinishedEvent>;

    /// Input of one processing run: either a recorded segment or text handed in directly.
    struct Job
    {
        std::optional<SpeechSegment> segment;
        std::string text;
        std::optional<ActionSpec> action;
    };

    auto actionFor(std::string_view id) -> std::optional<ActionSpec>
    {
        if (id.empty())
            return std::nullopt;
        return parseActionSpec(id);
    }

    auto describe(const std::optional<ActionSpec>& action) -> std::string
    {
        if (!action)
            return "raw transcription";
        if (action->argument.empty())
            return std::string(actionToString(action->action));
        return std::format("{}:{}", actionToString(action->action), action->argument);
    }

} // namespace

struct WorkflowCoordinator::Impl
{
    WorkflowConfig config;
    TranscriptionEngine& transcriber;
    StreamingOrchestrator& orchestrator;
    OutputSink& sink;

    LatencyWindow endToEnd;
    LatencyWindow transcription { TranscriptionTarget };
    std::atomic<WorkflowState> published = WorkflowState::Idle;

    std::mutex queueMutex;
    std::condition_variable_any queueChanged;
    std::deque<Event> queue;
    std::jthread coordinator;

    // Declared after the queue: its dispatcher posts into it until stopped.
    AudioPipeline pipeline;
    bool pipelineReady = false;

    // Coordinator thread only.
    WorkflowState current = WorkflowState::Idle;
    std::optional<ActionSpec> pendingAction;
    std::uint64_t generation = 0;
    std::jthread processor;
    std::uint64_t ignoreThrough = 0;
    bool awaitingFlush = false;
    bool dropNextFlush = false;
    Clock::time_point errorDeadline {};
    Clock::time_point nextLevelReport {};
    Clock::time_point speechEnded {};

    Impl(WorkflowConfig cfg, TranscriptionEngine& t, StreamingOrchestrator& o, OutputSink& s):
        config(std::move(cfg)),
        transcriber(t),
        orchestrator(o),
        sink(s),
        endToEnd(config.latencyBudget)
    {
        config.levelRateHz = std::clamp(config.levelRateHz, 1u, 60u);
    }

    void post(Event event)
    {
        {
            auto lock = std::lock_guard(queueMutex);
            queue.push_back(std::move(event));
        }
        queueChanged.notify_one();
    }

    [[nodiscard]] auto nextWakeup() const -> Clock::time_point
    {
        auto wake = Clock::now() + IdleWait;
        if (current == WorkflowState::Listening)
            wake = std::min(wake, nextLevelReport);
        if (current == WorkflowState::Error)
            wake = std::min(wake, errorDeadline);
        return wake;
    }

    void run(std::stop_token stopToken)
    {
        log::debug("Workflow coordinator started");
        while (!stopToken.stop_requested())
        {
            auto event = std::optional<Event> {};
            {
                auto lock = std::unique_lock(queueMutex);
                if (queueChanged.wait_until(lock, stopToken, nextWakeup(), [&] { return !queue.empty(); }))
                {
                    event = std::move(queue.front());
                    queue.pop_front();
                }
            }

            if (event)
                dispatch(std::move(*event));
            onTick();
        }

        cancelProcessing();
        pipeline.stop();
        log::debug("Workflow coordinator stopped");
    }

    void dispatch(Event event)
    {
        if (auto* trigger = std::get_if<TriggerEvent>(&event))
            handleTrigger(*trigger);
        else if (auto* started = std::get_if<SpeechStartedEvent>(&event))
            handleSpeechStarted(started->segmentId);
        else if (auto* ended = std::get_if<SpeechEndedEvent>(&event))
            handleSpeechEnded(std::move(ended->segment));
        else if (auto* finished = std::get_if<ProcessingFinishedEvent>(&event))
            handleProcessingFinished(finished->generation, std::move(finished->outcome));
    }

    void onTick()
    {
        auto const now = Clock::now();
        if (current == WorkflowState::Error && now >= errorDeadline)
            setState(WorkflowState::Idle);

        if (current == WorkflowState::Listening && now >= nextLevelReport)
        {
            sink.reportLevel(pipeline.telemetry().level);
            nextLevelReport = now + std::chrono::microseconds(1'000'000 / config.levelRateHz);
        }
    }

    void setState(WorkflowState state, std::optional<std::string_view> detail = std::nullopt)
    {
        if (state == current && !detail)
            return;
        log::debug("Workflow: {} -> {}", workflowStateToString(current), workflowStateToString(state));
        current = state;
        published.store(state, std::memory_order_release);
        sink.reportState(state, detail);
    }

    void enterError(const Error& error)
    {
        log::error("Workflow failed: {}", error);
        errorDeadline = Clock::now() + config.errorDisplay;
        setState(WorkflowState::Error, std::format("{}", error));
    }

    // {{{ triggers
    void handleTrigger(const TriggerEvent& trigger)
    {
        if (current == WorkflowState::Error)
            setState(WorkflowState::Idle);

        if (std::holds_alternative<StartDictation>(trigger))
            onStartDictation();
        else if (auto const* action = std::get_if<RunAction>(&trigger))
            onRunAction(*action);
        else if (std::holds_alternative<Cancel>(trigger))
            onCancel();
    }

    void onStartDictation()
    {
        switch (current)
        {
            case WorkflowState::Idle:
            case WorkflowState::Error: beginListening(actionFor(config.defaultAction)); break;
            case WorkflowState::Listening: flushOrIdle(); break;
            case WorkflowState::Processing:
                log::info("Dictation requested while processing; cancelling the running workflow");
                cancelProcessing();
                beginListening(actionFor(config.defaultAction));
                break;
        }
    }

    void onRunAction(const RunAction& trigger)
    {
        auto action = actionFor(trigger.actionId.empty() ? config.defaultAction : trigger.actionId);

        if (current == WorkflowState::Processing)
        {
            log::info("Action '{}' supersedes the running workflow", trigger.actionId);
            cancelProcessing();
            setState(WorkflowState::Idle);
        }

        if (trigger.selectedText && !trigger.selectedText->empty())
        {
            if (current == WorkflowState::Listening)
                cancelListening();
            speechEnded = Clock::now();
            startProcessing(Job { .text = *trigger.selectedText, .action = std::move(action) });
        }
        else if (current == WorkflowState::Listening)
        {
            pendingAction = std::move(action);
            flushOrIdle();
        }
        else
        {
            beginListening(std::move(action));
        }
    }

    void onCancel()
    {
        switch (current)
        {
            case WorkflowState::Listening:
                cancelListening();
                setState(WorkflowState::Idle);
                break;
            case WorkflowState::Processing:
                cancelProcessing();
                setState(WorkflowState::Idle);
                break;
            case WorkflowState::Idle:
            case WorkflowState::Error: break;
        }
    }
    // }}}

    // {{{ listening
    void beginListening(std::optional<ActionSpec> action)
    {
        if (!pipelineReady)
        {
            enterError(Error { .code = ErrorCode::DeviceUnavailable, .message = "No audio input configured" });
            return;
        }

        if (!pipeline.isCapturing())
        {
            if (auto started = pipeline.start(); !started)
            {
                enterError(started.error());
                return;
            }
        }

        log::info("Listening ({})", describe(action));
        pendingAction = std::move(action);
        nextLevelReport = Clock::now();
        setState(WorkflowState::Listening);
    }

    void flushOrIdle()
    {
        if (pipeline.requestFlush())
            awaitingFlush = true;
        else
            setState(WorkflowState::Idle);
    }

    /// Abandons the segment being recorded; its end event, when it arrives, is dropped.
    void cancelListening()
    {
        if (!config.continuousListening)
        {
            pipeline.stop();
            // stop() has dispatched every pending event, flush answers included.
            awaitingFlush = false;
        }
        ignoreThrough = pipeline.telemetry().lastSegmentId;
        dropNextFlush = awaitingFlush;
        pendingAction.reset();
    }

    void handleSpeechStarted(std::uint64_t segmentId)
    {
        if (segmentId <= ignoreThrough)
            return;
        if (current == WorkflowState::Idle && config.continuousListening)
            beginListening(actionFor(config.defaultAction));
    }

    void handleSpeechEnded(SpeechSegment segment)
    {
        if (segment.endReason == SegmentEndReason::Manual)
        {
            awaitingFlush = false;
            if (std::exchange(dropNextFlush, false))
            {
                log::debug("Dropping flushed segment {} of a cancelled workflow", segment.id);
                return;
            }
        }

        if (segment.id <= ignoreThrough)
        {
            log::debug("Dropping segment {} of a cancelled workflow", segment.id);
            return;
        }

        if (current != WorkflowState::Listening)
        {
            log::debug("Ignoring segment {} while {}", segment.id, workflowStateToString(current));
            return;
        }

        speechEnded = Clock::now();
        if (!config.continuousListening)
            pipeline.stop();

        if (segment.empty())
        {
            log::info("No speech captured");
            setState(WorkflowState::Idle);
            return;
        }

        log::info("Segment {}: {} ms of speech ({})",
                  segment.id,
                  segment.duration().count(),
                  segmentEndReasonToString(segment.endReason));
        startProcessing(Job { .segment = std::move(segment), .action = std::exchange(pendingAction, std::nullopt) });
    }
    // }}}

    // {{{ processing
    void startProcessing(Job job)
    {
        auto const id = ++generation;
        setState(WorkflowState::Processing);
        processor = std::jthread([this, id, job = std::move(job)](std::stop_token stopToken) mutable {
            auto outcome = process(std::move(job), stopToken);
            post(ProcessingFinishedEvent { .generation = id, .outcome = std::move(outcome) });
        });
    }

    /// Runs on the processor thread.
    auto process(Job job, std::stop_token stopToken) -> Result<JobOutcome>
    {
        auto text = std::move(job.text);
        if (job.segment)
        {
            auto const start = Clock::now();
            auto transcript = transcriber.transcribe(job.segment->samples,
                                                     job.segment->sampleRate,
                                                     config.language,
                                                     config.transcriptionTimeout,
                                                     stopToken);
            if (!transcript)
                return std::unexpected(transcript.error());
            text = std::move(*transcript);
            auto const elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
            if (transcription.record(elapsed))
                log::debug("Transcription took {} ms (target {} ms)", elapsed.count(), TranscriptionTarget.count());
            log::info("Transcribed in {} ms: \"{}\"", elapsed.count(), text);
        }

        if (text.empty() || !job.action)
            return JobOutcome { .text = std::move(text) };

        auto const request = AiRequest {
            .text = std::move(text),
            .action = job.action->action,
            .actionArgument = job.action->argument,
            .preferredProvider = config.preferredProvider,
            .maxTokens = config.maxTokens,
            .timeLimit = config.requestTimeLimit,
        };

        auto const callbacks = StreamCallbacks {
            .onToken = [this](const StreamToken& token) { sink.reportToken(token.text); },
            .onFallback =
                [this](std::string_view provider, const Error& error) {
                    log::warning("Falling back from '{}': {}", provider, error.message);
                    sink.discardTokens();
                },
        };

        auto result = orchestrator.run(request, callbacks, stopToken);
        if (!result)
            return std::unexpected(result.error());
        return JobOutcome { .text = std::move(result->text), .provider = std::move(result->provider) };
    }

    void cancelProcessing()
    {
        ++generation;
        if (processor.joinable())
        {
            processor.request_stop();
            processor.join();
        }
    }

    void handleProcessingFinished(std::uint64_t id, Result<JobOutcome> outcome)
    {
        if (id != generation || current != WorkflowState::Processing)
        {
            log::debug("Discarding result of superseded workflow {}", id);
            return;
        }
        if (processor.joinable())
            processor.join();

        if (!outcome)
        {
            if (outcome.error().code == ErrorCode::Cancelled)
                setState(WorkflowState::Idle);
            else
                enterError(outcome.error());
            return;
        }

        if (outcome->text.empty())
        {
            log::info("Nothing to deliver");
            setState(WorkflowState::Idle);
            return;
        }

        sink.deliver(outcome->text);

        auto const latency = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - speechEnded);
        if (endToEnd.record(latency))
            log::warning("End-to-end latency {} ms exceeded the {} ms budget",
                         latency.count(),
                         config.latencyBudget.count());
        else
            log::debug("Delivered {} chars in {} ms{}",
                       outcome->text.size(),
                       latency.count(),
                       outcome->provider.empty() ? std::string {} : std::format(" via '{}'", outcome->provider));

        setState(WorkflowState::Idle);
    }
    // }}}
};

WorkflowCoordinator::WorkflowCoordinator(WorkflowConfig config,
                                         TranscriptionEngine& transcriber,
                                         StreamingOrchestrator& orchestrator,
                                         OutputSink& sink):
    _impl(std::make_unique<Impl>(std::move(config), transcriber, orchestrator, sink))
{
}

WorkflowCoordinator::~WorkflowCoordinator()
{
    stop();
}

auto WorkflowCoordinator::start(AudioPipelineConfig audioConfig, std::unique_ptr<AudioSource> source) -> VoidResult
{
    if (_impl->coordinator.joinable())
        return makeError(ErrorCode::InvalidArgument, "Workflow coordinator already started");

    if (source)
    {
        auto* impl = _impl.get();
        auto callbacks = PipelineCallbacks {
            .onSpeechStart = [impl](std::uint64_t id) { impl->post(SpeechStartedEvent { .segmentId = id }); },
            .onSpeechEnd = [impl](SpeechSegment segment) { impl->post(SpeechEndedEvent { std::move(segment) }); },
        };
        if (auto result = _impl->pipeline.initialize(std::move(audioConfig), std::move(source), std::move(callbacks));
            !result)
            return result;
        _impl->pipelineReady = true;

        if (_impl->config.continuousListening)
        {
            if (auto result = _impl->pipeline.start(); !result)
                return result;
            log::info("Continuous listening enabled");
        }
    }
    else
    {
        log::info("No audio source; only text actions are available");
    }

    _impl->sink.reportState(WorkflowState::Idle, std::nullopt);
    _impl->coordinator = std::jthread([impl = _impl.get()](std::stop_token stopToken) { impl->run(stopToken); });
    return {};
}

void WorkflowCoordinator::stop()
{
    if (!_impl->coordinator.joinable())
        return;
    _impl->coordinator.request_stop();
    _impl->coordinator.join();
}

void WorkflowCoordinator::submit(TriggerEvent trigger)
{
    _impl->post(Event(std::in_place_type<TriggerEvent>, std::move(trigger)));
}

auto WorkflowCoordinator::state() const -> WorkflowState
{
    return _impl->published.load(std::memory_order_acquire);
}

auto WorkflowCoordinator::pipelineTelemetry() const -> PipelineTelemetry
{
    return _impl->pipeline.telemetry();
}

auto WorkflowCoordinator::endToEndLatency() const -> LatencySummary
{
    return _impl->endToEnd.summary();
}

auto WorkflowCoordinator::transcriptionLatency() const -> LatencySummary
{
    return _impl->transcription.summary();
}

} // namespace vocatype
