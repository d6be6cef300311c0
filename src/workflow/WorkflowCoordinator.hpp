// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/LatencyStats.hpp>
#include <ai/StreamingOrchestrator.hpp>
#include <audio/AudioPipeline.hpp>
#include <audio/AudioSource.hpp>
#include <audio/TranscriptionEngine.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <workflow/OutputSink.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace vocatype
{

/// @brief Behaviour of the dictation workflow.
struct WorkflowConfig
{
    /// Start listening automatically whenever speech is detected.
    bool continuousListening = false;

    /// Action applied to dictated text ("fix_grammar", "translate:German", a custom prompt id, ...).
    /// Empty delivers the raw transcription.
    std::string defaultAction;

    std::string language = "en";
    std::chrono::milliseconds transcriptionTimeout { 10'000 };

    /// Provider tried first for every request; empty uses the configured order.
    std::string preferredProvider;
    std::uint32_t maxTokens = 1000;
    std::chrono::milliseconds requestTimeLimit { 30'000 };

    /// How long the Error state is shown before returning to Idle.
    std::chrono::milliseconds errorDisplay { 3'000 };

    /// Rate of OutputSink::reportLevel() while listening (clamped to 1..60).
    unsigned levelRateHz = 30;

    /// End-to-end target from speech end to delivery.
    std::chrono::milliseconds latencyBudget { 2'000 };
};

/// @brief The dictation state machine over {Idle, Listening, Processing, Error}.
///
/// Owns the audio pipeline and runs on its own thread, consuming triggers and pipeline events in
/// FIFO order. Transcription and AI processing run on a separate per-workflow thread that is
/// cancelled through its stop token. Only one workflow is active at a time; a trigger that arrives
/// while processing cancels the running workflow and waits for it to wind down, and only the
/// latest workflow may deliver a result.
class WorkflowCoordinator
{
  public:
    /// @param config Workflow behaviour.
    /// @param transcriber Speech-to-text engine; must outlive the coordinator.
    /// @param orchestrator AI backends; must outlive the coordinator.
    /// @param sink Output collaborator; must outlive the coordinator.
    WorkflowCoordinator(WorkflowConfig config,
                        TranscriptionEngine& transcriber,
                        StreamingOrchestrator& orchestrator,
                        OutputSink& sink);
    ~WorkflowCoordinator();

    WorkflowCoordinator(const WorkflowCoordinator&) = delete;
    WorkflowCoordinator& operator=(const WorkflowCoordinator&) = delete;

    /// @brief Prepares the audio pipeline and starts the coordinator thread.
    ///
    /// In continuous-listening mode the audio device is opened immediately; otherwise it is opened
    /// on the first dictation trigger.
    /// @return Success, a configuration error, or the device error in continuous mode.
    [[nodiscard]] auto start(AudioPipelineConfig audioConfig, std::unique_ptr<AudioSource> source) -> VoidResult;

    /// @brief Cancels any running workflow, stops the audio pipeline and joins the coordinator.
    void stop();

    /// @brief Queues a trigger. Thread-safe; never blocks on the workflow.
    void submit(TriggerEvent trigger);

    /// @brief Current state (may lag the sink's view by one event).
    [[nodiscard]] auto state() const -> WorkflowState;

    [[nodiscard]] auto pipelineTelemetry() const -> PipelineTelemetry;

    /// @brief Speech-end-to-delivery latencies of completed workflows.
    [[nodiscard]] auto endToEndLatency() const -> LatencySummary;

    /// @brief Time spent in the transcription engine per segment (target 200 ms).
    [[nodiscard]] auto transcriptionLatency() const -> LatencySummary;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace vocatype
