// SPDX-License-Identifier: Apache-2.0
#include <workflow/WorkflowCoordinator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <functional>
#include <thread>

#include "TestDoubles.hpp"

using namespace vocatype;
using namespace vocatype::test;

namespace
{

auto audioConfig() -> AudioPipelineConfig
{
    return AudioPipelineConfig {
        .bufferDuration = 5000ms,
        .maxSegmentDuration = 4000ms,
        .vad = VadConfig { .smoothing = 0.0f, .onsetFrames = 3, .releaseFrames = 10 },
    };
}

/// Everything a coordinator needs, with scripted collaborators.
struct Rig
{
    std::shared_ptr<SyntheticDevice> device = std::make_shared<SyntheticDevice>();
    StubTranscriber transcriber;
    RecordingSink sink;
    ScriptedProvider* provider = nullptr;
    std::unique_ptr<StreamingOrchestrator> orchestrator;
    std::unique_ptr<WorkflowCoordinator> coordinator;

    Rig(WorkflowConfig config,
        Result<std::string> transcript,
        std::vector<ProviderStep> script,
        std::chrono::milliseconds transcriptionDelay = 0ms):
        transcriber(std::move(transcript), transcriptionDelay)
    {
        auto scripted = std::make_unique<ScriptedProvider>("primary", std::move(script));
        provider = scripted.get();
        auto providers = std::vector<std::unique_ptr<ProviderClient>> {};
        providers.push_back(std::move(scripted));
        orchestrator = std::make_unique<StreamingOrchestrator>(std::move(providers));
        coordinator = std::make_unique<WorkflowCoordinator>(std::move(config), transcriber, *orchestrator, sink);
    }

    ~Rig() { coordinator->stop(); }

    auto startWithAudio(AudioPipelineConfig config = audioConfig()) -> VoidResult
    {
        return coordinator->start(std::move(config), std::make_unique<SyntheticAudioSource>(device));
    }

    auto startTextOnly() -> VoidResult { return coordinator->start(audioConfig(), nullptr); }

    void speak(std::chrono::milliseconds duration = 500ms)
    {
        (void) device->feed(signal(duration, 0.3f));
    }

    void utterance()
    {
        speak();
        (void) device->feed(silence(300ms));
    }

    /// Keeps the device running with silence until @p done holds.
    auto feedSilenceUntil(const std::function<bool()>& done) -> bool
    {
        for (auto i = 0; i < 200; ++i)
        {
            if (done())
                return true;
            (void) device->feed(silence(20ms));
            std::this_thread::sleep_for(10ms);
        }
        return done();
    }
};

auto countOf(const std::vector<WorkflowState>& states, WorkflowState state) -> std::ptrdiff_t
{
    return std::ranges::count(states, state);
}

} // namespace

TEST_CASE("WorkflowCoordinator dictation with an AI action", "[workflow]")
{
    auto rig = Rig(WorkflowConfig { .defaultAction = "fix_grammar" },
                   std::string("hello world"),
                   { ProviderStep { .tokens = { "Hello", " world", "." } } });
    REQUIRE(rig.startWithAudio().has_value());
    CHECK(!rig.device->isCapturing());

    rig.coordinator->submit(StartDictation {});
    REQUIRE(rig.sink.waitForState(WorkflowState::Listening));
    CHECK(rig.device->isCapturing());

    rig.utterance();
    REQUIRE(rig.sink.waitForDeliveries(1));
    REQUIRE(rig.sink.waitForStateCount(WorkflowState::Idle, 2));

    CHECK(rig.sink.delivered() == std::vector<std::string> { "Hello world." });
    CHECK(rig.sink.tokens() == std::vector<std::string> { "Hello", " world", "." });
    CHECK(rig.sink.states()
          == std::vector<WorkflowState> {
              WorkflowState::Idle, WorkflowState::Listening, WorkflowState::Processing, WorkflowState::Idle });
    CHECK(!rig.sink.levels().empty());

    CHECK(rig.transcriber.calls() == 1);
    CHECK(rig.transcriber.lastLanguage() == "en");
    CHECK(rig.transcriber.lastSampleCount() == 60 * FrameSamples);
    CHECK(rig.transcriber.lastSampleRate() == DefaultSampleRate);

    auto const request = rig.provider->lastRequest();
    CHECK(request.text == "hello world");
    CHECK(request.action == AiAction::FixGrammar);

    CHECK(!rig.device->isCapturing());
    CHECK(rig.coordinator->endToEndLatency().sampleCount == 1);
    CHECK(rig.coordinator->transcriptionLatency().sampleCount == 1);
    CHECK(rig.coordinator->state() == WorkflowState::Idle);
}

TEST_CASE("WorkflowCoordinator dictation of a five second clip with the default audio settings", "[workflow]")
{
    auto rig = Rig(WorkflowConfig { .defaultAction = "fix_grammar" },
                   std::string("hello world"),
                   { ProviderStep { .tokens = { "Hello", " world", "." } } });
    REQUIRE(rig.startWithAudio(AudioPipelineConfig {}).has_value());

    rig.coordinator->submit(StartDictation {});
    REQUIRE(rig.sink.waitForState(WorkflowState::Listening));

    (void) rig.device->feed(dictationClip());
    REQUIRE(rig.sink.waitForDeliveries(1));
    REQUIRE(rig.sink.waitForStateCount(WorkflowState::Idle, 2));

    CHECK(rig.sink.delivered() == std::vector<std::string> { "Hello world." });
    CHECK(rig.sink.states()
          == std::vector<WorkflowState> {
              WorkflowState::Idle, WorkflowState::Listening, WorkflowState::Processing, WorkflowState::Idle });

    CHECK(rig.transcriber.calls() == 1);
    CHECK(rig.transcriber.lastSampleCount() >= durationToSamples(4250ms, DefaultSampleRate));
    CHECK(rig.transcriber.lastSampleCount() <= durationToSamples(5000ms, DefaultSampleRate));
}

TEST_CASE("WorkflowCoordinator delivers the raw transcript without an action", "[workflow]")
{
    auto rig = Rig(WorkflowConfig {}, std::string("just the words"), {});
    REQUIRE(rig.startWithAudio().has_value());

    rig.coordinator->submit(StartDictation {});
    REQUIRE(rig.sink.waitForState(WorkflowState::Listening));
    rig.utterance();

    REQUIRE(rig.sink.waitForDeliveries(1));
    CHECK(rig.sink.delivered().front() == "just the words");
    CHECK(rig.provider->calls() == 0);
}

TEST_CASE("WorkflowCoordinator second dictation trigger finishes the utterance", "[workflow]")
{
    auto rig = Rig(WorkflowConfig {}, std::string("flushed"), {});
    REQUIRE(rig.startWithAudio().has_value());

    rig.coordinator->submit(StartDictation {});
    REQUIRE(rig.sink.waitForState(WorkflowState::Listening));
    rig.speak(300ms);

    rig.coordinator->submit(StartDictation {});
    REQUIRE(rig.feedSilenceUntil([&] { return !rig.sink.delivered().empty(); }));
    CHECK(rig.sink.delivered().front() == "flushed");
}

TEST_CASE("WorkflowCoordinator ends quietly when nothing was said", "[workflow]")
{
    auto rig = Rig(WorkflowConfig {}, std::string("unused"), {});
    REQUIRE(rig.startWithAudio().has_value());

    rig.coordinator->submit(StartDictation {});
    REQUIRE(rig.sink.waitForState(WorkflowState::Listening));
    rig.coordinator->submit(StartDictation {});

    REQUIRE(rig.feedSilenceUntil([&] { return rig.coordinator->state() == WorkflowState::Idle; }));
    CHECK(rig.transcriber.calls() == 0);
    CHECK(rig.sink.delivered().empty());
}

TEST_CASE("WorkflowCoordinator applies an action chosen while listening", "[workflow]")
{
    auto rig = Rig(WorkflowConfig {}, std::string("guten morgen"), { ProviderStep { .tokens = { "Good morning" } } });
    REQUIRE(rig.startWithAudio().has_value());

    rig.coordinator->submit(StartDictation {});
    REQUIRE(rig.sink.waitForState(WorkflowState::Listening));
    rig.speak(300ms);

    rig.coordinator->submit(RunAction { .actionId = "translate:English" });
    REQUIRE(rig.feedSilenceUntil([&] { return !rig.sink.delivered().empty(); }));

    CHECK(rig.sink.delivered().front() == "Good morning");
    auto const request = rig.provider->lastRequest();
    CHECK(request.action == AiAction::Translate);
    CHECK(request.actionArgument == "English");
}

TEST_CASE("WorkflowCoordinator cancel while listening discards the recording", "[workflow]")
{
    auto rig = Rig(WorkflowConfig {}, std::string("never"), {});
    REQUIRE(rig.startWithAudio().has_value());

    rig.coordinator->submit(StartDictation {});
    REQUIRE(rig.sink.waitForState(WorkflowState::Listening));
    rig.speak(300ms);

    rig.coordinator->submit(Cancel {});
    REQUIRE(rig.sink.waitForStateCount(WorkflowState::Idle, 2));
    std::this_thread::sleep_for(200ms);

    CHECK(rig.transcriber.calls() == 0);
    CHECK(rig.sink.delivered().empty());
    CHECK(countOf(rig.sink.states(), WorkflowState::Processing) == 0);
    CHECK(!rig.device->isCapturing());
}

TEST_CASE("WorkflowCoordinator cancel while processing", "[workflow]")
{
    auto rig = Rig(WorkflowConfig {}, std::string("slow"), {}, 5000ms);
    REQUIRE(rig.startWithAudio().has_value());

    rig.coordinator->submit(StartDictation {});
    REQUIRE(rig.sink.waitForState(WorkflowState::Listening));
    rig.utterance();
    REQUIRE(rig.sink.waitForState(WorkflowState::Processing));

    auto const cancelled = std::chrono::steady_clock::now();
    rig.coordinator->submit(Cancel {});
    REQUIRE(rig.sink.waitForState(WorkflowState::Idle));
    CHECK(std::chrono::steady_clock::now() - cancelled < 2000ms);

    std::this_thread::sleep_for(100ms);
    CHECK(rig.sink.delivered().empty());
    CHECK(rig.sink.states().back() == WorkflowState::Idle);
    CHECK(rig.transcriber.calls() == 1);
}

TEST_CASE("WorkflowCoordinator processes selected text without audio", "[workflow]")
{
    auto rig = Rig(WorkflowConfig {}, std::string("unused"), { ProviderStep { .tokens = { "Short." } } });
    REQUIRE(rig.startTextOnly().has_value());

    rig.coordinator->submit(RunAction { .actionId = "summarize", .selectedText = "A long paragraph." });
    REQUIRE(rig.sink.waitForDeliveries(1));

    CHECK(rig.sink.delivered().front() == "Short.");
    CHECK(rig.transcriber.calls() == 0);
    CHECK(rig.coordinator->transcriptionLatency().sampleCount == 0);
    auto const request = rig.provider->lastRequest();
    CHECK(request.action == AiAction::Summarize);
    CHECK(request.text == "A long paragraph.");
}

TEST_CASE("WorkflowCoordinator: a new action supersedes the running one", "[workflow]")
{
    auto rig = Rig(WorkflowConfig {},
                   std::string("unused"),
                   {
                       ProviderStep { .tokens = { "first", " answer", " is", " slow" }, .tokenDelay = 300ms },
                       ProviderStep { .tokens = { "Second." } },
                   });
    REQUIRE(rig.startTextOnly().has_value());

    rig.coordinator->submit(RunAction { .actionId = "improve", .selectedText = "first" });
    REQUIRE(rig.sink.waitForState(WorkflowState::Processing));
    rig.coordinator->submit(RunAction { .actionId = "improve", .selectedText = "second" });

    REQUIRE(rig.sink.waitForDeliveries(1));
    std::this_thread::sleep_for(400ms);
    CHECK(rig.sink.delivered() == std::vector<std::string> { "Second." });
    CHECK(rig.provider->lastRequest().text == "second");
    CHECK(rig.provider->calls() == 2);
}

TEST_CASE("WorkflowCoordinator reports failures and recovers", "[workflow]")
{
    auto rig = Rig(WorkflowConfig { .errorDisplay = 100ms },
                   std::unexpected(failure(ErrorCode::TranscriptionError, "model crashed")),
                   {});
    REQUIRE(rig.startWithAudio().has_value());

    rig.coordinator->submit(StartDictation {});
    REQUIRE(rig.sink.waitForState(WorkflowState::Listening));
    rig.utterance();

    REQUIRE(rig.sink.waitForState(WorkflowState::Error));
    auto const details = rig.sink.details();
    REQUIRE(!details.empty());
    CHECK(details.back().find("model crashed") != std::string::npos);

    // Falls back to Idle on its own after the display time.
    REQUIRE(rig.sink.waitForState(WorkflowState::Idle));
    CHECK(rig.sink.delivered().empty());
}

TEST_CASE("WorkflowCoordinator reports exhausted providers as an error", "[workflow]")
{
    auto rig = Rig(WorkflowConfig { .errorDisplay = 5000ms },
                   std::string("unused"),
                   { ProviderStep { .startError = failure(ErrorCode::NetworkError, "unreachable") } });
    REQUIRE(rig.startTextOnly().has_value());

    rig.coordinator->submit(RunAction { .actionId = "improve", .selectedText = "text" });
    REQUIRE(rig.sink.waitForState(WorkflowState::Error));
    CHECK(rig.sink.details().back().find("AllProvidersExhausted") != std::string::npos);

    // A trigger leaves the error state immediately.
    rig.coordinator->submit(Cancel {});
    REQUIRE(rig.sink.waitForState(WorkflowState::Idle));
}

TEST_CASE("WorkflowCoordinator without audio input rejects dictation", "[workflow]")
{
    auto rig = Rig(WorkflowConfig {}, std::string("unused"), {});
    REQUIRE(rig.startTextOnly().has_value());

    rig.coordinator->submit(StartDictation {});
    REQUIRE(rig.sink.waitForState(WorkflowState::Error));
    CHECK(rig.sink.details().back().find("DeviceUnavailable") != std::string::npos);
}

TEST_CASE("WorkflowCoordinator continuous listening", "[workflow]")
{
    auto rig = Rig(WorkflowConfig { .continuousListening = true }, std::string("again"), {});
    REQUIRE(rig.startWithAudio().has_value());
    CHECK(rig.device->isCapturing());

    rig.utterance();
    REQUIRE(rig.sink.waitForDeliveries(1));
    REQUIRE(rig.sink.waitForStateCount(WorkflowState::Idle, 2));
    CHECK(rig.device->isCapturing());

    rig.utterance();
    REQUIRE(rig.sink.waitForDeliveries(2));
    CHECK(rig.transcriber.calls() == 2);
}

TEST_CASE("WorkflowCoordinator::start twice is rejected", "[workflow]")
{
    auto rig = Rig(WorkflowConfig {}, std::string("unused"), {});
    REQUIRE(rig.startTextOnly().has_value());
    auto const again = rig.startTextOnly();
    REQUIRE(!again.has_value());
    CHECK(again.error().code == ErrorCode::InvalidArgument);
}
