// SPDX-License-Identifier: Apache-2.0
#include <audio/AudioPipeline.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <condition_variable>
#include <mutex>
#include <vector>

#include "TestDoubles.hpp"

using namespace vocatype;
using namespace vocatype::test;

namespace
{

/// Collects the pipeline callbacks, which arrive on the dispatcher thread.
class SegmentCollector
{
  public:
    auto callbacks() -> PipelineCallbacks
    {
        return PipelineCallbacks {
            .onSpeechStart =
                [this](std::uint64_t id) {
                    {
                        auto lock = std::lock_guard(_mutex);
                        _starts.push_back(id);
                    }
                    _changed.notify_all();
                },
            .onSpeechEnd =
                [this](SpeechSegment segment) {
                    {
                        auto lock = std::lock_guard(_mutex);
                        _segments.push_back(std::move(segment));
                    }
                    _changed.notify_all();
                },
        };
    }

    auto waitForSegments(std::size_t count, std::chrono::milliseconds timeout = 3s) -> bool
    {
        auto lock = std::unique_lock(_mutex);
        return _changed.wait_for(lock, timeout, [&] { return _segments.size() >= count; });
    }

    auto waitForStarts(std::size_t count, std::chrono::milliseconds timeout = 3s) -> bool
    {
        auto lock = std::unique_lock(_mutex);
        return _changed.wait_for(lock, timeout, [&] { return _starts.size() >= count; });
    }

    [[nodiscard]] auto segments() -> std::vector<SpeechSegment>
    {
        auto lock = std::lock_guard(_mutex);
        return _segments;
    }

    [[nodiscard]] auto starts() -> std::vector<std::uint64_t>
    {
        auto lock = std::lock_guard(_mutex);
        return _starts;
    }

  private:
    std::mutex _mutex;
    std::condition_variable _changed;
    std::vector<std::uint64_t> _starts;
    std::vector<SpeechSegment> _segments;
};

/// Unsmoothed detector so that segment boundaries fall on predictable frames.
auto deterministicConfig() -> AudioPipelineConfig
{
    return AudioPipelineConfig {
        .bufferDuration = 5000ms,
        .maxSegmentDuration = 4000ms,
        .vad = VadConfig { .smoothing = 0.0f, .onsetFrames = 3, .releaseFrames = 10 },
    };
}

struct PipelineFixture
{
    std::shared_ptr<SyntheticDevice> device = std::make_shared<SyntheticDevice>();
    SegmentCollector collector;
    AudioPipeline pipeline;

    auto start(AudioPipelineConfig config = deterministicConfig()) -> VoidResult
    {
        if (auto ok = pipeline.initialize(
                std::move(config), std::make_unique<SyntheticAudioSource>(device), collector.callbacks());
            !ok)
            return ok;
        return pipeline.start();
    }
};

} // namespace

TEST_CASE("validateAudioPipelineConfig", "[pipeline]")
{
    CHECK(validateAudioPipelineConfig(AudioPipelineConfig {}).has_value());

    auto config = AudioPipelineConfig {};
    SECTION("segment longer than the buffer")
    {
        config.bufferDuration = 5000ms;
        config.maxSegmentDuration = 6000ms;
    }
    SECTION("unsupported sample rate")
    {
        config.sampleRate = 1000;
    }
    SECTION("sample rate without whole 10 ms frames")
    {
        config.sampleRate = 22050;
    }
    SECTION("segment bound that falls inside a frame")
    {
        config.maxSegmentDuration = 1005ms;
    }
    SECTION("invalid detector block")
    {
        config.vad.releaseFrames = 0;
    }
    auto const result = validateAudioPipelineConfig(config);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("AudioPipeline::initialize requires an audio source", "[pipeline]")
{
    auto pipeline = AudioPipeline {};
    auto const result = pipeline.initialize(AudioPipelineConfig {}, nullptr, PipelineCallbacks {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidArgument);

    auto const notReady = pipeline.start();
    REQUIRE(!notReady.has_value());
    CHECK(notReady.error().code == ErrorCode::StreamInitError);
}

TEST_CASE("AudioPipeline emits one segment per utterance, including the onset frames", "[pipeline]")
{
    auto fixture = PipelineFixture {};
    REQUIRE(fixture.start().has_value());

    REQUIRE(fixture.device->feed(silence(200ms)));
    REQUIRE(fixture.device->feed(signal(500ms, 0.3f)));
    REQUIRE(fixture.device->feed(silence(300ms)));

    REQUIRE(fixture.collector.waitForSegments(1));
    auto const segments = fixture.collector.segments();
    REQUIRE(segments.size() == 1);

    auto const& segment = segments.front();
    CHECK(segment.id == 1);
    CHECK(segment.endReason == SegmentEndReason::SpeechEnd);
    CHECK(segment.sampleRate == DefaultSampleRate);
    // 50 speech frames plus the 10 silent frames of the release run.
    CHECK(segment.samples.size() == 60 * FrameSamples);
    CHECK(segment.samples.front() == 0.3f);
    CHECK(segment.samples.back() == 0.0f);
    CHECK(fixture.collector.starts() == std::vector<std::uint64_t> { 1 });

    fixture.pipeline.stop();
    // No speech was open at stop, so nothing else is emitted.
    CHECK(fixture.collector.segments().size() == 1);
}

TEST_CASE("AudioPipeline splits long speech at the maximum segment duration", "[pipeline]")
{
    auto fixture = PipelineFixture {};
    auto config = deterministicConfig();
    config.maxSegmentDuration = 1000ms;
    REQUIRE(fixture.start(config).has_value());

    REQUIRE(fixture.device->feed(signal(2500ms, 0.3f)));
    REQUIRE(fixture.collector.waitForSegments(2));

    auto const segments = fixture.collector.segments();
    REQUIRE(segments.size() >= 2);
    CHECK(segments[0].endReason == SegmentEndReason::MaxDuration);
    CHECK(segments[0].samples.size() == 16000);
    CHECK(segments[1].endReason == SegmentEndReason::MaxDuration);
    CHECK(segments[1].samples.size() == 16000);
    CHECK(segments[1].id == segments[0].id + 1);

    fixture.pipeline.stop();
    auto const all = fixture.collector.segments();
    REQUIRE(all.size() == 3);
    CHECK(all[2].endReason == SegmentEndReason::Stopped);
}

TEST_CASE("AudioPipeline::requestFlush closes the open segment", "[pipeline]")
{
    auto fixture = PipelineFixture {};
    REQUIRE(fixture.start().has_value());

    REQUIRE(fixture.device->feed(signal(300ms, 0.3f)));
    REQUIRE(fixture.collector.waitForStarts(1));
    CHECK(fixture.pipeline.telemetry().speechActive);

    REQUIRE(fixture.pipeline.requestFlush());
    // The flush is applied by the capture callback.
    REQUIRE(fixture.device->feed(signal(20ms, 0.3f)));
    REQUIRE(fixture.collector.waitForSegments(1));

    auto const segment = fixture.collector.segments().front();
    CHECK(segment.endReason == SegmentEndReason::Manual);
    CHECK(segment.samples.size() >= 300 * 16);
    CHECK(!fixture.pipeline.telemetry().speechActive);
}

TEST_CASE("AudioPipeline answers a flush without speech with an empty segment", "[pipeline]")
{
    auto fixture = PipelineFixture {};
    REQUIRE(fixture.start().has_value());

    REQUIRE(fixture.device->feed(silence(100ms)));
    REQUIRE(fixture.pipeline.requestFlush());
    REQUIRE(fixture.device->feed(silence(20ms)));
    REQUIRE(fixture.collector.waitForSegments(1));

    auto const segment = fixture.collector.segments().front();
    CHECK(segment.empty());
    CHECK(segment.endReason == SegmentEndReason::Manual);
    CHECK(fixture.pipeline.telemetry().lastSegmentId == segment.id);
    CHECK(fixture.collector.starts().empty());
}

TEST_CASE("AudioPipeline::stop emits the open segment before returning", "[pipeline]")
{
    auto fixture = PipelineFixture {};
    REQUIRE(fixture.start().has_value());

    REQUIRE(fixture.device->feed(signal(400ms, 0.3f)));
    fixture.pipeline.stop();

    auto const segments = fixture.collector.segments();
    REQUIRE(segments.size() == 1);
    CHECK(segments.front().endReason == SegmentEndReason::Stopped);
    CHECK(segments.front().samples.size() == 400 * 16);

    CHECK(!fixture.pipeline.isCapturing());
    CHECK(!fixture.pipeline.requestFlush());
    CHECK(!fixture.device->feed(signal(100ms, 0.3f)));
    CHECK(fixture.device->closes == 1);
}

TEST_CASE("AudioPipeline can be restarted after stop", "[pipeline]")
{
    auto fixture = PipelineFixture {};
    REQUIRE(fixture.start().has_value());
    fixture.pipeline.stop();

    REQUIRE(fixture.pipeline.start().has_value());
    REQUIRE(fixture.device->feed(signal(300ms, 0.3f)));
    REQUIRE(fixture.device->feed(silence(200ms)));
    REQUIRE(fixture.collector.waitForSegments(1));

    CHECK(fixture.device->opens == 2);
    CHECK(fixture.collector.segments().front().endReason == SegmentEndReason::SpeechEnd);
}

TEST_CASE("AudioPipeline propagates a device that cannot be opened", "[pipeline]")
{
    auto fixture = PipelineFixture {};
    fixture.device->openError = failure(ErrorCode::DeviceUnavailable, "No capture device matches 'usb'");

    auto const result = fixture.start();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::DeviceUnavailable);
    CHECK(!fixture.pipeline.isCapturing());
}

TEST_CASE("AudioPipeline telemetry", "[pipeline]")
{
    auto fixture = PipelineFixture {};
    REQUIRE(fixture.start().has_value());

    REQUIRE(fixture.device->feed(signal(100ms, 0.3f)));
    auto const telemetry = fixture.pipeline.telemetry();
    CHECK(telemetry.capturing);
    CHECK(telemetry.framesProcessed == 10);
    CHECK(telemetry.peak == Catch::Approx(0.3f));
    // 0.3 is about -10.5 dBFS.
    CHECK(telemetry.level == Catch::Approx(0.825f).margin(0.01f));
    CHECK(telemetry.buffer.size == 1600);
    CHECK(fixture.pipeline.recentAudio(50ms).size() == 800);
}

TEST_CASE("AudioPipeline analyses 10 ms frames at other capture rates", "[pipeline]")
{
    auto fixture = PipelineFixture {};
    auto config = deterministicConfig();
    config.sampleRate = 48000;
    REQUIRE(fixture.start(config).has_value());

    // 100 ms at 48 kHz.
    REQUIRE(fixture.device->feed(std::vector<float>(4800, 0.3f)));
    CHECK(fixture.pipeline.telemetry().framesProcessed == 10);
    CHECK(fixture.pipeline.telemetry().buffer.size == 4800);

    REQUIRE(fixture.device->feed(std::vector<float>(19200, 0.3f)));
    REQUIRE(fixture.device->feed(std::vector<float>(14400, 0.0f)));
    REQUIRE(fixture.collector.waitForSegments(1));

    auto const segment = fixture.collector.segments().front();
    CHECK(segment.sampleRate == 48000);
    CHECK(segment.endReason == SegmentEndReason::SpeechEnd);
    // 500 ms of speech plus the 100 ms release run, independent of the rate.
    CHECK(segment.samples.size() == 60 * frameSamplesFor(48000));
    CHECK(segment.duration() == 600ms);
}

TEST_CASE("AudioPipeline turns five seconds of dictation into one segment with the default settings",
          "[pipeline]")
{
    auto fixture = PipelineFixture {};
    REQUIRE(fixture.start(AudioPipelineConfig {}).has_value());

    auto const clip = dictationClip();
    REQUIRE(clip.size() == 5 * DefaultSampleRate);
    REQUIRE(fixture.device->feed(clip));
    REQUIRE(fixture.collector.waitForSegments(1));
    fixture.pipeline.stop();

    auto const segments = fixture.collector.segments();
    REQUIRE(segments.size() == 1);
    CHECK(segments.front().endReason == SegmentEndReason::SpeechEnd);
    CHECK(segments.front().duration() >= 4250ms);
    CHECK(segments.front().duration() <= 5000ms);
}
