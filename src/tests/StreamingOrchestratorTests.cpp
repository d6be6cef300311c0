// SPDX-License-Identifier: Apache-2.0
#include <ai/StreamingOrchestrator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <mutex>
#include <thread>

#include "TestDoubles.hpp"

using namespace vocatype;
using namespace vocatype::test;

namespace
{

struct Harness
{
    ScriptedProvider* primary = nullptr;
    ScriptedProvider* secondary = nullptr;
    std::unique_ptr<StreamingOrchestrator> orchestrator;
};

auto makeHarness(std::vector<ProviderStep> primaryScript,
                 std::vector<ProviderStep> secondaryScript,
                 OrchestratorConfig config = {}) -> Harness
{
    auto primary = std::make_unique<ScriptedProvider>("primary", std::move(primaryScript));
    auto secondary = std::make_unique<ScriptedProvider>("secondary", std::move(secondaryScript));

    auto harness = Harness { .primary = primary.get(), .secondary = secondary.get() };
    auto providers = std::vector<std::unique_ptr<ProviderClient>> {};
    providers.push_back(std::move(primary));
    providers.push_back(std::move(secondary));
    harness.orchestrator = std::make_unique<StreamingOrchestrator>(std::move(providers), config);
    return harness;
}

auto fixGrammar(std::string text) -> AiRequest
{
    return AiRequest { .text = std::move(text), .action = AiAction::FixGrammar };
}

/// Records the callbacks of one run.
struct Observer
{
    std::mutex mutex;
    std::vector<StreamToken> tokens;
    std::vector<std::pair<std::string, ErrorCode>> fallbacks;

    auto callbacks() -> StreamCallbacks
    {
        return StreamCallbacks {
            .onToken =
                [this](const StreamToken& token) {
                    auto lock = std::lock_guard(mutex);
                    tokens.push_back(token);
                },
            .onFallback =
                [this](std::string_view provider, const Error& error) {
                    auto lock = std::lock_guard(mutex);
                    fallbacks.emplace_back(std::string(provider), error.code);
                },
        };
    }

    auto tokenTexts() -> std::vector<std::string>
    {
        auto lock = std::lock_guard(mutex);
        auto texts = std::vector<std::string> {};
        for (auto const& token: tokens)
            texts.push_back(token.text);
        return texts;
    }
};

} // namespace

TEST_CASE("StreamingOrchestrator streams the first provider's answer", "[orchestrator]")
{
    auto harness = makeHarness({ ProviderStep { .tokens = { "Hello", " world", "." } } }, {});
    auto observer = Observer {};

    auto const result = harness.orchestrator->run(fixGrammar("hello world"), observer.callbacks(), {});
    REQUIRE(result.has_value());
    CHECK(result->text == "Hello world.");
    CHECK(result->provider == "primary");
    CHECK(result->attempts == 1);
    CHECK(observer.tokenTexts() == std::vector<std::string> { "Hello", " world", "." });
    CHECK(observer.tokens.back().index == 2);
    CHECK(observer.fallbacks.empty());
    CHECK(harness.secondary->calls() == 0);

    auto const stats = harness.primary->stats().snapshot();
    CHECK(stats.requests == 1);
    CHECK(stats.failures == 0);
    // The stream's connection went back to the pool.
    CHECK(harness.primary->pool().activeCount() == 0);
}

TEST_CASE("StreamingOrchestrator falls back when a request cannot start", "[orchestrator]")
{
    auto harness = makeHarness({ ProviderStep { .startError = failure(ErrorCode::NetworkError) } },
                               { ProviderStep { .tokens = { "Fixed." } } });
    auto observer = Observer {};

    auto const result = harness.orchestrator->run(fixGrammar("fixed"), observer.callbacks(), {});
    REQUIRE(result.has_value());
    CHECK(result->provider == "secondary");
    CHECK(result->attempts == 2);
    CHECK(observer.fallbacks.empty());
    CHECK(harness.primary->stats().snapshot().failures == 1);
}

TEST_CASE("StreamingOrchestrator discards a partial answer that fails mid-stream", "[orchestrator]")
{
    auto harness = makeHarness(
        { ProviderStep { .tokens = { "Par", "tial" }, .failAfterTokens = failure(ErrorCode::NetworkError) } },
        { ProviderStep { .tokens = { "Complete." } } });
    auto observer = Observer {};

    auto const result = harness.orchestrator->run(fixGrammar("complete"), observer.callbacks(), {});
    REQUIRE(result.has_value());
    CHECK(result->text == "Complete.");
    CHECK(result->provider == "secondary");

    REQUIRE(observer.fallbacks.size() == 1);
    CHECK(observer.fallbacks[0].first == "primary");
    CHECK(observer.fallbacks[0].second == ErrorCode::NetworkError);
    CHECK(observer.tokenTexts() == std::vector<std::string> { "Par", "tial", "Complete." });
}

TEST_CASE("StreamingOrchestrator gives up on a provider that misses the first-token deadline", "[orchestrator]")
{
    auto harness = makeHarness({ ProviderStep { .tokens = { "late" }, .firstDelay = 5000ms } },
                               { ProviderStep { .tokens = { "on time" } } },
                               OrchestratorConfig { .firstTokenTimeout = 100ms });
    auto observer = Observer {};

    auto const started = std::chrono::steady_clock::now();
    auto const result = harness.orchestrator->run(fixGrammar("x"), observer.callbacks(), {});
    REQUIRE(result.has_value());
    CHECK(result->text == "on time");
    CHECK(std::chrono::steady_clock::now() - started < 2000ms);
    CHECK(harness.primary->stats().snapshot().failures == 1);
    CHECK(observer.fallbacks.empty());
}

TEST_CASE("StreamingOrchestrator gives up on a stalled stream", "[orchestrator]")
{
    auto harness = makeHarness({ ProviderStep { .tokens = { "Hel" }, .stall = true } },
                               { ProviderStep { .tokens = { "Hello" } } },
                               OrchestratorConfig { .interTokenTimeout = 100ms });
    auto observer = Observer {};

    auto const result = harness.orchestrator->run(fixGrammar("x"), observer.callbacks(), {});
    REQUIRE(result.has_value());
    CHECK(result->text == "Hello");
    REQUIRE(observer.fallbacks.size() == 1);
    CHECK(observer.fallbacks[0].second == ErrorCode::Timeout);
}

TEST_CASE("StreamingOrchestrator treats an empty response as a provider failure", "[orchestrator]")
{
    auto harness = makeHarness({ ProviderStep {} }, { ProviderStep { .tokens = { "ok" } } });
    auto observer = Observer {};

    auto const result = harness.orchestrator->run(fixGrammar("x"), observer.callbacks(), {});
    REQUIRE(result.has_value());
    CHECK(result->provider == "secondary");
}

TEST_CASE("StreamingOrchestrator disables a provider after an authentication failure", "[orchestrator]")
{
    auto harness = makeHarness({ ProviderStep { .startError = failure(ErrorCode::AuthError, "HTTP 401: bad key") } },
                               { ProviderStep { .tokens = { "ok" } } });
    auto observer = Observer {};

    REQUIRE(harness.orchestrator->run(fixGrammar("x"), observer.callbacks(), {}).has_value());
    CHECK(harness.orchestrator->isProviderDisabled("primary"));

    REQUIRE(harness.orchestrator->run(fixGrammar("y"), observer.callbacks(), {}).has_value());
    CHECK(harness.primary->calls() == 1);

    CHECK(harness.orchestrator->resetProvider("primary"));
    CHECK(!harness.orchestrator->isProviderDisabled("primary"));
    REQUIRE(harness.orchestrator->run(fixGrammar("z"), observer.callbacks(), {}).has_value());
    CHECK(harness.primary->calls() == 2);

    CHECK(!harness.orchestrator->resetProvider("unknown"));
}

TEST_CASE("StreamingOrchestrator tries the preferred provider first", "[orchestrator]")
{
    auto harness = makeHarness({ ProviderStep { .tokens = { "from primary" } } },
                               { ProviderStep { .tokens = { "from secondary" } } });
    auto request = fixGrammar("x");
    request.preferredProvider = "secondary";

    auto const order = harness.orchestrator->attemptOrder(request);
    REQUIRE(order.size() == 2);
    CHECK(order[0]->name() == "secondary");
    CHECK(order[1]->name() == "primary");

    auto observer = Observer {};
    auto const result = harness.orchestrator->run(request, observer.callbacks(), {});
    REQUIRE(result.has_value());
    CHECK(result->provider == "secondary");
    CHECK(harness.primary->calls() == 0);

    request.preferredProvider = "unknown";
    CHECK(harness.orchestrator->attemptOrder(request).front()->name() == "primary");
}

TEST_CASE("StreamingOrchestrator reports exhaustion with the last provider error", "[orchestrator]")
{
    auto harness = makeHarness({ ProviderStep { .startError = failure(ErrorCode::NetworkError) } },
                               { ProviderStep { .startError = failure(ErrorCode::RateLimited, "HTTP 429") } });
    auto observer = Observer {};

    auto const result = harness.orchestrator->run(fixGrammar("x"), observer.callbacks(), {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::AllProvidersExhausted);
    REQUIRE(result.error().cause != nullptr);
    CHECK(result.error().cause->code == ErrorCode::RateLimited);
    CHECK(result.error().rootCause().message == "HTTP 429");
}

TEST_CASE("StreamingOrchestrator stops on non-recoverable errors", "[orchestrator]")
{
    auto harness = makeHarness({ ProviderStep { .startError = failure(ErrorCode::InvalidArgument, "empty text") } },
                               { ProviderStep { .tokens = { "ok" } } });
    auto observer = Observer {};

    auto const result = harness.orchestrator->run(fixGrammar(""), observer.callbacks(), {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidArgument);
    CHECK(harness.secondary->calls() == 0);
}

TEST_CASE("StreamingOrchestrator without providers", "[orchestrator]")
{
    auto orchestrator = StreamingOrchestrator(std::vector<std::unique_ptr<ProviderClient>> {});
    auto const result = orchestrator.run(fixGrammar("x"), {}, {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::AllProvidersExhausted);
    CHECK(result.error().cause == nullptr);
}

TEST_CASE("StreamingOrchestrator delivers no token after cancellation", "[orchestrator]")
{
    auto tokens = std::vector<std::string>(40, "word ");
    auto harness = makeHarness(
        { ProviderStep { .tokens = tokens, .tokenDelay = 25ms }, ProviderStep { .tokens = { "Again", "." } } },
        { ProviderStep { .tokens = { "unused" } } });

    auto delivered = std::atomic<int> { 0 };
    auto deliveredAtStop = std::atomic<int> { -1 };
    auto callbacks = StreamCallbacks { .onToken = [&](const StreamToken&) { ++delivered; } };

    auto stopSource = std::stop_source {};
    auto canceller = std::jthread([&] {
        std::this_thread::sleep_for(150ms);
        stopSource.request_stop();
        deliveredAtStop = delivered.load();
    });

    auto const result = harness.orchestrator->run(fixGrammar("x"), callbacks, stopSource.get_token());
    canceller.join();

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::Cancelled);
    CHECK(delivered.load() == deliveredAtStop.load());
    CHECK(delivered.load() < 40);
    CHECK(harness.secondary->calls() == 0);
    CHECK(harness.primary->pool().activeCount() == 0);

    // The connection given back by the cancelled stream serves the next request.
    auto const again = harness.orchestrator->run(fixGrammar("y"), {}, {});
    REQUIRE(again.has_value());
    CHECK(again->text == "Again.");
    CHECK(again->provider == "primary");
    CHECK(harness.primary->pool().createdCount() == 1);
    CHECK(harness.primary->pool().activeCount() == 0);
}

TEST_CASE("StreamingOrchestrator::complete applies the same fallback", "[orchestrator]")
{
    auto harness = makeHarness({ ProviderStep { .startError = failure(ErrorCode::Timeout) } },
                               { ProviderStep { .tokens = { "Done", "." } } });

    auto const result = harness.orchestrator->complete(fixGrammar("x"), {});
    REQUIRE(result.has_value());
    CHECK(result->text == "Done.");
    CHECK(result->provider == "secondary");
    CHECK(result->attempts == 2);
}
