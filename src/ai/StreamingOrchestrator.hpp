// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/ProviderClient.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace vocatype
{

/// @brief Timeouts applied to every streamed attempt.
struct OrchestratorConfig
{
    std::chrono::milliseconds firstTokenTimeout { 2'000 };
    std::chrono::milliseconds interTokenTimeout { 10'000 };
    std::chrono::milliseconds requestTimeout { 30'000 };
};

/// @brief Observers of a streamed run. Invoked on the calling thread.
struct StreamCallbacks
{
    /// Receives every token of the attempt currently being accumulated, in receive order.
    std::function<void(const StreamToken& token)> onToken;

    /// Invoked when an attempt fails after it already delivered tokens; its text is discarded.
    std::function<void(std::string_view provider, const Error& error)> onFallback;
};

/// @brief Outcome of a successful orchestration.
struct OrchestrationResult
{
    std::string text;
    std::string provider;
    std::chrono::milliseconds firstTokenLatency { 0 };
    std::chrono::milliseconds totalLatency { 0 };
    std::size_t attempts = 0;
};

/// @brief Runs AI requests against a prioritized set of providers with automatic fallback.
///
/// Each provider is tried at most once per request: the preferred provider first (if any), then
/// the configured order. Recoverable provider failures move on to the next provider; an
/// authentication failure additionally disables the provider until resetProvider(). Thread-safe.
class StreamingOrchestrator
{
  public:
    /// @param providers Backends in priority order.
    StreamingOrchestrator(std::vector<std::unique_ptr<ProviderClient>> providers, OrchestratorConfig config = {});

    StreamingOrchestrator(const StreamingOrchestrator&) = delete;
    StreamingOrchestrator& operator=(const StreamingOrchestrator&) = delete;

    /// @brief Streams a request, delivering tokens as they arrive.
    ///
    /// Once @p stopToken has been signalled (request_stop() has returned), no further token reaches
    /// StreamCallbacks::onToken and the active stream is aborted.
    /// @return The accumulated text, Cancelled, a non-recoverable error (e.g. InvalidArgument), or
    ///         AllProvidersExhausted carrying the last provider error as its cause.
    [[nodiscard]] auto run(const AiRequest& request, const StreamCallbacks& callbacks, std::stop_token stopToken)
        -> Result<OrchestrationResult>;

    /// @brief Non-streaming variant of run() with the same fallback rules.
    [[nodiscard]] auto complete(const AiRequest& request, std::stop_token stopToken) -> Result<OrchestrationResult>;

    /// @brief Re-enables a provider disabled by an authentication failure.
    /// @return false if no provider has that name.
    auto resetProvider(std::string_view name) -> bool;

    [[nodiscard]] auto isProviderDisabled(std::string_view name) const -> bool;

    /// @brief Providers in the order they would be tried for @p request (disabled ones included).
    [[nodiscard]] auto attemptOrder(const AiRequest& request) const -> std::vector<ProviderClient*>;

    [[nodiscard]] auto providerNames() const -> std::vector<std::string>;

    [[nodiscard]] auto provider(std::string_view name) const -> ProviderClient*;

    [[nodiscard]] auto config() const -> const OrchestratorConfig& { return _config; }

  private:
    /// Records a failed attempt. Returns true if the next provider should be tried.
    auto handleFailure(ProviderClient& provider, const Error& error) -> bool;

    std::vector<std::unique_ptr<ProviderClient>> _providers;
    OrchestratorConfig _config;

    mutable std::mutex _disabledMutex;
    std::unordered_set<std::string> _disabled;
};

} // namespace vocatype
