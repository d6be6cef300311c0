// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/LatencyStats.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace vocatype
{

/// @brief Lazy, finite, non-restartable sequence of response tokens.
class TokenStream
{
  public:
    virtual ~TokenStream() = default;

    /// @brief Waits for the next token.
    /// @param timeout Maximum time to wait.
    /// @return The next token, std::nullopt at the end of the response, Timeout if nothing arrived
    ///         in time, Cancelled after cancel(), or the provider's failure.
    [[nodiscard]] virtual auto next(std::chrono::milliseconds timeout) -> Result<std::optional<StreamToken>> = 0;

    /// @brief Aborts the response. Thread-safe; wakes a blocked next().
    virtual void cancel() = 0;
};

/// @brief Client of one AI text-processing backend.
///
/// Implementations are internally synchronized and may serve concurrent requests up to the size of
/// their connection pool. A TokenStream must not outlive the client that created it.
class ProviderClient
{
  public:
    virtual ~ProviderClient() = default;

    /// @brief Unique configured name, used for preference and logging.
    [[nodiscard]] virtual auto name() const -> const std::string& = 0;

    /// @brief Performs a request and returns the complete response text.
    [[nodiscard]] virtual auto issueRequest(const AiRequest& request, std::stop_token stopToken)
        -> Result<std::string> = 0;

    /// @brief Starts a streaming request.
    /// @return A token stream, or the error that prevented the request from starting.
    [[nodiscard]] virtual auto issueStreamingRequest(const AiRequest& request)
        -> Result<std::unique_ptr<TokenStream>> = 0;

    /// @brief Latency statistics, published by the orchestrator.
    [[nodiscard]] virtual auto stats() -> ProviderLatencyStats& = 0;
};

} // namespace vocatype
