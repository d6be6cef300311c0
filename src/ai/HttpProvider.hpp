// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/ConnectionPool.hpp>
#include <ai/Prompts.hpp>
#include <ai/ProviderClient.hpp>
#include <ai/SseParser.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace vocatype
{

/// @brief Settings shared by all HTTP backends.
struct HttpProviderConfig
{
    std::string name;
    std::string model;
    std::string baseUrl;
    std::string apiKey;
    float temperature = 0.3f;
    std::uint32_t maxTokens = 1000;
    std::chrono::milliseconds requestTimeout { 30'000 };
    std::chrono::milliseconds connectTimeout { 5'000 };
    ConnectionPoolConfig pool;
};

/// @brief A fully prepared HTTP POST.
struct HttpRequest
{
    std::string url;
    std::vector<std::string> headers;
    std::string body;
};

/// @brief What one stream event contributed to the response.
struct StreamDelta
{
    std::string text;
    bool done = false;
};

/// @brief Maps a non-2xx HTTP status to the provider error taxonomy.
[[nodiscard]] auto httpStatusToError(long status, std::string_view body) -> Error;

/// @brief Extracts a human-readable message from a JSON error body ({"error": {"message": ...}}).
[[nodiscard]] auto extractApiErrorMessage(std::string_view body) -> std::string;

/// @brief Base class of the libcurl-backed providers.
///
/// Owns a pool of curl handles (each slot keeps its own keep-alive connection cache) and runs every
/// streaming transfer on its own thread feeding a TokenChannel. Cancelling a stream interrupts the
/// transfer at once, even while the server sends nothing. Subclasses only describe the wire
/// format.
class HttpProvider: public ProviderClient
{
  public:
    HttpProvider(HttpProviderConfig config, std::shared_ptr<const PromptLibrary> prompts);
    ~HttpProvider() override;

    HttpProvider(const HttpProvider&) = delete;
    HttpProvider& operator=(const HttpProvider&) = delete;

    [[nodiscard]] auto name() const -> const std::string& override;
    [[nodiscard]] auto issueRequest(const AiRequest& request, std::stop_token stopToken)
        -> Result<std::string> override;
    [[nodiscard]] auto issueStreamingRequest(const AiRequest& request) -> Result<std::unique_ptr<TokenStream>> override;
    [[nodiscard]] auto stats() -> ProviderLatencyStats& override;

    [[nodiscard]] auto config() const -> const HttpProviderConfig& { return _config; }

    /// @brief Transfer time limit for @p request: its own limit, capped by the provider's requestTimeout.
    [[nodiscard]] auto effectiveTimeout(const AiRequest& request) const -> std::chrono::milliseconds;

  protected:
    [[nodiscard]] virtual auto buildRequest(const AiRequest& request, const Prompt& prompt, bool stream) const
        -> HttpRequest = 0;
    [[nodiscard]] virtual auto parseResponse(std::string_view body) const -> Result<std::string> = 0;
    [[nodiscard]] virtual auto parseStreamEvent(const SseEvent& event) const -> Result<StreamDelta> = 0;

  private:
    struct Impl;
    HttpProviderConfig _config;
    std::shared_ptr<const PromptLibrary> _prompts;
    std::unique_ptr<Impl> _impl;
};

} // namespace vocatype
