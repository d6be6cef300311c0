// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/HttpProvider.hpp>

namespace vocatype
{

namespace anthropic
{
    constexpr auto DefaultBaseUrl = "https://api.anthropic.com/v1";
    constexpr auto DefaultModel = "claude-3-5-haiku-latest";
    constexpr auto ApiVersion = "2023-06-01";

    [[nodiscard]] auto buildRequest(const HttpProviderConfig& config,
                                    const AiRequest& request,
                                    const Prompt& prompt,
                                    bool stream) -> HttpRequest;

    /// @brief Joins the text blocks of a Messages API response.
    [[nodiscard]] auto parseResponse(std::string_view body) -> Result<std::string>;

    /// @brief Interprets one Messages API stream event; "message_stop" ends the stream.
    [[nodiscard]] auto parseStreamEvent(const SseEvent& event) -> Result<StreamDelta>;
} // namespace anthropic

/// @brief Anthropic Messages API backend.
class AnthropicProvider final: public HttpProvider
{
  public:
    using HttpProvider::HttpProvider;

  protected:
    [[nodiscard]] auto buildRequest(const AiRequest& request, const Prompt& prompt, bool stream) const
        -> HttpRequest override
    {
        return anthropic::buildRequest(config(), request, prompt, stream);
    }

    [[nodiscard]] auto parseResponse(std::string_view body) const -> Result<std::string> override
    {
        return anthropic::parseResponse(body);
    }

    [[nodiscard]] auto parseStreamEvent(const SseEvent& event) const -> Result<StreamDelta> override
    {
        return anthropic::parseStreamEvent(event);
    }
};

} // namespace vocatype
