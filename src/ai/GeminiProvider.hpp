// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/HttpProvider.hpp>

namespace vocatype
{

namespace gemini
{
    constexpr auto DefaultBaseUrl = "https://generativelanguage.googleapis.com/v1beta";
    constexpr auto DefaultModel = "gemini-2.0-flash";

    [[nodiscard]] auto buildRequest(const HttpProviderConfig& config,
                                    const AiRequest& request,
                                    const Prompt& prompt,
                                    bool stream) -> HttpRequest;

    /// @brief Joins candidates[0].content.parts[*].text of a generateContent response.
    [[nodiscard]] auto parseResponse(std::string_view body) -> Result<std::string>;

    /// @brief Interprets one streamGenerateContent SSE event (same payload shape as a response).
    [[nodiscard]] auto parseStreamEvent(const SseEvent& event) -> Result<StreamDelta>;
} // namespace gemini

/// @brief Google Gemini generateContent backend.
class GeminiProvider final: public HttpProvider
{
  public:
    using HttpProvider::HttpProvider;

  protected:
    [[nodiscard]] auto buildRequest(const AiRequest& request, const Prompt& prompt, bool stream) const
        -> HttpRequest override
    {
        return gemini::buildRequest(config(), request, prompt, stream);
    }

    [[nodiscard]] auto parseResponse(std::string_view body) const -> Result<std::string> override
    {
        return gemini::parseResponse(body);
    }

    [[nodiscard]] auto parseStreamEvent(const SseEvent& event) const -> Result<StreamDelta> override
    {
        return gemini::parseStreamEvent(event);
    }
};

} // namespace vocatype
