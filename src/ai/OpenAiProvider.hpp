// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/HttpProvider.hpp>

#include <nlohmann/json.hpp>

namespace vocatype
{

namespace openai
{
    constexpr auto DefaultBaseUrl = "https://api.openai.com/v1";
    constexpr auto DefaultModel = "gpt-4o-mini";

    [[nodiscard]] auto buildRequest(const HttpProviderConfig& config,
                                    const AiRequest& request,
                                    const Prompt& prompt,
                                    bool stream) -> HttpRequest;

    /// @brief Returns choices[0].message.content of a chat completion.
    [[nodiscard]] auto parseResponse(std::string_view body) -> Result<std::string>;

    /// @brief Interprets one chat completion chunk; "[DONE]" ends the stream.
    [[nodiscard]] auto parseStreamEvent(const SseEvent& event) -> Result<StreamDelta>;

    /// @brief Maps an OpenAI-style error object ({"type", "code", "message"}) to an Error.
    [[nodiscard]] auto errorFromJson(const nlohmann::json& error) -> Error;
} // namespace openai

/// @brief OpenAI chat completions backend; also serves compatible local servers (Ollama, LocalAI,
///        llama.cpp server), for which the API key may be empty.
class OpenAiProvider final: public HttpProvider
{
  public:
    using HttpProvider::HttpProvider;

  protected:
    [[nodiscard]] auto buildRequest(const AiRequest& request, const Prompt& prompt, bool stream) const
        -> HttpRequest override
    {
        return openai::buildRequest(config(), request, prompt, stream);
    }

    [[nodiscard]] auto parseResponse(std::string_view body) const -> Result<std::string> override
    {
        return openai::parseResponse(body);
    }

    [[nodiscard]] auto parseStreamEvent(const SseEvent& event) const -> Result<StreamDelta> override
    {
        return openai::parseStreamEvent(event);
    }
};

} // namespace vocatype
