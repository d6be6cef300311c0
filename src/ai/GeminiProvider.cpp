// SPDX-License-Identifier: Apache-2.0
#include "GeminiProvider.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <format>

namespace vocatype::gemini
{

namespace
{

    /// Extracts the candidate text; a chunk without text yields an empty string.
    auto extractText(const nlohmann::json& response, bool requireText) -> Result<std::string>
    {
        if (auto const error = response.find("error"); error != response.end() && error->is_object())
            return std::unexpected(httpStatusToError(json::getIntOr(*error, "code", 500), response.dump()));

        auto const candidates = response.find("candidates");
        if (candidates == response.end() || !candidates->is_array() || candidates->empty())
        {
            if (auto const feedback = response.find("promptFeedback"); feedback != response.end())
                return makeError(ErrorCode::ProtocolError,
                                 std::format("Prompt blocked: {}", json::getStringOr(*feedback, "blockReason", "unknown")));
            if (!requireText)
                return std::string {};
            return makeError(ErrorCode::ProtocolError, "No candidates in response");
        }

        auto text = std::string {};
        auto const& candidate = candidates->front();
        auto const content = candidate.find("content");
        if (content != candidate.end() && content->is_object())
        {
            auto const parts = content->find("parts");
            if (parts != content->end() && parts->is_array())
                for (auto const& part: *parts)
                    text += json::getStringOr(part, "text", "");
        }

        if (text.empty() && requireText)
        {
            auto const reason = json::getStringOr(candidate, "finishReason", "");
            if (reason.empty() || reason == "STOP")
                return makeError(ErrorCode::ProtocolError, "No text in response");
            return makeError(ErrorCode::ProtocolError, std::format("Response stopped: {}", reason));
        }
        return text;
    }

} // namespace

auto buildRequest(const HttpProviderConfig& config, const AiRequest& request, const Prompt& prompt, bool stream)
    -> HttpRequest
{
    auto const baseUrl = config.baseUrl.empty() ? std::string(DefaultBaseUrl) : config.baseUrl;
    auto const model = config.model.empty() ? std::string(DefaultModel) : config.model;
    auto const url = stream ? std::format("{}/models/{}:streamGenerateContent?alt=sse&key={}", baseUrl, model, config.apiKey)
                            : std::format("{}/models/{}:generateContent?key={}", baseUrl, model, config.apiKey);

    auto body = nlohmann::json {
        { "systemInstruction", { { "parts", nlohmann::json::array({ { { "text", prompt.system } } }) } } },
        { "contents",
          nlohmann::json::array({ { { "role", "user" },
                                    { "parts", nlohmann::json::array({ { { "text", prompt.user } } }) } } }) },
        { "generationConfig",
          {
              { "temperature", config.temperature },
              { "maxOutputTokens", std::min(request.maxTokens, config.maxTokens) },
              { "candidateCount", 1 },
          } },
    };

    return HttpRequest {
        .url = url,
        .headers = { "Content-Type: application/json", stream ? "Accept: text/event-stream" : "Accept: application/json" },
        .body = body.dump(),
    };
}

auto parseResponse(std::string_view body) -> Result<std::string>
{
    auto parsed = json::parse(body);
    if (!parsed)
        return std::unexpected(parsed.error());
    return extractText(*parsed, true);
}

auto parseStreamEvent(const SseEvent& event) -> Result<StreamDelta>
{
    auto parsed = json::parse(event.data);
    if (!parsed)
        return std::unexpected(parsed.error());

    auto text = extractText(*parsed, false);
    if (!text)
        return std::unexpected(text.error());
    return StreamDelta { .text = std::move(*text), .done = false };
}

} // namespace vocatype::gemini
