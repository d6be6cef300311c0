// SPDX-License-Identifier: Apache-2.0
#include "OpenAiProvider.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <format>

namespace vocatype::openai
{

auto errorFromJson(const nlohmann::json& error) -> Error
{
    auto const message = error.is_object() ? json::getStringOr(error, "message", "unknown error")
                                           : (error.is_string() ? error.get<std::string>() : error.dump());
    auto const type = error.is_object() ? json::getStringOr(error, "type", "") : std::string {};
    auto const code = error.is_object() ? json::getStringOr(error, "code", "") : std::string {};

    auto const mentions = [&](std::string_view needle) {
        return type.find(needle) != std::string::npos || code.find(needle) != std::string::npos;
    };

    auto errorCode = ErrorCode::ProtocolError;
    if (mentions("auth") || mentions("api_key") || mentions("permission"))
        errorCode = ErrorCode::AuthError;
    else if (mentions("rate_limit") || mentions("quota"))
        errorCode = ErrorCode::RateLimited;
    else if (mentions("server_error") || mentions("overloaded"))
        errorCode = ErrorCode::NetworkError;
    else if (mentions("timeout"))
        errorCode = ErrorCode::Timeout;
    return Error { .code = errorCode, .message = message };
}

auto buildRequest(const HttpProviderConfig& config, const AiRequest& request, const Prompt& prompt, bool stream)
    -> HttpRequest
{
    auto const baseUrl = config.baseUrl.empty() ? std::string(DefaultBaseUrl) : config.baseUrl;

    auto body = nlohmann::json {
        { "model", config.model.empty() ? std::string(DefaultModel) : config.model },
        { "messages",
          nlohmann::json::array({
              { { "role", "system" }, { "content", prompt.system } },
              { { "role", "user" }, { "content", prompt.user } },
          }) },
        { "temperature", config.temperature },
        { "max_tokens", std::min(request.maxTokens, config.maxTokens) },
        { "stream", stream },
    };

    auto headers = std::vector<std::string> {
        "Content-Type: application/json",
        stream ? "Accept: text/event-stream" : "Accept: application/json",
    };
    if (!config.apiKey.empty())
        headers.push_back(std::format("Authorization: Bearer {}", config.apiKey));

    return HttpRequest {
        .url = std::format("{}/chat/completions", baseUrl),
        .headers = std::move(headers),
        .body = body.dump(),
    };
}

auto parseResponse(std::string_view body) -> Result<std::string>
{
    auto parsed = json::parse(body);
    if (!parsed)
        return std::unexpected(parsed.error());

    if (auto const error = parsed->find("error"); error != parsed->end() && !error->is_null())
        return std::unexpected(errorFromJson(*error));

    auto const choices = parsed->find("choices");
    if (choices == parsed->end() || !choices->is_array() || choices->empty())
        return makeError(ErrorCode::ProtocolError, "No choices in response");

    auto const& choice = choices->front();
    auto const message = choice.find("message");
    if (message == choice.end() || !message->is_object())
        return makeError(ErrorCode::ProtocolError, "No message in first choice");

    auto const content = message->find("content");
    if (content == message->end() || !content->is_string())
        return makeError(ErrorCode::ProtocolError, "No text content in first choice");
    return content->get<std::string>();
}

auto parseStreamEvent(const SseEvent& event) -> Result<StreamDelta>
{
    if (event.data == "[DONE]")
        return StreamDelta { .text = {}, .done = true };

    auto parsed = json::parse(event.data);
    if (!parsed)
        return std::unexpected(parsed.error());

    if (auto const error = parsed->find("error"); error != parsed->end() && !error->is_null())
        return std::unexpected(errorFromJson(*error));

    auto delta = StreamDelta {};
    auto const choices = parsed->find("choices");
    if (choices == parsed->end() || !choices->is_array() || choices->empty())
        return delta;

    auto const& choice = choices->front();
    if (auto const d = choice.find("delta"); d != choice.end() && d->is_object())
        delta.text = json::getStringOr(*d, "content", "");
    return delta;
}

} // namespace vocatype::openai
