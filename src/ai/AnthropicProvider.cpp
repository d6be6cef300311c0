// SPDX-License-Identifier: Apache-2.0
#include "AnthropicProvider.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <format>

namespace vocatype::anthropic
{

namespace
{

    auto errorFromJson(const nlohmann::json& error) -> Error
    {
        auto const type = json::getStringOr(error, "type", "");
        auto const message = json::getStringOr(error, "message", type);

        auto code = ErrorCode::ProtocolError;
        if (type == "authentication_error" || type == "permission_error")
            code = ErrorCode::AuthError;
        else if (type == "rate_limit_error")
            code = ErrorCode::RateLimited;
        else if (type == "overloaded_error" || type == "api_error")
            code = ErrorCode::NetworkError;
        else if (type == "timeout_error")
            code = ErrorCode::Timeout;
        return Error { .code = code, .message = message };
    }

} // namespace

auto buildRequest(const HttpProviderConfig& config, const AiRequest& request, const Prompt& prompt, bool stream)
    -> HttpRequest
{
    auto const baseUrl = config.baseUrl.empty() ? std::string(DefaultBaseUrl) : config.baseUrl;

    auto body = nlohmann::json {
        { "model", config.model.empty() ? std::string(DefaultModel) : config.model },
        { "max_tokens", std::min(request.maxTokens, config.maxTokens) },
        { "system", prompt.system },
        { "messages", nlohmann::json::array({ { { "role", "user" }, { "content", prompt.user } } }) },
        { "temperature", config.temperature },
        { "stream", stream },
    };

    return HttpRequest {
        .url = std::format("{}/messages", baseUrl),
        .headers = {
            "Content-Type: application/json",
            std::format("x-api-key: {}", config.apiKey),
            std::format("anthropic-version: {}", ApiVersion),
        },
        .body = body.dump(),
    };
}

auto parseResponse(std::string_view body) -> Result<std::string>
{
    auto parsed = json::parse(body);
    if (!parsed)
        return std::unexpected(parsed.error());

    if (json::getStringOr(*parsed, "type", "") == "error")
        return std::unexpected(errorFromJson(parsed->value("error", nlohmann::json::object())));

    auto const content = parsed->find("content");
    if (content == parsed->end() || !content->is_array())
        return makeError(ErrorCode::ProtocolError, "No content in response");

    auto text = std::string {};
    for (auto const& block: *content)
        if (json::getStringOr(block, "type", "") == "text")
            text += json::getStringOr(block, "text", "");

    if (text.empty())
        return makeError(ErrorCode::ProtocolError, "No text content in response");
    return text;
}

auto parseStreamEvent(const SseEvent& event) -> Result<StreamDelta>
{
    if (event.event == "ping")
        return StreamDelta {};
    if (event.event == "message_stop")
        return StreamDelta { .text = {}, .done = true };

    auto parsed = json::parse(event.data);
    if (!parsed)
        return std::unexpected(parsed.error());

    // The event type is repeated inside the payload; prefer it when the event name is missing.
    auto const type = event.event == "message" ? json::getStringOr(*parsed, "type", "") : event.event;

    if (type == "error")
        return std::unexpected(errorFromJson(parsed->value("error", nlohmann::json::object())));
    if (type == "message_stop")
        return StreamDelta { .text = {}, .done = true };
    if (type != "content_block_delta")
        return StreamDelta {};

    auto const delta = parsed->find("delta");
    if (delta == parsed->end() || !delta->is_object())
        return makeError(ErrorCode::ProtocolError, "content_block_delta without delta");
    if (json::getStringOr(*delta, "type", "") != "text_delta")
        return StreamDelta {};
    return StreamDelta { .text = json::getStringOr(*delta, "text", ""), .done = false };
}

} // namespace vocatype::anthropic
