// SPDX-License-Identifier: Apache-2.0
#include "ProviderFactory.hpp"

#include <ai/AnthropicProvider.hpp>
#include <ai/GeminiProvider.hpp>
#include <ai/OpenAiProvider.hpp>
#include <core/Log.hpp>

#include <cstdlib>
#include <format>

namespace vocatype
{

auto providerKindToString(ProviderKind kind) -> std::string_view
{
    switch (kind)
    {
        case ProviderKind::Gemini: return "gemini";
        case ProviderKind::OpenAi: return "openai";
        case ProviderKind::Anthropic: return "anthropic";
    }
    return "unknown";
}

auto providerKindFromString(std::string_view name) -> std::optional<ProviderKind>
{
    if (name == "gemini")
        return ProviderKind::Gemini;
    if (name == "openai" || name == "ollama" || name == "localai" || name == "llamacpp")
        return ProviderKind::OpenAi;
    if (name == "anthropic")
        return ProviderKind::Anthropic;
    return std::nullopt;
}

auto resolveApiKey(const ProviderConfig& config) -> std::string
{
    if (!config.apiKey.empty())
        return config.apiKey;
    if (config.apiKeyEnv.empty())
        return {};
    if (auto const* value = std::getenv(config.apiKeyEnv.c_str()))
        return value;
    return {};
}

auto requiresApiKey(const ProviderConfig& config) -> bool
{
    // Local OpenAI-compatible servers usually run without authentication
    return config.kind != ProviderKind::OpenAi || config.baseUrl.empty();
}

auto createProvider(const ProviderConfig& config, std::shared_ptr<const PromptLibrary> prompts)
    -> Result<std::unique_ptr<ProviderClient>>
{
    auto apiKey = resolveApiKey(config);
    if (apiKey.empty() && requiresApiKey(config))
        return makeError(ErrorCode::AuthError,
                         config.apiKeyEnv.empty()
                             ? std::format("Provider '{}' has no API key", config.name)
                             : std::format("Provider '{}' has no API key (${} is not set)", config.name, config.apiKeyEnv));

    auto httpConfig = HttpProviderConfig {
        .name = config.name,
        .model = config.model,
        .baseUrl = config.baseUrl,
        .apiKey = std::move(apiKey),
        .temperature = config.temperature,
        .maxTokens = config.maxTokens,
        .requestTimeout = config.requestTimeout,
        .connectTimeout = config.connectTimeout,
        .pool = ConnectionPoolConfig {
            .maxConnections = config.maxConnections,
            .idleTimeout = config.idleTimeout,
            .acquireTimeout = config.connectTimeout,
        },
    };

    log::info("Provider '{}' ({}{}{})",
              config.name,
              providerKindToString(config.kind),
              config.model.empty() ? "" : ", model ",
              config.model);

    switch (config.kind)
    {
        case ProviderKind::Gemini: return std::make_unique<GeminiProvider>(std::move(httpConfig), std::move(prompts));
        case ProviderKind::OpenAi: return std::make_unique<OpenAiProvider>(std::move(httpConfig), std::move(prompts));
        case ProviderKind::Anthropic:
            return std::make_unique<AnthropicProvider>(std::move(httpConfig), std::move(prompts));
    }
    return makeError(ErrorCode::ConfigError, std::format("Provider '{}' has an unknown kind", config.name));
}

} // namespace vocatype
