// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/Prompts.hpp>
#include <ai/ProviderClient.hpp>
#include <core/Error.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace vocatype
{

/// @brief The supported backend wire protocols.
enum class ProviderKind : std::uint8_t
{
    Gemini,
    OpenAi,
    Anthropic,
};

[[nodiscard]] auto providerKindToString(ProviderKind kind) -> std::string_view;

/// @brief Parses a provider kind. "ollama", "localai" and "llamacpp" are OpenAI-compatible.
[[nodiscard]] auto providerKindFromString(std::string_view name) -> std::optional<ProviderKind>;

/// @brief Configuration of one backend entry.
struct ProviderConfig
{
    std::string name;
    ProviderKind kind = ProviderKind::Gemini;
    std::string apiKey;
    /// Environment variable holding the API key; used when apiKey is empty.
    std::string apiKeyEnv;
    std::string model;
    std::string baseUrl;
    float temperature = 0.3f;
    std::uint32_t maxTokens = 1000;
    std::chrono::milliseconds requestTimeout { 30'000 };
    std::chrono::milliseconds connectTimeout { 5'000 };
    std::size_t maxConnections = 4;
    std::chrono::milliseconds idleTimeout { 90'000 };
};

/// @brief Returns the inline key, else the value of the configured environment variable.
[[nodiscard]] auto resolveApiKey(const ProviderConfig& config) -> std::string;

/// @brief Returns true if the backend cannot be used without an API key.
[[nodiscard]] auto requiresApiKey(const ProviderConfig& config) -> bool;

/// @brief Creates the client for one configured backend.
/// @return The client, or AuthError when a required API key is missing.
[[nodiscard]] auto createProvider(const ProviderConfig& config, std::shared_ptr<const PromptLibrary> prompts)
    -> Result<std::unique_ptr<ProviderClient>>;

} // namespace vocatype
