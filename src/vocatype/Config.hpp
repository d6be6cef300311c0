// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/ProviderFactory.hpp>
#include <ai/StreamingOrchestrator.hpp>
#include <audio/AudioPipeline.hpp>
#include <core/Error.hpp>
#include <core/Log.hpp>
#include <workflow/WorkflowCoordinator.hpp>

#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace vocatype
{

/// @brief Speech-to-text configuration section.
struct TranscriptionConfig
{
    std::string modelPath;
    /// ISO 639-1 code or "auto".
    std::string language = "en";
    int threads = 4;
    std::chrono::milliseconds timeout { 10'000 };
};

/// @brief Top-level application configuration.
///
/// The workflow's language and transcription timeout mirror the transcription section; the loader
/// keeps them in sync.
struct AppConfig
{
    AudioPipelineConfig audio;
    TranscriptionConfig transcription;

    /// AI backends in priority order.
    std::vector<ProviderConfig> providers;

    OrchestratorConfig orchestrator;
    WorkflowConfig workflow;

    /// Custom prompt id to instruction.
    std::map<std::string, std::string> customPrompts;

    log::Level logLevel = log::Level::Info;
};

/// @brief The provider list used when the config file does not name any: Gemini, key from $GEMINI_API_KEY.
[[nodiscard]] auto defaultProviders() -> std::vector<ProviderConfig>;

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration (defaults if no file exists) or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses a configuration document.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating the parent directory.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Checks value ranges and cross-field constraints.
/// @return Success, or a ConfigError naming the first offending setting.
[[nodiscard]] auto validateConfig(const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
/// On Linux: $XDG_CONFIG_HOME/vocatype or ~/.config/vocatype
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace vocatype
