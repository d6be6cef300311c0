// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <set>
#include <sstream>

namespace vocatype
{

namespace
{

    auto parseAudio(const nlohmann::json& audio) -> AudioPipelineConfig
    {
        auto config = AudioPipelineConfig {};
        config.sampleRate = json::getUintOr(audio, "sampleRate", DefaultSampleRate);
        config.deviceName = json::getStringOr(audio, "deviceName", "");
        config.bufferDuration = std::chrono::seconds(json::getUintOr(audio, "bufferSeconds", 30));
        config.maxSegmentDuration = json::getMillisecondsOr(audio, "maxSegmentMs", config.maxSegmentDuration);

        if (auto const vad = audio.find("vad"); vad != audio.end() && vad->is_object())
        {
            config.vad.sensitivity = json::getFloatOr(*vad, "sensitivity", config.vad.sensitivity);
            config.vad.smoothing = json::getFloatOr(*vad, "smoothing", config.vad.smoothing);
            config.vad.onsetFrames = json::getUintOr(*vad, "onsetFrames", config.vad.onsetFrames);
            config.vad.releaseFrames = json::getUintOr(*vad, "releaseFrames", config.vad.releaseFrames);
        }
        return config;
    }

    auto parseProvider(const nlohmann::json& entry, std::size_t index) -> Result<ProviderConfig>
    {
        if (!entry.is_object())
            return makeError(ErrorCode::ConfigError, std::format("providers[{}] is not an object", index));

        auto const kindName = json::getStringOr(entry, "kind", "");
        auto const kind = providerKindFromString(kindName);
        if (!kind)
            return makeError(ErrorCode::ConfigError,
                             std::format("providers[{}]: unknown provider kind '{}'", index, kindName));

        auto config = ProviderConfig {};
        config.kind = *kind;
        config.name = json::getStringOr(entry, "name", kindName);
        config.apiKey = json::getStringOr(entry, "apiKey", "");
        config.apiKeyEnv = json::getStringOr(entry, "apiKeyEnv", "");
        config.model = json::getStringOr(entry, "model", "");
        config.baseUrl = json::getStringOr(entry, "baseUrl", "");
        config.temperature = json::getFloatOr(entry, "temperature", config.temperature);
        config.maxTokens = json::getUintOr(entry, "maxTokens", config.maxTokens);
        config.requestTimeout = json::getMillisecondsOr(entry, "requestTimeoutMs", config.requestTimeout);
        config.connectTimeout = json::getMillisecondsOr(entry, "connectTimeoutMs", config.connectTimeout);
        config.maxConnections = json::getUintOr(entry, "maxConnections", static_cast<std::uint32_t>(config.maxConnections));
        config.idleTimeout = json::getMillisecondsOr(entry, "idleTimeoutMs", config.idleTimeout);
        return config;
    }

    auto toJson(const ProviderConfig& provider) -> nlohmann::json
    {
        auto entry = nlohmann::json::object();
        entry["name"] = provider.name;
        entry["kind"] = std::string(providerKindToString(provider.kind));
        // Inline keys are never written back; only the environment variable reference is.
        if (!provider.apiKeyEnv.empty())
            entry["apiKeyEnv"] = provider.apiKeyEnv;
        if (!provider.model.empty())
            entry["model"] = provider.model;
        if (!provider.baseUrl.empty())
            entry["baseUrl"] = provider.baseUrl;
        entry["temperature"] = provider.temperature;
        entry["maxTokens"] = provider.maxTokens;
        entry["requestTimeoutMs"] = provider.requestTimeout.count();
        entry["connectTimeoutMs"] = provider.connectTimeout.count();
        entry["maxConnections"] = provider.maxConnections;
        entry["idleTimeoutMs"] = provider.idleTimeout.count();
        return entry;
    }

} // namespace

auto defaultProviders() -> std::vector<ProviderConfig>
{
    auto gemini = ProviderConfig {};
    gemini.name = "gemini";
    gemini.kind = ProviderKind::Gemini;
    gemini.apiKeyEnv = "GEMINI_API_KEY";
    return { std::move(gemini) };
}

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\vocatype";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/vocatype";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/vocatype";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/vocatype";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, "Malformed config file", parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = AppConfig {};

    if (auto const it = root.find("audio"); it != root.end() && it->is_object())
        config.audio = parseAudio(*it);

    // Transcription section
    if (auto const it = root.find("transcription"); it != root.end() && it->is_object())
    {
        auto const& transcription = *it;
        config.transcription.modelPath = json::getStringOr(transcription, "modelPath", "");
        config.transcription.language = json::getStringOr(transcription, "language", "en");
        config.transcription.threads = json::getIntOr(transcription, "threads", 4);
        config.transcription.timeout =
            json::getMillisecondsOr(transcription, "timeoutMs", config.transcription.timeout);
    }

    // Providers section (order is priority)
    if (auto const it = root.find("providers"); it != root.end())
    {
        if (!it->is_array())
            return makeError(ErrorCode::ConfigError, "'providers' must be an array");
        for (auto index = std::size_t { 0 }; index < it->size(); ++index)
        {
            auto provider = parseProvider((*it)[index], index);
            if (!provider)
                return std::unexpected(provider.error());
            config.providers.push_back(std::move(*provider));
        }
    }
    else
    {
        config.providers = defaultProviders();
    }

    // Orchestrator section
    if (auto const it = root.find("orchestrator"); it != root.end() && it->is_object())
    {
        auto& orchestrator = config.orchestrator;
        orchestrator.firstTokenTimeout =
            json::getMillisecondsOr(*it, "firstTokenTimeoutMs", orchestrator.firstTokenTimeout);
        orchestrator.interTokenTimeout =
            json::getMillisecondsOr(*it, "interTokenTimeoutMs", orchestrator.interTokenTimeout);
        orchestrator.requestTimeout = json::getMillisecondsOr(*it, "requestTimeoutMs", orchestrator.requestTimeout);
    }

    // Workflow section
    if (auto const it = root.find("workflow"); it != root.end() && it->is_object())
    {
        auto& workflow = config.workflow;
        workflow.continuousListening = json::getBoolOr(*it, "continuousListening", false);
        workflow.defaultAction = json::getStringOr(*it, "defaultAction", "");
        workflow.preferredProvider = json::getStringOr(*it, "preferredProvider", "");
        workflow.maxTokens = json::getUintOr(*it, "maxTokens", workflow.maxTokens);
        workflow.requestTimeLimit = json::getMillisecondsOr(*it, "requestTimeLimitMs", workflow.requestTimeLimit);
        workflow.errorDisplay = json::getMillisecondsOr(*it, "errorDisplayMs", workflow.errorDisplay);
        workflow.levelRateHz = json::getUintOr(*it, "levelRateHz", workflow.levelRateHz);
        workflow.latencyBudget = json::getMillisecondsOr(*it, "latencyBudgetMs", workflow.latencyBudget);
    }
    config.workflow.language = config.transcription.language;
    config.workflow.transcriptionTimeout = config.transcription.timeout;

    // Custom prompts section
    if (auto const it = root.find("customPrompts"); it != root.end() && it->is_object())
    {
        for (auto const& [id, instruction]: it->items())
        {
            if (instruction.is_string())
                config.customPrompts[id] = instruction.get<std::string>();
            else
                log::warning("Ignoring custom prompt '{}': instruction must be a string", id);
        }
    }

    if (auto const it = root.find("logLevel"); it != root.end())
    {
        auto const name = it->is_string() ? it->get<std::string>() : std::string {};
        auto const level = log::levelFromString(name);
        if (!level)
            return makeError(ErrorCode::ConfigError, std::format("Unknown log level '{}'", name));
        config.logLevel = *level;
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto config = parseConfig(ss.str());
    if (!config)
        return makeError(ErrorCode::ConfigError, std::format("Invalid config file {}", path), config.error());

    if (auto valid = validateConfig(*config); !valid)
        return std::unexpected(valid.error());
    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    // Audio section
    auto audio = nlohmann::json::object();
    audio["sampleRate"] = config.audio.sampleRate;
    if (!config.audio.deviceName.empty())
        audio["deviceName"] = config.audio.deviceName;
    audio["bufferSeconds"] = std::chrono::duration_cast<std::chrono::seconds>(config.audio.bufferDuration).count();
    audio["maxSegmentMs"] = config.audio.maxSegmentDuration.count();
    audio["vad"] = {
        { "sensitivity", config.audio.vad.sensitivity },
        { "smoothing", config.audio.vad.smoothing },
        { "onsetFrames", config.audio.vad.onsetFrames },
        { "releaseFrames", config.audio.vad.releaseFrames },
    };
    root["audio"] = std::move(audio);

    // Transcription section
    auto transcription = nlohmann::json::object();
    if (!config.transcription.modelPath.empty())
        transcription["modelPath"] = config.transcription.modelPath;
    transcription["language"] = config.transcription.language;
    transcription["threads"] = config.transcription.threads;
    transcription["timeoutMs"] = config.transcription.timeout.count();
    root["transcription"] = std::move(transcription);

    // Providers section
    auto providers = nlohmann::json::array();
    for (auto const& provider: config.providers)
        providers.push_back(toJson(provider));
    root["providers"] = std::move(providers);

    root["orchestrator"] = {
        { "firstTokenTimeoutMs", config.orchestrator.firstTokenTimeout.count() },
        { "interTokenTimeoutMs", config.orchestrator.interTokenTimeout.count() },
        { "requestTimeoutMs", config.orchestrator.requestTimeout.count() },
    };

    // Workflow section
    auto workflow = nlohmann::json::object();
    workflow["continuousListening"] = config.workflow.continuousListening;
    if (!config.workflow.defaultAction.empty())
        workflow["defaultAction"] = config.workflow.defaultAction;
    if (!config.workflow.preferredProvider.empty())
        workflow["preferredProvider"] = config.workflow.preferredProvider;
    workflow["maxTokens"] = config.workflow.maxTokens;
    workflow["requestTimeLimitMs"] = config.workflow.requestTimeLimit.count();
    workflow["errorDisplayMs"] = config.workflow.errorDisplay.count();
    workflow["levelRateHz"] = config.workflow.levelRateHz;
    workflow["latencyBudgetMs"] = config.workflow.latencyBudget.count();
    root["workflow"] = std::move(workflow);

    if (!config.customPrompts.empty())
    {
        auto prompts = nlohmann::json::object();
        for (auto const& [id, instruction]: config.customPrompts)
            prompts[id] = instruction;
        root["customPrompts"] = std::move(prompts);
    }

    root["logLevel"] = std::string(log::levelToString(config.logLevel));

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Failed to write config file: {}", path));
    return {};
}

auto validateConfig(const AppConfig& config) -> VoidResult
{
    if (auto audio = validateAudioPipelineConfig(config.audio); !audio)
        return makeError(ErrorCode::ConfigError, "Invalid audio settings", audio.error());
    // The whisper model consumes 16 kHz mono and segments are passed to it without resampling.
    if (config.audio.sampleRate != DefaultSampleRate)
        return makeError(ErrorCode::ConfigError,
                         std::format("audio.sampleRate must be {} Hz for speech recognition, got {} Hz",
                                     DefaultSampleRate,
                                     config.audio.sampleRate));

    if (config.transcription.threads <= 0)
        return makeError(ErrorCode::ConfigError, "transcription.threads must be positive");
    if (config.transcription.timeout.count() <= 0)
        return makeError(ErrorCode::ConfigError, "transcription.timeoutMs must be positive");

    auto names = std::set<std::string> {};
    for (auto const& provider: config.providers)
    {
        if (provider.name.empty())
            return makeError(ErrorCode::ConfigError, "Every provider needs a name");
        if (!names.insert(provider.name).second)
            return makeError(ErrorCode::ConfigError, std::format("Duplicate provider name '{}'", provider.name));
        if (provider.temperature < 0.0f || provider.temperature > 2.0f)
            return makeError(ErrorCode::ConfigError,
                             std::format("Provider '{}': temperature {} is outside [0, 2]",
                                         provider.name,
                                         provider.temperature));
        if (provider.maxTokens == 0 || provider.maxConnections == 0)
            return makeError(ErrorCode::ConfigError,
                             std::format("Provider '{}': maxTokens and maxConnections must be positive",
                                         provider.name));
        if (provider.requestTimeout.count() <= 0 || provider.connectTimeout.count() <= 0)
            return makeError(ErrorCode::ConfigError,
                             std::format("Provider '{}': timeouts must be positive", provider.name));
    }

    auto const& orchestrator = config.orchestrator;
    if (orchestrator.firstTokenTimeout.count() <= 0 || orchestrator.interTokenTimeout.count() <= 0
        || orchestrator.requestTimeout.count() <= 0)
        return makeError(ErrorCode::ConfigError, "Orchestrator timeouts must be positive");

    auto const& workflow = config.workflow;
    if (!workflow.preferredProvider.empty() && !names.contains(workflow.preferredProvider))
        return makeError(ErrorCode::ConfigError,
                         std::format("Preferred provider '{}' is not configured", workflow.preferredProvider));
    if (workflow.levelRateHz == 0 || workflow.levelRateHz > 60)
        return makeError(ErrorCode::ConfigError,
                         std::format("workflow.levelRateHz must be within 1..60, got {}", workflow.levelRateHz));
    if (workflow.errorDisplay.count() <= 0 || workflow.latencyBudget.count() <= 0
        || workflow.requestTimeLimit.count() <= 0)
        return makeError(ErrorCode::ConfigError, "Workflow durations must be positive");
    if (workflow.maxTokens == 0)
        return makeError(ErrorCode::ConfigError, "workflow.maxTokens must be positive");

    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        auto config = AppConfig {};
        config.providers = defaultProviders();
        return config;
    }

    return loadConfigFromFile(path);
}

} // namespace vocatype
