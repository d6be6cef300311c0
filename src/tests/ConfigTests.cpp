// SPDX-License-Identifier: Apache-2.0
#include <vocatype/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace vocatype;
using namespace std::chrono_literals;

namespace
{

auto writeTempConfig(std::string_view name, std::string_view content) -> std::filesystem::path
{
    auto const path = std::filesystem::temp_directory_path() / name;
    auto file = std::ofstream(path);
    file << content;
    return path;
}

} // namespace

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    CHECK(!defaultConfigDir().empty());
    CHECK(defaultConfigPath().ends_with("vocatype/config.json"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.audio.sampleRate == 16000);
    CHECK(config.audio.bufferDuration == 30s);
    CHECK(config.audio.vad.sensitivity == 0.5f);
    CHECK(config.transcription.language == "en");
    CHECK(config.orchestrator.firstTokenTimeout == 2000ms);
    CHECK(config.workflow.levelRateHz == 30);
    CHECK(config.workflow.defaultAction.empty());
    CHECK(config.logLevel == log::Level::Info);
    CHECK(validateConfig(config).has_value());
}

TEST_CASE("parseConfig reads every section", "[config]")
{
    auto const result = parseConfig(R"({
        "audio": {
            "deviceName": "USB",
            "bufferSeconds": 20,
            "maxSegmentMs": 8000,
            "vad": { "sensitivity": 0.7, "onsetFrames": 4, "releaseFrames": 25 }
        },
        "transcription": { "modelPath": "/models/ggml-base.en.bin", "language": "de", "threads": 2, "timeoutMs": 5000 },
        "providers": [
            { "name": "fast", "kind": "gemini", "apiKeyEnv": "GEMINI_API_KEY", "model": "gemini-2.0-flash-lite" },
            { "kind": "ollama", "baseUrl": "http://localhost:11434/v1", "model": "llama3.2", "maxConnections": 1 }
        ],
        "orchestrator": { "firstTokenTimeoutMs": 1500, "interTokenTimeoutMs": 4000 },
        "workflow": {
            "continuousListening": true,
            "defaultAction": "translate:English",
            "preferredProvider": "ollama",
            "levelRateHz": 20,
            "latencyBudgetMs": 2500
        },
        "customPrompts": { "email": "Rewrite as a polite email", "broken": 42 },
        "logLevel": "debug"
    })");
    REQUIRE(result.has_value());
    auto const& config = *result;

    SECTION("audio")
    {
        CHECK(config.audio.deviceName == "USB");
        CHECK(config.audio.bufferDuration == 20s);
        CHECK(config.audio.maxSegmentDuration == 8000ms);
        CHECK(config.audio.vad.sensitivity == 0.7f);
        CHECK(config.audio.vad.onsetFrames == 4);
        CHECK(config.audio.vad.releaseFrames == 25);
    }

    SECTION("transcription is mirrored into the workflow")
    {
        CHECK(config.transcription.modelPath == "/models/ggml-base.en.bin");
        CHECK(config.transcription.threads == 2);
        CHECK(config.workflow.language == "de");
        CHECK(config.workflow.transcriptionTimeout == 5000ms);
    }

    SECTION("providers keep their order")
    {
        REQUIRE(config.providers.size() == 2);
        CHECK(config.providers[0].name == "fast");
        CHECK(config.providers[0].kind == ProviderKind::Gemini);
        CHECK(config.providers[0].model == "gemini-2.0-flash-lite");
        CHECK(config.providers[1].name == "ollama");
        CHECK(config.providers[1].kind == ProviderKind::OpenAi);
        CHECK(config.providers[1].maxConnections == 1);
    }

    SECTION("orchestrator and workflow")
    {
        CHECK(config.orchestrator.firstTokenTimeout == 1500ms);
        CHECK(config.orchestrator.interTokenTimeout == 4000ms);
        CHECK(config.orchestrator.requestTimeout == 30000ms);
        CHECK(config.workflow.continuousListening);
        CHECK(config.workflow.defaultAction == "translate:English");
        CHECK(config.workflow.preferredProvider == "ollama");
        CHECK(config.workflow.levelRateHz == 20);
        CHECK(config.workflow.latencyBudget == 2500ms);
    }

    SECTION("custom prompts skip non-string entries")
    {
        CHECK(config.customPrompts.size() == 1);
        CHECK(config.customPrompts.at("email") == "Rewrite as a polite email");
    }

    CHECK(config.logLevel == log::Level::Debug);
    CHECK(validateConfig(config).has_value());
}

TEST_CASE("parseConfig falls back to the default provider", "[config]")
{
    auto const result = parseConfig("{}");
    REQUIRE(result.has_value());
    REQUIRE(result->providers.size() == 1);
    CHECK(result->providers[0].name == "gemini");
    CHECK(result->providers[0].apiKeyEnv == "GEMINI_API_KEY");

    auto const none = parseConfig(R"({"providers": []})");
    REQUIRE(none.has_value());
    CHECK(none->providers.empty());
}

TEST_CASE("parseConfig rejects malformed documents", "[config]")
{
    SECTION("not JSON")
    {
        auto const result = parseConfig("{ audio: ");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
        CHECK(result.error().cause != nullptr);
    }
    SECTION("not an object")
    {
        CHECK(!parseConfig("[1, 2]").has_value());
    }
    SECTION("unknown provider kind")
    {
        auto const result = parseConfig(R"({"providers": [{"kind": "mistral"}]})");
        REQUIRE(!result.has_value());
        CHECK(result.error().message == "providers[0]: unknown provider kind 'mistral'");
    }
    SECTION("unknown log level")
    {
        CHECK(!parseConfig(R"({"logLevel": "loud"})").has_value());
    }
}

TEST_CASE("validateConfig names the offending setting", "[config]")
{
    auto config = AppConfig {};
    config.providers = defaultProviders();

    SECTION("duplicate provider names")
    {
        config.providers.push_back(config.providers.front());
        auto const result = validateConfig(config);
        REQUIRE(!result.has_value());
        CHECK(result.error().message == "Duplicate provider name 'gemini'");
    }
    SECTION("unknown preferred provider")
    {
        config.workflow.preferredProvider = "anthropic";
        CHECK(!validateConfig(config).has_value());
    }
    SECTION("segment longer than the audio buffer")
    {
        config.audio.maxSegmentDuration = 60s;
        auto const result = validateConfig(config);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().cause != nullptr);
        CHECK(result.error().cause->code == ErrorCode::ConfigError);
    }
    SECTION("capture rate the speech model cannot consume")
    {
        config.audio.sampleRate = 48000;
        auto const result = validateConfig(config);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
        CHECK(result.error().message.find("audio.sampleRate") != std::string::npos);
    }
    SECTION("segment bound that is not a whole number of frames")
    {
        config.audio.maxSegmentDuration = 10005ms;
        auto const result = validateConfig(config);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().cause != nullptr);
        CHECK(result.error().cause->message.find("multiple of 10 ms") != std::string::npos);
    }
    SECTION("level rate out of range")
    {
        config.workflow.levelRateHz = 120;
        CHECK(!validateConfig(config).has_value());
    }
    SECTION("temperature out of range")
    {
        config.providers.front().temperature = 3.0f;
        CHECK(!validateConfig(config).has_value());
    }
}

TEST_CASE("saveConfigToFile and loadConfigFromFile round-trip without inline keys", "[config]")
{
    auto const path = std::filesystem::temp_directory_path() / "vocatype_test_dir" / "config.json";
    std::filesystem::remove_all(path.parent_path());

    auto config = AppConfig {};
    config.transcription.modelPath = "/models/ggml-small.bin";
    config.workflow.defaultAction = "fix_grammar";
    config.customPrompts["email"] = "Rewrite as a polite email";
    config.providers = {
        ProviderConfig { .name = "claude", .kind = ProviderKind::Anthropic, .apiKey = "secret" },
        ProviderConfig { .name = "local", .kind = ProviderKind::OpenAi, .baseUrl = "http://localhost:8080/v1" },
    };

    REQUIRE(saveConfigToFile(path.string(), config).has_value());

    auto const loaded = loadConfigFromFile(path.string());
    REQUIRE(loaded.has_value());
    CHECK(loaded->transcription.modelPath == "/models/ggml-small.bin");
    CHECK(loaded->workflow.defaultAction == "fix_grammar");
    CHECK(loaded->customPrompts.at("email") == "Rewrite as a polite email");
    REQUIRE(loaded->providers.size() == 2);
    CHECK(loaded->providers[0].kind == ProviderKind::Anthropic);
    CHECK(loaded->providers[0].apiKey.empty());
    CHECK(loaded->providers[1].baseUrl == "http://localhost:8080/v1");

    std::filesystem::remove_all(path.parent_path());
}

TEST_CASE("loadConfigFromFile reports unreadable and invalid files", "[config]")
{
    auto const missing = loadConfigFromFile("/nonexistent/vocatype/config.json");
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::ConfigError);

    auto const path = writeTempConfig("vocatype_test_invalid.json", R"({"workflow": {"levelRateHz": 0}})");
    auto const invalid = loadConfigFromFile(path.string());
    REQUIRE(!invalid.has_value());
    CHECK(invalid.error().message.find("levelRateHz") != std::string::npos);
    std::filesystem::remove(path);
}
