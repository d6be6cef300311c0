// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <ai/Prompts.hpp>
#include <ai/ProviderFactory.hpp>
#include <ai/StreamingOrchestrator.hpp>
#include <audio/AudioCapture.hpp>
#include <audio/Transcriber.hpp>
#include <core/Log.hpp>
#include <workflow/OutputSink.hpp>
#include <workflow/WorkflowCoordinator.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>
#include <string>

namespace vocatype
{

namespace
{
    // Voice meter constants
    constexpr auto MeterBars = std::array { "▁", "▂", "▃", "▅", "▇" };
    constexpr auto MeterWidth = 24;

    constexpr auto HelpText = std::string_view {
        "Commands:\n"
        "  d                     start dictation (again: finish the current utterance)\n"
        "  a <action> [text]     run an action on text, or on the next utterance if no text is given\n"
        "                        actions: fix_grammar, improve, summarize, auto, translate:<language>,\n"
        "                        or a custom prompt id\n"
        "  c                     cancel\n"
        "  s                     latency statistics\n"
        "  h                     this help\n"
        "  q                     quit\n"
    };

    auto trim(std::string_view text) -> std::string_view
    {
        auto const begin = text.find_first_not_of(" \t\r\n");
        if (begin == std::string_view::npos)
            return {};
        auto const end = text.find_last_not_of(" \t\r\n");
        return text.substr(begin, end - begin + 1);
    }

    /// Splits off the first whitespace-delimited word.
    auto splitWord(std::string_view text) -> std::pair<std::string_view, std::string_view>
    {
        text = trim(text);
        auto const space = text.find_first_of(" \t");
        if (space == std::string_view::npos)
            return { text, {} };
        return { text.substr(0, space), trim(text.substr(space)) };
    }

    auto formatSummary(std::string_view label, const LatencySummary& summary) -> std::string
    {
        if (summary.sampleCount == 0)
            return std::format("  {:<22} no samples\n", label);
        return std::format("  {:<22} n={} avg={}ms p50={}ms p95={}ms max={}ms ({:.1f}% within {}ms)\n",
                           label,
                           summary.sampleCount,
                           summary.average.count(),
                           summary.p50.count(),
                           summary.p95.count(),
                           summary.max.count(),
                           summary.complianceRate,
                           summary.target.count());
    }

    /// @brief Terminal rendition of the workflow output.
    class ConsoleOutput final: public OutputSink
    {
      public:
        explicit ConsoleOutput(bool showMeter): _showMeter(showMeter) {}

        void deliver(const std::string& text) override
        {
            auto lock = std::lock_guard(_mutex);
            clearLine();
            _streaming = false;
            std::cout << std::format("\n>>> {}\n", text) << std::flush;
        }

        void reportState(WorkflowState state, std::optional<std::string_view> detail) override
        {
            auto lock = std::lock_guard(_mutex);
            clearLine();
            if (detail)
                std::cout << std::format("[{}] {}\n", workflowStateToString(state), *detail);
            else
                std::cout << std::format("[{}]\n", workflowStateToString(state));
            std::cout.flush();
        }

        void reportLevel(float level) override
        {
            if (!_showMeter)
                return;

            auto lock = std::lock_guard(_mutex);
            if (_streaming)
                return;

            auto meter = std::string {};
            auto const filled = level * static_cast<float>(MeterWidth);
            for (auto i = 0; i < MeterWidth; ++i)
            {
                auto const fill = std::clamp(filled - static_cast<float>(i), 0.0f, 1.0f);
                auto const bar = static_cast<std::size_t>(std::lround(fill * static_cast<float>(MeterBars.size() - 1)));
                meter += MeterBars[bar];
            }
            std::cout << "\r" << meter << std::flush;
            _meterVisible = true;
        }

        void reportToken(std::string_view token) override
        {
            auto lock = std::lock_guard(_mutex);
            clearLine();
            _streaming = true;
            std::cout << token << std::flush;
        }

        void discardTokens() override
        {
            auto lock = std::lock_guard(_mutex);
            if (_streaming)
                std::cout << " [discarded, retrying]\n" << std::flush;
            _streaming = false;
        }

      private:
        void clearLine()
        {
            if (!_meterVisible)
                return;
            std::cout << "\r\033[K";
            _meterVisible = false;
        }

        std::mutex _mutex;
        bool _showMeter;
        bool _meterVisible = false;
        bool _streaming = false;
    };

} // namespace

struct App::Impl
{
    AppConfig config;
    ConsoleOutput output;
    WhisperTranscriber transcriber;
    std::unique_ptr<StreamingOrchestrator> orchestrator;
    std::unique_ptr<WorkflowCoordinator> coordinator;

    Impl(AppConfig cfg, bool showMeter): config(std::move(cfg)), output(showMeter) {}

    auto createProviders() -> std::vector<std::unique_ptr<ProviderClient>>
    {
        auto prompts = std::make_shared<const PromptLibrary>(config.customPrompts);
        auto providers = std::vector<std::unique_ptr<ProviderClient>> {};
        for (auto const& providerConfig: config.providers)
        {
            auto provider = createProvider(providerConfig, prompts);
            if (!provider)
            {
                log::warning("Skipping provider '{}': {}", providerConfig.name, provider.error().message);
                continue;
            }
            providers.push_back(std::move(*provider));
        }
        if (providers.empty())
            log::warning("No AI provider available; only raw dictation will work");
        return providers;
    }

    void printStats() const
    {
        auto text = std::string { "Latency:\n" };
        text += formatSummary("end-to-end", coordinator->endToEndLatency());
        text += formatSummary("transcription", coordinator->transcriptionLatency());
        for (auto const& name: orchestrator->providerNames())
        {
            auto* provider = orchestrator->provider(name);
            auto const stats = provider->stats().snapshot();
            text += std::format("  {} ({} requests, {} failures{})\n",
                                name,
                                stats.requests,
                                stats.failures,
                                orchestrator->isProviderDisabled(name) ? ", disabled" : "");
            text += formatSummary("first token", stats.firstToken);
            text += formatSummary("total", stats.total);
        }
        auto const telemetry = coordinator->pipelineTelemetry();
        text += std::format("Audio: {} frames, {} segments, {} dropped events, buffer {}/{} samples\n",
                            telemetry.framesProcessed,
                            telemetry.segmentsEmitted,
                            telemetry.droppedEvents,
                            telemetry.buffer.size,
                            telemetry.buffer.capacity);
        std::cout << text << std::flush;
    }

    /// @return false when the user asked to quit.
    auto handleCommand(std::string_view line) -> bool
    {
        auto const [command, rest] = splitWord(line);
        if (command.empty())
            return true;

        if (command == "q" || command == "quit")
            return false;

        if (command == "d")
            coordinator->submit(StartDictation {});
        else if (command == "c")
            coordinator->submit(Cancel {});
        else if (command == "a")
        {
            auto const [action, text] = splitWord(rest);
            auto trigger = RunAction { .actionId = std::string(action) };
            if (!text.empty())
                trigger.selectedText = std::string(text);
            coordinator->submit(std::move(trigger));
        }
        else if (command == "s")
            printStats();
        else if (command == "h" || command == "help")
            std::cout << HelpText << std::flush;
        else
            std::cout << std::format("Unknown command '{}' (h for help)\n", command) << std::flush;
        return true;
    }
};

App::App(AppConfig config, bool showMeter): _impl(std::make_unique<Impl>(std::move(config), showMeter))
{
}

App::~App()
{
    if (_impl->coordinator)
        _impl->coordinator->stop();
}

auto App::initialize() -> VoidResult
{
    auto& config = _impl->config;
    if (auto valid = validateConfig(config); !valid)
        return valid;

    _impl->orchestrator = std::make_unique<StreamingOrchestrator>(_impl->createProviders(), config.orchestrator);

    auto source = std::unique_ptr<AudioSource> {};
    if (config.transcription.modelPath.empty() || !std::filesystem::exists(config.transcription.modelPath))
    {
        log::warning("Whisper model not found ({}); voice input unavailable",
                     config.transcription.modelPath.empty() ? "not configured" : config.transcription.modelPath);
    }
    else
    {
        auto loaded = _impl->transcriber.initialize(TranscriberConfig {
            .modelPath = config.transcription.modelPath,
            .language = config.transcription.language,
            .threads = config.transcription.threads,
        });
        if (!loaded)
            return loaded;
        source = std::make_unique<AudioCapture>();
    }

    _impl->coordinator = std::make_unique<WorkflowCoordinator>(
        config.workflow, _impl->transcriber, *_impl->orchestrator, _impl->output);
    if (auto started = _impl->coordinator->start(config.audio, std::move(source)); !started)
        return started;

    // Auto-create config file with resolved settings if none exists
    auto const configPath = defaultConfigPath();
    if (!std::filesystem::exists(configPath))
    {
        auto saveResult = saveConfigToFile(configPath, config);
        if (saveResult)
            log::info("Config file created at {}", configPath);
        else
            log::warning("Failed to save config file: {}", saveResult.error().message);
    }

    log::info("Application initialized successfully");
    return {};
}

auto App::run() -> int
{
    std::cout << HelpText << std::flush;

    auto line = std::string {};
    while (std::getline(std::cin, line))
    {
        if (!_impl->handleCommand(line))
            break;
    }

    _impl->coordinator->stop();
    return 0;
}

} // namespace vocatype
