// SPDX-License-Identifier: Apache-2.0
#include <audio/AudioCapture.hpp>
#include <core/Log.hpp>
#include <vocatype/App.hpp>
#include <vocatype/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>
#include <iostream>

int main(int argc, char** argv)
{
    auto app = CLI::App { "vocatype - voice dictation with streaming AI text actions" };

    auto configPath = std::string {};
    auto whisperModel = std::string {};
    auto language = std::string {};
    auto deviceName = std::string {};
    auto defaultAction = std::string {};
    auto preferredProvider = std::string {};
    auto logLevel = std::string {};
    auto sensitivity = -1.0f;
    auto continuous = false;
    auto showMeter = false;
    auto listDevices = false;
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-m,--whisper-model", whisperModel, "Path to whisper.cpp model file");
    app.add_option("-l,--language", language, "Transcription language (ISO 639-1 code or 'auto')");
    app.add_option("-d,--device", deviceName, "Capture device (case-insensitive substring)");
    app.add_option("-a,--action", defaultAction, "Action applied to dictated text (e.g. fix_grammar)");
    app.add_option("-p,--provider", preferredProvider, "Provider tried first");
    app.add_option("--sensitivity", sensitivity, "Voice activity sensitivity (0..1)")->check(CLI::Range(0.0f, 1.0f));
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");
    app.add_flag("--continuous", continuous, "Listen continuously and process every utterance");
    app.add_flag("--meter", showMeter, "Show the input level meter while listening");
    app.add_flag("--list-devices", listDevices, "List capture devices and exit");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    if (listDevices)
    {
        auto devices = vocatype::AudioCapture::listDevices();
        if (!devices)
        {
            vocatype::log::error("Failed to enumerate capture devices: {}", devices.error());
            return 1;
        }
        for (auto const& device: *devices)
            std::cout << std::format("{} {}\n", device.isDefault ? "*" : " ", device.name);
        return 0;
    }

    // Load config
    auto configResult = configPath.empty() ? vocatype::loadConfig() : vocatype::loadConfigFromFile(configPath);

    if (!configResult)
    {
        vocatype::log::error("Failed to load config: {}", configResult.error());
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!whisperModel.empty())
        config.transcription.modelPath = whisperModel;
    if (!language.empty())
    {
        config.transcription.language = language;
        config.workflow.language = language;
    }
    if (!deviceName.empty())
        config.audio.deviceName = deviceName;
    if (!defaultAction.empty())
        config.workflow.defaultAction = defaultAction;
    if (!preferredProvider.empty())
        config.workflow.preferredProvider = preferredProvider;
    if (sensitivity >= 0.0f)
        config.audio.vad.sensitivity = sensitivity;
    if (continuous)
        config.workflow.continuousListening = true;
    if (!logLevel.empty())
    {
        auto const level = vocatype::log::levelFromString(logLevel);
        if (!level)
        {
            vocatype::log::error("Unknown log level '{}'", logLevel);
            return 1;
        }
        config.logLevel = *level;
    }
    if (verbose)
        config.logLevel = vocatype::log::Level::Debug;

    vocatype::log::setLevel(config.logLevel);

    auto application = vocatype::App(std::move(config), showMeter);
    auto initResult = application.initialize();
    if (!initResult)
    {
        vocatype::log::error("Initialization failed: {}", initResult.error());
        return 1;
    }

    return application.run();
}
