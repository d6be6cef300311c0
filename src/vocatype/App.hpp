// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <vocatype/Config.hpp>

#include <memory>

namespace vocatype
{

/// @brief Console front end that wires the audio, transcription and AI components together.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    /// @param showMeter Whether to draw the input level meter while listening.
    explicit App(AppConfig config, bool showMeter = false);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Loads the speech model, creates the providers and starts the workflow.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Reads trigger commands from stdin until "q" or end of input.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace vocatype
