// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace vocatype
{

/// @brief The observable state of the dictation workflow.
enum class WorkflowState : std::uint8_t
{
    Idle,
    Listening,
    Processing,
    Error,
};

/// @brief Converts a WorkflowState to its display name.
[[nodiscard]] constexpr auto workflowStateToString(WorkflowState state) -> std::string_view
{
    switch (state)
    {
        case WorkflowState::Idle: return "Idle";
        case WorkflowState::Listening: return "Listening";
        case WorkflowState::Processing: return "Processing";
        case WorkflowState::Error: return "Error";
    }
    return "Unknown";
}

/// @brief Predefined AI text-processing actions.
enum class AiAction : std::uint8_t
{
    FixGrammar,
    Improve,
    Summarize,
    Translate,
    Auto,
    Custom, ///< Instruction looked up from the configured custom prompts.
};

/// @brief Converts an AiAction to its action id.
[[nodiscard]] constexpr auto actionToString(AiAction action) -> std::string_view
{
    switch (action)
    {
        case AiAction::FixGrammar: return "fix_grammar";
        case AiAction::Improve: return "improve";
        case AiAction::Summarize: return "summarize";
        case AiAction::Translate: return "translate";
        case AiAction::Auto: return "auto";
        case AiAction::Custom: return "custom";
    }
    return "custom";
}

/// @brief Parses an action id. Unknown ids are custom prompt ids.
[[nodiscard]] constexpr auto actionFromString(std::string_view id) -> AiAction
{
    if (id == "fix_grammar")
        return AiAction::FixGrammar;
    if (id == "improve")
        return AiAction::Improve;
    if (id == "summarize")
        return AiAction::Summarize;
    if (id == "translate")
        return AiAction::Translate;
    if (id == "auto")
        return AiAction::Auto;
    return AiAction::Custom;
}

/// @brief A single invocation of an AI backend. Immutable once built.
struct AiRequest
{
    std::string text;
    AiAction action = AiAction::FixGrammar;

    /// Custom prompt id (for AiAction::Custom) or target language (for AiAction::Translate).
    std::string actionArgument;

    /// Provider name to try first; empty uses the configured priority order only.
    std::string preferredProvider;

    std::uint32_t maxTokens = 1000;
    std::chrono::milliseconds timeLimit { 30000 };
};

/// @brief One incrementally delivered fragment of a streamed response.
struct StreamToken
{
    std::string text;
    std::size_t index = 0;
};

/// @brief Trigger: start dictating (or force-flush the current segment while listening).
struct StartDictation
{
};

/// @brief Trigger: run an AI action, on the selected text if given, otherwise on dictated speech.
struct RunAction
{
    std::string actionId;
    std::optional<std::string> selectedText;
};

/// @brief Trigger: abort whatever the workflow is doing and return to Idle.
struct Cancel
{
};

/// @brief Event emitted by the trigger collaborator (hotkeys, UI, console).
using TriggerEvent = std::variant<StartDictation, RunAction, Cancel>;

} // namespace vocatype
