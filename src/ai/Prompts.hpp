// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace vocatype
{

/// @brief Prompt text sent to a backend: a system instruction plus the user message.
struct Prompt
{
    std::string system;
    std::string user;
};

/// @brief An action id as typed by the user, e.g. "fix_grammar" or "translate:German".
struct ActionSpec
{
    AiAction action = AiAction::FixGrammar;
    std::string argument;
};

/// @brief Splits "action[:argument]". Unknown action ids become custom prompt ids.
[[nodiscard]] auto parseActionSpec(std::string_view spec) -> ActionSpec;

/// @brief Renders AI requests into prompts, including user-defined custom prompts.
class PromptLibrary
{
  public:
    PromptLibrary() = default;
    explicit PromptLibrary(std::map<std::string, std::string> customPrompts);

    /// @brief Builds the prompt for @p request.
    /// @return The prompt, or InvalidArgument for an unknown custom prompt id or empty text.
    [[nodiscard]] auto render(const AiRequest& request) const -> Result<Prompt>;

    [[nodiscard]] auto hasCustomPrompt(std::string_view id) const -> bool;

    [[nodiscard]] auto customPrompts() const -> const std::map<std::string, std::string>& { return _custom; }

  private:
    std::map<std::string, std::string> _custom;
};

} // namespace vocatype
