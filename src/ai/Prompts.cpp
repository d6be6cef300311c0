// SPDX-License-Identifier: Apache-2.0
#include "Prompts.hpp"

#include <format>

namespace vocatype
{

namespace
{

    constexpr auto SystemInstruction = std::string_view {
        "You are a writing assistant embedded in a dictation tool. Reply with the resulting text only, "
        "without explanations, quotes or markdown."
    };

    auto instructionFor(AiAction action, std::string_view argument) -> std::string
    {
        switch (action)
        {
            case AiAction::FixGrammar:
                return "Correct the grammar, spelling and punctuation of the following text. Keep the wording "
                       "and meaning otherwise unchanged";
            case AiAction::Improve:
                return "Improve the following text by fixing grammar, enhancing clarity and improving style "
                       "while preserving the original meaning";
            case AiAction::Summarize: return "Provide a concise summary of the following text";
            case AiAction::Translate:
                return std::format("Translate the following text to {}", argument.empty() ? "English" : argument);
            case AiAction::Auto:
                return "Analyze the following text and perform the most appropriate action (improve, summarize, "
                       "translate, or other helpful processing)";
            case AiAction::Custom: break;
        }
        return std::string(argument);
    }

} // namespace

auto parseActionSpec(std::string_view spec) -> ActionSpec
{
    auto id = spec;
    auto argument = std::string_view {};
    if (auto const colon = spec.find(':'); colon != std::string_view::npos)
    {
        id = spec.substr(0, colon);
        argument = spec.substr(colon + 1);
    }

    auto const action = actionFromString(id);
    if (action == AiAction::Custom)
        return ActionSpec { .action = action, .argument = std::string(id == "custom" ? argument : spec) };
    return ActionSpec { .action = action, .argument = std::string(argument) };
}

PromptLibrary::PromptLibrary(std::map<std::string, std::string> customPrompts): _custom(std::move(customPrompts))
{
}

auto PromptLibrary::render(const AiRequest& request) const -> Result<Prompt>
{
    if (request.text.empty())
        return makeError(ErrorCode::InvalidArgument, "Cannot process empty text");

    auto instruction = std::string {};
    if (request.action == AiAction::Custom)
    {
        auto const it = _custom.find(request.actionArgument);
        if (it == _custom.end())
            return makeError(ErrorCode::InvalidArgument,
                             std::format("Unknown custom prompt '{}'", request.actionArgument));
        instruction = it->second;
    }
    else
    {
        instruction = instructionFor(request.action, request.actionArgument);
    }

    return Prompt {
        .system = std::string(SystemInstruction),
        .user = std::format("{}:\n\n{}", instruction, request.text),
    };
}

auto PromptLibrary::hasCustomPrompt(std::string_view id) const -> bool
{
    return _custom.contains(std::string(id));
}

} // namespace vocatype
