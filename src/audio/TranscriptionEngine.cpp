// SPDX-License-Identifier: Apache-2.0
#include "TranscriptionEngine.hpp"

#include <array>

namespace vocatype
{

auto normalizeTranscript(std::string_view text) -> std::string
{
    auto const start = text.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos)
        return {};
    auto const end = text.find_last_not_of(" \t\n\r");
    auto trimmed = text.substr(start, end - start + 1);

    // Whisper emits these for silence or background noise
    static constexpr auto NonSpeechMarkers = std::array {
        std::string_view { "[BLANK_AUDIO]" }, std::string_view { "(blank audio)" },
        std::string_view { "[SOUND]" },       std::string_view { "[MUSIC]" },
        std::string_view { "[NOISE]" },       std::string_view { "[SILENCE]" },
    };
    for (auto const marker: NonSpeechMarkers)
        if (trimmed == marker)
            return {};

    return std::string(trimmed);
}

} // namespace vocatype
