// SPDX-License-Identifier: Apache-2.0
#include "TranscriptionEngine.hpp"

#include <array>
#include <string_view>

namespace sightline
{

auto normalizeTranscript(std::string text) -> std::string
{
    auto const start = text.find_first_not_of(" \t\n\r");
    if (start == std::string::npos)
        return {};
    auto const end = text.find_last_not_of(" \t\n\r");
    text = text.substr(start, end - start + 1);

    // Whisper hallucinates these on non-speech input.
    if (text.starts_with('[') || text.starts_with('('))
    {
        static constexpr auto HallucinationPatterns = std::array {
            std::string_view { "[BLANK_AUDIO]" }, std::string_view { "(blank audio)" },
            std::string_view { "[SOUND]" },       std::string_view { "[MUSIC]" },
            std::string_view { "[NOISE]" },       std::string_view { "[silence]" },
        };
        for (auto const& pattern: HallucinationPatterns)
            if (text == pattern)
                return {};
    }

    return text;
}

} // namespace sightline
