// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <span>
#include <string>

namespace sightline
{

/// @brief Speech-to-text engine.
class TranscriptionEngine
{
  public:
    virtual ~TranscriptionEngine() = default;

    /// @brief Transcribes float32 PCM at 16kHz mono.
    /// @return The text (possibly empty) or a TranscriptionError.
    [[nodiscard]] virtual auto transcribe(std::span<const float> samples) -> Result<std::string> = 0;

    /// @brief Short name for logs ("whisper", "process").
    [[nodiscard]] virtual auto name() const -> std::string = 0;
};

/// @brief Trims whitespace and maps whisper's non-speech markers ("[BLANK_AUDIO]", ...) to "".
[[nodiscard]] auto normalizeTranscript(std::string text) -> std::string;

} // namespace sightline
