// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/TranscriptionEngine.hpp>

#include <memory>
#include <string>

namespace sightline
{

/// @brief Configuration for the whisper.cpp engine.
struct WhisperConfig
{
    std::string modelPath;
    std::string language = "en";
    int threads = 4;
    bool translate = false;
};

/// @brief Local speech-to-text using whisper.cpp.
class WhisperEngine: public TranscriptionEngine
{
  public:
    WhisperEngine();
    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    /// @brief Loads the whisper model.
    /// @param config Engine configuration.
    /// @return Success or an error.
    [[nodiscard]] auto initialize(const WhisperConfig& config) -> VoidResult;

    [[nodiscard]] auto transcribe(std::span<const float> samples) -> Result<std::string> override;
    [[nodiscard]] auto name() const -> std::string override { return "whisper"; }

    /// @brief Returns true if the model is loaded.
    [[nodiscard]] auto isLoaded() const -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace sightline
