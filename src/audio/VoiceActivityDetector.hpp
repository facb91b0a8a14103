// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <atomic>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace sightline
{

/// @brief How eagerly a block is classified as speech.
enum class VadSensitivity : std::uint8_t
{
    Low,
    Medium,
    High,
};

[[nodiscard]] constexpr auto vadSensitivityToString(VadSensitivity sensitivity) -> std::string_view
{
    switch (sensitivity)
    {
        case VadSensitivity::Low: return "low";
        case VadSensitivity::Medium: return "medium";
        case VadSensitivity::High: return "high";
    }
    return "medium";
}

[[nodiscard]] constexpr auto vadSensitivityFromString(std::string_view str) -> std::optional<VadSensitivity>
{
    if (str == "low")
        return VadSensitivity::Low;
    if (str == "medium")
        return VadSensitivity::Medium;
    if (str == "high")
        return VadSensitivity::High;
    return std::nullopt;
}

/// @brief Classifies PCM blocks as speech or non-speech.
///
/// One detector is shared by all audio capture loops, so implementations must be
/// safe to call concurrently.
class VoiceActivityDetector
{
  public:
    virtual ~VoiceActivityDetector() = default;

    /// @brief Classifies one block of float32 PCM at 16kHz mono.
    [[nodiscard]] virtual auto isSpeech(std::span<const float> samples) -> Result<bool> = 0;

    /// @brief Changes the sensitivity; applies to every block processed afterwards.
    virtual void setSensitivity(VadSensitivity sensitivity) = 0;

    [[nodiscard]] virtual auto sensitivity() const -> VadSensitivity = 0;
};

/// @brief Energy based voice activity detection (RMS over the block).
class EnergyVad: public VoiceActivityDetector
{
  public:
    explicit EnergyVad(VadSensitivity sensitivity = VadSensitivity::Medium);

    [[nodiscard]] auto isSpeech(std::span<const float> samples) -> Result<bool> override;
    void setSensitivity(VadSensitivity sensitivity) override;
    [[nodiscard]] auto sensitivity() const -> VadSensitivity override;

    /// @brief Returns the RMS energy threshold used for a sensitivity level.
    [[nodiscard]] static auto threshold(VadSensitivity sensitivity) -> float;

    /// @brief Computes the RMS energy of a block.
    [[nodiscard]] static auto rms(std::span<const float> samples) -> float;

  private:
    std::atomic<VadSensitivity> _sensitivity;
};

} // namespace sightline
