// SPDX-License-Identifier: Apache-2.0
#include "VoiceActivityDetector.hpp"

#include <cmath>

namespace sightline
{

EnergyVad::EnergyVad(VadSensitivity sensitivity): _sensitivity(sensitivity)
{
}

auto EnergyVad::threshold(VadSensitivity sensitivity) -> float
{
    // Higher sensitivity means a lower energy floor for speech.
    switch (sensitivity)
    {
        case VadSensitivity::Low: return 0.02f;
        case VadSensitivity::Medium: return 0.01f;
        case VadSensitivity::High: return 0.005f;
    }
    return 0.01f;
}

auto EnergyVad::rms(std::span<const float> samples) -> float
{
    if (samples.empty())
        return 0.0f;

    auto energy = 0.0f;
    for (auto const sample: samples)
        energy += sample * sample;

    return std::sqrt(energy / static_cast<float>(samples.size()));
}

auto EnergyVad::isSpeech(std::span<const float> samples) -> Result<bool>
{
    if (samples.empty())
        return makeError(ErrorCode::AudioError, "VAD received an empty block");

    auto const energy = rms(samples);
    if (!std::isfinite(energy))
        return makeError(ErrorCode::AudioError, "VAD received non-finite samples");

    return energy >= threshold(_sensitivity.load());
}

void EnergyVad::setSensitivity(VadSensitivity sensitivity)
{
    _sensitivity.store(sensitivity);
}

auto EnergyVad::sensitivity() const -> VadSensitivity
{
    return _sensitivity.load();
}

} // namespace sightline
