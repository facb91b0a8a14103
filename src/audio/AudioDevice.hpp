// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sightline
{

/// @brief Whether a device records the microphone or what the system plays back.
enum class DeviceDirection : std::uint8_t
{
    Input,
    Output,
};

/// @brief Capture control state of a device, owned by the DeviceRegistry.
enum class DeviceState : std::uint8_t
{
    Running,
    Paused,
    Stopped,
};

[[nodiscard]] constexpr auto deviceStateToString(DeviceState state) -> std::string_view
{
    switch (state)
    {
        case DeviceState::Running: return "running";
        case DeviceState::Paused: return "paused";
        case DeviceState::Stopped: return "stopped";
    }
    return "stopped";
}

[[nodiscard]] constexpr auto deviceStateFromString(std::string_view str) -> std::optional<DeviceState>
{
    if (str == "running")
        return DeviceState::Running;
    if (str == "paused")
        return DeviceState::Paused;
    if (str == "stopped")
        return DeviceState::Stopped;
    return std::nullopt;
}

/// @brief Identity of an audio device.
///
/// The textual id is "<name> (input)" or "<name> (output)".
struct AudioDevice
{
    std::string name;
    DeviceDirection direction = DeviceDirection::Input;

    [[nodiscard]] auto id() const -> std::string;

    auto operator<=>(const AudioDevice&) const = default;
};

/// @brief Parses a device id of the form "<name> (input)" or "<name> (output)".
/// @param id The textual id.
/// @return The device or a ConfigError.
[[nodiscard]] auto parseAudioDevice(std::string_view id) -> Result<AudioDevice>;

} // namespace sightline
