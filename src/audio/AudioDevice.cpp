// SPDX-License-Identifier: Apache-2.0
#include "AudioDevice.hpp"

#include <format>

namespace sightline
{

namespace
{
    constexpr auto InputSuffix = std::string_view { " (input)" };
    constexpr auto OutputSuffix = std::string_view { " (output)" };
} // namespace

auto AudioDevice::id() const -> std::string
{
    return name + std::string(direction == DeviceDirection::Input ? InputSuffix : OutputSuffix);
}

auto parseAudioDevice(std::string_view id) -> Result<AudioDevice>
{
    auto device = AudioDevice {};

    if (id.ends_with(InputSuffix))
    {
        device.name = std::string(id.substr(0, id.size() - InputSuffix.size()));
        device.direction = DeviceDirection::Input;
    }
    else if (id.ends_with(OutputSuffix))
    {
        device.name = std::string(id.substr(0, id.size() - OutputSuffix.size()));
        device.direction = DeviceDirection::Output;
    }
    else
    {
        return makeError(ErrorCode::ConfigError,
                         std::format("Audio device '{}' must end with \" (input)\" or \" (output)\"", id));
    }

    if (device.name.empty())
        return makeError(ErrorCode::ConfigError, std::format("Audio device '{}' has an empty name", id));

    return device;
}

} // namespace sightline
