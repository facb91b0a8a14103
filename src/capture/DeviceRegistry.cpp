// SPDX-License-Identifier: Apache-2.0
#include "DeviceRegistry.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace sightline
{

DeviceRegistry::DeviceRegistry(AudioBackend* audio, ScreenCapture* screen): _audio(audio), _screen(screen)
{
}

auto DeviceRegistry::listAudioDevices() -> Result<std::vector<AudioDeviceInfo>>
{
    if (!_audio)
        return makeError(ErrorCode::AudioError, "Audio capture is not available");
    return _audio->listDevices();
}

auto DeviceRegistry::listMonitors() -> Result<std::vector<MonitorInfo>>
{
    if (!_screen)
        return makeError(ErrorCode::VisionError, "Screen capture is not available");
    return _screen->listMonitors();
}

auto DeviceRegistry::resolveAudioDevices(const std::vector<std::string>& ids, MissingSources missing)
    -> Result<std::vector<AudioDevice>>
{
    auto available = listAudioDevices();
    if (!available)
        return std::unexpected(available.error());

    auto resolved = std::vector<AudioDevice> {};

    if (ids.empty())
    {
        for (auto const direction: { DeviceDirection::Input, DeviceDirection::Output })
        {
            auto const it = std::ranges::find_if(*available, [direction](const AudioDeviceInfo& info) {
                return info.isDefault && info.device.direction == direction;
            });
            if (it != available->end())
                resolved.push_back(it->device);
            else
                log::info("No default {} audio device found", direction == DeviceDirection::Input ? "input" : "output");
        }
        return resolved;
    }

    for (auto const& id: ids)
    {
        auto device = parseAudioDevice(id);
        if (!device)
            return std::unexpected(device.error());

        auto const known = std::ranges::any_of(
            *available, [&](const AudioDeviceInfo& info) { return info.device == *device; });
        if (!known)
        {
            if (missing == MissingSources::Fail)
                return makeError(ErrorCode::ConfigError, std::format("Audio device '{}' not found", id));
            log::warning("Audio device '{}' is not present; skipping it", id);
            continue;
        }

        if (std::ranges::find(resolved, *device) == resolved.end())
            resolved.push_back(std::move(*device));
    }
    return resolved;
}

auto DeviceRegistry::resolveMonitors(const std::vector<std::uint32_t>& ids, MissingSources missing)
    -> Result<std::vector<MonitorInfo>>
{
    auto available = listMonitors();
    if (!available)
        return std::unexpected(available.error());

    if (ids.empty())
        return available;

    auto resolved = std::vector<MonitorInfo> {};
    for (auto const id: ids)
    {
        auto const it = std::ranges::find_if(*available, [id](const MonitorInfo& m) { return m.id == id; });
        if (it == available->end())
        {
            if (missing == MissingSources::Fail)
                return makeError(ErrorCode::ConfigError, std::format("Monitor {} not found", id));
            log::warning("Monitor {} is not present; skipping it", id);
            continue;
        }
        if (std::ranges::none_of(resolved, [id](const MonitorInfo& m) { return m.id == id; }))
            resolved.push_back(*it);
    }
    return resolved;
}

void DeviceRegistry::setDeviceState(const AudioDevice& device, DeviceState state)
{
    {
        auto lock = std::lock_guard(_mutex);
        _states[device] = state;
    }
    log::info("Audio device '{}' set to {}", device.id(), deviceStateToString(state));
}

auto DeviceRegistry::deviceState(const AudioDevice& device) const -> DeviceState
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _states.find(device);
    return it != _states.end() ? it->second : DeviceState::Running;
}

auto DeviceRegistry::deviceStates() const -> std::map<AudioDevice, DeviceState>
{
    auto lock = std::lock_guard(_mutex);
    return _states;
}

auto DeviceRegistry::stateProvider(const AudioDevice& device) const -> DeviceStateProvider
{
    return [this, device] { return deviceState(device); };
}

} // namespace sightline
