// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioCaptureLoop.hpp>
#include <audio/AudioDevice.hpp>
#include <audio/AudioSource.hpp>
#include <core/Error.hpp>
#include <vision/ScreenCapture.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace sightline
{

/// @brief What resolution does with a configured id that is not currently present.
enum class MissingSources : std::uint8_t
{
    Fail, ///< ConfigError, used when validating the configuration at startup
    Skip, ///< warning, used while recording so the other sources keep running
};

/// @brief Enumerates capture sources, resolves configured ids, and owns device control state.
///
/// Capture loops only read the control state; the service API writes it.
class DeviceRegistry
{
  public:
    /// @param audio Audio backend, or nullptr when audio capture is unavailable.
    /// @param screen Screen capturer, or nullptr when vision capture is unavailable.
    DeviceRegistry(AudioBackend* audio, ScreenCapture* screen);

    [[nodiscard]] auto listAudioDevices() -> Result<std::vector<AudioDeviceInfo>>;
    [[nodiscard]] auto listMonitors() -> Result<std::vector<MonitorInfo>>;

    /// @brief Resolves configured device ids.
    ///
    /// An empty list selects the default input and the default output device (either
    /// may be missing). A malformed id is always a ConfigError; an id that is not
    /// listed is handled according to @p missing.
    [[nodiscard]] auto resolveAudioDevices(const std::vector<std::string>& ids,
                                           MissingSources missing = MissingSources::Fail)
        -> Result<std::vector<AudioDevice>>;

    /// @brief Resolves configured monitor ids; an empty list selects every monitor.
    [[nodiscard]] auto resolveMonitors(const std::vector<std::uint32_t>& ids,
                                       MissingSources missing = MissingSources::Fail)
        -> Result<std::vector<MonitorInfo>>;

    void setDeviceState(const AudioDevice& device, DeviceState state);
    [[nodiscard]] auto deviceState(const AudioDevice& device) const -> DeviceState;
    [[nodiscard]] auto deviceStates() const -> std::map<AudioDevice, DeviceState>;

    /// @brief Returns a reader of the device's control state for its capture loop.
    [[nodiscard]] auto stateProvider(const AudioDevice& device) const -> DeviceStateProvider;

    [[nodiscard]] auto audioBackend() const -> AudioBackend* { return _audio; }
    [[nodiscard]] auto screenCapture() const -> ScreenCapture* { return _screen; }

  private:
    AudioBackend* _audio;
    ScreenCapture* _screen;
    mutable std::mutex _mutex;
    std::map<AudioDevice, DeviceState> _states;
};

} // namespace sightline
