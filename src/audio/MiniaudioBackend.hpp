// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioSource.hpp>

#include <memory>

namespace sightline
{

/// @brief AudioBackend on top of miniaudio.
///
/// Input devices are miniaudio capture devices. Output devices are recorded through
/// their "Monitor of ..." capture source (PulseAudio/PipeWire) or, where the backend
/// supports it, a loopback device. All sources deliver float32 PCM at 16kHz mono.
class MiniaudioBackend: public AudioBackend
{
  public:
    MiniaudioBackend();
    ~MiniaudioBackend() override;

    MiniaudioBackend(const MiniaudioBackend&) = delete;
    MiniaudioBackend& operator=(const MiniaudioBackend&) = delete;

    /// @brief Initializes the miniaudio context.
    /// @return Success or an AudioError.
    [[nodiscard]] auto initialize() -> VoidResult;

    [[nodiscard]] auto listDevices() -> Result<std::vector<AudioDeviceInfo>> override;
    [[nodiscard]] auto open(const AudioDevice& device) -> Result<std::unique_ptr<AudioSource>> override;

    // Context must be reachable from the C callbacks of every open source
    struct Context;

  private:
    std::shared_ptr<Context> _context;
};

} // namespace sightline
