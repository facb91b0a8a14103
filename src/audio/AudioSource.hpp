// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioDevice.hpp>
#include <core/Error.hpp>
#include <core/Time.hpp>

#include <memory>
#include <stop_token>
#include <vector>

namespace sightline
{

/// @brief Sample rate of every PCM buffer in the pipeline (mono, float32).
constexpr auto SampleRate = 16000;

/// @brief Number of samples per block handed to the voice activity detector (32 ms).
constexpr auto BlockSize = 512;

/// @brief A fixed-size block of PCM samples read from a device.
struct AudioBlock
{
    std::vector<float> samples;
    Timestamp capturedAt;
};

/// @brief An open capture handle, exclusively owned by one audio capture loop.
class AudioSource
{
  public:
    virtual ~AudioSource() = default;

    /// @brief Returns the device this source records.
    [[nodiscard]] virtual auto device() const -> const AudioDevice& = 0;

    /// @brief Blocks until the next PCM block is available.
    /// @param stop Interrupts the wait; the result is then a Cancelled error.
    /// @return The block, or a DeviceError when the device failed or disconnected.
    [[nodiscard]] virtual auto read(std::stop_token stop) -> Result<AudioBlock> = 0;
};

/// @brief A device as reported by the backend's enumeration.
struct AudioDeviceInfo
{
    AudioDevice device;
    bool isDefault = false;
};

/// @brief Enumerates audio devices and opens capture handles.
class AudioBackend
{
  public:
    virtual ~AudioBackend() = default;

    /// @brief Lists input devices and output (loopback) devices.
    [[nodiscard]] virtual auto listDevices() -> Result<std::vector<AudioDeviceInfo>> = 0;

    /// @brief Opens the device and starts capturing.
    /// @param device The device to open.
    /// @return A running source or a DeviceError.
    [[nodiscard]] virtual auto open(const AudioDevice& device) -> Result<std::unique_ptr<AudioSource>> = 0;
};

} // namespace sightline
