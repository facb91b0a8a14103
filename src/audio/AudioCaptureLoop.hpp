// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioSegmenter.hpp>
#include <audio/AudioSource.hpp>
#include <audio/VoiceActivityDetector.hpp>
#include <core/Channel.hpp>
#include <core/Error.hpp>

#include <functional>
#include <memory>
#include <stop_token>

namespace sightline
{

/// @brief Receives speech segments; blocks while the downstream writer is saturated.
using SegmentSink = std::function<PushStatus(AudioSegment segment, std::stop_token stop)>;

/// @brief Reads the current control state of the device.
using DeviceStateProvider = std::function<DeviceState()>;

/// @brief Capture loop of one audio device: PCM blocks -> VAD -> speech segments.
class AudioCaptureLoop
{
  public:
    AudioCaptureLoop(std::unique_ptr<AudioSource> source,
                     VoiceActivityDetector& vad,
                     SegmenterConfig config,
                     DeviceStateProvider state,
                     SegmentSink sink);

    /// @brief Runs until stopped, until the device is set to Stopped, or until it fails.
    /// @return Success on a requested stop, or the DeviceError that ended the loop.
    [[nodiscard]] auto run(std::stop_token stop) -> VoidResult;

    [[nodiscard]] auto device() const -> const AudioDevice& { return _source->device(); }

    /// @brief Number of segments discarded because they contained no speech.
    [[nodiscard]] auto discardedSegments() const -> size_t { return _discarded; }

    /// @brief Number of segments handed to the sink.
    [[nodiscard]] auto emittedSegments() const -> size_t { return _emitted; }

  private:
    [[nodiscard]] auto emit(AudioSegment segment, std::stop_token stop) -> bool;

    std::unique_ptr<AudioSource> _source;
    VoiceActivityDetector& _vad;
    AudioSegmenter _segmenter;
    DeviceStateProvider _state;
    SegmentSink _sink;
    size_t _discarded = 0;
    size_t _emitted = 0;
};

} // namespace sightline
