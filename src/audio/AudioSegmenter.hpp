// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioDevice.hpp>
#include <audio/AudioSource.hpp>
#include <core/Time.hpp>

#include <chrono>
#include <optional>
#include <vector>

namespace sightline
{

/// @brief A contiguous span of PCM from one device, closed by the segmenter.
struct AudioSegment
{
    AudioDevice device;
    Timestamp start;
    Timestamp end;
    std::vector<float> samples; ///< float32 PCM at 16kHz mono
    bool containsSpeech = false;

    [[nodiscard]] auto duration() const -> std::chrono::microseconds { return end - start; }
};

/// @brief Segment boundaries.
struct SegmenterConfig
{
    std::chrono::milliseconds chunkDuration { 30'000 };
    std::chrono::milliseconds silenceDuration { 1'000 };
};

/// @brief Accumulates VAD-classified blocks into segments.
///
/// A segment closes at whichever comes first: the chunk duration is reached, or speech
/// was seen and has been followed by silenceDuration of consecutive silence. Durations
/// are measured in samples, so the result does not depend on read jitter.
class AudioSegmenter
{
  public:
    AudioSegmenter(AudioDevice device, SegmenterConfig config);

    /// @brief Adds a block.
    /// @param block The PCM block.
    /// @param isSpeech The VAD verdict for the block.
    /// @return The closed segment, if this block closed one.
    [[nodiscard]] auto push(const AudioBlock& block, bool isSpeech) -> std::optional<AudioSegment>;

    /// @brief Closes the open segment, if any samples are buffered.
    [[nodiscard]] auto flush() -> std::optional<AudioSegment>;

    /// @brief Discards the open segment.
    void reset();

    [[nodiscard]] auto bufferedSamples() const -> size_t { return _samples.size(); }

  private:
    [[nodiscard]] auto close() -> AudioSegment;

    AudioDevice _device;
    size_t _maxSamples;
    size_t _silenceSamples;
    StreamClock _clock;
    std::optional<Timestamp> _start;
    std::vector<float> _samples;
    size_t _trailingSilence = 0;
    bool _speechSeen = false;
};

} // namespace sightline
