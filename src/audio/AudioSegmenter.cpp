// SPDX-License-Identifier: Apache-2.0
#include "AudioSegmenter.hpp"

#include <algorithm>

namespace sightline
{

namespace
{
    auto samplesFor(std::chrono::milliseconds duration) -> size_t
    {
        auto const count = duration.count() * SampleRate / 1000;
        return static_cast<size_t>(std::max<std::int64_t>(count, 1));
    }
} // namespace

AudioSegmenter::AudioSegmenter(AudioDevice device, SegmenterConfig config):
    _device(std::move(device)),
    _maxSamples(samplesFor(config.chunkDuration)),
    _silenceSamples(samplesFor(config.silenceDuration))
{
}

auto AudioSegmenter::push(const AudioBlock& block, bool isSpeech) -> std::optional<AudioSegment>
{
    if (block.samples.empty())
        return std::nullopt;

    if (!_start)
        _start = _clock.next(block.capturedAt);

    _samples.insert(_samples.end(), block.samples.begin(), block.samples.end());

    if (isSpeech)
    {
        _speechSeen = true;
        _trailingSilence = 0;
    }
    else
    {
        _trailingSilence += block.samples.size();
    }

    if (_samples.size() >= _maxSamples)
        return close();

    if (_speechSeen && _trailingSilence >= _silenceSamples)
        return close();

    return std::nullopt;
}

auto AudioSegmenter::flush() -> std::optional<AudioSegment>
{
    if (_samples.empty())
        return std::nullopt;
    return close();
}

void AudioSegmenter::reset()
{
    _start.reset();
    _samples.clear();
    _trailingSilence = 0;
    _speechSeen = false;
}

auto AudioSegmenter::close() -> AudioSegment
{
    auto const length = std::chrono::microseconds {
        static_cast<std::int64_t>(_samples.size()) * 1'000'000 / SampleRate
    };

    auto segment = AudioSegment {
        .device = _device,
        .start = *_start,
        .end = *_start + length,
        .samples = std::move(_samples),
        .containsSpeech = _speechSeen,
    };

    // The next segment never starts before this one ends.
    static_cast<void>(_clock.next(segment.end - std::chrono::microseconds { 1 }));

    reset();
    return segment;
}

} // namespace sightline
