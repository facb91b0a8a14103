// SPDX-License-Identifier: Apache-2.0
#include "AudioCaptureLoop.hpp"

#include <core/Log.hpp>

namespace sightline
{

AudioCaptureLoop::AudioCaptureLoop(std::unique_ptr<AudioSource> source,
                                   VoiceActivityDetector& vad,
                                   SegmenterConfig config,
                                   DeviceStateProvider state,
                                   SegmentSink sink):
    _source(std::move(source)),
    _vad(vad),
    _segmenter(_source->device(), config),
    _state(std::move(state)),
    _sink(std::move(sink))
{
}

auto AudioCaptureLoop::run(std::stop_token stop) -> VoidResult
{
    auto const deviceId = _source->device().id();
    log::info("Audio capture loop started for '{}'", deviceId);

    auto paused = false;

    while (!stop.stop_requested())
    {
        auto const state = _state ? _state() : DeviceState::Running;
        if (state == DeviceState::Stopped)
        {
            log::info("Audio device '{}' stopped by control request", deviceId);
            return {};
        }

        auto block = _source->read(stop);
        if (!block)
        {
            if (block.error().code == ErrorCode::Cancelled || stop.stop_requested())
                break;
            log::error("Audio device '{}' failed at {}: {}",
                       deviceId,
                       formatTimestamp(Clock::now()),
                       block.error().message);
            return std::unexpected(block.error());
        }

        if (state == DeviceState::Paused)
        {
            if (!paused)
                log::info("Audio device '{}' paused", deviceId);
            paused = true;
            _segmenter.reset();
            continue;
        }
        if (paused)
        {
            log::info("Audio device '{}' resumed", deviceId);
            paused = false;
        }

        auto speech = _vad.isSpeech(block->samples);
        if (!speech)
            log::warning("VAD failed on '{}': {}", deviceId, speech.error());

        auto segment = _segmenter.push(*block, speech.value_or(false));
        if (segment && !emit(std::move(*segment), stop))
            break;
    }

    // The unit in progress is abandoned on shutdown.
    log::info("Audio capture loop for '{}' finished ({} segments, {} silent discarded)",
              deviceId,
              _emitted,
              _discarded);
    return {};
}

auto AudioCaptureLoop::emit(AudioSegment segment, std::stop_token stop) -> bool
{
    if (!segment.containsSpeech)
    {
        ++_discarded;
        log::trace("Discarding silent segment of '{}' ({} ms)",
                   segment.device.id(),
                   std::chrono::duration_cast<std::chrono::milliseconds>(segment.duration()).count());
        return true;
    }

    auto const status = _sink(std::move(segment), stop);
    if (status != PushStatus::Pushed)
        return false;

    ++_emitted;
    return true;
}

} // namespace sightline
