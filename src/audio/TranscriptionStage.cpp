// SPDX-License-Identifier: Apache-2.0
#include "TranscriptionStage.hpp"

#include <core/Log.hpp>
#include <core/Shutdown.hpp>

namespace sightline
{

TranscriptionStage::TranscriptionStage(TranscriptionEngine& engine, TranscriptionPolicy policy):
    _engine(engine), _policy(policy)
{
    if (_policy.retries < 0)
        _policy.retries = 0;
}

auto TranscriptionStage::transcribe(const AudioSegment& segment, std::stop_token stop) -> Transcript
{
    auto transcript = Transcript {};
    auto backoff = _policy.backoff;

    for (auto attempt = 0; attempt <= _policy.retries; ++attempt)
    {
        if (attempt > 0)
        {
            log::debug("Retrying transcription of '{}' segment in {} ms (attempt {}/{})",
                       segment.device.id(),
                       backoff.count(),
                       attempt + 1,
                       _policy.retries + 1);
            if (!sleepFor(backoff, stop))
                break;
            backoff *= 2;
        }

        ++transcript.attempts;
        auto text = _engine.transcribe(segment.samples);
        if (text)
        {
            transcript.text = std::move(*text);
            return transcript;
        }

        log::warning("Transcription ({}) of '{}' segment at {} failed: {}",
                     _engine.name(),
                     segment.device.id(),
                     formatTimestamp(segment.start),
                     text.error());
    }

    log::error("Giving up on transcription of '{}' segment at {} after {} attempt(s); storing empty text",
               segment.device.id(),
               formatTimestamp(segment.start),
               transcript.attempts);
    transcript.failed = true;
    return transcript;
}

} // namespace sightline
