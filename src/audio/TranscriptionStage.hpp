// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioSegmenter.hpp>
#include <audio/TranscriptionEngine.hpp>

#include <chrono>
#include <stop_token>

namespace sightline
{

/// @brief Retry policy of the transcription stage.
struct TranscriptionPolicy
{
    int retries = 2;                            ///< attempts after the first one
    std::chrono::milliseconds backoff { 500 };  ///< first wait, doubled per retry
};

/// @brief Outcome of transcribing one segment.
struct Transcript
{
    std::string text;
    int attempts = 0;
    bool failed = false; ///< every attempt failed; text is empty
};

/// @brief Transcribes speech segments with bounded retry and exponential backoff.
///
/// A permanently failing segment yields an empty transcript rather than an error,
/// so the segment is still persisted.
class TranscriptionStage
{
  public:
    TranscriptionStage(TranscriptionEngine& engine, TranscriptionPolicy policy);

    /// @brief Transcribes a segment.
    /// @param segment The segment; must contain speech.
    /// @param stop Interrupts backoff waits (the segment then counts as failed).
    [[nodiscard]] auto transcribe(const AudioSegment& segment, std::stop_token stop) -> Transcript;

    [[nodiscard]] auto policy() const -> const TranscriptionPolicy& { return _policy; }

  private:
    TranscriptionEngine& _engine;
    TranscriptionPolicy _policy;
};

} // namespace sightline
