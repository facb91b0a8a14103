// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioSegmenter.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <storage/ChunkFile.hpp>
#include <vision/CaptureFrame.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace sightline
{

struct ChunkWriterConfig
{
    std::filesystem::path dataDir;  ///< chunk files go to <dataDir>/data
    std::chrono::seconds videoChunkDuration { 60 };
    std::chrono::seconds audioChunkDuration { 30 };
    int jpegQuality = 80;
};

/// @brief Called when a new chunk file has been created, before its first unit is written.
using ChunkOpenedCallback =
    std::function<VoidResult(StreamKind kind, const std::string& stream, const std::string& path, Timestamp startedAt)>;

/// @brief Writes captured units into duration-bounded chunk files, one open chunk per stream.
///
/// A stream is a monitor for video and a device for audio. A unit whose timestamp is at
/// least the chunk duration past the open chunk's start finalizes that chunk and opens a
/// new one.
class ChunkWriter
{
  public:
    ChunkWriter(ChunkWriterConfig config, ChunkOpenedCallback onChunkOpened);
    ~ChunkWriter();

    ChunkWriter(const ChunkWriter&) = delete;
    ChunkWriter& operator=(const ChunkWriter&) = delete;

    /// @brief Creates the chunk directory.
    [[nodiscard]] auto prepare() -> VoidResult;

    /// @brief Encodes the frame as JPEG and appends it to its monitor's chunk.
    [[nodiscard]] auto appendFrame(const CaptureFrame& frame) -> Result<ChunkRef>;

    /// @brief Appends the segment's PCM to its device's chunk.
    [[nodiscard]] auto appendAudio(const AudioSegment& segment) -> Result<ChunkRef>;

    /// @brief Finalizes every open chunk of the given kind.
    [[nodiscard]] auto finalize(StreamKind kind) -> VoidResult;

    /// @brief Finalizes every open chunk.
    [[nodiscard]] auto finalizeAll() -> VoidResult;

    [[nodiscard]] auto openChunkCount() const -> size_t;
    [[nodiscard]] auto chunkDirectory() const -> std::filesystem::path;

  private:
    struct OpenChunk
    {
        std::unique_ptr<ChunkFileWriter> file;
        Timestamp startedAt;
    };

    [[nodiscard]] auto append(StreamKind kind,
                              const std::string& stream,
                              Timestamp timestamp,
                              std::uint32_t a,
                              std::uint32_t b,
                              std::span<const std::uint8_t> payload) -> Result<ChunkRef>;

    ChunkWriterConfig _config;
    ChunkOpenedCallback _onChunkOpened;
    std::map<std::pair<StreamKind, std::string>, OpenChunk> _chunks;
    mutable std::mutex _mutex;
};

/// @brief Maps a monitor id or device name to a file-name-safe stream name.
[[nodiscard]] auto streamName(std::string_view name) -> std::string;

} // namespace sightline
