// SPDX-License-Identifier: Apache-2.0
#include "ChunkWriter.hpp"

#include <core/Log.hpp>
#include <vision/FrameEncoder.hpp>

#include <cctype>
#include <format>
#include <system_error>

namespace sightline
{

auto streamName(std::string_view name) -> std::string
{
    auto result = std::string {};
    for (auto const c: name)
        result += std::isalnum(static_cast<unsigned char>(c)) || c == '-' ? c : '_';
    return result.empty() ? std::string { "stream" } : result;
}

ChunkWriter::ChunkWriter(ChunkWriterConfig config, ChunkOpenedCallback onChunkOpened):
    _config(std::move(config)), _onChunkOpened(std::move(onChunkOpened))
{
}

ChunkWriter::~ChunkWriter()
{
    if (auto r = finalizeAll(); !r)
        log::error("Finalizing chunks on shutdown failed: {}", r.error());
}

auto ChunkWriter::chunkDirectory() const -> std::filesystem::path
{
    return _config.dataDir / "data";
}

auto ChunkWriter::prepare() -> VoidResult
{
    auto ec = std::error_code {};
    std::filesystem::create_directories(chunkDirectory(), ec);
    if (ec)
        return makeError(ErrorCode::PersistenceError,
                         std::format("Cannot create chunk directory '{}': {}", chunkDirectory().string(), ec.message()));
    return {};
}

auto ChunkWriter::appendFrame(const CaptureFrame& frame) -> Result<ChunkRef>
{
    auto jpeg = encodeJpeg(frame.image, _config.jpegQuality);
    if (!jpeg)
        return std::unexpected(jpeg.error());

    return append(StreamKind::Video,
                  std::format("monitor_{}", frame.monitorId),
                  frame.timestamp,
                  static_cast<std::uint32_t>(frame.image.width),
                  static_cast<std::uint32_t>(frame.image.height),
                  *jpeg);
}

auto ChunkWriter::appendAudio(const AudioSegment& segment) -> Result<ChunkRef>
{
    auto const pcm = encodePcm(segment.samples);
    return append(StreamKind::Audio, segment.device.id(), segment.start, SampleRate, 1, pcm);
}

auto ChunkWriter::append(StreamKind kind,
                         const std::string& stream,
                         Timestamp timestamp,
                         std::uint32_t a,
                         std::uint32_t b,
                         std::span<const std::uint8_t> payload) -> Result<ChunkRef>
{
    auto lock = std::lock_guard(_mutex);

    auto const key = std::pair { kind, stream };
    auto const duration = kind == StreamKind::Video ? _config.videoChunkDuration : _config.audioChunkDuration;

    auto it = _chunks.find(key);
    if (it != _chunks.end() && timestamp - it->second.startedAt >= duration)
    {
        auto finalized = it->second.file->finalize();
        _chunks.erase(it);
        it = _chunks.end();
        if (!finalized)
            return std::unexpected(finalized.error());
    }

    if (it == _chunks.end())
    {
        auto const path = chunkDirectory()
                          / std::format("{}_{}.{}", streamName(stream), formatFileTimestamp(timestamp), chunkExtension(kind));
        auto file = ChunkFileWriter::create(path.string(), kind);
        if (!file)
            return std::unexpected(file.error());

        if (_onChunkOpened)
        {
            if (auto registered = _onChunkOpened(kind, stream, (*file)->path(), timestamp); !registered)
            {
                (*file)->abandon();
                return makeError(ErrorCode::PersistenceError,
                                 std::format("Cannot register chunk '{}': {}", (*file)->path(), registered.error().message));
            }
        }

        log::debug("Chunk opened for {}: {}", stream, (*file)->path());
        it = _chunks.emplace(key, OpenChunk { .file = std::move(*file), .startedAt = timestamp }).first;
    }

    auto offset = it->second.file->append(timestamp, a, b, payload);
    if (!offset)
    {
        // The stream continues in a fresh chunk once the cycle restarts.
        it->second.file->abandon();
        _chunks.erase(it);
        return std::unexpected(offset.error());
    }

    return ChunkRef { .path = it->second.file->path(), .offset = *offset };
}

auto ChunkWriter::finalize(StreamKind kind) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    auto firstError = VoidResult {};
    for (auto it = _chunks.begin(); it != _chunks.end();)
    {
        if (it->first.first != kind)
        {
            ++it;
            continue;
        }
        if (auto r = it->second.file->finalize(); !r && firstError)
            firstError = std::unexpected(r.error());
        it = _chunks.erase(it);
    }
    return firstError;
}

auto ChunkWriter::finalizeAll() -> VoidResult
{
    auto video = finalize(StreamKind::Video);
    auto audio = finalize(StreamKind::Audio);
    return video ? audio : video;
}

auto ChunkWriter::openChunkCount() const -> size_t
{
    auto lock = std::lock_guard(_mutex);
    return _chunks.size();
}

} // namespace sightline
