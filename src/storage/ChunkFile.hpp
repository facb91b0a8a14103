// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Time.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sightline
{

/// @brief What a chunk file holds.
enum class StreamKind : std::uint8_t
{
    Video = 1, ///< JPEG frames; record fields a/b are width/height
    Audio = 2, ///< float32 LE PCM; record fields a/b are sample rate/channels
};

[[nodiscard]] constexpr auto chunkExtension(StreamKind kind) -> std::string_view
{
    return kind == StreamKind::Video ? "vchunk" : "achunk";
}

/// @brief Chunk file layout.
///
/// A 16-byte header ("SLCHUNK1", kind, version, 6 reserved bytes) followed by records
/// {u32 magic, u32 offset, i64 timestamp_us, u32 a, u32 b, u32 payloadSize, payload},
/// all little-endian. Record offsets start at 0 and increase by one.
namespace chunkformat
{
    constexpr auto FileMagic = std::string_view { "SLCHUNK1" };
    constexpr auto Version = std::uint8_t { 1 };
    constexpr auto HeaderSize = 16;
    constexpr auto RecordMagic = std::uint32_t { 0x31524C53 }; // "SLR1"
    constexpr auto RecordHeaderSize = 28;
} // namespace chunkformat

/// @brief One unit read back from a chunk.
struct ChunkRecord
{
    std::int64_t offset = 0;
    Timestamp timestamp;
    std::uint32_t a = 0;
    std::uint32_t b = 0;
    std::vector<std::uint8_t> payload;
};

/// @brief Append-only writer of one chunk file.
///
/// Every append is flushed with fdatasync before it is acknowledged. A failed append
/// truncates the partial record away and leaves the writer broken; no further appends
/// are accepted.
class ChunkFileWriter
{
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

  public:
    ChunkFileWriter(PrivateTag, std::string path, StreamKind kind, int fd, std::int64_t size);

    /// @brief Creates a new chunk file (fails if it already exists).
    [[nodiscard]] static auto create(std::string path, StreamKind kind) -> Result<std::unique_ptr<ChunkFileWriter>>;

    ~ChunkFileWriter();

    ChunkFileWriter(const ChunkFileWriter&) = delete;
    ChunkFileWriter& operator=(const ChunkFileWriter&) = delete;

    /// @brief Appends one unit.
    /// @return The unit's offset, or a PersistenceError.
    [[nodiscard]] auto append(Timestamp timestamp, std::uint32_t a, std::uint32_t b, std::span<const std::uint8_t> payload)
        -> Result<std::int64_t>;

    /// @brief Syncs, closes and makes the file read-only.
    [[nodiscard]] auto finalize() -> VoidResult;

    /// @brief Closes the file without finalizing it (after a failure).
    void abandon();

    [[nodiscard]] auto path() const -> const std::string& { return _path; }
    [[nodiscard]] auto kind() const -> StreamKind { return _kind; }
    [[nodiscard]] auto unitCount() const -> std::int64_t { return _units; }
    [[nodiscard]] auto broken() const -> bool { return _broken; }
    [[nodiscard]] auto isOpen() const -> bool { return _fd >= 0; }

  private:
    std::string _path;
    StreamKind _kind;
    int _fd = -1;
    std::int64_t _size = 0;
    std::int64_t _units = 0;
    bool _broken = false;
};

/// @brief Reads units back from chunk files.
class ChunkReader
{
  public:
    /// @brief Reads the unit at the given offset.
    /// @return The record, NotFound if the chunk has no such offset, or an IoError.
    [[nodiscard]] static auto readUnit(const std::string& path, std::int64_t offset) -> Result<ChunkRecord>;

    /// @brief Reads every unit of a chunk in file order.
    [[nodiscard]] static auto readAll(const std::string& path) -> Result<std::vector<ChunkRecord>>;

    /// @brief Reads the stream kind from the file header.
    [[nodiscard]] static auto readKind(const std::string& path) -> Result<StreamKind>;
};

/// @brief Serializes float32 samples as little-endian bytes.
[[nodiscard]] auto encodePcm(std::span<const float> samples) -> std::vector<std::uint8_t>;

/// @brief Parses little-endian float32 bytes.
[[nodiscard]] auto decodePcm(std::span<const std::uint8_t> bytes) -> Result<std::vector<float>>;

} // namespace sightline
