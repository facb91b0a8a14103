// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <storage/Records.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace sightline
{

/// @brief Time-ordered, taggable, full-text-searchable store of captured content.
///
/// Writes go through one writer connection and are serialized by a mutex. Reads use a
/// separate read-only connection, so searches run while capture keeps writing.
/// Every source row and its FTS row are written in the same transaction.
class Archive
{
    struct Impl;
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

  public:
    Archive(PrivateTag, std::unique_ptr<Impl> impl);
    ~Archive();

    Archive(const Archive&) = delete;
    Archive& operator=(const Archive&) = delete;

    /// @brief Opens (creating and migrating if needed) the archive database.
    /// @param databasePath Path of the SQLite file.
    [[nodiscard]] static auto open(const std::filesystem::path& databasePath) -> Result<std::unique_ptr<Archive>>;

    /// @brief Registers a video chunk file. Idempotent by path.
    /// @return The chunk id.
    [[nodiscard]] auto registerVideoChunk(const std::string& path, std::uint32_t monitorId, Timestamp startedAt)
        -> Result<std::int64_t>;

    /// @brief Registers an audio chunk file. Idempotent by path.
    /// @return The chunk id.
    [[nodiscard]] auto registerAudioChunk(const std::string& path, const std::string& deviceName, Timestamp startedAt)
        -> Result<std::int64_t>;

    /// @brief Inserts a frame and its OCR rows (with FTS rows) in one transaction.
    [[nodiscard]] auto insertFrame(const FrameRow& frame, const std::vector<OcrRow>& ocrRows) -> Result<FrameIds>;

    /// @brief Inserts one OCR row (with its FTS row) for an existing frame.
    [[nodiscard]] auto insertOcr(std::int64_t frameId, const OcrRow& row) -> Result<std::int64_t>;

    /// @brief Inserts an audio transcript (with its FTS row).
    /// @return The transcription id.
    [[nodiscard]] auto insertAudio(const AudioRow& row) -> Result<std::int64_t>;

    /// @brief Attaches tags. Already attached tags are left alone.
    /// @param id Frame id for vision, transcription id for audio.
    /// @return Success, NotFound for an unknown id, or a DatabaseError.
    [[nodiscard]] auto addTags(std::int64_t id, TagContentType type, const std::vector<std::string>& tags)
        -> VoidResult;

    /// @brief Detaches tags. Tags that are not attached are ignored.
    [[nodiscard]] auto removeTags(std::int64_t id, TagContentType type, const std::vector<std::string>& tags)
        -> VoidResult;

    /// @brief Tags of a frame or transcription, sorted by name.
    [[nodiscard]] auto tagsOf(std::int64_t id, TagContentType type) -> Result<std::vector<std::string>>;

    /// @brief Returns one page of results; the query must already be validated.
    [[nodiscard]] auto search(const SearchQuery& query) -> Result<std::vector<SearchResult>>;

    /// @brief Counts every row matching the query's filters (ignores limit/offset).
    [[nodiscard]] auto countSearchResults(const SearchQuery& query) -> Result<std::int64_t>;

    [[nodiscard]] auto latestTimestamps() -> Result<LatestTimestamps>;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace sightline
