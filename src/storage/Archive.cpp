// SPDX-License-Identifier: Apache-2.0
#include "Archive.hpp"

#include <core/Log.hpp>
#include <storage/Migrations.hpp>
#include <storage/SearchSql.hpp>
#include <storage/SqliteDb.hpp>

#include <format>
#include <mutex>
#include <optional>

namespace sightline
{

namespace
{

    auto execute(SqliteDb& db, std::string_view sql, const std::vector<SqlValue>& bindings) -> VoidResult
    {
        auto stmt = db.prepare(sql);
        if (!stmt)
            return std::unexpected(stmt.error());
        if (auto r = stmt->bindAll(bindings); !r)
            return r;
        return stmt->run();
    }

    /// @brief Runs a single-column query and returns the first row's value, if any.
    auto queryInt64(SqliteDb& db, std::string_view sql, const std::vector<SqlValue>& bindings)
        -> Result<std::optional<std::int64_t>>
    {
        auto stmt = db.prepare(sql);
        if (!stmt)
            return std::unexpected(stmt.error());
        if (auto r = stmt->bindAll(bindings); !r)
            return std::unexpected(r.error());
        auto row = stmt->step();
        if (!row)
            return std::unexpected(row.error());
        if (!*row || stmt->columnIsNull(0))
            return std::optional<std::int64_t> {};
        return std::optional<std::int64_t> { stmt->columnInt64(0) };
    }

    auto normalizeTags(const std::vector<std::string>& tags) -> std::vector<std::string>
    {
        auto result = std::vector<std::string> {};
        for (auto const& tag: tags)
        {
            auto const begin = tag.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                continue;
            auto const end = tag.find_last_not_of(" \t\r\n");
            result.push_back(tag.substr(begin, end - begin + 1));
        }
        return result;
    }

    struct TagTables
    {
        std::string_view contentTable;
        std::string_view relationTable;
        std::string_view relationColumn;
    };

    constexpr auto tagTables(TagContentType type) -> TagTables
    {
        if (type == TagContentType::Vision)
            return { "frames", "vision_tags", "frame_id" };
        return { "audio_transcriptions", "audio_tags", "audio_transcription_id" };
    }

    /// @brief Maps a failed write to the error the orchestrator escalates on.
    auto persistenceError(const Error& error, std::string_view what) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::DatabaseError, std::format("{}: {}", what, error.message));
    }

} // namespace

struct Archive::Impl
{
    std::unique_ptr<SqliteDb> writer;
    std::unique_ptr<SqliteDb> reader;
    std::mutex writeMutex;

    [[nodiscard]] auto chunkId(std::string_view table, const std::string& path) -> Result<std::int64_t>
    {
        auto id = queryInt64(*writer, std::format("SELECT id FROM {} WHERE file_path = ?", table), { path });
        if (!id)
            return std::unexpected(id.error());
        if (!*id)
            return makeError(ErrorCode::DatabaseError, std::format("Chunk '{}' is not registered", path));
        return **id;
    }

    [[nodiscard]] auto registerChunk(std::string_view sql, std::string_view table, std::vector<SqlValue> bindings)
        -> Result<std::int64_t>
    {
        auto const path = std::get<std::string>(bindings.front());
        auto lock = std::lock_guard(writeMutex);
        if (auto r = execute(*writer, sql, bindings); !r)
            return persistenceError(r.error(), std::format("register chunk '{}'", path));
        return chunkId(table, path);
    }

    [[nodiscard]] auto insertOcrLocked(std::int64_t frameId, const OcrRow& row) -> Result<std::int64_t>
    {
        if (auto r = execute(*writer,
                             "INSERT INTO ocr_text (frame_id, text, app_name, window_name, focused)"
                             " VALUES (?, ?, ?, ?, ?)",
                             { frameId, row.text, row.appName, row.windowName, std::int64_t { row.focused } });
            !r)
            return std::unexpected(r.error());

        auto const ocrId = writer->lastInsertId();
        if (auto r = execute(*writer, "INSERT INTO ocr_text_fts (rowid, text) VALUES (?, ?)", { ocrId, row.text });
            !r)
            return std::unexpected(r.error());
        return ocrId;
    }

    [[nodiscard]] auto contentExists(TagContentType type, std::int64_t id) -> Result<bool>
    {
        auto found =
            queryInt64(*writer, std::format("SELECT 1 FROM {} WHERE id = ?", tagTables(type).contentTable), { id });
        if (!found)
            return std::unexpected(found.error());
        return found->has_value();
    }

    [[nodiscard]] auto tags(std::int64_t id, TagContentType type) -> Result<std::vector<std::string>>
    {
        auto const tables = tagTables(type);
        auto stmt = reader->prepare(std::format("SELECT t.name FROM tags t JOIN {} r ON r.tag_id = t.id"
                                                " WHERE r.{} = ? ORDER BY t.name",
                                                tables.relationTable,
                                                tables.relationColumn));
        if (!stmt)
            return std::unexpected(stmt.error());
        if (auto r = stmt->bind(1, id); !r)
            return std::unexpected(r.error());

        auto names = std::vector<std::string> {};
        while (true)
        {
            auto row = stmt->step();
            if (!row)
                return std::unexpected(row.error());
            if (!*row)
                break;
            names.push_back(stmt->columnText(0));
        }
        return names;
    }

    [[nodiscard]] auto loadScreenText(std::int64_t ocrId) -> Result<OcrResult>
    {
        auto stmt = reader->prepare(
            "SELECT o.id, o.frame_id, o.text, f.timestamp, c.file_path, f.offset_index, o.app_name,"
            " o.window_name, o.focused"
            " FROM ocr_text o JOIN frames f ON f.id = o.frame_id JOIN video_chunks c ON c.id = f.video_chunk_id"
            " WHERE o.id = ?");
        if (!stmt)
            return std::unexpected(stmt.error());
        if (auto r = stmt->bind(1, ocrId); !r)
            return std::unexpected(r.error());
        auto row = stmt->step();
        if (!row)
            return std::unexpected(row.error());
        if (!*row)
            return makeError(ErrorCode::NotFound, std::format("OCR row {} not found", ocrId));

        auto result = OcrResult {
            .ocrId = stmt->columnInt64(0),
            .frameId = stmt->columnInt64(1),
            .text = stmt->columnText(2),
            .timestamp = fromMicros(stmt->columnInt64(3)),
            .filePath = stmt->columnText(4),
            .offsetIndex = stmt->columnInt64(5),
            .appName = stmt->columnText(6),
            .windowName = stmt->columnText(7),
            .focused = stmt->columnInt64(8) != 0,
            .tags = {},
            .frame = std::nullopt,
        };

        auto frameTags = tags(result.frameId, TagContentType::Vision);
        if (!frameTags)
            return std::unexpected(frameTags.error());
        result.tags = std::move(*frameTags);
        return result;
    }

    [[nodiscard]] auto loadAudio(std::int64_t transcriptionId) -> Result<AudioResult>
    {
        auto stmt = reader->prepare(
            "SELECT a.id, a.audio_chunk_id, a.transcription, a.timestamp, c.file_path, a.offset_index,"
            " a.device_name, a.is_input_device"
            " FROM audio_transcriptions a JOIN audio_chunks c ON c.id = a.audio_chunk_id WHERE a.id = ?");
        if (!stmt)
            return std::unexpected(stmt.error());
        if (auto r = stmt->bind(1, transcriptionId); !r)
            return std::unexpected(r.error());
        auto row = stmt->step();
        if (!row)
            return std::unexpected(row.error());
        if (!*row)
            return makeError(ErrorCode::NotFound, std::format("Transcription {} not found", transcriptionId));

        auto result = AudioResult {
            .transcriptionId = stmt->columnInt64(0),
            .chunkId = stmt->columnInt64(1),
            .transcription = stmt->columnText(2),
            .timestamp = fromMicros(stmt->columnInt64(3)),
            .filePath = stmt->columnText(4),
            .offsetIndex = stmt->columnInt64(5),
            .deviceName = stmt->columnText(6),
            .isInputDevice = stmt->columnInt64(7) != 0,
            .tags = {},
        };

        auto audioTags = tags(result.transcriptionId, TagContentType::Audio);
        if (!audioTags)
            return std::unexpected(audioTags.error());
        result.tags = std::move(*audioTags);
        return result;
    }

    [[nodiscard]] auto loadFts(std::int64_t ocrId, const std::string& match) -> Result<FtsResult>
    {
        auto source = loadScreenText(ocrId);
        if (!source)
            return std::unexpected(source.error());

        auto result = FtsResult {
            .textId = source->ocrId,
            .matchedText = source->text,
            .frameId = source->frameId,
            .timestamp = source->timestamp,
            .appName = std::move(source->appName),
            .windowName = std::move(source->windowName),
            .filePath = std::move(source->filePath),
            .offsetIndex = source->offsetIndex,
            .originalFrameText = source->text,
            .tags = std::move(source->tags),
        };

        if (match.empty())
            return result;

        auto stmt = reader->prepare("SELECT snippet(ocr_text_fts, 0, '[', ']', '...', 32) FROM ocr_text_fts"
                                    " WHERE ocr_text_fts MATCH ? AND rowid = ?");
        if (!stmt)
            return std::unexpected(stmt.error());
        if (auto r = stmt->bindAll({ match, ocrId }); !r)
            return std::unexpected(r.error());
        auto row = stmt->step();
        if (!row)
            return std::unexpected(row.error());
        if (*row)
            result.matchedText = stmt->columnText(0);
        return result;
    }
};

Archive::Archive(PrivateTag, std::unique_ptr<Impl> impl): _impl(std::move(impl))
{
}

Archive::~Archive() = default;

auto Archive::open(const std::filesystem::path& databasePath) -> Result<std::unique_ptr<Archive>>
{
    auto impl = std::make_unique<Impl>();

    auto writer = SqliteDb::open(databasePath.string(), false);
    if (!writer)
        return std::unexpected(writer.error());
    impl->writer = std::move(*writer);

    if (auto r = migrate(*impl->writer); !r)
        return std::unexpected(r.error());

    auto reader = SqliteDb::open(databasePath.string(), true);
    if (!reader)
        return std::unexpected(reader.error());
    impl->reader = std::move(*reader);

    log::info("Archive opened: {}", databasePath.string());
    return std::make_unique<Archive>(PrivateTag {}, std::move(impl));
}

auto Archive::registerVideoChunk(const std::string& path, std::uint32_t monitorId, Timestamp startedAt)
    -> Result<std::int64_t>
{
    return _impl->registerChunk(
        "INSERT OR IGNORE INTO video_chunks (file_path, monitor_id, started_at) VALUES (?, ?, ?)",
        "video_chunks",
        { path, std::int64_t { monitorId }, toMicros(startedAt) });
}

auto Archive::registerAudioChunk(const std::string& path, const std::string& deviceName, Timestamp startedAt)
    -> Result<std::int64_t>
{
    return _impl->registerChunk(
        "INSERT OR IGNORE INTO audio_chunks (file_path, device_name, started_at) VALUES (?, ?, ?)",
        "audio_chunks",
        { path, deviceName, toMicros(startedAt) });
}

auto Archive::insertFrame(const FrameRow& frame, const std::vector<OcrRow>& ocrRows) -> Result<FrameIds>
{
    auto lock = std::lock_guard(_impl->writeMutex);

    auto chunkId = _impl->chunkId("video_chunks", frame.chunk.path);
    if (!chunkId)
        return std::unexpected(chunkId.error());

    auto tx = Transaction { *_impl->writer };
    if (auto r = tx.begin(); !r)
        return persistenceError(r.error(), "insert frame");

    if (auto r = execute(*_impl->writer,
                         "INSERT INTO frames (video_chunk_id, offset_index, timestamp, monitor_id) VALUES (?, ?, ?, ?)",
                         { *chunkId, frame.chunk.offset, toMicros(frame.timestamp), std::int64_t { frame.monitorId } });
        !r)
        return persistenceError(r.error(), "insert frame");

    auto ids = FrameIds { .frameId = _impl->writer->lastInsertId(), .ocrIds = {} };
    for (auto const& row: ocrRows)
    {
        auto ocrId = _impl->insertOcrLocked(ids.frameId, row);
        if (!ocrId)
            return persistenceError(ocrId.error(), "insert OCR text");
        ids.ocrIds.push_back(*ocrId);
    }

    if (auto r = tx.commit(); !r)
        return persistenceError(r.error(), "commit frame");

    return ids;
}

auto Archive::insertOcr(std::int64_t frameId, const OcrRow& row) -> Result<std::int64_t>
{
    auto lock = std::lock_guard(_impl->writeMutex);

    auto exists = _impl->contentExists(TagContentType::Vision, frameId);
    if (!exists)
        return std::unexpected(exists.error());
    if (!*exists)
        return makeError(ErrorCode::NotFound, std::format("Frame {} not found", frameId));

    auto tx = Transaction { *_impl->writer };
    if (auto r = tx.begin(); !r)
        return persistenceError(r.error(), "insert OCR text");

    auto ocrId = _impl->insertOcrLocked(frameId, row);
    if (!ocrId)
        return persistenceError(ocrId.error(), "insert OCR text");

    if (auto r = tx.commit(); !r)
        return persistenceError(r.error(), "commit OCR text");
    return *ocrId;
}

auto Archive::insertAudio(const AudioRow& row) -> Result<std::int64_t>
{
    auto lock = std::lock_guard(_impl->writeMutex);

    auto chunkId = _impl->chunkId("audio_chunks", row.chunk.path);
    if (!chunkId)
        return std::unexpected(chunkId.error());

    auto tx = Transaction { *_impl->writer };
    if (auto r = tx.begin(); !r)
        return persistenceError(r.error(), "insert transcription");

    if (auto r = execute(*_impl->writer,
                         "INSERT INTO audio_transcriptions (audio_chunk_id, offset_index, timestamp, end_timestamp,"
                         " transcription, transcription_engine, device_name, is_input_device)"
                         " VALUES (?, ?, ?, ?, ?, ?, ?, ?)",
                         { *chunkId,
                           row.chunk.offset,
                           toMicros(row.start),
                           toMicros(row.end),
                           row.transcription,
                           row.engine,
                           row.deviceName,
                           std::int64_t { row.isInputDevice } });
        !r)
        return persistenceError(r.error(), "insert transcription");

    auto const id = _impl->writer->lastInsertId();
    if (auto r = execute(*_impl->writer,
                         "INSERT INTO audio_transcriptions_fts (rowid, transcription) VALUES (?, ?)",
                         { id, row.transcription });
        !r)
        return persistenceError(r.error(), "insert transcription");

    if (auto r = tx.commit(); !r)
        return persistenceError(r.error(), "commit transcription");
    return id;
}

auto Archive::addTags(std::int64_t id, TagContentType type, const std::vector<std::string>& tags) -> VoidResult
{
    auto const names = normalizeTags(tags);
    auto const tables = tagTables(type);
    auto lock = std::lock_guard(_impl->writeMutex);

    auto exists = _impl->contentExists(type, id);
    if (!exists)
        return std::unexpected(exists.error());
    if (!*exists)
        return makeError(ErrorCode::NotFound,
                         std::format("No {} content with id {}", tagContentTypeToString(type), id));

    auto tx = Transaction { *_impl->writer };
    if (auto r = tx.begin(); !r)
        return r;

    for (auto const& name: names)
    {
        if (auto r = execute(*_impl->writer, "INSERT OR IGNORE INTO tags (name) VALUES (?)", { name }); !r)
            return r;
        if (auto r = execute(*_impl->writer,
                             std::format("INSERT OR IGNORE INTO {} ({}, tag_id)"
                                         " SELECT ?, id FROM tags WHERE name = ?",
                                         tables.relationTable,
                                         tables.relationColumn),
                             { id, name });
            !r)
            return r;
    }

    return tx.commit();
}

auto Archive::removeTags(std::int64_t id, TagContentType type, const std::vector<std::string>& tags) -> VoidResult
{
    auto const names = normalizeTags(tags);
    auto const tables = tagTables(type);
    auto lock = std::lock_guard(_impl->writeMutex);

    auto exists = _impl->contentExists(type, id);
    if (!exists)
        return std::unexpected(exists.error());
    if (!*exists)
        return makeError(ErrorCode::NotFound,
                         std::format("No {} content with id {}", tagContentTypeToString(type), id));

    auto tx = Transaction { *_impl->writer };
    if (auto r = tx.begin(); !r)
        return r;

    for (auto const& name: names)
    {
        if (auto r = execute(*_impl->writer,
                             std::format("DELETE FROM {} WHERE {} = ? AND tag_id IN (SELECT id FROM tags WHERE name = ?)",
                                         tables.relationTable,
                                         tables.relationColumn),
                             { id, name });
            !r)
            return r;
    }

    return tx.commit();
}

auto Archive::tagsOf(std::int64_t id, TagContentType type) -> Result<std::vector<std::string>>
{
    return _impl->tags(id, type);
}

auto Archive::search(const SearchQuery& query) -> Result<std::vector<SearchResult>>
{
    auto const sql = buildSearchSql(query);
    auto stmt = _impl->reader->prepare(sql.sql);
    if (!stmt)
        return std::unexpected(stmt.error());
    if (auto r = stmt->bindAll(sql.bindings); !r)
        return std::unexpected(r.error());

    auto rows = std::vector<std::pair<ResultKind, std::int64_t>> {};
    while (true)
    {
        auto row = stmt->step();
        if (!row)
            return std::unexpected(row.error());
        if (!*row)
            break;
        rows.emplace_back(static_cast<ResultKind>(stmt->columnInt64(0)), stmt->columnInt64(1));
    }

    auto const match = ftsMatchExpression(query.text);
    auto results = std::vector<SearchResult> {};
    results.reserve(rows.size());

    for (auto const& [kind, id]: rows)
    {
        switch (kind)
        {
            case ResultKind::Ocr: {
                auto result = _impl->loadScreenText(id);
                if (!result)
                    return std::unexpected(result.error());
                results.emplace_back(std::move(*result));
                break;
            }
            case ResultKind::Audio: {
                auto result = _impl->loadAudio(id);
                if (!result)
                    return std::unexpected(result.error());
                results.emplace_back(std::move(*result));
                break;
            }
            case ResultKind::Fts: {
                auto result = _impl->loadFts(id, match);
                if (!result)
                    return std::unexpected(result.error());
                results.emplace_back(std::move(*result));
                break;
            }
        }
    }
    return results;
}

auto Archive::countSearchResults(const SearchQuery& query) -> Result<std::int64_t>
{
    auto const sql = buildCountSql(query);
    auto count = queryInt64(*_impl->reader, sql.sql, sql.bindings);
    if (!count)
        return std::unexpected(count.error());
    return count->value_or(0);
}

auto Archive::latestTimestamps() -> Result<LatestTimestamps>
{
    auto frame = queryInt64(*_impl->reader, "SELECT MAX(timestamp) FROM frames", {});
    if (!frame)
        return std::unexpected(frame.error());
    auto audio = queryInt64(*_impl->reader, "SELECT MAX(timestamp) FROM audio_transcriptions", {});
    if (!audio)
        return std::unexpected(audio.error());

    auto latest = LatestTimestamps {};
    if (*frame)
        latest.frame = fromMicros(**frame);
    if (*audio)
        latest.audio = fromMicros(**audio);
    return latest;
}

} // namespace sightline
