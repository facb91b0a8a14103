// SPDX-License-Identifier: Apache-2.0
#include "Migrations.hpp"

#include <core/Log.hpp>

#include <array>
#include <format>
#include <string_view>

namespace sightline
{

namespace
{

    // Timestamps are microseconds since the Unix epoch (UTC).
    // Each FTS table uses the rowid of its source row.
    constexpr auto Steps = std::array {
        std::string_view { R"sql(
CREATE TABLE video_chunks (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    file_path TEXT NOT NULL UNIQUE,
    monitor_id INTEGER NOT NULL,
    started_at INTEGER NOT NULL
);

CREATE TABLE frames (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    video_chunk_id INTEGER NOT NULL REFERENCES video_chunks(id),
    offset_index INTEGER NOT NULL,
    timestamp INTEGER NOT NULL,
    monitor_id INTEGER NOT NULL,
    UNIQUE (video_chunk_id, offset_index)
);
CREATE INDEX idx_frames_timestamp ON frames(timestamp);

CREATE TABLE ocr_text (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    frame_id INTEGER NOT NULL REFERENCES frames(id),
    text TEXT NOT NULL,
    app_name TEXT NOT NULL,
    window_name TEXT NOT NULL,
    focused INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX idx_ocr_text_frame_id ON ocr_text(frame_id);
CREATE INDEX idx_ocr_text_app_name ON ocr_text(app_name);

CREATE VIRTUAL TABLE ocr_text_fts USING fts5(text, tokenize = 'unicode61');

CREATE TABLE audio_chunks (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    file_path TEXT NOT NULL UNIQUE,
    device_name TEXT NOT NULL,
    started_at INTEGER NOT NULL
);

CREATE TABLE audio_transcriptions (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    audio_chunk_id INTEGER NOT NULL REFERENCES audio_chunks(id),
    offset_index INTEGER NOT NULL,
    timestamp INTEGER NOT NULL,
    end_timestamp INTEGER NOT NULL,
    transcription TEXT NOT NULL,
    transcription_engine TEXT NOT NULL,
    device_name TEXT NOT NULL,
    is_input_device INTEGER NOT NULL,
    UNIQUE (audio_chunk_id, offset_index)
);
CREATE INDEX idx_audio_transcriptions_timestamp ON audio_transcriptions(timestamp);

CREATE VIRTUAL TABLE audio_transcriptions_fts USING fts5(transcription, tokenize = 'unicode61');

CREATE TABLE tags (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT NOT NULL UNIQUE
);

CREATE TABLE vision_tags (
    frame_id INTEGER NOT NULL REFERENCES frames(id),
    tag_id INTEGER NOT NULL REFERENCES tags(id),
    PRIMARY KEY (frame_id, tag_id)
);

CREATE TABLE audio_tags (
    audio_transcription_id INTEGER NOT NULL REFERENCES audio_transcriptions(id),
    tag_id INTEGER NOT NULL REFERENCES tags(id),
    PRIMARY KEY (audio_transcription_id, tag_id)
);
)sql" },
    };

    static_assert(Steps.size() == SchemaVersion);

} // namespace

auto schemaVersion(SqliteDb& db) -> Result<int>
{
    auto stmt = db.prepare("PRAGMA user_version;");
    if (!stmt)
        return std::unexpected(stmt.error());
    auto row = stmt->step();
    if (!row)
        return std::unexpected(row.error());
    return *row ? static_cast<int>(stmt->columnInt64(0)) : 0;
}

auto migrate(SqliteDb& db) -> VoidResult
{
    auto current = schemaVersion(db);
    if (!current)
        return std::unexpected(current.error());

    if (*current > SchemaVersion)
        return makeError(ErrorCode::DatabaseError,
                         std::format("Database schema version {} is newer than supported version {}",
                                     *current,
                                     SchemaVersion));

    for (auto version = *current; version < SchemaVersion; ++version)
    {
        auto tx = Transaction { db };
        if (auto r = tx.begin(); !r)
            return r;
        if (auto r = db.exec(Steps[static_cast<size_t>(version)]); !r)
            return makeError(ErrorCode::DatabaseError,
                             std::format("Migration to version {} failed: {}", version + 1, r.error().message));
        if (auto r = db.exec(std::format("PRAGMA user_version = {};", version + 1)); !r)
            return r;
        if (auto r = tx.commit(); !r)
            return r;
        log::info("Database migrated to schema version {}", version + 1);
    }
    return {};
}

} // namespace sightline
