// SPDX-License-Identifier: Apache-2.0
#include "Fakes.hpp"

#include <storage/Archive.hpp>
#include <storage/Migrations.hpp>
#include <storage/SearchSql.hpp>
#include <storage/SqliteDb.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using namespace sightline;
using namespace sightline::test;
using namespace std::chrono_literals;

namespace
{

/// @brief Archive in a temp dir with one registered chunk per modality.
struct ArchiveFixture
{
    TempDir dir { "archive" };
    std::unique_ptr<Archive> archive;
    std::string videoChunk;
    std::string audioChunk;
    Timestamp t0 = fromMicros(1'700'000'000'000'000);

    ArchiveFixture()
    {
        archive = Archive::open(dir.path() / "db.sqlite").value();
        videoChunk = (dir.path() / "monitor_0.vchunk").string();
        audioChunk = (dir.path() / "mic.achunk").string();
        REQUIRE(archive->registerVideoChunk(videoChunk, 0, t0).has_value());
        REQUIRE(archive->registerAudioChunk(audioChunk, "Mic", t0).has_value());
    }

    auto frame(std::int64_t offset, Timestamp ts, std::vector<OcrRow> rows) -> FrameIds
    {
        return archive
            ->insertFrame(FrameRow { .chunk = { .path = videoChunk, .offset = offset }, .timestamp = ts, .monitorId = 0 },
                          rows)
            .value();
    }

    auto audio(std::int64_t offset, Timestamp ts, std::string text) -> std::int64_t
    {
        return archive
            ->insertAudio(AudioRow {
                .chunk = { .path = audioChunk, .offset = offset },
                .start = ts,
                .end = ts + 2s,
                .transcription = std::move(text),
                .engine = "fake",
                .deviceName = "Mic",
                .isInputDevice = true,
            })
            .value();
    }
};

auto window(std::string text, std::string app = "Firefox", std::string title = "Docs") -> OcrRow
{
    return OcrRow { .text = std::move(text), .appName = std::move(app), .windowName = std::move(title), .focused = true };
}

auto timestamps(const std::vector<SearchResult>& results) -> std::vector<Timestamp>
{
    auto out = std::vector<Timestamp> {};
    for (auto const& r: results)
        out.push_back(timestampOf(r));
    return out;
}

} // namespace

TEST_CASE("ftsMatchExpression quotes every token", "[searchsql]")
{
    CHECK(ftsMatchExpression("") == "");
    CHECK(ftsMatchExpression("   ") == "");
    CHECK(ftsMatchExpression("hello") == "\"hello\"");
    CHECK(ftsMatchExpression("  hello   world ") == "\"hello\" \"world\"");
    CHECK(ftsMatchExpression("a OR b") == "\"a\" \"OR\" \"b\"");
    CHECK(ftsMatchExpression("say \"hi\"") == "\"say\" \"\"\"hi\"\"\"");
}

TEST_CASE("likeSubstringPattern escapes wildcards", "[searchsql]")
{
    CHECK(likeSubstringPattern("chrome") == "%chrome%");
    CHECK(likeSubstringPattern("100%") == "%100\\%%");
    CHECK(likeSubstringPattern("a_b\\c") == "%a\\_b\\\\c%");
}

TEST_CASE("buildSearchSql orders by time and pages", "[searchsql]")
{
    auto query = SearchQuery { .text = "invoice", .limit = 5, .offset = 10 };
    auto const sql = buildSearchSql(query);

    CHECK(sql.sql.find("UNION ALL") != std::string::npos);
    CHECK(sql.sql.find("ORDER BY ts DESC") != std::string::npos);
    CHECK(sql.sql.ends_with("LIMIT ? OFFSET ?"));
    REQUIRE(sql.bindings.size() == 4);
    CHECK(std::get<std::int64_t>(sql.bindings[2]) == 5);
    CHECK(std::get<std::int64_t>(sql.bindings[3]) == 10);

    // The count covers the same rows without pagination.
    auto const count = buildCountSql(query);
    CHECK(count.sql.starts_with("SELECT COUNT(*)"));
    CHECK(count.bindings.size() == 2);
}

TEST_CASE("Window filters exclude audio rows", "[searchsql]")
{
    auto const sql = buildSearchSql(SearchQuery { .contentType = ContentType::Audio, .appName = "Slack" });
    CHECK(sql.sql.find(" AND 0") != std::string::npos);
    CHECK(sql.sql.find("ocr_text") == std::string::npos);
}

TEST_CASE("Migrations bring a fresh database to the current version", "[migrations]")
{
    auto dir = TempDir("migrations");
    auto db = SqliteDb::open((dir.path() / "m.sqlite").string(), false);
    REQUIRE(db.has_value());

    CHECK(schemaVersion(**db).value() == 0);
    REQUIRE(migrate(**db).has_value());
    CHECK(schemaVersion(**db).value() == SchemaVersion);

    // Running again is a no-op.
    REQUIRE(migrate(**db).has_value());
    CHECK(schemaVersion(**db).value() == SchemaVersion);

    REQUIRE((*db)->exec("PRAGMA user_version = 99;").has_value());
    auto newer = migrate(**db);
    REQUIRE(!newer.has_value());
    CHECK(newer.error().code == ErrorCode::DatabaseError);
}

TEST_CASE("Archive rejects units of unregistered chunks", "[archive]")
{
    auto fixture = ArchiveFixture {};
    auto result = fixture.archive->insertFrame(
        FrameRow { .chunk = { .path = "/nowhere.vchunk", .offset = 0 }, .timestamp = fixture.t0, .monitorId = 0 }, {});
    CHECK(!result.has_value());
}

TEST_CASE("Archive registers chunks idempotently", "[archive]")
{
    auto fixture = ArchiveFixture {};
    auto first = fixture.archive->registerVideoChunk(fixture.videoChunk, 0, fixture.t0);
    auto second = fixture.archive->registerVideoChunk(fixture.videoChunk, 0, fixture.t0);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(*first == *second);
}

TEST_CASE("Archive search returns newest first across modalities", "[archive]")
{
    auto fixture = ArchiveFixture {};
    auto const t0 = fixture.t0;

    fixture.frame(0, t0 + 1s, { window("quarterly report draft") });
    fixture.audio(0, t0 + 2s, "let us discuss the quarterly report");
    fixture.frame(1, t0 + 3s, { window("email inbox") });
    fixture.audio(1, t0 + 4s, "lunch plans");

    auto all = fixture.archive->search(SearchQuery {});
    REQUIRE(all.has_value());
    CHECK(timestamps(*all) == std::vector { t0 + 4s, t0 + 3s, t0 + 2s, t0 + 1s });
    CHECK(std::holds_alternative<AudioResult>((*all)[0]));
    CHECK(std::holds_alternative<OcrResult>((*all)[1]));

    auto matching = fixture.archive->search(SearchQuery { .text = "quarterly report" });
    REQUIRE(matching.has_value());
    CHECK(timestamps(*matching) == std::vector { t0 + 2s, t0 + 1s });
    CHECK(fixture.archive->countSearchResults(SearchQuery { .text = "quarterly report" }).value() == 2);

    auto audioOnly = fixture.archive->search(SearchQuery { .text = "quarterly", .contentType = ContentType::Audio });
    REQUIRE(audioOnly.has_value());
    REQUIRE(audioOnly->size() == 1);
    auto const& audio = std::get<AudioResult>(audioOnly->front());
    CHECK(audio.transcription == "let us discuss the quarterly report");
    CHECK(audio.filePath == fixture.audioChunk);
    CHECK(audio.offsetIndex == 0);
    CHECK(audio.deviceName == "Mic");
    CHECK(audio.isInputDevice);
}

TEST_CASE("Archive search honors time range and window filters", "[archive]")
{
    auto fixture = ArchiveFixture {};
    auto const t0 = fixture.t0;

    fixture.frame(0, t0, { window("alpha", "Firefox", "Docs"), window("beta", "Slack", "general") });
    fixture.frame(1, t0 + 10s, { window("gamma", "Firefox", "Mail") });
    fixture.audio(0, t0 + 5s, "spoken words");

    auto ranged = fixture.archive->search(SearchQuery { .start = t0 + 1s, .end = t0 + 10s });
    REQUIRE(ranged.has_value());
    CHECK(timestamps(*ranged) == std::vector { t0 + 10s, t0 + 5s });

    auto byApp = fixture.archive->search(SearchQuery { .appName = "fire" });
    REQUIRE(byApp.has_value());
    REQUIRE(byApp->size() == 2);
    for (auto const& r: *byApp)
        CHECK(std::get<OcrResult>(r).appName == "Firefox");

    auto byWindow = fixture.archive->search(SearchQuery { .appName = "firefox", .windowName = "MAIL" });
    REQUIRE(byWindow.has_value());
    REQUIRE(byWindow->size() == 1);
    CHECK(std::get<OcrResult>(byWindow->front()).text == "gamma");
}

TEST_CASE("Archive pages partition the ordered result set", "[archive]")
{
    auto fixture = ArchiveFixture {};
    for (auto i = 0; i < 7; ++i)
        fixture.frame(i, fixture.t0 + i * 1s, { window(std::format("page row {}", i)) });

    auto seen = std::vector<Timestamp> {};
    for (auto offset = 0; offset < 9; offset += 3)
    {
        auto page = fixture.archive->search(SearchQuery { .limit = 3, .offset = offset });
        REQUIRE(page.has_value());
        auto const ts = timestamps(*page);
        seen.insert(seen.end(), ts.begin(), ts.end());
    }

    CHECK(seen.size() == 7);
    CHECK(std::ranges::is_sorted(seen, std::greater {}));
    CHECK(std::ranges::adjacent_find(seen) == seen.end());
    CHECK(fixture.archive->countSearchResults(SearchQuery { .limit = 3 }).value() == 7);
}

TEST_CASE("Archive FTS results carry a highlighted snippet", "[archive]")
{
    auto fixture = ArchiveFixture {};
    auto const ids = fixture.frame(0, fixture.t0, { window("the build failed on the release branch") });

    auto results = fixture.archive->search(SearchQuery { .text = "release", .contentType = ContentType::Fts });
    REQUIRE(results.has_value());
    REQUIRE(results->size() == 1);
    auto const& fts = std::get<FtsResult>(results->front());
    CHECK(fts.textId == ids.ocrIds.front());
    CHECK(fts.frameId == ids.frameId);
    CHECK(fts.matchedText.find("[release]") != std::string::npos);
    CHECK(fts.originalFrameText == "the build failed on the release branch");
}

TEST_CASE("Search text with FTS operators is matched literally", "[archive]")
{
    auto fixture = ArchiveFixture {};
    fixture.frame(0, fixture.t0, { window("cats AND dogs") });

    auto results = fixture.archive->search(SearchQuery { .text = "AND dogs\"" });
    CHECK(results.has_value());
}

TEST_CASE("Archive tags are idempotent and scoped by content type", "[archive]")
{
    auto fixture = ArchiveFixture {};
    auto const frame = fixture.frame(0, fixture.t0, { window("tagged text") });
    auto const transcript = fixture.audio(0, fixture.t0, "tagged speech");

    REQUIRE(fixture.archive->addTags(frame.frameId, TagContentType::Vision, { "work", " urgent ", "" }).has_value());
    REQUIRE(fixture.archive->addTags(frame.frameId, TagContentType::Vision, { "work" }).has_value());
    CHECK(fixture.archive->tagsOf(frame.frameId, TagContentType::Vision).value()
          == std::vector<std::string> { "urgent", "work" });

    REQUIRE(fixture.archive->addTags(transcript, TagContentType::Audio, { "meeting" }).has_value());
    CHECK(fixture.archive->tagsOf(transcript, TagContentType::Audio).value() == std::vector<std::string> { "meeting" });

    REQUIRE(fixture.archive->removeTags(frame.frameId, TagContentType::Vision, { "work", "never-added" }).has_value());
    CHECK(fixture.archive->tagsOf(frame.frameId, TagContentType::Vision).value() == std::vector<std::string> { "urgent" });

    auto results = fixture.archive->search(SearchQuery { .text = "tagged", .contentType = ContentType::Ocr });
    REQUIRE(results.has_value());
    REQUIRE(results->size() == 1);
    CHECK(std::get<OcrResult>(results->front()).tags == std::vector<std::string> { "urgent" });

    auto missing = fixture.archive->addTags(9999, TagContentType::Audio, { "x" });
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::NotFound);
}

TEST_CASE("Archive reports the newest timestamps per modality", "[archive]")
{
    auto fixture = ArchiveFixture {};
    CHECK(!fixture.archive->latestTimestamps().value().frame.has_value());
    CHECK(!fixture.archive->latestTimestamps().value().audio.has_value());

    fixture.frame(0, fixture.t0 + 1s, {});
    fixture.frame(1, fixture.t0 + 7s, {});
    fixture.audio(0, fixture.t0 + 3s, "hi");

    auto const latest = fixture.archive->latestTimestamps().value();
    CHECK(latest.frame == fixture.t0 + 7s);
    CHECK(latest.audio == fixture.t0 + 3s);
}

TEST_CASE("Archive survives reopening", "[archive]")
{
    auto dir = TempDir("reopen");
    auto const dbPath = dir.path() / "db.sqlite";
    auto const chunk = (dir.path() / "c.vchunk").string();
    auto const t0 = fromMicros(1'700'000'000'000'000);
    {
        auto archive = Archive::open(dbPath).value();
        REQUIRE(archive->registerVideoChunk(chunk, 0, t0).has_value());
        REQUIRE(archive
                    ->insertFrame(FrameRow { .chunk = { .path = chunk, .offset = 0 }, .timestamp = t0, .monitorId = 0 },
                                  { window("persisted") })
                    .has_value());
    }

    auto archive = Archive::open(dbPath).value();
    auto results = archive->search(SearchQuery { .text = "persisted" });
    REQUIRE(results.has_value());
    REQUIRE(results->size() == 1);
    CHECK(std::get<OcrResult>(results->front()).filePath == chunk);
}
