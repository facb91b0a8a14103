// SPDX-License-Identifier: Apache-2.0
#include "Fakes.hpp"

#include <storage/ChunkFile.hpp>
#include <storage/ChunkWriter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <fstream>

using namespace sightline;
using namespace sightline::test;
using namespace std::chrono_literals;

namespace
{

auto bytes(std::string_view text) -> std::vector<std::uint8_t>
{
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

auto frameAt(std::uint32_t monitor, Timestamp ts) -> CaptureFrame
{
    return CaptureFrame {
        .monitorId = monitor,
        .timestamp = ts,
        .image = Image { .width = 8, .height = 8, .pixels = std::vector<std::uint8_t>(8 * 8 * 4, 0x20) },
        .windows = {},
    };
}

auto segmentAt(Timestamp ts) -> AudioSegment
{
    return AudioSegment {
        .device = AudioDevice { .name = "Mic", .direction = DeviceDirection::Input },
        .start = ts,
        .end = ts + 1s,
        .samples = std::vector<float>(1600, 0.25f),
        .containsSpeech = true,
    };
}

} // namespace

TEST_CASE("ChunkFileWriter assigns consecutive offsets that read back the same unit", "[chunk]")
{
    auto dir = TempDir("chunkfile");
    auto const path = (dir.path() / "a.vchunk").string();

    auto writer = ChunkFileWriter::create(path, StreamKind::Video);
    REQUIRE(writer.has_value());

    auto const t0 = fromMicros(1'000'000);
    for (auto i = 0; i < 5; ++i)
    {
        auto offset = (*writer)->append(t0 + i * 1s, 640, 480, bytes(std::format("frame-{}", i)));
        REQUIRE(offset.has_value());
        CHECK(*offset == i);
    }
    REQUIRE((*writer)->finalize().has_value());

    for (auto i = 0; i < 5; ++i)
    {
        auto record = ChunkReader::readUnit(path, i);
        REQUIRE(record.has_value());
        CHECK(record->offset == i);
        CHECK(record->timestamp == t0 + i * 1s);
        CHECK(record->a == 640);
        CHECK(record->payload == bytes(std::format("frame-{}", i)));
    }

    auto missing = ChunkReader::readUnit(path, 5);
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::NotFound);

    CHECK(ChunkReader::readKind(path).value() == StreamKind::Video);
    CHECK(ChunkReader::readAll(path).value().size() == 5);
}

TEST_CASE("ChunkFileWriter refuses to overwrite an existing chunk", "[chunk]")
{
    auto dir = TempDir("chunkexists");
    auto const path = (dir.path() / "b.achunk").string();

    REQUIRE(ChunkFileWriter::create(path, StreamKind::Audio).has_value());
    auto second = ChunkFileWriter::create(path, StreamKind::Audio);
    REQUIRE(!second.has_value());
    CHECK(second.error().code == ErrorCode::PersistenceError);
}

TEST_CASE("Finalized chunks are read-only and reject appends", "[chunk]")
{
    auto dir = TempDir("chunkfinal");
    auto const path = (dir.path() / "c.vchunk").string();

    auto writer = ChunkFileWriter::create(path, StreamKind::Video);
    REQUIRE(writer.has_value());
    REQUIRE((*writer)->append(now(), 1, 1, bytes("x")).has_value());
    REQUIRE((*writer)->finalize().has_value());

    CHECK(!(*writer)->isOpen());
    CHECK(!(*writer)->append(now(), 1, 1, bytes("y")).has_value());

    auto const perms = std::filesystem::status(path).permissions();
    CHECK((perms & std::filesystem::perms::owner_write) == std::filesystem::perms::none);
}

TEST_CASE("Units before a torn record stay readable", "[chunk]")
{
    auto dir = TempDir("chunktorn");
    auto const path = (dir.path() / "d.vchunk").string();

    {
        auto writer = ChunkFileWriter::create(path, StreamKind::Video);
        REQUIRE(writer.has_value());
        REQUIRE((*writer)->append(now(), 1, 1, bytes("complete")).has_value());
        (*writer)->abandon();
    }
    {
        // Half a record header, as a crash during a write would leave behind.
        auto out = std::ofstream(path, std::ios::binary | std::ios::app);
        out.write("SLR1\x01\x00", 6);
    }

    CHECK(ChunkReader::readUnit(path, 0).value().payload == bytes("complete"));

    auto missing = ChunkReader::readUnit(path, 1);
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::IoError);
    CHECK(!ChunkReader::readAll(path).has_value());
}

TEST_CASE("A record claiming more bytes than the file holds is rejected", "[chunk]")
{
    auto dir = TempDir("chunkoversize");
    auto const path = (dir.path() / "e.vchunk").string();

    {
        auto writer = ChunkFileWriter::create(path, StreamKind::Video);
        REQUIRE(writer.has_value());
        REQUIRE((*writer)->append(now(), 1, 1, bytes("first")).has_value());
        REQUIRE((*writer)->append(now(), 1, 1, bytes("second")).has_value());
        (*writer)->abandon();
    }
    {
        // Corrupt the payload size of the first record to 4 GiB - 1.
        auto file = std::fstream(path, std::ios::binary | std::ios::in | std::ios::out);
        file.seekp(chunkformat::HeaderSize + 24);
        file.write("\xFF\xFF\xFF\xFF", 4);
    }

    auto first = ChunkReader::readUnit(path, 0);
    REQUIRE(!first.has_value());
    CHECK(first.error().code == ErrorCode::IoError);

    // Skipping over the corrupt record must not run past the end of the file either.
    auto second = ChunkReader::readUnit(path, 1);
    REQUIRE(!second.has_value());
    CHECK(second.error().code == ErrorCode::IoError);
}

TEST_CASE("PCM payloads preserve samples", "[chunk]")
{
    auto const samples = std::vector<float> { 0.0f, -1.0f, 0.5f, 1.0f, -0.25f };
    auto const encoded = encodePcm(samples);
    CHECK(encoded.size() == samples.size() * 4);

    auto decoded = decodePcm(encoded);
    REQUIRE(decoded.has_value());
    CHECK(*decoded == samples);

    CHECK(!decodePcm(std::vector<std::uint8_t> { 1, 2, 3 }).has_value());
}

TEST_CASE("ChunkWriter keeps one chunk per stream and rolls over by duration", "[chunkwriter]")
{
    auto dir = TempDir("chunkwriter");
    auto opened = std::vector<std::string> {};
    auto writer = ChunkWriter(
        ChunkWriterConfig { .dataDir = dir.path(), .videoChunkDuration = 10s, .audioChunkDuration = 5s, .jpegQuality = 80 },
        [&](StreamKind, const std::string& stream, const std::string& path, Timestamp) -> VoidResult {
            opened.push_back(stream + "|" + path);
            return {};
        });
    REQUIRE(writer.prepare().has_value());

    auto const t0 = fromMicros(1'700'000'000'000'000);
    auto a = writer.appendFrame(frameAt(0, t0));
    auto b = writer.appendFrame(frameAt(0, t0 + 9s));
    auto c = writer.appendFrame(frameAt(1, t0 + 1s));
    auto d = writer.appendFrame(frameAt(0, t0 + 10s));
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(c.has_value());
    REQUIRE(d.has_value());

    CHECK(a->path == b->path);
    CHECK(a->offset == 0);
    CHECK(b->offset == 1);
    CHECK(c->path != a->path);
    CHECK(c->offset == 0);
    CHECK(d->path != a->path);
    CHECK(d->offset == 0);
    CHECK(opened.size() == 3);
    CHECK(writer.openChunkCount() == 2);

    // The rolled-over chunk was finalized and still holds both frames.
    CHECK(ChunkReader::readAll(a->path).value().size() == 2);
    CHECK(std::filesystem::path(a->path).parent_path() == writer.chunkDirectory());
    CHECK(std::filesystem::path(a->path).filename().string().starts_with("monitor_0_"));
    CHECK(std::filesystem::path(a->path).extension() == ".vchunk");

    auto audio = writer.appendAudio(segmentAt(t0));
    REQUIRE(audio.has_value());
    auto record = ChunkReader::readUnit(audio->path, audio->offset);
    REQUIRE(record.has_value());
    CHECK(decodePcm(record->payload).value().size() == 1600);
    CHECK(record->a == SampleRate);

    REQUIRE(writer.finalizeAll().has_value());
    CHECK(writer.openChunkCount() == 0);
}

TEST_CASE("ChunkWriter abandons a chunk whose registration fails", "[chunkwriter]")
{
    auto dir = TempDir("chunkregister");
    auto writer = ChunkWriter(
        ChunkWriterConfig { .dataDir = dir.path(), .videoChunkDuration = 10s, .audioChunkDuration = 5s, .jpegQuality = 80 },
        [](StreamKind, const std::string&, const std::string&, Timestamp) -> VoidResult {
            return makeError(ErrorCode::DatabaseError, "disk full");
        });
    REQUIRE(writer.prepare().has_value());

    auto ref = writer.appendFrame(frameAt(0, now()));
    REQUIRE(!ref.has_value());
    CHECK(ref.error().code == ErrorCode::PersistenceError);
    CHECK(writer.openChunkCount() == 0);
}
