// SPDX-License-Identifier: Apache-2.0
#include "ChunkFile.hpp"

#include <core/Log.hpp>

#include <array>
#include <bit>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <limits>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace sightline
{

namespace
{

    void putU32(std::uint8_t* out, std::uint32_t value)
    {
        for (auto i = 0; i < 4; ++i)
            out[i] = static_cast<std::uint8_t>(value >> (8 * i));
    }

    void putI64(std::uint8_t* out, std::int64_t value)
    {
        auto const bits = static_cast<std::uint64_t>(value);
        for (auto i = 0; i < 8; ++i)
            out[i] = static_cast<std::uint8_t>(bits >> (8 * i));
    }

    auto getU32(const std::uint8_t* in) -> std::uint32_t
    {
        auto value = std::uint32_t { 0 };
        for (auto i = 0; i < 4; ++i)
            value |= static_cast<std::uint32_t>(in[i]) << (8 * i);
        return value;
    }

    auto getI64(const std::uint8_t* in) -> std::int64_t
    {
        auto value = std::uint64_t { 0 };
        for (auto i = 0; i < 8; ++i)
            value |= static_cast<std::uint64_t>(in[i]) << (8 * i);
        return static_cast<std::int64_t>(value);
    }

    auto writeAll(int fd, const std::uint8_t* data, size_t size) -> bool
    {
        while (size > 0)
        {
            auto const written = ::write(fd, data, size);
            if (written < 0)
            {
                if (errno == EINTR)
                    continue;
                return false;
            }
            data += written;
            size -= static_cast<size_t>(written);
        }
        return true;
    }

    auto ioError(std::string_view what, const std::string& path) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::PersistenceError, std::format("{} '{}': {}", what, path, std::strerror(errno)));
    }

    /// @brief Sequential record scanner over an open chunk.
    class RecordScanner
    {
      public:
        explicit RecordScanner(std::string path): _path(std::move(path)), _in(_path, std::ios::binary) {}

        auto open() -> Result<StreamKind>
        {
            auto ec = std::error_code {};
            _fileSize = std::filesystem::file_size(_path, ec);
            if (!_in || ec)
                return makeError(ErrorCode::IoError, std::format("Cannot open chunk '{}'", _path));

            auto header = std::array<std::uint8_t, chunkformat::HeaderSize> {};
            if (!_in.read(reinterpret_cast<char*>(header.data()), header.size()))
                return makeError(ErrorCode::IoError, std::format("Chunk '{}' has a truncated header", _path));

            if (std::memcmp(header.data(), chunkformat::FileMagic.data(), chunkformat::FileMagic.size()) != 0)
                return makeError(ErrorCode::IoError, std::format("'{}' is not a chunk file", _path));

            auto const kind = header[8];
            if (kind != static_cast<std::uint8_t>(StreamKind::Video)
                && kind != static_cast<std::uint8_t>(StreamKind::Audio))
                return makeError(ErrorCode::IoError, std::format("Chunk '{}' has unknown stream kind {}", _path, kind));
            if (header[9] != chunkformat::Version)
                return makeError(ErrorCode::IoError,
                                 std::format("Chunk '{}' has unsupported version {}", _path, header[9]));
            return static_cast<StreamKind>(kind);
        }

        /// @brief Reads the next record header.
        /// @return false at a clean end of file.
        auto nextHeader(ChunkRecord& record, std::uint32_t& payloadSize) -> Result<bool>
        {
            auto header = std::array<std::uint8_t, chunkformat::RecordHeaderSize> {};
            _in.read(reinterpret_cast<char*>(header.data()), header.size());
            if (_in.gcount() == 0 && _in.eof())
                return false;
            if (_in.gcount() != static_cast<std::streamsize>(header.size()))
                return makeError(ErrorCode::IoError, std::format("Chunk '{}' has a truncated record", _path));

            if (getU32(header.data()) != chunkformat::RecordMagic)
                return makeError(ErrorCode::IoError, std::format("Chunk '{}' has a corrupt record", _path));

            record.offset = getU32(header.data() + 4);
            record.timestamp = fromMicros(getI64(header.data() + 8));
            record.a = getU32(header.data() + 16);
            record.b = getU32(header.data() + 20);
            payloadSize = getU32(header.data() + 24);
            return true;
        }

        auto readPayload(ChunkRecord& record, std::uint32_t payloadSize) -> VoidResult
        {
            if (auto r = checkPayloadSize(payloadSize); !r)
                return r;
            record.payload.resize(payloadSize);
            if (!_in.read(reinterpret_cast<char*>(record.payload.data()), payloadSize))
                return makeError(ErrorCode::IoError, std::format("Chunk '{}' has a truncated payload", _path));
            return {};
        }

        auto skipPayload(std::uint32_t payloadSize) -> VoidResult
        {
            if (auto r = checkPayloadSize(payloadSize); !r)
                return r;
            if (!_in.seekg(payloadSize, std::ios::cur))
                return makeError(ErrorCode::IoError, std::format("Chunk '{}' has a truncated payload", _path));
            return {};
        }

      private:
        /// @brief A record may not claim more bytes than the file has left.
        auto checkPayloadSize(std::uint32_t payloadSize) -> VoidResult
        {
            auto const position = _in.tellg();
            auto const remaining =
                position < 0 ? std::uintmax_t { 0 } : _fileSize - static_cast<std::uintmax_t>(position);
            if (payloadSize > remaining)
                return makeError(ErrorCode::IoError,
                                 std::format("Chunk '{}' has a record of {} bytes with {} bytes left",
                                             _path,
                                             payloadSize,
                                             remaining));
            return {};
        }

        std::string _path;
        std::ifstream _in;
        std::uintmax_t _fileSize = 0;
    };

} // namespace

ChunkFileWriter::ChunkFileWriter(PrivateTag, std::string path, StreamKind kind, int fd, std::int64_t size):
    _path(std::move(path)), _kind(kind), _fd(fd), _size(size)
{
}

ChunkFileWriter::~ChunkFileWriter()
{
    if (_fd >= 0)
        ::close(_fd);
}

auto ChunkFileWriter::create(std::string path, StreamKind kind) -> Result<std::unique_ptr<ChunkFileWriter>>
{
    auto const fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0)
        return ioError("Cannot create chunk", path);

    auto header = std::array<std::uint8_t, chunkformat::HeaderSize> {};
    std::memcpy(header.data(), chunkformat::FileMagic.data(), chunkformat::FileMagic.size());
    header[8] = static_cast<std::uint8_t>(kind);
    header[9] = chunkformat::Version;

    if (!writeAll(fd, header.data(), header.size()) || ::fdatasync(fd) != 0)
    {
        auto error = ioError("Cannot write chunk header", path);
        ::close(fd);
        ::unlink(path.c_str());
        return error;
    }

    return std::make_unique<ChunkFileWriter>(PrivateTag {}, std::move(path), kind, fd, chunkformat::HeaderSize);
}

auto ChunkFileWriter::append(Timestamp timestamp,
                             std::uint32_t a,
                             std::uint32_t b,
                             std::span<const std::uint8_t> payload) -> Result<std::int64_t>
{
    if (_fd < 0 || _broken)
        return makeError(ErrorCode::PersistenceError, std::format("Chunk '{}' is not writable", _path));
    if (payload.size() > std::numeric_limits<std::uint32_t>::max())
        return makeError(ErrorCode::PersistenceError, std::format("Unit too large for chunk '{}'", _path));

    auto const offset = _units;
    auto header = std::array<std::uint8_t, chunkformat::RecordHeaderSize> {};
    putU32(header.data(), chunkformat::RecordMagic);
    putU32(header.data() + 4, static_cast<std::uint32_t>(offset));
    putI64(header.data() + 8, toMicros(timestamp));
    putU32(header.data() + 16, a);
    putU32(header.data() + 20, b);
    putU32(header.data() + 24, static_cast<std::uint32_t>(payload.size()));

    if (!writeAll(_fd, header.data(), header.size()) || !writeAll(_fd, payload.data(), payload.size())
        || ::fdatasync(_fd) != 0)
    {
        auto error = ioError("Write to chunk failed", _path);
        _broken = true;
        // Drop the partial record so the chunk stays readable up to the last good unit.
        if (::ftruncate(_fd, _size) != 0)
            log::warning("Cannot truncate broken chunk '{}': {}", _path, std::strerror(errno));
        return error;
    }

    _size += static_cast<std::int64_t>(header.size() + payload.size());
    ++_units;
    return offset;
}

auto ChunkFileWriter::finalize() -> VoidResult
{
    if (_fd < 0)
        return {};

    auto const synced = ::fsync(_fd) == 0;
    auto const closed = ::close(_fd) == 0;
    _fd = -1;
    if (!synced || !closed)
        return ioError("Cannot finalize chunk", _path);

    if (::chmod(_path.c_str(), 0444) != 0)
        return ioError("Cannot make chunk read-only", _path);

    log::debug("Chunk finalized: {} ({} units)", _path, _units);
    return {};
}

void ChunkFileWriter::abandon()
{
    if (_fd < 0)
        return;
    ::close(_fd);
    _fd = -1;
    _broken = true;
    log::warning("Chunk abandoned: {} ({} units kept)", _path, _units);
}

auto ChunkReader::readKind(const std::string& path) -> Result<StreamKind>
{
    auto scanner = RecordScanner { path };
    return scanner.open();
}

auto ChunkReader::readUnit(const std::string& path, std::int64_t offset) -> Result<ChunkRecord>
{
    auto scanner = RecordScanner { path };
    if (auto kind = scanner.open(); !kind)
        return std::unexpected(kind.error());

    while (true)
    {
        auto record = ChunkRecord {};
        auto payloadSize = std::uint32_t { 0 };
        auto more = scanner.nextHeader(record, payloadSize);
        if (!more)
            return std::unexpected(more.error());
        if (!*more)
            break;

        if (record.offset == offset)
        {
            if (auto r = scanner.readPayload(record, payloadSize); !r)
                return std::unexpected(r.error());
            return record;
        }
        if (auto r = scanner.skipPayload(payloadSize); !r)
            return std::unexpected(r.error());
    }
    return makeError(ErrorCode::NotFound, std::format("Chunk '{}' has no unit at offset {}", path, offset));
}

auto ChunkReader::readAll(const std::string& path) -> Result<std::vector<ChunkRecord>>
{
    auto scanner = RecordScanner { path };
    if (auto kind = scanner.open(); !kind)
        return std::unexpected(kind.error());

    auto records = std::vector<ChunkRecord> {};
    while (true)
    {
        auto record = ChunkRecord {};
        auto payloadSize = std::uint32_t { 0 };
        auto more = scanner.nextHeader(record, payloadSize);
        if (!more)
            return std::unexpected(more.error());
        if (!*more)
            break;
        if (auto r = scanner.readPayload(record, payloadSize); !r)
            return std::unexpected(r.error());
        records.push_back(std::move(record));
    }
    return records;
}

auto encodePcm(std::span<const float> samples) -> std::vector<std::uint8_t>
{
    auto bytes = std::vector<std::uint8_t>(samples.size() * 4);
    for (auto i = size_t { 0 }; i < samples.size(); ++i)
        putU32(bytes.data() + i * 4, std::bit_cast<std::uint32_t>(samples[i]));
    return bytes;
}

auto decodePcm(std::span<const std::uint8_t> bytes) -> Result<std::vector<float>>
{
    if (bytes.size() % 4 != 0)
        return makeError(ErrorCode::IoError, std::format("PCM payload of {} bytes is not float32", bytes.size()));

    auto samples = std::vector<float>(bytes.size() / 4);
    for (auto i = size_t { 0 }; i < samples.size(); ++i)
        samples[i] = std::bit_cast<float>(getU32(bytes.data() + i * 4));
    return samples;
}

} // namespace sightline
