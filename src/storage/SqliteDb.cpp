// SPDX-License-Identifier: Apache-2.0
#include "SqliteDb.hpp"

#include <core/Log.hpp>

#include <format>
#include <type_traits>
#include <utility>

namespace sightline
{

auto databaseError(sqlite3* db, std::string_view what) -> std::unexpected<Error>
{
    auto const* message = db ? sqlite3_errmsg(db) : "no connection";
    return makeError(ErrorCode::DatabaseError, std::format("{}: {}", what, message));
}

Statement::~Statement()
{
    if (_stmt)
        sqlite3_finalize(_stmt);
}

Statement::Statement(Statement&& other) noexcept:
    _db(std::exchange(other._db, nullptr)), _stmt(std::exchange(other._stmt, nullptr))
{
}

Statement& Statement::operator=(Statement&& other) noexcept
{
    if (this != &other)
    {
        if (_stmt)
            sqlite3_finalize(_stmt);
        _db = std::exchange(other._db, nullptr);
        _stmt = std::exchange(other._stmt, nullptr);
    }
    return *this;
}

auto Statement::bind(int index, const SqlValue& value) -> VoidResult
{
    auto const rc = std::visit(
        [&](auto const& v) -> int {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>)
                return sqlite3_bind_null(_stmt, index);
            else if constexpr (std::is_same_v<T, std::int64_t>)
                return sqlite3_bind_int64(_stmt, index, static_cast<sqlite3_int64>(v));
            else if constexpr (std::is_same_v<T, double>)
                return sqlite3_bind_double(_stmt, index, v);
            else
                return sqlite3_bind_text(_stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        },
        value);

    if (rc != SQLITE_OK)
        return databaseError(_db, std::format("bind parameter {}", index));
    return {};
}

auto Statement::bindAll(const std::vector<SqlValue>& values) -> VoidResult
{
    for (auto i = size_t { 0 }; i < values.size(); ++i)
        if (auto bound = bind(static_cast<int>(i + 1), values[i]); !bound)
            return bound;
    return {};
}

auto Statement::step() -> Result<bool>
{
    auto const rc = sqlite3_step(_stmt);
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;
    return databaseError(_db, "step");
}

auto Statement::run() -> VoidResult
{
    auto result = step();
    if (!result)
        return std::unexpected(result.error());
    return {};
}

auto Statement::columnInt64(int col) const -> std::int64_t
{
    return static_cast<std::int64_t>(sqlite3_column_int64(_stmt, col));
}

auto Statement::columnText(int col) const -> std::string
{
    auto const* text = sqlite3_column_text(_stmt, col);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string {};
}

auto Statement::columnIsNull(int col) const -> bool
{
    return sqlite3_column_type(_stmt, col) == SQLITE_NULL;
}

auto SqliteDb::open(const std::string& path, bool readOnly) -> Result<std::unique_ptr<SqliteDb>>
{
    auto const flags = (readOnly ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE))
                       | SQLITE_OPEN_FULLMUTEX;

    sqlite3* handle = nullptr;
    auto const rc = sqlite3_open_v2(path.c_str(), &handle, flags, nullptr);
    if (rc != SQLITE_OK)
    {
        auto error = databaseError(handle, std::format("open '{}'", path));
        if (handle)
            sqlite3_close(handle);
        return error;
    }

    auto db = std::make_unique<SqliteDb>(PrivateTag {}, handle, path);

    // Wait for locks instead of failing immediately.
    if (sqlite3_busy_timeout(handle, 5000) != SQLITE_OK)
        return databaseError(handle, "busy_timeout");

    if (!readOnly)
    {
        // WAL lets the read connection run searches while capture writes.
        if (auto r = db->exec("PRAGMA journal_mode=WAL; PRAGMA synchronous=NORMAL; PRAGMA foreign_keys=ON;"); !r)
            return std::unexpected(r.error());
    }
    if (auto r = db->exec("PRAGMA temp_store=MEMORY; PRAGMA cache_size=-20000;"); !r)
        return std::unexpected(r.error());

    return db;
}

SqliteDb::~SqliteDb()
{
    if (_db)
        sqlite3_close(_db);
}

auto SqliteDb::exec(std::string_view sql) -> VoidResult
{
    char* err = nullptr;
    auto const statement = std::string(sql);
    auto const rc = sqlite3_exec(_db, statement.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK)
    {
        auto message = std::string(err ? err : sqlite3_errmsg(_db));
        sqlite3_free(err);
        return makeError(ErrorCode::DatabaseError, std::format("exec failed: {}", message));
    }
    return {};
}

auto SqliteDb::prepare(std::string_view sql) -> Result<Statement>
{
    sqlite3_stmt* stmt = nullptr;
    auto const rc = sqlite3_prepare_v2(_db, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK)
        return databaseError(_db, "prepare");
    return Statement { _db, stmt };
}

auto SqliteDb::lastInsertId() const -> std::int64_t
{
    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(_db));
}

Transaction::~Transaction()
{
    if (!_active)
        return;
    if (auto r = _db.exec("ROLLBACK;"); !r)
        log::error("Rollback failed on {}: {}", _db.path(), r.error());
}

auto Transaction::begin() -> VoidResult
{
    if (auto r = _db.exec("BEGIN IMMEDIATE;"); !r)
        return r;
    _active = true;
    return {};
}

auto Transaction::commit() -> VoidResult
{
    if (auto r = _db.exec("COMMIT;"); !r)
        return r;
    _active = false;
    return {};
}

} // namespace sightline
