// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sightline
{

/// @brief A value bound to a statement parameter.
using SqlValue = std::variant<std::nullptr_t, std::int64_t, double, std::string>;

/// @brief RAII prepared statement.
class Statement
{
  public:
    Statement() = default;
    Statement(sqlite3* db, sqlite3_stmt* stmt): _db(db), _stmt(stmt) {}
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /// @brief Binds a 1-based parameter.
    [[nodiscard]] auto bind(int index, const SqlValue& value) -> VoidResult;

    /// @brief Binds all values in order, starting at parameter 1.
    [[nodiscard]] auto bindAll(const std::vector<SqlValue>& values) -> VoidResult;

    /// @brief Advances the statement.
    /// @return true if a row is available, false when done, or a DatabaseError.
    [[nodiscard]] auto step() -> Result<bool>;

    /// @brief Runs a statement that returns no rows.
    [[nodiscard]] auto run() -> VoidResult;

    [[nodiscard]] auto columnInt64(int col) const -> std::int64_t;
    [[nodiscard]] auto columnText(int col) const -> std::string;
    [[nodiscard]] auto columnIsNull(int col) const -> bool;

    [[nodiscard]] auto handle() const -> sqlite3_stmt* { return _stmt; }

  private:
    sqlite3* _db = nullptr;
    sqlite3_stmt* _stmt = nullptr;
};

/// @brief Thin RAII wrapper around a sqlite3 connection.
class SqliteDb
{
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

  public:
    SqliteDb(PrivateTag, sqlite3* db, std::string path): _db(db), _path(std::move(path)) {}

    /// @brief Opens (and for read-write, creates) a database and applies the connection pragmas.
    /// @param path Database file.
    /// @param readOnly Opens a read-only connection (WAL readers do not block the writer).
    [[nodiscard]] static auto open(const std::string& path, bool readOnly) -> Result<std::unique_ptr<SqliteDb>>;

    ~SqliteDb();

    SqliteDb(const SqliteDb&) = delete;
    SqliteDb& operator=(const SqliteDb&) = delete;

    /// @brief Executes one or more SQL statements (pragmas, migrations, transaction control).
    [[nodiscard]] auto exec(std::string_view sql) -> VoidResult;

    [[nodiscard]] auto prepare(std::string_view sql) -> Result<Statement>;

    [[nodiscard]] auto lastInsertId() const -> std::int64_t;

    [[nodiscard]] auto handle() const -> sqlite3* { return _db; }
    [[nodiscard]] auto path() const -> const std::string& { return _path; }

  private:
    sqlite3* _db = nullptr;
    std::string _path;
};

/// @brief Write transaction scope; BEGIN IMMEDIATE takes the write lock up front.
///
/// Rolls back on destruction unless committed.
class Transaction
{
  public:
    explicit Transaction(SqliteDb& db): _db(db) {}
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    [[nodiscard]] auto begin() -> VoidResult;
    [[nodiscard]] auto commit() -> VoidResult;

  private:
    SqliteDb& _db;
    bool _active = false;
};

/// @brief Builds a DatabaseError from the connection's last error.
[[nodiscard]] auto databaseError(sqlite3* db, std::string_view what) -> std::unexpected<Error>;

} // namespace sightline
