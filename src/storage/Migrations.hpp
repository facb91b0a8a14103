// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <storage/SqliteDb.hpp>

namespace sightline
{

/// @brief Current schema version (PRAGMA user_version).
constexpr auto SchemaVersion = 1;

/// @brief Brings the schema up to SchemaVersion, one transaction per step.
/// @return Success, or a DatabaseError (also when the file is newer than this build).
[[nodiscard]] auto migrate(SqliteDb& db) -> VoidResult;

/// @brief Reads PRAGMA user_version.
[[nodiscard]] auto schemaVersion(SqliteDb& db) -> Result<int>;

} // namespace sightline
