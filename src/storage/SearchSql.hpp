// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <storage/Records.hpp>
#include <storage/SqliteDb.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sightline
{

/// @brief Kind column of a search row; also the tie-breaker of the ordering key.
enum class ResultKind : std::int64_t
{
    Ocr = 0,
    Audio = 1,
    Fts = 2,
};

/// @brief SQL text plus its positional bindings.
struct SqlQuery
{
    std::string sql;
    std::vector<SqlValue> bindings;
};

/// @brief Turns free text into an FTS5 MATCH expression.
///
/// Every whitespace separated token becomes a quoted phrase, so operators and
/// punctuation are matched literally and the tokens are implicitly ANDed.
/// Returns an empty string when the text has no tokens.
[[nodiscard]] auto ftsMatchExpression(std::string_view text) -> std::string;

/// @brief Escapes a LIKE pattern for a substring match with ESCAPE '\'.
[[nodiscard]] auto likeSubstringPattern(std::string_view text) -> std::string;

/// @brief Page query: rows of (kind, id, timestamp) ordered by timestamp DESC, kind, id DESC.
[[nodiscard]] auto buildSearchSql(const SearchQuery& query) -> SqlQuery;

/// @brief Count query over exactly the rows buildSearchSql() pages through.
[[nodiscard]] auto buildCountSql(const SearchQuery& query) -> SqlQuery;

} // namespace sightline
