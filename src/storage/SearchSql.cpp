// SPDX-License-Identifier: Apache-2.0
#include "SearchSql.hpp"

#include <format>

namespace sightline
{

namespace
{

    auto isSpace(char c) -> bool
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }

    /// @brief Builds the UNION ALL of the per-kind selects shared by the page and count queries.
    auto buildUnion(const SearchQuery& query) -> SqlQuery
    {
        auto const match = ftsMatchExpression(query.text);
        auto const hasWindowFilter = query.appName.has_value() || query.windowName.has_value();

        auto result = SqlQuery {};
        auto parts = std::vector<std::string> {};

        auto const addTimeRange = [&](std::string& sql, std::string_view column) {
            if (query.start)
            {
                sql += std::format(" AND {} >= ?", column);
                result.bindings.emplace_back(toMicros(*query.start));
            }
            if (query.end)
            {
                sql += std::format(" AND {} <= ?", column);
                result.bindings.emplace_back(toMicros(*query.end));
            }
        };

        auto const addScreenText = [&](ResultKind kind) {
            auto sql = std::format("SELECT {} AS kind, o.id AS id, f.timestamp AS ts"
                                   " FROM ocr_text o JOIN frames f ON f.id = o.frame_id",
                                   static_cast<std::int64_t>(kind));
            if (!match.empty())
                sql += " JOIN ocr_text_fts ON ocr_text_fts.rowid = o.id";
            sql += " WHERE 1 = 1";
            if (!match.empty())
            {
                sql += " AND ocr_text_fts MATCH ?";
                result.bindings.emplace_back(match);
            }
            addTimeRange(sql, "f.timestamp");
            if (query.appName)
            {
                sql += " AND o.app_name LIKE ? ESCAPE '\\'";
                result.bindings.emplace_back(likeSubstringPattern(*query.appName));
            }
            if (query.windowName)
            {
                sql += " AND o.window_name LIKE ? ESCAPE '\\'";
                result.bindings.emplace_back(likeSubstringPattern(*query.windowName));
            }
            parts.push_back(std::move(sql));
        };

        auto const addAudio = [&]() {
            auto sql = std::format("SELECT {} AS kind, a.id AS id, a.timestamp AS ts FROM audio_transcriptions a",
                                   static_cast<std::int64_t>(ResultKind::Audio));
            if (!match.empty())
                sql += " JOIN audio_transcriptions_fts ON audio_transcriptions_fts.rowid = a.id";
            sql += " WHERE 1 = 1";
            if (!match.empty())
            {
                sql += " AND audio_transcriptions_fts MATCH ?";
                result.bindings.emplace_back(match);
            }
            addTimeRange(sql, "a.timestamp");
            // Audio has no app or window; such filters exclude it.
            if (hasWindowFilter)
                sql += " AND 0";
            parts.push_back(std::move(sql));
        };

        switch (query.contentType)
        {
            case ContentType::All:
                addScreenText(ResultKind::Ocr);
                addAudio();
                break;
            case ContentType::Ocr: addScreenText(ResultKind::Ocr); break;
            case ContentType::Audio: addAudio(); break;
            case ContentType::Fts: addScreenText(ResultKind::Fts); break;
        }

        for (auto const& part: parts)
        {
            if (!result.sql.empty())
                result.sql += " UNION ALL ";
            result.sql += part;
        }
        return result;
    }

} // namespace

auto ftsMatchExpression(std::string_view text) -> std::string
{
    auto expression = std::string {};
    auto pos = size_t { 0 };
    while (pos < text.size())
    {
        while (pos < text.size() && isSpace(text[pos]))
            ++pos;
        auto const begin = pos;
        while (pos < text.size() && !isSpace(text[pos]))
            ++pos;
        if (pos == begin)
            continue;

        if (!expression.empty())
            expression += ' ';
        expression += '"';
        for (auto const c: text.substr(begin, pos - begin))
        {
            if (c == '"')
                expression += '"';
            expression += c;
        }
        expression += '"';
    }
    return expression;
}

auto likeSubstringPattern(std::string_view text) -> std::string
{
    auto pattern = std::string { "%" };
    for (auto const c: text)
    {
        if (c == '%' || c == '_' || c == '\\')
            pattern += '\\';
        pattern += c;
    }
    pattern += '%';
    return pattern;
}

auto buildSearchSql(const SearchQuery& query) -> SqlQuery
{
    auto result = buildUnion(query);
    result.sql = std::format("SELECT kind, id, ts FROM ({}) ORDER BY ts DESC, kind ASC, id DESC LIMIT ? OFFSET ?",
                             result.sql);
    result.bindings.emplace_back(query.limit);
    result.bindings.emplace_back(query.offset);
    return result;
}

auto buildCountSql(const SearchQuery& query) -> SqlQuery
{
    auto result = buildUnion(query);
    result.sql = std::format("SELECT COUNT(*) FROM ({})", result.sql);
    return result;
}

} // namespace sightline
