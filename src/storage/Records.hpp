// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Time.hpp>
#include <core/Types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sightline
{

/// @brief Default and maximum page size of a search.
constexpr auto DefaultSearchLimit = std::int64_t { 20 };
constexpr auto MaxSearchLimit = std::int64_t { 1000 };

/// @brief Filters and pagination of a search.
struct SearchQuery
{
    std::string text;                    ///< empty matches everything
    ContentType contentType = ContentType::All;
    std::optional<Timestamp> start;      ///< inclusive
    std::optional<Timestamp> end;        ///< inclusive
    std::optional<std::string> appName;  ///< case-insensitive substring
    std::optional<std::string> windowName;
    std::int64_t limit = DefaultSearchLimit;
    std::int64_t offset = 0;
    bool includeFrames = false;
};

/// @brief A screen text row.
struct OcrResult
{
    std::int64_t ocrId = 0;
    std::int64_t frameId = 0;
    std::string text;
    Timestamp timestamp;
    std::string filePath;
    std::int64_t offsetIndex = 0;
    std::string appName;
    std::string windowName;
    bool focused = false;
    std::vector<std::string> tags;
    std::optional<std::string> frame; ///< base64 JPEG, only with includeFrames
};

/// @brief An audio transcript row.
struct AudioResult
{
    std::int64_t transcriptionId = 0;
    std::int64_t chunkId = 0;
    std::string transcription;
    Timestamp timestamp;
    std::string filePath;
    std::int64_t offsetIndex = 0;
    std::string deviceName;
    bool isInputDevice = true;
    std::vector<std::string> tags;
};

/// @brief A full-text match inside a screen text row.
struct FtsResult
{
    std::int64_t textId = 0;
    std::string matchedText; ///< snippet with the match highlighted
    std::int64_t frameId = 0;
    Timestamp timestamp;
    std::string appName;
    std::string windowName;
    std::string filePath;
    std::int64_t offsetIndex = 0;
    std::optional<std::string> originalFrameText;
    std::vector<std::string> tags;
};

using SearchResult = std::variant<OcrResult, AudioResult, FtsResult>;

/// @brief Timestamp of a search result.
[[nodiscard]] inline auto timestampOf(const SearchResult& result) -> Timestamp
{
    return std::visit([](auto const& r) { return r.timestamp; }, result);
}

/// @brief One page of search results.
struct SearchPage
{
    std::vector<SearchResult> results;
    std::int64_t total = 0;
    std::int64_t limit = DefaultSearchLimit;
    std::int64_t offset = 0;
};

/// @brief A captured frame ready for insertion.
struct FrameRow
{
    ChunkRef chunk;
    Timestamp timestamp;
    std::uint32_t monitorId = 0;
};

/// @brief One window's text ready for insertion.
struct OcrRow
{
    std::string text;
    std::string appName;
    std::string windowName;
    bool focused = false;
};

/// @brief Identifiers assigned by insertFrame().
struct FrameIds
{
    std::int64_t frameId = 0;
    std::vector<std::int64_t> ocrIds;
};

/// @brief A transcribed audio segment ready for insertion.
struct AudioRow
{
    ChunkRef chunk;
    Timestamp start;
    Timestamp end;
    std::string transcription;
    std::string engine;
    std::string deviceName;
    bool isInputDevice = true;
};

/// @brief Newest capture timestamps, per modality.
struct LatestTimestamps
{
    std::optional<Timestamp> frame;
    std::optional<Timestamp> audio;
};

} // namespace sightline
