// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sightline
{

/// @brief Content filter of a search request.
enum class ContentType : std::uint8_t
{
    All,
    Ocr,
    Audio,
    Fts,
};

/// @brief Converts a ContentType to its wire name.
[[nodiscard]] constexpr auto contentTypeToString(ContentType type) -> std::string_view
{
    switch (type)
    {
        case ContentType::All: return "all";
        case ContentType::Ocr: return "ocr";
        case ContentType::Audio: return "audio";
        case ContentType::Fts: return "fts";
    }
    return "all";
}

/// @brief Parses a content type name ("all", "ocr", "audio", "fts").
[[nodiscard]] constexpr auto contentTypeFromString(std::string_view str) -> std::optional<ContentType>
{
    if (str == "all" || str.empty())
        return ContentType::All;
    if (str == "ocr")
        return ContentType::Ocr;
    if (str == "audio")
        return ContentType::Audio;
    if (str == "fts")
        return ContentType::Fts;
    return std::nullopt;
}

/// @brief Origin of a taggable content id.
enum class TagContentType : std::uint8_t
{
    Vision, ///< The id is a frame id.
    Audio,  ///< The id is an audio transcription id.
};

/// @brief Parses a tag content type name ("vision", "audio").
[[nodiscard]] constexpr auto tagContentTypeFromString(std::string_view str) -> std::optional<TagContentType>
{
    if (str == "vision")
        return TagContentType::Vision;
    if (str == "audio")
        return TagContentType::Audio;
    return std::nullopt;
}

[[nodiscard]] constexpr auto tagContentTypeToString(TagContentType type) -> std::string_view
{
    return type == TagContentType::Vision ? "vision" : "audio";
}

/// @brief Axis-aligned rectangle in monitor pixel coordinates.
struct Rect
{
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    [[nodiscard]] auto empty() const -> bool { return width <= 0 || height <= 0; }

    auto operator==(const Rect&) const -> bool = default;
};

/// @brief Address of one unit (frame or audio segment) inside a chunk file.
struct ChunkRef
{
    std::string path;
    std::int64_t offset = 0;

    auto operator==(const ChunkRef&) const -> bool = default;
};

} // namespace sightline
