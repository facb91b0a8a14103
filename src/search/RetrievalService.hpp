// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <storage/Archive.hpp>
#include <storage/Records.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sightline
{

/// @brief What to do when a requested frame cannot be loaded.
enum class FramePolicy : std::uint8_t
{
    OmitRow,   ///< keep the row without a frame and log the failure
    FailBatch, ///< fail the whole request
};

[[nodiscard]] constexpr auto framePolicyFromString(std::string_view str) -> std::optional<FramePolicy>
{
    if (str == "omit")
        return FramePolicy::OmitRow;
    if (str == "fail")
        return FramePolicy::FailBatch;
    return std::nullopt;
}

[[nodiscard]] constexpr auto framePolicyToString(FramePolicy policy) -> std::string_view
{
    return policy == FramePolicy::OmitRow ? "omit" : "fail";
}

/// @brief Read side of the archive: validated, paginated, filtered search.
class RetrievalService
{
  public:
    RetrievalService(Archive& archive, FramePolicy framePolicy);

    /// @brief Validates a query and applies the filter rules.
    ///
    /// An app or window filter forces the content type to OCR.
    /// @return The effective query, or a QueryError.
    [[nodiscard]] static auto normalize(SearchQuery query) -> Result<SearchQuery>;

    /// @brief Runs a search.
    /// @return The page with the total match count, or a QueryError / DatabaseError /
    ///         (with FramePolicy::FailBatch) the frame loading error.
    [[nodiscard]] auto search(const SearchQuery& query) -> Result<SearchPage>;

    /// @brief Loads the stored JPEG of a frame as base64.
    [[nodiscard]] auto loadFrame(const std::string& path, std::int64_t offset) const -> Result<std::string>;

  private:
    Archive& _archive;
    FramePolicy _framePolicy;
};

} // namespace sightline
