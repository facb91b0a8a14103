// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstdint>
#include <vector>

namespace sightline
{

/// @brief Tightly packed 8-bit RGBA image.
struct Image
{
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> pixels; ///< width * height * 4 bytes, row-major

    [[nodiscard]] auto empty() const -> bool { return width <= 0 || height <= 0 || pixels.empty(); }

    [[nodiscard]] auto byteSize() const -> size_t { return static_cast<size_t>(width) * height * 4; }

    /// @brief Returns the sub-image covered by region, clipped to the image bounds.
    [[nodiscard]] auto crop(Rect region) const -> Image;

    /// @brief Returns the whole-image rectangle.
    [[nodiscard]] auto bounds() const -> Rect { return Rect { .x = 0, .y = 0, .width = width, .height = height }; }
};

/// @brief Intersection of two rectangles (empty when disjoint).
[[nodiscard]] auto intersect(Rect a, Rect b) -> Rect;

/// @brief Clips rect to area and expresses the result relative to the area's origin.
[[nodiscard]] auto clipTo(Rect rect, Rect area) -> Rect;

} // namespace sightline
