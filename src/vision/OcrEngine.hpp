// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <vision/Image.hpp>

#include <string>
#include <vector>

namespace sightline
{

/// @brief A recognised text line.
struct OcrTextBlock
{
    std::string text;
    Rect bounds;
    float confidence = 0.0f;
};

/// @brief Optical character recognition engine.
class OcrEngine
{
  public:
    virtual ~OcrEngine() = default;

    /// @brief Recognises text in an RGBA image.
    /// @return The text blocks in reading order, or an OcrError.
    [[nodiscard]] virtual auto recognize(const Image& image) -> Result<std::vector<OcrTextBlock>> = 0;
};

/// @brief Joins the texts of the blocks with newlines, skipping empty ones.
[[nodiscard]] auto joinText(const std::vector<OcrTextBlock>& blocks) -> std::string;

} // namespace sightline
