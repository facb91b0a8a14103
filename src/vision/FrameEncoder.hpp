// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <vision/Image.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace sightline
{

/// @brief Default JPEG quality of stored frames.
constexpr auto DefaultJpegQuality = 80;

/// @brief Encodes an RGBA image as JPEG (alpha is dropped).
/// @return The JPEG bytes or a VisionError.
[[nodiscard]] auto encodeJpeg(const Image& image, int quality = DefaultJpegQuality)
    -> Result<std::vector<std::uint8_t>>;

/// @brief Decodes a JPEG (or any format stb_image reads) into RGBA.
/// @return The image or a VisionError.
[[nodiscard]] auto decodeImage(std::span<const std::uint8_t> bytes) -> Result<Image>;

} // namespace sightline
