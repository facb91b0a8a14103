// SPDX-License-Identifier: Apache-2.0
#include "FrameEncoder.hpp"

#include <stb_image.h>
#include <stb_image_write.h>

#include <algorithm>
#include <format>
#include <limits>

namespace sightline
{

namespace
{
    void appendBytes(void* context, void* data, int size)
    {
        auto* out = static_cast<std::vector<std::uint8_t>*>(context);
        auto const* bytes = static_cast<const std::uint8_t*>(data);
        out->insert(out->end(), bytes, bytes + size);
    }
} // namespace

auto encodeJpeg(const Image& image, int quality) -> Result<std::vector<std::uint8_t>>
{
    if (image.empty() || image.pixels.size() < image.byteSize())
        return makeError(ErrorCode::VisionError,
                         std::format("Cannot encode {}x{} image with {} bytes",
                                     image.width,
                                     image.height,
                                     image.pixels.size()));

    auto jpeg = std::vector<std::uint8_t> {};
    auto const ok = stbi_write_jpg_to_func(
        appendBytes, &jpeg, image.width, image.height, 4, image.pixels.data(), std::clamp(quality, 1, 100));
    if (!ok || jpeg.empty())
        return makeError(ErrorCode::VisionError, "JPEG encoding failed");

    return jpeg;
}

auto decodeImage(std::span<const std::uint8_t> bytes) -> Result<Image>
{
    if (bytes.empty() || bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max()))
        return makeError(ErrorCode::VisionError, std::format("Invalid image buffer of {} bytes", bytes.size()));

    int width = 0;
    int height = 0;
    int channels = 0;
    auto* data = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()), &width, &height, &channels, 4);
    if (!data)
    {
        auto const* reason = stbi_failure_reason();
        return makeError(ErrorCode::VisionError,
                         std::format("Image decoding failed: {}", reason ? reason : "unknown"));
    }

    auto image = Image { .width = width, .height = height, .pixels = {} };
    image.pixels.assign(data, data + image.byteSize());
    stbi_image_free(data);
    return image;
}

} // namespace sightline
