// SPDX-License-Identifier: Apache-2.0
#include "Image.hpp"

#include <algorithm>
#include <cstring>

namespace sightline
{

auto intersect(Rect a, Rect b) -> Rect
{
    auto const left = std::max(a.x, b.x);
    auto const top = std::max(a.y, b.y);
    auto const right = std::min(a.x + a.width, b.x + b.width);
    auto const bottom = std::min(a.y + a.height, b.y + b.height);
    if (right <= left || bottom <= top)
        return Rect {};
    return Rect { .x = left, .y = top, .width = right - left, .height = bottom - top };
}

auto clipTo(Rect rect, Rect area) -> Rect
{
    auto clipped = intersect(rect, area);
    if (clipped.empty())
        return Rect {};
    clipped.x -= area.x;
    clipped.y -= area.y;
    return clipped;
}

auto Image::crop(Rect region) const -> Image
{
    auto const clipped = intersect(region, bounds());
    if (clipped.empty())
        return Image {};

    auto result = Image { .width = clipped.width, .height = clipped.height, .pixels = {} };
    result.pixels.resize(result.byteSize());

    auto const rowBytes = static_cast<size_t>(clipped.width) * 4;
    for (auto row = 0; row < clipped.height; ++row)
    {
        auto const* src = pixels.data() + (static_cast<size_t>(clipped.y + row) * width + clipped.x) * 4;
        std::memcpy(result.pixels.data() + static_cast<size_t>(row) * rowBytes, src, rowBytes);
    }
    return result;
}

} // namespace sightline
