// SPDX-License-Identifier: Apache-2.0
#include "Base64.hpp"

#include <array>

namespace sightline::base64
{

namespace
{
    constexpr auto Alphabet =
        std::string_view { "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/" };

    constexpr auto DecodeTable = [] {
        auto table = std::array<int, 256> {};
        table.fill(-1);
        for (auto i = 0; i < 64; ++i)
            table[static_cast<unsigned char>(Alphabet[static_cast<size_t>(i)])] = i;
        return table;
    }();
} // namespace

auto encode(std::span<const std::uint8_t> data) -> std::string
{
    auto out = std::string {};
    out.reserve(((data.size() + 2) / 3) * 4);

    auto i = size_t { 0 };
    for (; i + 2 < data.size(); i += 3)
    {
        auto const v = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out.push_back(Alphabet[(v >> 18) & 0x3F]);
        out.push_back(Alphabet[(v >> 12) & 0x3F]);
        out.push_back(Alphabet[(v >> 6) & 0x3F]);
        out.push_back(Alphabet[v & 0x3F]);
    }

    auto const rest = data.size() - i;
    if (rest == 1)
    {
        auto const v = data[i] << 16;
        out.push_back(Alphabet[(v >> 18) & 0x3F]);
        out.push_back(Alphabet[(v >> 12) & 0x3F]);
        out += "==";
    }
    else if (rest == 2)
    {
        auto const v = (data[i] << 16) | (data[i + 1] << 8);
        out.push_back(Alphabet[(v >> 18) & 0x3F]);
        out.push_back(Alphabet[(v >> 12) & 0x3F]);
        out.push_back(Alphabet[(v >> 6) & 0x3F]);
        out.push_back('=');
    }

    return out;
}

auto decode(std::string_view text) -> Result<std::vector<std::uint8_t>>
{
    if (text.size() % 4 != 0)
        return makeError(ErrorCode::InvalidArgument, "base64 input length is not a multiple of 4");

    auto out = std::vector<std::uint8_t> {};
    out.reserve(text.size() / 4 * 3);

    for (auto i = size_t { 0 }; i < text.size(); i += 4)
    {
        auto quad = std::array<int, 4> {};
        auto padding = 0;
        for (auto j = 0; j < 4; ++j)
        {
            auto const c = static_cast<unsigned char>(text[i + static_cast<size_t>(j)]);
            if (c == '=' && i + 4 == text.size() && j >= 2)
            {
                quad[static_cast<size_t>(j)] = 0;
                ++padding;
                continue;
            }
            if (padding > 0 || DecodeTable[c] < 0)
                return makeError(ErrorCode::InvalidArgument, "invalid base64 character");
            quad[static_cast<size_t>(j)] = DecodeTable[c];
        }

        auto const v = (quad[0] << 18) | (quad[1] << 12) | (quad[2] << 6) | quad[3];
        out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
        if (padding < 2)
            out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
        if (padding < 1)
            out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    }

    return out;
}

} // namespace sightline::base64
