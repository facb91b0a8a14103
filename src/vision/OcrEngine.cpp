// SPDX-License-Identifier: Apache-2.0
#include "OcrEngine.hpp"

namespace sightline
{

auto joinText(const std::vector<OcrTextBlock>& blocks) -> std::string
{
    auto text = std::string {};
    for (auto const& block: blocks)
    {
        if (block.text.empty())
            continue;
        if (!text.empty())
            text += '\n';
        text += block.text;
    }
    return text;
}

} // namespace sightline
