// SPDX-License-Identifier: Apache-2.0
#include "WindowFilter.hpp"

#include <algorithm>
#include <cctype>

namespace sightline
{

namespace
{
    auto toLower(std::string_view s) -> std::string
    {
        auto result = std::string(s);
        std::ranges::transform(result, result.begin(), [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    auto lowered(std::vector<std::string> patterns) -> std::vector<std::string>
    {
        std::erase_if(patterns, [](const std::string& p) { return p.empty(); });
        for (auto& pattern: patterns)
            pattern = toLower(pattern);
        return patterns;
    }
} // namespace

auto containsIgnoreCase(std::string_view haystack, std::string_view needle) -> bool
{
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

WindowFilter::WindowFilter(std::vector<std::string> included, std::vector<std::string> ignored):
    _included(lowered(std::move(included))), _ignored(lowered(std::move(ignored)))
{
}

auto WindowFilter::accepts(std::string_view appName, std::string_view windowName) const -> bool
{
    auto const app = toLower(appName);
    auto const window = toLower(windowName);
    auto const matches = [&](const std::string& pattern) {
        return app.find(pattern) != std::string::npos || window.find(pattern) != std::string::npos;
    };

    if (std::ranges::any_of(_ignored, matches))
        return false;

    return _included.empty() || std::ranges::any_of(_included, matches);
}

} // namespace sightline
