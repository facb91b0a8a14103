// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sightline
{

/// @brief Allow/deny lists for windows, matched case-insensitively as substrings
/// of the app name or the window name.
///
/// A window matching the deny list is rejected even if it also matches the allow list.
/// An empty allow list allows every window.
class WindowFilter
{
  public:
    WindowFilter() = default;
    WindowFilter(std::vector<std::string> included, std::vector<std::string> ignored);

    [[nodiscard]] auto accepts(std::string_view appName, std::string_view windowName) const -> bool;

  private:
    std::vector<std::string> _included;
    std::vector<std::string> _ignored;
};

/// @brief Case-insensitive (ASCII) substring test.
[[nodiscard]] auto containsIgnoreCase(std::string_view haystack, std::string_view needle) -> bool;

} // namespace sightline
