// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <vision/Image.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace sightline
{

/// @brief A physical display.
struct MonitorInfo
{
    std::uint32_t id = 0;
    std::string name;
    int width = 0;
    int height = 0;
    bool isDefault = false;
};

/// @brief A visible top-level window on a monitor.
struct WindowInfo
{
    std::string appName;
    std::string windowName;
    Rect bounds; ///< relative to the monitor origin
    bool focused = false;
};

/// @brief One screenshot of a monitor plus the windows visible on it.
struct Screenshot
{
    Image image;
    std::vector<WindowInfo> windows;
};

/// @brief Platform screen capturer.
///
/// capture() may be called concurrently for different monitors.
class ScreenCapture
{
  public:
    virtual ~ScreenCapture() = default;

    [[nodiscard]] virtual auto listMonitors() -> Result<std::vector<MonitorInfo>> = 0;

    /// @brief Captures a monitor.
    /// @return The screenshot or a VisionError (monitor gone, display lost, ...).
    [[nodiscard]] virtual auto capture(std::uint32_t monitorId) -> Result<Screenshot> = 0;
};

} // namespace sightline
