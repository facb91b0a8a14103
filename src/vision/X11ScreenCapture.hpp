// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vision/ScreenCapture.hpp>

#include <memory>
#include <string_view>

namespace sightline
{

/// @brief ScreenCapture on top of Xlib and the RandR extension.
///
/// Monitors are the active RandR monitors of the default screen, so one X screen
/// spanning several outputs yields one monitor per output. Without RandR 1.5 the
/// whole screen is monitor 0. Windows are the EWMH client list (_NET_CLIENT_LIST),
/// named by _NET_WM_NAME and WM_CLASS, clipped to the monitor.
///
/// A lost display connection is reported as a VisionError instead of terminating the
/// process; the next call reconnects.
class X11ScreenCapture: public ScreenCapture
{
  public:
    X11ScreenCapture();
    ~X11ScreenCapture() override;

    X11ScreenCapture(const X11ScreenCapture&) = delete;
    X11ScreenCapture& operator=(const X11ScreenCapture&) = delete;

    /// @brief Connects to the X server.
    /// @param displayName Display to open; empty uses $DISPLAY.
    [[nodiscard]] auto open(std::string_view displayName = {}) -> VoidResult;

    [[nodiscard]] auto listMonitors() -> Result<std::vector<MonitorInfo>> override;
    [[nodiscard]] auto capture(std::uint32_t monitorId) -> Result<Screenshot> override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace sightline
