// SPDX-License-Identifier: Apache-2.0
#include "X11ScreenCapture.hpp"

#include <core/Log.hpp>

#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/extensions/Xrandr.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <bit>
#include <format>
#include <mutex>
#include <optional>
#include <string>

namespace sightline
{

namespace
{

    auto ignoreXError(Display* display, XErrorEvent* event) -> int
    {
        // Windows routinely vanish between listing and querying them.
        auto buffer = std::array<char, 256> {};
        XGetErrorText(display, event->error_code, buffer.data(), static_cast<int>(buffer.size()));
        log::trace("X error ignored: {} (request {})", buffer.data(), static_cast<int>(event->request_code));
        return 0;
    }

    /// @brief Reads a window property as raw items. The caller owns nothing; data is copied.
    template <typename T>
    auto readProperty(Display* display, Window window, Atom property, Atom type) -> std::vector<T>
    {
        Atom actualType = None;
        int actualFormat = 0;
        unsigned long itemCount = 0;
        unsigned long bytesAfter = 0;
        unsigned char* data = nullptr;

        auto const status = XGetWindowProperty(display,
                                               window,
                                               property,
                                               0,
                                               (~0L),
                                               False,
                                               type,
                                               &actualType,
                                               &actualFormat,
                                               &itemCount,
                                               &bytesAfter,
                                               &data);

        auto result = std::vector<T> {};
        if (status == Success && data && actualType == type)
        {
            auto const* items = reinterpret_cast<const T*>(data);
            result.assign(items, items + itemCount);
        }
        if (data)
            XFree(data);
        return result;
    }

    struct ColorChannel
    {
        unsigned long mask = 0;
        int shift = 0;
        unsigned long max = 0;

        explicit ColorChannel(unsigned long m): mask(m)
        {
            if (mask == 0)
                return;
            shift = std::countr_zero(mask);
            max = mask >> shift;
        }

        [[nodiscard]] auto extract(unsigned long pixel) const -> std::uint8_t
        {
            if (max == 0)
                return 0;
            auto const value = (pixel & mask) >> shift;
            return static_cast<std::uint8_t>(max == 255 ? value : value * 255 / max);
        }
    };

    auto toImage(XImage* ximage) -> Image
    {
        auto image = Image { .width = ximage->width, .height = ximage->height, .pixels = {} };
        image.pixels.resize(image.byteSize());

        auto const red = ColorChannel { ximage->red_mask };
        auto const green = ColorChannel { ximage->green_mask };
        auto const blue = ColorChannel { ximage->blue_mask };

        auto* out = image.pixels.data();
        for (auto y = 0; y < ximage->height; ++y)
        {
            for (auto x = 0; x < ximage->width; ++x)
            {
                auto const pixel = XGetPixel(ximage, x, y);
                *out++ = red.extract(pixel);
                *out++ = green.extract(pixel);
                *out++ = blue.extract(pixel);
                *out++ = 0xFF;
            }
        }
        return image;
    }

    auto logIoError(Display* display) -> int
    {
        log::error("X display {} connection lost", DisplayString(display));
        return 0;
    }

    /// @brief A monitor with its rectangle in root window coordinates.
    struct MonitorArea
    {
        MonitorInfo info;
        Rect area;
    };

} // namespace

struct X11ScreenCapture::Impl
{
    Display* display = nullptr;
    std::string displayName;
    std::mutex mutex;
    std::atomic<bool> connectionLost = false;
    bool opened = false;
    bool randrMonitors = false;

    Atom clientList = None;
    Atom activeWindow = None;
    Atom wmName = None;
    Atom utf8String = None;

    ~Impl() { disconnect(); }

    /// @brief Replaces Xlib's default exit() on a broken connection.
    static void onConnectionLost(Display* /*display*/, void* userData)
    {
        static_cast<Impl*>(userData)->connectionLost = true;
    }

    [[nodiscard]] auto connect() -> VoidResult
    {
        display = XOpenDisplay(displayName.empty() ? nullptr : displayName.c_str());
        if (!display)
            return makeError(ErrorCode::VisionError,
                             std::format("Cannot open X display '{}'", displayName.empty() ? "$DISPLAY" : displayName));

        connectionLost = false;
        XSetIOErrorExitHandler(display, &Impl::onConnectionLost, this);

        clientList = XInternAtom(display, "_NET_CLIENT_LIST", False);
        activeWindow = XInternAtom(display, "_NET_ACTIVE_WINDOW", False);
        wmName = XInternAtom(display, "_NET_WM_NAME", False);
        utf8String = XInternAtom(display, "UTF8_STRING", False);

        auto eventBase = 0;
        auto errorBase = 0;
        auto major = 0;
        auto minor = 0;
        randrMonitors = XRRQueryExtension(display, &eventBase, &errorBase)
                        && XRRQueryVersion(display, &major, &minor)
                        && (major > 1 || (major == 1 && minor >= 5));
        if (!randrMonitors)
            log::warning("X display {} lacks RandR 1.5; the whole screen is one monitor", DisplayString(display));
        return {};
    }

    void disconnect()
    {
        // XCloseDisplay skips the final round trip on a connection marked broken.
        if (display)
            XCloseDisplay(display);
        display = nullptr;
    }

    /// @brief Ensures a live connection, reconnecting after a lost one.
    [[nodiscard]] auto ensureConnected() -> VoidResult
    {
        if (display && !connectionLost)
            return {};
        if (!opened)
            return makeError(ErrorCode::VisionError, "X display not open");

        disconnect();
        if (auto connected = connect(); !connected)
            return connected;
        log::info("Reconnected to X display {}", DisplayString(display));
        return {};
    }

    [[nodiscard]] auto checkConnection(std::string_view what) const -> VoidResult
    {
        if (connectionLost)
            return makeError(ErrorCode::VisionError, std::format("X display connection lost during {}", what));
        return {};
    }

    [[nodiscard]] auto monitors() const -> std::vector<MonitorArea>
    {
        auto const screen = DefaultScreen(display);
        auto const root = RootWindow(display, screen);
        auto areas = std::vector<MonitorArea> {};

        if (randrMonitors)
        {
            auto count = 0;
            auto* infos = XRRGetMonitors(display, root, True, &count);
            for (auto i = 0; infos && i < count; ++i)
            {
                auto const& m = infos[i];
                auto name = std::format("monitor {}", i);
                if (char* atomName = m.name != None ? XGetAtomName(display, m.name) : nullptr)
                {
                    name = atomName;
                    XFree(atomName);
                }
                areas.push_back(MonitorArea {
                    .info = MonitorInfo { .id = static_cast<std::uint32_t>(i),
                                          .name = std::move(name),
                                          .width = m.width,
                                          .height = m.height,
                                          .isDefault = m.primary != 0 },
                    .area = Rect { .x = m.x, .y = m.y, .width = m.width, .height = m.height },
                });
            }
            if (infos)
                XRRFreeMonitors(infos);

            if (!areas.empty() && std::ranges::none_of(areas, [](auto const& a) { return a.info.isDefault; }))
                areas.front().info.isDefault = true;
        }

        if (areas.empty())
        {
            auto const width = DisplayWidth(display, screen);
            auto const height = DisplayHeight(display, screen);
            areas.push_back(MonitorArea {
                .info = MonitorInfo { .id = 0,
                                      .name = std::format("{} screen {}", DisplayString(display), screen),
                                      .width = width,
                                      .height = height,
                                      .isDefault = true },
                .area = Rect { .x = 0, .y = 0, .width = width, .height = height },
            });
        }
        return areas;
    }

    [[nodiscard]] auto windowName(Window window) const -> std::string
    {
        auto utf8 = readProperty<char>(display, window, wmName, utf8String);
        if (!utf8.empty())
            return std::string(utf8.begin(), utf8.end());

        char* legacy = nullptr;
        auto name = std::string {};
        if (XFetchName(display, window, &legacy) && legacy)
        {
            name = legacy;
            XFree(legacy);
        }
        return name;
    }

    [[nodiscard]] auto appName(Window window) const -> std::string
    {
        auto hint = XClassHint {};
        auto name = std::string {};
        if (XGetClassHint(display, window, &hint))
        {
            if (hint.res_class)
                name = hint.res_class;
            else if (hint.res_name)
                name = hint.res_name;
            if (hint.res_name)
                XFree(hint.res_name);
            if (hint.res_class)
                XFree(hint.res_class);
        }
        return name;
    }

    /// @brief Viewable client windows overlapping @p area, in coordinates relative to it.
    [[nodiscard]] auto listWindows(Rect area) const -> std::vector<WindowInfo>
    {
        auto const root = DefaultRootWindow(display);
        auto const clients = readProperty<Window>(display, root, clientList, XA_WINDOW);
        auto const active = readProperty<Window>(display, root, activeWindow, XA_WINDOW);
        auto const focusedWindow = active.empty() ? Window { None } : active.front();

        auto windows = std::vector<WindowInfo> {};
        for (auto const window: clients)
        {
            auto attributes = XWindowAttributes {};
            if (!XGetWindowAttributes(display, window, &attributes) || attributes.map_state != IsViewable)
                continue;

            int x = 0;
            int y = 0;
            Window child = None;
            if (!XTranslateCoordinates(display, window, root, 0, 0, &x, &y, &child))
                continue;

            auto const bounds =
                clipTo(Rect { .x = x, .y = y, .width = attributes.width, .height = attributes.height }, area);
            if (bounds.empty())
                continue;

            windows.push_back(WindowInfo {
                .appName = appName(window),
                .windowName = windowName(window),
                .bounds = bounds,
                .focused = window == focusedWindow,
            });
        }
        return windows;
    }
};

X11ScreenCapture::X11ScreenCapture(): _impl(std::make_unique<Impl>())
{
}

X11ScreenCapture::~X11ScreenCapture() = default;

auto X11ScreenCapture::open(std::string_view displayName) -> VoidResult
{
    XInitThreads();
    XSetErrorHandler(ignoreXError);
    XSetIOErrorHandler(logIoError);

    auto lock = std::lock_guard(_impl->mutex);
    _impl->disconnect();
    _impl->displayName = std::string(displayName);
    if (auto connected = _impl->connect(); !connected)
        return connected;
    _impl->opened = true;

    log::info("Connected to X display {} ({} monitor(s))", DisplayString(_impl->display), _impl->monitors().size());
    return {};
}

auto X11ScreenCapture::listMonitors() -> Result<std::vector<MonitorInfo>>
{
    auto lock = std::lock_guard(_impl->mutex);
    if (auto connected = _impl->ensureConnected(); !connected)
        return std::unexpected(connected.error());

    auto monitors = std::vector<MonitorInfo> {};
    for (auto& area: _impl->monitors())
        monitors.push_back(std::move(area.info));

    if (auto alive = _impl->checkConnection("monitor listing"); !alive)
        return std::unexpected(alive.error());
    return monitors;
}

auto X11ScreenCapture::capture(std::uint32_t monitorId) -> Result<Screenshot>
{
    auto lock = std::lock_guard(_impl->mutex);
    if (auto connected = _impl->ensureConnected(); !connected)
        return std::unexpected(connected.error());

    auto const areas = _impl->monitors();
    if (auto alive = _impl->checkConnection("monitor listing"); !alive)
        return std::unexpected(alive.error());

    auto const it = std::ranges::find_if(areas, [monitorId](auto const& a) { return a.info.id == monitorId; });
    if (it == areas.end())
        return makeError(ErrorCode::VisionError, std::format("Monitor {} not found", monitorId));

    auto const area = it->area;
    auto* ximage = XGetImage(_impl->display,
                             DefaultRootWindow(_impl->display),
                             area.x,
                             area.y,
                             static_cast<unsigned>(area.width),
                             static_cast<unsigned>(area.height),
                             AllPlanes,
                             ZPixmap);
    if (!ximage)
    {
        if (auto alive = _impl->checkConnection("capture"); !alive)
            return std::unexpected(alive.error());
        return makeError(ErrorCode::VisionError, std::format("XGetImage failed for monitor {}", monitorId));
    }

    auto screenshot = Screenshot { .image = toImage(ximage), .windows = _impl->listWindows(area) };
    XDestroyImage(ximage);

    if (auto alive = _impl->checkConnection("window listing"); !alive)
        return std::unexpected(alive.error());
    return screenshot;
}

} // namespace sightline
