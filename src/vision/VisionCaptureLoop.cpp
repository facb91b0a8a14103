// SPDX-License-Identifier: Apache-2.0
#include "VisionCaptureLoop.hpp"

#include <core/Log.hpp>
#include <core/Shutdown.hpp>

namespace sightline
{

namespace
{
    constexpr auto UnknownName = std::string_view { "unknown" };

    auto tickInterval(double fps) -> std::chrono::steady_clock::duration
    {
        return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(1.0 / fps));
    }
} // namespace

VisionCaptureLoop::VisionCaptureLoop(MonitorInfo monitor,
                                     ScreenCapture& capture,
                                     OcrEngine& ocr,
                                     WindowFilter filter,
                                     const CaptureControl& control,
                                     VisionLoopConfig config,
                                     FrameSink sink):
    _monitor(std::move(monitor)),
    _capture(capture),
    _ocr(ocr),
    _filter(std::move(filter)),
    _control(control),
    _config(config),
    _sink(std::move(sink)),
    _dedup(config.dedup)
{
}

auto VisionCaptureLoop::captureFrame() -> Result<CaptureFrame>
{
    auto screenshot = _capture.capture(_monitor.id);
    if (!screenshot)
        return std::unexpected(screenshot.error());

    auto frame = CaptureFrame {
        .monitorId = _monitor.id,
        .timestamp = _clock.next(),
        .image = {},
        .windows = {},
    };

    _dedup.nextTick();

    auto regions = std::vector<WindowInfo> {};
    if (screenshot->windows.empty())
        regions.push_back(WindowInfo { .appName = std::string(UnknownName),
                                       .windowName = std::string(UnknownName),
                                       .bounds = screenshot->image.bounds(),
                                       .focused = false });
    else
        regions = std::move(screenshot->windows);

    auto attempted = 0;
    auto failed = 0;
    auto lastError = Error {};

    for (auto const& window: regions)
    {
        if (!_filter.accepts(window.appName, window.windowName))
            continue;

        auto const region = screenshot->image.crop(window.bounds);
        if (region.empty())
            continue;

        ++attempted;
        auto blocks = _ocr.recognize(region);
        if (!blocks)
        {
            ++failed;
            lastError = blocks.error();
            log::warning("OCR failed on monitor {} window '{}' ({}): {}",
                         _monitor.id,
                         window.windowName,
                         window.appName,
                         blocks.error());
            continue;
        }

        auto text = joinText(*blocks);
        if (text.empty())
            continue;
        if (!_dedup.admit(_monitor.id, window.appName, window.windowName, text))
            continue;

        frame.windows.push_back(WindowOcr {
            .appName = window.appName.empty() ? std::string(UnknownName) : window.appName,
            .windowName = window.windowName.empty() ? std::string(UnknownName) : window.windowName,
            .text = std::move(text),
            .focused = window.focused,
        });
    }

    if (attempted > 0 && failed == attempted)
        return makeError(ErrorCode::OcrError, std::format("All OCR calls failed: {}", lastError.message));

    frame.image = std::move(screenshot->image);
    return frame;
}

auto VisionCaptureLoop::run(std::stop_token stop) -> VoidResult
{
    if (!(_config.fps > 0.0))
        return makeError(ErrorCode::ConfigError, std::format("Invalid fps: {}", _config.fps));

    auto const interval = tickInterval(_config.fps);
    auto lastSuccess = std::chrono::steady_clock::now();
    auto nextTick = lastSuccess;

    log::info("Vision capture loop started for monitor {} ({:.2f} fps)", _monitor.id, _config.fps);

    while (!stop.stop_requested())
    {
        if (!sleepUntil(nextTick, stop))
            break;
        nextTick += interval;
        auto const tickStart = std::chrono::steady_clock::now();
        if (nextTick < tickStart)
            nextTick = tickStart; // skip missed ticks rather than bursting

        if (_control.visionPaused())
        {
            lastSuccess = tickStart;
            continue;
        }

        auto frame = captureFrame();
        if (!frame)
        {
            log::warning("Monitor {} capture failed at {}: {}",
                         _monitor.id,
                         formatTimestamp(Clock::now()),
                         frame.error());

            if (tickStart - lastSuccess >= _config.failureTimeout)
            {
                log::error("Monitor {}: no successful frame for {} s, stopping its capture",
                           _monitor.id,
                           std::chrono::duration_cast<std::chrono::seconds>(_config.failureTimeout).count());
                return makeError(ErrorCode::VisionError,
                                 std::format("Monitor {} failed for longer than the failure timeout",
                                             _monitor.id));
            }
            continue;
        }

        lastSuccess = tickStart;

        auto const pushStart = std::chrono::steady_clock::now();
        if (_sink(std::move(*frame), stop) != PushStatus::Pushed)
            break;
        auto const blocked = std::chrono::steady_clock::now() - pushStart;
        if (blocked > interval)
            log::warning("Monitor {}: capture lagging, writer blocked for {} ms",
                         _monitor.id,
                         std::chrono::duration_cast<std::chrono::milliseconds>(blocked).count());
        ++_frames;
    }

    log::info("Vision capture loop for monitor {} finished ({} frames)", _monitor.id, _frames);
    return {};
}

} // namespace sightline
