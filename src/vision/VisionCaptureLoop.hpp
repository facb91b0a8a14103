// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Channel.hpp>
#include <core/Error.hpp>
#include <vision/CaptureControl.hpp>
#include <vision/CaptureFrame.hpp>
#include <vision/OcrDeduplicator.hpp>
#include <vision/OcrEngine.hpp>
#include <vision/ScreenCapture.hpp>
#include <vision/WindowFilter.hpp>

#include <chrono>
#include <functional>
#include <stop_token>

namespace sightline
{

/// @brief Receives captured frames; blocks while the downstream writer is saturated.
using FrameSink = std::function<PushStatus(CaptureFrame frame, std::stop_token stop)>;

struct VisionLoopConfig
{
    double fps = 1.0;
    std::chrono::milliseconds failureTimeout { 300'000 };
    OcrDedupPolicy dedup = OcrDedupPolicy::None;
};

/// @brief Capture loop of one monitor: tick -> screenshot -> per-window OCR -> frame.
class VisionCaptureLoop
{
  public:
    VisionCaptureLoop(MonitorInfo monitor,
                      ScreenCapture& capture,
                      OcrEngine& ocr,
                      WindowFilter filter,
                      const CaptureControl& control,
                      VisionLoopConfig config,
                      FrameSink sink);

    /// @brief Runs until stopped.
    /// @return Success on a requested stop, or a VisionError when no frame succeeded
    ///         within the failure timeout.
    [[nodiscard]] auto run(std::stop_token stop) -> VoidResult;

    /// @brief Captures and recognises one frame.
    [[nodiscard]] auto captureFrame() -> Result<CaptureFrame>;

    [[nodiscard]] auto monitor() const -> const MonitorInfo& { return _monitor; }
    [[nodiscard]] auto framesCaptured() const -> size_t { return _frames; }

  private:
    MonitorInfo _monitor;
    ScreenCapture& _capture;
    OcrEngine& _ocr;
    WindowFilter _filter;
    const CaptureControl& _control;
    VisionLoopConfig _config;
    FrameSink _sink;
    OcrDeduplicator _dedup;
    StreamClock _clock;
    size_t _frames = 0;
};

} // namespace sightline
