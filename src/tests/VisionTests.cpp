// SPDX-License-Identifier: Apache-2.0
#include "Fakes.hpp"

#include <vision/CaptureControl.hpp>
#include <vision/FrameEncoder.hpp>
#include <vision/Image.hpp>
#include <vision/OcrDeduplicator.hpp>
#include <vision/OcrEngine.hpp>
#include <vision/VisionCaptureLoop.hpp>
#include <vision/WindowFilter.hpp>
#include <vision/X11ScreenCapture.hpp>

#include <catch2/catch_test_macros.hpp>

#include <thread>

using namespace sightline;
using namespace sightline::test;
using namespace std::chrono_literals;

namespace
{

auto window(std::string app, std::string title, Rect bounds, bool focused = false) -> WindowInfo
{
    return WindowInfo { .appName = std::move(app), .windowName = std::move(title), .bounds = bounds, .focused = focused };
}

auto collectInto(std::vector<CaptureFrame>& frames) -> FrameSink
{
    return [&frames](CaptureFrame frame, std::stop_token) {
        frames.push_back(std::move(frame));
        return PushStatus::Pushed;
    };
}

} // namespace

TEST_CASE("Image crop clips to the image bounds", "[image]")
{
    auto image = Image { .width = 4, .height = 3, .pixels = std::vector<std::uint8_t>(48) };
    for (auto i = size_t { 0 }; i < image.pixels.size(); ++i)
        image.pixels[i] = static_cast<std::uint8_t>(i);

    auto const cropped = image.crop(Rect { .x = 2, .y = 1, .width = 10, .height = 10 });
    CHECK(cropped.width == 2);
    CHECK(cropped.height == 2);
    REQUIRE(cropped.pixels.size() == 16);
    CHECK(cropped.pixels[0] == (1 * 4 + 2) * 4);

    CHECK(image.crop(Rect { .x = 10, .y = 10, .width = 2, .height = 2 }).empty());
}

TEST_CASE("intersect of disjoint rectangles is empty", "[image]")
{
    CHECK(intersect(Rect { .x = 0, .y = 0, .width = 5, .height = 5 }, Rect { .x = 6, .y = 0, .width = 5, .height = 5 }).empty());
    auto const overlap = intersect(Rect { .x = 0, .y = 0, .width = 5, .height = 5 }, Rect { .x = 3, .y = 2, .width = 5, .height = 5 });
    CHECK(overlap.x == 3);
    CHECK(overlap.width == 2);
    CHECK(overlap.height == 3);
}

TEST_CASE("clipTo makes window bounds relative to a monitor", "[image]")
{
    auto const monitor = Rect { .x = 1920, .y = 0, .width = 1280, .height = 1024 };

    auto const inside = clipTo(Rect { .x = 2000, .y = 100, .width = 300, .height = 200 }, monitor);
    CHECK(inside.x == 80);
    CHECK(inside.y == 100);
    CHECK(inside.width == 300);
    CHECK(inside.height == 200);

    // A window straddling two monitors keeps only its part on this one.
    auto const straddling = clipTo(Rect { .x = 1800, .y = 50, .width = 400, .height = 100 }, monitor);
    CHECK(straddling.x == 0);
    CHECK(straddling.width == 280);

    CHECK(clipTo(Rect { .x = 0, .y = 0, .width = 800, .height = 600 }, monitor).empty());
}

TEST_CASE("encodeJpeg produces a decodable image of the same size", "[image]")
{
    auto image = Image { .width = 16, .height = 8, .pixels = std::vector<std::uint8_t>(16 * 8 * 4, 0x40) };
    auto jpeg = encodeJpeg(image);
    REQUIRE(jpeg.has_value());
    REQUIRE(jpeg->size() > 2);
    CHECK((*jpeg)[0] == 0xFF);
    CHECK((*jpeg)[1] == 0xD8);

    auto decoded = decodeImage(*jpeg);
    REQUIRE(decoded.has_value());
    CHECK(decoded->width == 16);
    CHECK(decoded->height == 8);

    CHECK(!encodeJpeg(Image {}).has_value());
    CHECK(!decodeImage(std::vector<std::uint8_t> { 1, 2, 3 }).has_value());
}

TEST_CASE("WindowFilter: deny list wins over allow list", "[filter]")
{
    auto const filter = WindowFilter({ "chrome", "terminal" }, { "private" });

    CHECK(filter.accepts("Google Chrome", "Inbox"));
    CHECK(filter.accepts("gnome-terminal", "~/src"));
    CHECK(!filter.accepts("Google Chrome", "Private Browsing"));
    CHECK(!filter.accepts("Firefox", "Docs"));
}

TEST_CASE("WindowFilter: empty allow list accepts everything not denied", "[filter]")
{
    auto const filter = WindowFilter({}, { "PASSWORD" });
    CHECK(filter.accepts("Editor", "notes.txt"));
    CHECK(!filter.accepts("KeePass Password Safe", "db"));
    CHECK(WindowFilter {}.accepts("", ""));
    CHECK(containsIgnoreCase("Visual Studio Code", "studio"));
    CHECK(!containsIgnoreCase("code", "Visual"));
}

TEST_CASE("OcrDeduplicator with the unchanged policy drops repeated text per window", "[dedup]")
{
    auto dedup = OcrDeduplicator(OcrDedupPolicy::Unchanged);
    CHECK(dedup.admit(0, "Editor", "a.txt", "hello"));
    CHECK(!dedup.admit(0, "Editor", "a.txt", "hello"));
    CHECK(dedup.admit(0, "Editor", "b.txt", "hello"));
    CHECK(dedup.admit(1, "Editor", "a.txt", "hello"));
    CHECK(dedup.admit(0, "Editor", "a.txt", "hello world"));

    auto none = OcrDeduplicator(OcrDedupPolicy::None);
    CHECK(none.admit(0, "Editor", "a.txt", "hello"));
    CHECK(none.admit(0, "Editor", "a.txt", "hello"));
}

TEST_CASE("OcrDeduplicator forgets windows that stay away", "[dedup]")
{
    auto dedup = OcrDeduplicator(OcrDedupPolicy::Unchanged, 2);

    dedup.nextTick();
    CHECK(dedup.admit(0, "Clock", "12:00", "noon"));
    CHECK(dedup.admit(0, "Editor", "a.txt", "hello"));

    for (auto tick = 0; tick < 2; ++tick)
    {
        dedup.nextTick();
        CHECK(!dedup.admit(0, "Editor", "a.txt", "hello"));
    }
    CHECK(dedup.size() == 2);

    dedup.nextTick();
    CHECK(!dedup.admit(0, "Editor", "a.txt", "hello"));
    CHECK(dedup.size() == 1);
    CHECK(dedup.admit(0, "Clock", "12:00", "noon"));
}

TEST_CASE("X11ScreenCapture reports an unavailable display as a vision error", "[vision][x11]")
{
    auto screen = X11ScreenCapture {};

    auto monitors = screen.listMonitors();
    REQUIRE(!monitors.has_value());
    CHECK(monitors.error().code == ErrorCode::VisionError);
    CHECK(screen.capture(0).error().code == ErrorCode::VisionError);

    auto opened = screen.open(":4242");
    REQUIRE(!opened.has_value());
    CHECK(opened.error().code == ErrorCode::VisionError);
    CHECK(screen.listMonitors().error().code == ErrorCode::VisionError);
}

TEST_CASE("joinText skips empty blocks", "[ocr]")
{
    auto const blocks = std::vector<OcrTextBlock> {
        { .text = "first", .bounds = {}, .confidence = 1.0f },
        { .text = "", .bounds = {}, .confidence = 1.0f },
        { .text = "second", .bounds = {}, .confidence = 1.0f },
    };
    CHECK(joinText(blocks) == "first\nsecond");
}

TEST_CASE("VisionCaptureLoop OCRs each accepted window", "[vision]")
{
    auto screen = FakeScreenCapture {};
    screen.setWindows({
        window("Terminal", "build", Rect { .x = 0, .y = 0, .width = 32, .height = 48 }, true),
        window("Browser", "Private tab", Rect { .x = 32, .y = 0, .width = 32, .height = 48 }),
        window("Offscreen", "ghost", Rect { .x = 500, .y = 500, .width = 10, .height = 10 }),
    });
    auto ocr = FakeOcrEngine("");
    auto control = CaptureControl {};
    auto frames = std::vector<CaptureFrame> {};

    auto loop = VisionCaptureLoop(screen.monitors[0], screen, ocr, WindowFilter({}, { "private" }), control, {}, collectInto(frames));
    auto frame = loop.captureFrame();

    REQUIRE(frame.has_value());
    CHECK(frame->monitorId == 0);
    CHECK(frame->image.width == 64);
    REQUIRE(frame->windows.size() == 1);
    CHECK(frame->windows[0].appName == "Terminal");
    CHECK(frame->windows[0].text == "width 32");
    CHECK(frame->windows[0].focused);
    CHECK(ocr.calls.load() == 1);
}

TEST_CASE("VisionCaptureLoop OCRs the whole screen when no window is known", "[vision]")
{
    auto screen = FakeScreenCapture {};
    auto ocr = FakeOcrEngine("desktop");
    auto control = CaptureControl {};
    auto frames = std::vector<CaptureFrame> {};

    auto loop = VisionCaptureLoop(screen.monitors[0], screen, ocr, WindowFilter {}, control, {}, collectInto(frames));
    auto frame = loop.captureFrame();

    REQUIRE(frame.has_value());
    REQUIRE(frame->windows.size() == 1);
    CHECK(frame->windows[0].appName == "unknown");
    CHECK(frame->windows[0].windowName == "unknown");
    CHECK(frame->windows[0].text == "desktop");
}

TEST_CASE("VisionCaptureLoop reports a tick where every OCR call failed", "[vision]")
{
    auto screen = FakeScreenCapture {};
    auto ocr = FakeOcrEngine {};
    ocr.failing = true;
    auto control = CaptureControl {};
    auto frames = std::vector<CaptureFrame> {};

    auto loop = VisionCaptureLoop(screen.monitors[0], screen, ocr, WindowFilter {}, control, {}, collectInto(frames));
    auto frame = loop.captureFrame();
    REQUIRE(!frame.has_value());
    CHECK(frame.error().code == ErrorCode::OcrError);
}

TEST_CASE("VisionCaptureLoop frame timestamps strictly increase", "[vision]")
{
    auto screen = FakeScreenCapture {};
    auto ocr = FakeOcrEngine {};
    auto control = CaptureControl {};
    auto frames = std::vector<CaptureFrame> {};

    auto loop = VisionCaptureLoop(screen.monitors[0], screen, ocr, WindowFilter {}, control, {}, collectInto(frames));
    auto previous = std::optional<Timestamp> {};
    for (auto i = 0; i < 20; ++i)
    {
        auto frame = loop.captureFrame();
        REQUIRE(frame.has_value());
        if (previous)
            CHECK(frame->timestamp > *previous);
        previous = frame->timestamp;
    }
}

TEST_CASE("VisionCaptureLoop rejects a non-positive fps", "[vision]")
{
    auto screen = FakeScreenCapture {};
    auto ocr = FakeOcrEngine {};
    auto control = CaptureControl {};
    auto frames = std::vector<CaptureFrame> {};

    auto loop = VisionCaptureLoop(screen.monitors[0], screen, ocr, WindowFilter {}, control, VisionLoopConfig { .fps = 0.0 }, collectInto(frames));
    auto result = loop.run(std::stop_source {}.get_token());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("VisionCaptureLoop gives up after the failure timeout", "[vision]")
{
    auto screen = FakeScreenCapture {};
    screen.failing = true;
    auto ocr = FakeOcrEngine {};
    auto control = CaptureControl {};
    auto frames = std::vector<CaptureFrame> {};

    auto const config = VisionLoopConfig { .fps = 100.0, .failureTimeout = 50ms, .dedup = OcrDedupPolicy::None };
    auto loop = VisionCaptureLoop(screen.monitors[0], screen, ocr, WindowFilter {}, control, config, collectInto(frames));
    auto result = loop.run(std::stop_source {}.get_token());

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::VisionError);
    CHECK(frames.empty());
    CHECK(screen.captures.load() > 1);
}

TEST_CASE("VisionCaptureLoop captures nothing while vision is paused", "[vision]")
{
    auto screen = FakeScreenCapture {};
    auto ocr = FakeOcrEngine {};
    auto control = CaptureControl {};
    control.pauseVision();
    auto frames = std::vector<CaptureFrame> {};

    auto const config = VisionLoopConfig { .fps = 100.0, .failureTimeout = 10s, .dedup = OcrDedupPolicy::None };
    auto loop = VisionCaptureLoop(screen.monitors[0], screen, ocr, WindowFilter {}, control, config, collectInto(frames));

    auto shutdown = ShutdownSignal {};
    auto stopper = std::jthread([&] {
        std::this_thread::sleep_for(100ms);
        shutdown.trigger();
    });

    CHECK(loop.run(shutdown.token()).has_value());
    stopper.join();
    CHECK(screen.captures.load() == 0);
    CHECK(frames.empty());
}

TEST_CASE("VisionCaptureLoop stops when the sink is closed", "[vision]")
{
    auto screen = FakeScreenCapture {};
    auto ocr = FakeOcrEngine {};
    auto control = CaptureControl {};
    auto pushed = 0;

    auto const config = VisionLoopConfig { .fps = 200.0, .failureTimeout = 10s, .dedup = OcrDedupPolicy::None };
    auto loop = VisionCaptureLoop(screen.monitors[0], screen, ocr, WindowFilter {}, control, config,
                                  [&pushed](CaptureFrame, std::stop_token) {
                                      return ++pushed < 3 ? PushStatus::Pushed : PushStatus::Closed;
                                  });

    CHECK(loop.run(std::stop_source {}.get_token()).has_value());
    CHECK(pushed == 3);
    CHECK(loop.framesCaptured() == 2);
}
