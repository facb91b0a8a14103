// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace sightline;

namespace
{

struct Captured
{
    log::Level level;
    std::string context;
    std::string message;
};

/// @brief Installs a capturing callback for the lifetime of the object.
struct CaptureLog
{
    std::vector<Captured> lines;
    log::Level previousLevel = log::getLevel();

    CaptureLog()
    {
        log::setCallback([this](log::Level level, std::string_view context, std::string_view message) {
            lines.push_back(Captured { level, std::string(context), std::string(message) });
        });
    }

    ~CaptureLog()
    {
        log::setCallback({});
        log::setLevel(previousLevel);
    }
};

} // namespace

TEST_CASE("levelFromString accepts the documented names", "[log]")
{
    CHECK(log::levelFromString("warn") == log::Level::Warning);
    CHECK(log::levelFromString("warning") == log::Level::Warning);
    CHECK(log::levelFromString("trace") == log::Level::Trace);
    CHECK(!log::levelFromString("verbose").has_value());
}

TEST_CASE("Messages above the level are dropped", "[log]")
{
    auto capture = CaptureLog {};
    log::setLevel(log::Level::Warning);

    log::info("not shown");
    log::warning("shown {}", 1);
    log::error("shown {}", 2);

    REQUIRE(capture.lines.size() == 2);
    CHECK(capture.lines[0].message == "shown 1");
    CHECK(capture.lines[1].level == log::Level::Error);
    CHECK(log::enabled(log::Level::Error));
    CHECK(!log::enabled(log::Level::Debug));
}

TEST_CASE("ScopedContext tags messages of its thread only", "[log]")
{
    auto capture = CaptureLog {};
    log::setLevel(log::Level::Info);

    {
        auto const outer = log::ScopedContext { "monitor 0" };
        log::info("outer");
        {
            auto const inner = log::ScopedContext { "video writer" };
            log::info("inner");
        }
        std::jthread([] { log::info("other thread"); }).join();
        log::info("outer again");
    }
    log::info("none");

    REQUIRE(capture.lines.size() == 5);
    CHECK(capture.lines[0].context == "monitor 0");
    CHECK(capture.lines[1].context == "video writer");
    CHECK(capture.lines[2].context.empty());
    CHECK(capture.lines[3].context == "monitor 0");
    CHECK(capture.lines[4].context.empty());
    CHECK(log::currentContext().empty());
}
