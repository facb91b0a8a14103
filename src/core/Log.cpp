// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <core/Time.hpp>

#include <atomic>
#include <mutex>
#include <print>
#include <utility>

namespace sightline::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto sinkMutex = std::mutex {};

    thread_local auto threadContext = std::string {};

    constexpr auto levelPrefix(Level level) -> std::string_view
    {
        switch (level)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    }
} // namespace

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    if (name == "error")
        return Level::Error;
    if (name == "warn" || name == "warning")
        return Level::Warning;
    if (name == "info")
        return Level::Info;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return std::nullopt;
}

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(sinkMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel.store(level, std::memory_order_relaxed);
}

auto getLevel() -> Level
{
    return globalLevel.load(std::memory_order_relaxed);
}

ScopedContext::ScopedContext(std::string context): _previous(std::exchange(threadContext, std::move(context)))
{
}

ScopedContext::~ScopedContext()
{
    threadContext = std::move(_previous);
}

auto currentContext() -> std::string_view
{
    return threadContext;
}

void write(Level level, std::string_view message)
{
    if (!enabled(level))
        return;

    auto lock = std::lock_guard(sinkMutex);

    if (globalCallback)
    {
        globalCallback(level, threadContext, message);
        return;
    }

    if (threadContext.empty())
        std::println(stderr, "{} [{}] {}", formatTimestamp(Clock::now()), levelPrefix(level), message);
    else
        std::println(
            stderr, "{} [{}] ({}) {}", formatTimestamp(Clock::now()), levelPrefix(level), threadContext, message);
}

} // namespace sightline::log
