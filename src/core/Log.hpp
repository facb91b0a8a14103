// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace sightline::log
{

/// @brief Verbosity level for log messages.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Parses a level name ("error", "warn", "info", "debug", "trace").
[[nodiscard]] auto levelFromString(std::string_view name) -> std::optional<Level>;

/// @brief Receives every message that passes the level filter.
/// @param context The calling thread's context (see ScopedContext), empty if none.
using LogCallback = std::function<void(Level level, std::string_view context, std::string_view message)>;

/// @brief Routes messages to a callback instead of stderr; an empty callback reverts to stderr.
///
/// The callback runs under the logger lock, on whichever capture or writer thread logged.
void setCallback(LogCallback callback);

void setLevel(Level level);
[[nodiscard]] auto getLevel() -> Level;

[[nodiscard]] inline auto enabled(Level level) -> bool
{
    return level <= getLevel();
}

/// @brief Tags every message of the current thread with a context such as a
///        monitor or device name, until the object goes out of scope.
///
/// Contexts nest; the innermost one is reported.
class ScopedContext
{
  public:
    explicit ScopedContext(std::string context);
    ~ScopedContext();

    ScopedContext(const ScopedContext&) = delete;
    ScopedContext& operator=(const ScopedContext&) = delete;

  private:
    std::string _previous;
};

/// @brief The current thread's context, empty outside any ScopedContext.
[[nodiscard]] auto currentContext() -> std::string_view;

/// @brief Writes a message as "<UTC timestamp> [LEVEL] (context) message" to stderr,
///        or hands it to the installed callback.
void write(Level level, std::string_view message);

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Warning))
        write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Info))
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Debug))
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Per-unit tracing (every frame, block, segment); off unless --verbose twice.
template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Trace))
        write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace sightline::log
