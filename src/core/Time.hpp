// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sightline
{

/// @brief Wall clock used for capture timestamps.
using Clock = std::chrono::system_clock;

/// @brief Capture timestamp, UTC with microsecond resolution.
///
/// Timestamps are taken when a unit is captured, never when it is persisted,
/// and are the ordering key of the archive.
using Timestamp = std::chrono::time_point<Clock, std::chrono::microseconds>;

/// @brief Returns the current wall clock time truncated to microseconds.
[[nodiscard]] inline auto now() -> Timestamp
{
    return std::chrono::floor<std::chrono::microseconds>(Clock::now());
}

/// @brief Converts a timestamp to microseconds since the Unix epoch.
[[nodiscard]] constexpr auto toMicros(Timestamp ts) -> std::int64_t
{
    return ts.time_since_epoch().count();
}

/// @brief Converts microseconds since the Unix epoch to a timestamp.
[[nodiscard]] constexpr auto fromMicros(std::int64_t micros) -> Timestamp
{
    return Timestamp { std::chrono::microseconds { micros } };
}

/// @brief Formats a time point as ISO-8601 UTC, e.g. "2024-08-12T04:00:00.000000Z".
[[nodiscard]] auto formatTimestamp(Clock::time_point tp) -> std::string;

/// @brief Formats a time point for use inside file names, e.g. "2024-08-12_04-00-00.000000".
[[nodiscard]] auto formatFileTimestamp(Timestamp ts) -> std::string;

/// @brief Parses an ISO-8601 UTC timestamp ("YYYY-MM-DDTHH:MM:SS[.fraction]Z").
/// @param text The timestamp text.
/// @return The timestamp or an InvalidArgument error.
[[nodiscard]] auto parseTimestamp(std::string_view text) -> Result<Timestamp>;

/// @brief Hands out strictly increasing timestamps for one capture stream.
///
/// Two units captured within the same microsecond would otherwise share a
/// timestamp and could be reordered by the archive.
class StreamClock
{
  public:
    /// @brief Returns max(now, previous + 1us).
    [[nodiscard]] auto next() -> Timestamp { return next(now()); }

    /// @brief Returns max(candidate, previous + 1us).
    [[nodiscard]] auto next(Timestamp candidate) -> Timestamp
    {
        if (_last && candidate <= *_last)
            candidate = *_last + std::chrono::microseconds { 1 };
        _last = candidate;
        return candidate;
    }

  private:
    std::optional<Timestamp> _last;
};

} // namespace sightline
