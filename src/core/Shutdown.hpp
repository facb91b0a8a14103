// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace sightline
{

/// @brief Process-wide shutdown broadcast.
///
/// Every capture loop and the orchestrator's restart loop observe the same stop token.
class ShutdownSignal
{
  public:
    /// @brief Requests shutdown. Idempotent and safe to call from any thread.
    void trigger() { _source.request_stop(); }

    [[nodiscard]] auto triggered() const -> bool { return _source.stop_requested(); }

    [[nodiscard]] auto token() const -> std::stop_token { return _source.get_token(); }

  private:
    std::stop_source _source;
};

/// @brief Sleeps for the given duration or until a stop is requested.
/// @return true if the full duration elapsed, false if interrupted.
template <typename Rep, typename Period>
auto sleepFor(std::chrono::duration<Rep, Period> duration, std::stop_token stop) -> bool
{
    auto mutex = std::mutex {};
    auto cv = std::condition_variable_any {};
    auto lock = std::unique_lock(mutex);
    return !cv.wait_for(lock, stop, duration, [] { return false; }) && !stop.stop_requested();
}

/// @brief Sleeps until the given time point or until a stop is requested.
/// @return true if the deadline was reached, false if interrupted.
template <typename ClockType, typename Duration>
auto sleepUntil(std::chrono::time_point<ClockType, Duration> deadline, std::stop_token stop) -> bool
{
    auto mutex = std::mutex {};
    auto cv = std::condition_variable_any {};
    auto lock = std::unique_lock(mutex);
    return !cv.wait_until(lock, stop, deadline, [] { return false; }) && !stop.stop_requested();
}

} // namespace sightline
