// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Shutdown.hpp>

#include <chrono>
#include <functional>
#include <thread>

#include <sys/types.h>

namespace sightline
{

/// @brief Triggers shutdown once a watched parent process has exited.
class ProcessWatchdog
{
  public:
    using AliveCheck = std::function<bool(pid_t pid)>;

    ProcessWatchdog(pid_t pid,
                    ShutdownSignal& shutdown,
                    std::chrono::milliseconds interval = std::chrono::milliseconds { 1'000 },
                    AliveCheck isAlive = processAlive);

    ProcessWatchdog(const ProcessWatchdog&) = delete;
    ProcessWatchdog& operator=(const ProcessWatchdog&) = delete;

    /// @brief Starts polling on a background thread. The thread ends with the shutdown signal.
    void start();

    /// @brief Stops polling without triggering shutdown.
    void stop();

    /// @brief Whether a process with the given id exists (kill(pid, 0)).
    [[nodiscard]] static auto processAlive(pid_t pid) -> bool;

  private:
    void watch(std::stop_token stop);

    pid_t _pid;
    ShutdownSignal& _shutdown;
    std::chrono::milliseconds _interval;
    AliveCheck _isAlive;
    std::jthread _thread;
};

} // namespace sightline
