// SPDX-License-Identifier: Apache-2.0
#include "ProcessWatchdog.hpp"

#include <core/Log.hpp>

#include <cerrno>

#include <signal.h>

namespace sightline
{

ProcessWatchdog::ProcessWatchdog(pid_t pid,
                                 ShutdownSignal& shutdown,
                                 std::chrono::milliseconds interval,
                                 AliveCheck isAlive):
    _pid(pid), _shutdown(shutdown), _interval(interval), _isAlive(std::move(isAlive))
{
}

auto ProcessWatchdog::processAlive(pid_t pid) -> bool
{
    // EPERM means the process exists but belongs to someone else.
    return ::kill(pid, 0) == 0 || errno == EPERM;
}

void ProcessWatchdog::start()
{
    log::info("Watching process {}; recording stops when it exits", _pid);
    _thread = std::jthread([this](std::stop_token stop) { watch(stop); });
}

void ProcessWatchdog::stop()
{
    if (_thread.joinable())
    {
        _thread.request_stop();
        _thread.join();
    }
}

void ProcessWatchdog::watch(std::stop_token stop)
{
    auto shutdownToken = _shutdown.token();
    auto forward = std::stop_callback(shutdownToken, [this] { _thread.request_stop(); });

    while (!stop.stop_requested())
    {
        if (!_isAlive(_pid))
        {
            log::info("Watched process {} has exited, shutting down", _pid);
            _shutdown.trigger();
            return;
        }
        if (!sleepFor(_interval, stop))
            return;
    }
}

} // namespace sightline
