// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Shutdown.hpp>
#include <sightline/Config.hpp>

#include <memory>

namespace sightline
{

/// @brief Wires capture backends, engines, storage and the service API together.
class App
{
  public:
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Opens the audio backend and the display, honoring the disable flags.
    /// A missing audio backend only disables audio; a missing display is an error.
    [[nodiscard]] auto initializeDevices() -> VoidResult;

    /// @brief Opens the archive and chunk directory and starts the engines.
    [[nodiscard]] auto initializeRecording() -> VoidResult;

    /// @brief Prints the audio devices, one id per line.
    /// @return Exit code.
    [[nodiscard]] auto printAudioDevices() -> int;

    /// @brief Prints the monitors, one per line.
    /// @return Exit code.
    [[nodiscard]] auto printMonitors() -> int;

    /// @brief Records until the shutdown signal fires.
    /// @param shutdown Process-wide shutdown signal.
    /// @param stdioApi Whether to serve the JSON-RPC API on stdin/stdout.
    /// @return Exit code (0 after a clean shutdown).
    [[nodiscard]] auto run(ShutdownSignal& shutdown, bool stdioApi) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace sightline
