// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <rpc/Transport.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sightline
{

/// @brief Command line of an external engine process (OCR helper, transcription bridge).
struct ProcessConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

/// @brief Transport that talks to a child process through its stdin/stdout.
///
/// The child inherits stderr, so engine diagnostics end up next to our own log.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Spawns the engine process.
    /// @param config The process configuration.
    /// @return Success or an error.
    [[nodiscard]] auto start(const ProcessConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace sightline
