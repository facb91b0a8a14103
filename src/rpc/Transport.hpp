// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>

namespace sightline
{

/// @brief Abstract line-delimited JSON channel to an external engine process.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends a JSON message to the peer.
    /// @param message The JSON message to send.
    /// @return Success or an error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Receives the next JSON message from the peer.
    /// @param timeout Maximum time to wait; TimeoutError when it elapses.
    /// @return The received JSON message or an error.
    [[nodiscard]] virtual auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> = 0;

    /// @brief Closes the connection.
    virtual void close() = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace sightline
