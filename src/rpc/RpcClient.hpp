// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <rpc/Transport.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace sightline
{

/// @brief Identity reported by an engine process during the handshake.
struct EngineInfo
{
    std::string name;
    std::string version;
};

/// @brief Opens a fresh transport to an engine (spawns the process for stdio engines).
using TransportFactory = std::function<Result<std::unique_ptr<Transport>>()>;

/// @brief JSON-RPC client for an external OCR or transcription engine.
///
/// Calls are serialized, so a single engine process can be shared by several capture loops.
/// A dead transport is reopened through the factory on the next call.
class RpcClient
{
  public:
    /// @brief Constructs the client; no connection is made until the first call.
    /// @param factory Opens the transport.
    /// @param clientName Name sent in the handshake.
    explicit RpcClient(TransportFactory factory, std::string clientName = "sightline");
    ~RpcClient();

    RpcClient(const RpcClient&) = delete;
    RpcClient& operator=(const RpcClient&) = delete;

    /// @brief Connects (if needed) and performs the "initialize" handshake.
    /// @return The engine's identity or an error.
    [[nodiscard]] auto connect() -> Result<EngineInfo>;

    /// @brief Invokes a method on the engine.
    /// @param method The method name.
    /// @param params The parameters.
    /// @param timeout How long to wait for the response.
    /// @return The result payload or an error.
    [[nodiscard]] auto call(std::string_view method, nlohmann::json params, std::chrono::milliseconds timeout)
        -> Result<nlohmann::json>;

    /// @brief Sends the "exit" notification and closes the transport.
    void shutdown();

    [[nodiscard]] auto isConnected() const -> bool;

  private:
    [[nodiscard]] auto connectLocked() -> Result<EngineInfo>;
    [[nodiscard]] auto requestLocked(std::string_view method,
                                     nlohmann::json params,
                                     std::chrono::milliseconds timeout) -> Result<nlohmann::json>;

    TransportFactory _factory;
    std::string _clientName;
    std::unique_ptr<Transport> _transport;
    EngineInfo _info;
    int64_t _nextId = 1;
    mutable std::mutex _mutex;
};

} // namespace sightline
