// SPDX-License-Identifier: Apache-2.0
#include "RpcClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <rpc/JsonRpc.hpp>

#include <format>

namespace sightline
{

namespace
{
    constexpr auto HandshakeTimeout = std::chrono::seconds { 30 };
} // namespace

RpcClient::RpcClient(TransportFactory factory, std::string clientName):
    _factory(std::move(factory)), _clientName(std::move(clientName))
{
}

RpcClient::~RpcClient()
{
    shutdown();
}

auto RpcClient::connect() -> Result<EngineInfo>
{
    auto lock = std::lock_guard(_mutex);
    return connectLocked();
}

auto RpcClient::call(std::string_view method, nlohmann::json params, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    auto lock = std::lock_guard(_mutex);

    auto connected = connectLocked();
    if (!connected)
        return std::unexpected(connected.error());

    auto result = requestLocked(method, std::move(params), timeout);
    if (!result && result.error().code != ErrorCode::ProtocolError)
    {
        // Transport-level failure: the engine state is unknown, start over on the next call.
        log::warning("Engine '{}' call '{}' failed: {}", _info.name, method, result.error().message);
        _transport->close();
        _transport.reset();
    }
    return result;
}

void RpcClient::shutdown()
{
    auto lock = std::lock_guard(_mutex);
    if (!_transport)
        return;

    if (_transport->isConnected())
        (void) _transport->send(jsonrpc::makeNotification("exit"));
    _transport->close();
    _transport.reset();
}

auto RpcClient::isConnected() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _transport && _transport->isConnected();
}

auto RpcClient::connectLocked() -> Result<EngineInfo>
{
    if (_transport && _transport->isConnected())
        return _info;

    auto transport = _factory();
    if (!transport)
        return std::unexpected(transport.error());
    _transport = std::move(*transport);

    auto params = nlohmann::json {
        { "clientInfo", { { "name", _clientName } } },
    };

    auto result = requestLocked("initialize", std::move(params), HandshakeTimeout);
    if (!result)
    {
        _transport->close();
        _transport.reset();
        return std::unexpected(result.error());
    }

    _info.name = json::getStringOr(result->value("engineInfo", nlohmann::json::object()), "name", "unknown");
    _info.version =
        json::getStringOr(result->value("engineInfo", nlohmann::json::object()), "version", "unknown");
    log::info("Engine connected: {} v{}", _info.name, _info.version);
    return _info;
}

auto RpcClient::requestLocked(std::string_view method, nlohmann::json params, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    auto const id = _nextId++;
    auto request = jsonrpc::makeRequest(id, method, std::move(params));

    return _transport->send(request)
        .and_then([&]() -> Result<nlohmann::json> {
            // Skip stray notifications and stale responses from an earlier timed-out call.
            while (true)
            {
                auto message = _transport->receive(timeout);
                if (!message)
                    return std::unexpected(message.error());
                if (message->contains("id") && (*message)["id"] == id)
                    return *message;
                log::debug("Ignoring unrelated engine message: {}", message->dump());
            }
        })
        .and_then([](const nlohmann::json& msg) -> Result<nlohmann::json> {
            return jsonrpc::parseResponse(msg).and_then(
                [](const jsonrpc::Response& resp) -> Result<nlohmann::json> {
                    if (resp.error)
                    {
                        return makeError(
                            ErrorCode::ProtocolError,
                            std::format("RPC error {}: {}", resp.error->code, resp.error->message));
                    }
                    return resp.result.value_or(nlohmann::json::object());
                });
        });
}

} // namespace sightline
