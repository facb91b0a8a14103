// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/TranscriptionEngine.hpp>
#include <rpc/RpcClient.hpp>

#include <chrono>
#include <memory>

namespace sightline
{

/// @brief Transcription through an external engine process speaking JSON-RPC.
///
/// Request: "transcribe" {sampleRate, channels, format: "f32le", data: base64}.
/// Response: {text}.
class RpcTranscriptionEngine: public TranscriptionEngine
{
  public:
    RpcTranscriptionEngine(std::unique_ptr<RpcClient> client, std::chrono::milliseconds timeout);

    [[nodiscard]] auto transcribe(std::span<const float> samples) -> Result<std::string> override;
    [[nodiscard]] auto name() const -> std::string override { return "process"; }

  private:
    std::unique_ptr<RpcClient> _client;
    std::chrono::milliseconds _timeout;
};

} // namespace sightline
