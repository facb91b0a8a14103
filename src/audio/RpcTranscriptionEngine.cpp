// SPDX-License-Identifier: Apache-2.0
#include "RpcTranscriptionEngine.hpp"

#include <audio/AudioSource.hpp>
#include <core/Base64.hpp>
#include <core/JsonUtils.hpp>

#include <cstdint>

namespace sightline
{

RpcTranscriptionEngine::RpcTranscriptionEngine(std::unique_ptr<RpcClient> client,
                                               std::chrono::milliseconds timeout):
    _client(std::move(client)), _timeout(timeout)
{
}

auto RpcTranscriptionEngine::transcribe(std::span<const float> samples) -> Result<std::string>
{
    auto const bytes = std::as_bytes(samples);
    auto const data = base64::encode(
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size()));

    auto params = nlohmann::json {
        { "sampleRate", SampleRate },
        { "channels", 1 },
        { "format", "f32le" },
        { "data", data },
    };

    auto result = _client->call("transcribe", std::move(params), _timeout);
    if (!result)
        return makeError(ErrorCode::TranscriptionError,
                         std::format("Transcription engine call failed: {}", result.error()));

    auto text = json::getString(*result, "text");
    if (!text)
        return makeError(ErrorCode::TranscriptionError,
                         std::format("Malformed transcription response: {}", text.error().message));

    return normalizeTranscript(std::move(*text));
}

} // namespace sightline
