// SPDX-License-Identifier: Apache-2.0
#include "Fakes.hpp"

#include <audio/RpcTranscriptionEngine.hpp>
#include <rpc/JsonRpc.hpp>
#include <rpc/RpcClient.hpp>
#include <rpc/StdioTransport.hpp>
#include <vision/RpcOcrEngine.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace sightline;
using namespace sightline::test;
using namespace std::chrono_literals;

namespace
{

/// @brief A shell engine answering the handshake, "recognize" and "transcribe" line by line.
///
/// Requests are dumped with sorted keys, so "id" is the first member. With $ONCE_MARKER
/// set, the first process to see a request exits without answering it.
constexpr auto EngineScript = R"(
while IFS= read -r line; do
    id=$(printf '%s' "$line" | sed -n 's/^{"id":\([0-9]*\),.*/\1/p')
    if [ -n "$ONCE_MARKER" ] && [ ! -e "$ONCE_MARKER" ]; then
        case "$line" in *'"initialize"'*) ;; *) touch "$ONCE_MARKER"; exit 1 ;; esac
    fi
    case "$line" in
        *'"initialize"'*) printf '{"jsonrpc":"2.0","id":%s,"result":{"engineInfo":{"name":"sh-engine","version":"1.0"}}}\n' "$id" ;;
        *'"recognize"'*) printf '{"jsonrpc":"2.0","id":%s,"result":{"blocks":[{"text":"Save","confidence":0.5,"bounds":{"x":1,"y":1,"width":20,"height":8}}]}}\n' "$id" ;;
        *'"transcribe"'*) printf '{"jsonrpc":"2.0","id":%s,"result":{"text":" hello from the engine "}}\n' "$id" ;;
        *'"exit"'*) exit 0 ;;
        *) printf '{"jsonrpc":"2.0","id":%s,"error":{"code":-32601,"message":"Method not found"}}\n' "$id" ;;
    esac
done
)";

auto engineProcess(std::map<std::string, std::string> env = {}) -> ProcessConfig
{
    return ProcessConfig { .command = "sh", .args = { "-c", EngineScript }, .env = std::move(env) };
}

/// @brief Client spawning a fresh engine process for every (re)connect.
auto engineClient(ProcessConfig process, int* spawned = nullptr) -> std::unique_ptr<RpcClient>
{
    auto factory = [process = std::move(process), spawned]() -> Result<std::unique_ptr<Transport>> {
        if (spawned)
            ++*spawned;
        auto transport = std::make_unique<StdioTransport>();
        if (auto started = transport->start(process); !started)
            return std::unexpected(started.error());
        return std::unique_ptr<Transport>(std::move(transport));
    };
    return std::make_unique<RpcClient>(std::move(factory), "sightline-tests");
}

} // namespace

TEST_CASE("An engine process completes the handshake over stdio", "[transport]")
{
    auto client = engineClient(engineProcess());

    auto info = client->connect();
    REQUIRE(info.has_value());
    CHECK(info->name == "sh-engine");
    CHECK(info->version == "1.0");
    CHECK(client->isConnected());

    auto unknown = client->call("summarize", nlohmann::json::object(), 2s);
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::ProtocolError);
    CHECK(client->isConnected());

    client->shutdown();
    CHECK(!client->isConnected());
}

TEST_CASE("An OCR engine process recognizes a frame over stdio", "[transport][ocr]")
{
    auto engine = RpcOcrEngine(engineClient(engineProcess()), 2s);
    auto image = Image { .width = 32, .height = 16, .pixels = std::vector<std::uint8_t>(32 * 16 * 4, 0x7f) };

    auto blocks = engine.recognize(image);
    REQUIRE(blocks.has_value());
    REQUIRE(blocks->size() == 1);
    CHECK((*blocks)[0].text == "Save");
    CHECK((*blocks)[0].bounds.width == 20);
}

TEST_CASE("A transcription engine process answers over stdio", "[transport][transcription]")
{
    auto engine = RpcTranscriptionEngine(engineClient(engineProcess()), 2s);

    // One second of audio makes a request line far larger than a pipe buffer.
    auto text = engine.transcribe(std::vector<float>(SampleRate, 0.25f));
    REQUIRE(text.has_value());
    CHECK(*text == "hello from the engine");
}

TEST_CASE("An engine process that dies is respawned by the next call", "[transport][transcription]")
{
    auto dir = TempDir("enginecrash");
    auto spawned = 0;
    auto engine = RpcTranscriptionEngine(
        engineClient(engineProcess({ { "ONCE_MARKER", (dir.path() / "crashed").string() } }), &spawned), 2s);

    auto first = engine.transcribe(std::vector<float>(1600, 0.1f));
    REQUIRE(!first.has_value());
    CHECK(first.error().code == ErrorCode::TranscriptionError);
    CHECK(spawned == 1);

    auto second = engine.transcribe(std::vector<float>(1600, 0.1f));
    REQUIRE(second.has_value());
    CHECK(*second == "hello from the engine");
    CHECK(spawned == 2);
}

TEST_CASE("An engine that cannot be spawned fails the call", "[transport]")
{
    auto engine = RpcOcrEngine(
        engineClient(ProcessConfig { .command = "/nonexistent/ocr-helper", .args = {}, .env = {} }), 500ms);

    auto blocks = engine.recognize(Image { .width = 1, .height = 1, .pixels = std::vector<std::uint8_t>(4) });
    REQUIRE(!blocks.has_value());
    CHECK(blocks.error().code == ErrorCode::OcrError);
}

TEST_CASE("StdioTransport receive times out when the engine stays silent", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport.start(ProcessConfig { .command = "sleep", .args = { "5" }, .env = {} }).has_value());

    REQUIRE(transport.send(jsonrpc::makeRequest(1, "initialize")).has_value());
    auto result = transport.receive(100ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TimeoutError);
    transport.close();
    CHECK(!transport.isConnected());
}
