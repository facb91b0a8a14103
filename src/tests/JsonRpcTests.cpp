// SPDX-License-Identifier: Apache-2.0
#include "Fakes.hpp"

#include <audio/RpcTranscriptionEngine.hpp>
#include <core/Base64.hpp>
#include <rpc/JsonRpc.hpp>
#include <vision/RpcOcrEngine.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstring>

using namespace sightline;
using namespace std::chrono_literals;
using sightline::test::MockTransport;

namespace
{

/// @brief Client over a mock transport whose engine already answered the handshake.
auto handshakenClient(MockTransport*& mock) -> std::unique_ptr<RpcClient>
{
    auto transport = std::make_unique<MockTransport>();
    mock = transport.get();
    mock->queueResponse(jsonrpc::makeResult(1, { { "engineInfo", { { "name", "engine" }, { "version", "1" } } } }));
    auto shared = std::make_shared<std::unique_ptr<MockTransport>>(std::move(transport));
    return std::make_unique<RpcClient>([shared]() -> Result<std::unique_ptr<Transport>> {
        if (!*shared)
            return makeError(ErrorCode::TransportError, "engine gone");
        return std::unique_ptr<Transport>(std::move(*shared));
    });
}

/// @brief The request as the engine process sees it.
auto lastRequest(const MockTransport& mock) -> jsonrpc::Request
{
    REQUIRE(!mock.sentMessages.empty());
    auto request = jsonrpc::parseRequest(mock.sentMessages.back());
    REQUIRE(request.has_value());
    return *request;
}

} // namespace

TEST_CASE("recognize requests carry the frame as base64 RGBA", "[jsonrpc][ocr]")
{
    MockTransport* mock = nullptr;
    auto engine = RpcOcrEngine(handshakenClient(mock), 1s);
    mock->queueResponse(jsonrpc::makeResult(2, { { "blocks", nlohmann::json::array() } }));

    auto image = Image { .width = 3, .height = 2, .pixels = std::vector<std::uint8_t>(3 * 2 * 4) };
    for (auto i = size_t { 0 }; i < image.pixels.size(); ++i)
        image.pixels[i] = static_cast<std::uint8_t>(i * 7);

    REQUIRE(engine.recognize(image).has_value());

    auto const request = lastRequest(*mock);
    CHECK(request.method == "recognize");
    CHECK(request.id == 2);
    CHECK(request.params["width"] == 3);
    CHECK(request.params["height"] == 2);
    CHECK(request.params["format"] == "rgba");
    CHECK(base64::decode(request.params["data"].get<std::string>()).value() == image.pixels);
}

TEST_CASE("recognize is not sent for an empty image", "[jsonrpc][ocr]")
{
    MockTransport* mock = nullptr;
    auto engine = RpcOcrEngine(handshakenClient(mock), 1s);

    auto blocks = engine.recognize(Image {});
    REQUIRE(blocks.has_value());
    CHECK(blocks->empty());
    CHECK(mock->sentMessages.empty());
}

TEST_CASE("recognize replies decode into text blocks", "[jsonrpc][ocr]")
{
    auto reply = jsonrpc::parseResponse(jsonrpc::makeResult(
        5,
        { { "blocks",
            nlohmann::json::array({
                { { "text", "Inbox" }, { "confidence", 0.5 }, { "bounds", { { "x", 4 }, { "y", 8 }, { "width", 40 }, { "height", 12 } } } },
                { { "text", "3 unread" } },
            }) } }));
    REQUIRE(reply.has_value());
    REQUIRE(reply->isSuccess());

    auto blocks = parseOcrBlocks(*reply->result);
    REQUIRE(blocks.has_value());
    REQUIRE(blocks->size() == 2);
    CHECK((*blocks)[0].text == "Inbox");
    CHECK((*blocks)[0].bounds.y == 8);
    CHECK((*blocks)[0].confidence == 0.5f);
    CHECK((*blocks)[1].text == "3 unread");
    CHECK((*blocks)[1].bounds.empty());

    auto malformed = parseOcrBlocks(nlohmann::json { { "blocks", nlohmann::json::array({ { { "confidence", 1.0 } } }) } });
    REQUIRE(!malformed.has_value());
    CHECK(malformed.error().code == ErrorCode::OcrError);
}

TEST_CASE("An engine error reply to recognize becomes an OCR error", "[jsonrpc][ocr]")
{
    MockTransport* mock = nullptr;
    auto engine = RpcOcrEngine(handshakenClient(mock), 1s);
    mock->queueResponse(jsonrpc::makeErrorResponse(2, jsonrpc::codes::InternalError, "tesseract crashed"));

    auto blocks = engine.recognize(Image { .width = 1, .height = 1, .pixels = std::vector<std::uint8_t>(4) });
    REQUIRE(!blocks.has_value());
    CHECK(blocks.error().code == ErrorCode::OcrError);
    CHECK(blocks.error().message.find("tesseract crashed") != std::string::npos);
}

TEST_CASE("transcribe requests carry 16 kHz mono float samples", "[jsonrpc][transcription]")
{
    MockTransport* mock = nullptr;
    auto engine = RpcTranscriptionEngine(handshakenClient(mock), 1s);
    mock->queueResponse(jsonrpc::makeResult(2, { { "text", "  see you tomorrow\n" } }));

    auto const samples = std::vector<float> { 0.0f, 0.25f, -0.5f, 1.0f };
    auto text = engine.transcribe(samples);
    REQUIRE(text.has_value());
    CHECK(*text == "see you tomorrow");

    auto const request = lastRequest(*mock);
    CHECK(request.method == "transcribe");
    CHECK(request.params["sampleRate"] == 16000);
    CHECK(request.params["channels"] == 1);
    CHECK(request.params["format"] == "f32le");

    auto const bytes = base64::decode(request.params["data"].get<std::string>());
    REQUIRE(bytes.has_value());
    REQUIRE(bytes->size() == samples.size() * sizeof(float));
    auto decoded = std::vector<float>(samples.size());
    std::memcpy(decoded.data(), bytes->data(), bytes->size());
    CHECK(decoded == samples);
}

TEST_CASE("A transcribe reply without text is a transcription error", "[jsonrpc][transcription]")
{
    MockTransport* mock = nullptr;
    auto engine = RpcTranscriptionEngine(handshakenClient(mock), 1s);
    mock->queueResponse(jsonrpc::makeResult(2, { { "segments", nlohmann::json::array() } }));

    auto text = engine.transcribe(std::vector<float>(160, 0.1f));
    REQUIRE(!text.has_value());
    CHECK(text.error().code == ErrorCode::TranscriptionError);
}

TEST_CASE("Service requests keep the caller's id and default their params", "[jsonrpc][api]")
{
    auto search = jsonrpc::parseRequest(nlohmann::json::parse(
        R"({"jsonrpc":"2.0","id":"req-7","method":"search","params":{"q":"invoice","contentType":"ocr","limit":5}})"));
    REQUIRE(search.has_value());
    CHECK(search->method == "search");
    CHECK(search->id == "req-7");
    CHECK(search->params["contentType"] == "ocr");

    auto const reply = jsonrpc::makeResult(search->id, { { "data", nlohmann::json::array() }, { "total", 0 } });
    CHECK(reply["id"] == "req-7");
    CHECK(reply["result"]["total"] == 0);

    auto health = jsonrpc::parseRequest(nlohmann::json::parse(R"({"jsonrpc":"2.0","id":1,"method":"health"})"));
    REQUIRE(health.has_value());
    CHECK(health->params.is_object());
    CHECK(health->params.empty());

    auto pause = jsonrpc::parseRequest(jsonrpc::makeNotification("pauseVision"));
    REQUIRE(pause.has_value());
    CHECK(pause->isNotification());
}

TEST_CASE("Messages that are not JSON-RPC 2.0 requests are rejected", "[jsonrpc][api]")
{
    auto const rejected = [](std::string_view text) {
        auto request = jsonrpc::parseRequest(nlohmann::json::parse(text));
        return !request.has_value() && request.error().code == ErrorCode::ProtocolError;
    };

    CHECK(rejected(R"({"id":1,"method":"search"})"));
    CHECK(rejected(R"({"jsonrpc":"1.0","id":1,"method":"search"})"));
    CHECK(rejected(R"({"jsonrpc":"2.0","id":1,"params":{}})"));
    CHECK(rejected(R"(["search"])"));

    auto const orphan = jsonrpc::parseResponse(nlohmann::json { { "jsonrpc", "2.0" }, { "id", 1 } });
    REQUIRE(!orphan.has_value());
    CHECK(orphan.error().code == ErrorCode::ProtocolError);
}
