// SPDX-License-Identifier: Apache-2.0
#include "RpcOcrEngine.hpp"

#include <core/Base64.hpp>
#include <core/JsonUtils.hpp>

namespace sightline
{

RpcOcrEngine::RpcOcrEngine(std::unique_ptr<RpcClient> client, std::chrono::milliseconds timeout):
    _client(std::move(client)), _timeout(timeout)
{
}

auto RpcOcrEngine::recognize(const Image& image) -> Result<std::vector<OcrTextBlock>>
{
    if (image.empty())
        return std::vector<OcrTextBlock> {};

    auto params = nlohmann::json {
        { "width", image.width },
        { "height", image.height },
        { "format", "rgba" },
        { "data", base64::encode(image.pixels) },
    };

    auto result = _client->call("recognize", std::move(params), _timeout);
    if (!result)
        return makeError(ErrorCode::OcrError, std::format("OCR engine call failed: {}", result.error()));

    return parseOcrBlocks(*result);
}

auto parseOcrBlocks(const nlohmann::json& result) -> Result<std::vector<OcrTextBlock>>
{
    if (!result.is_object() || !result.contains("blocks") || !result["blocks"].is_array())
        return makeError(ErrorCode::OcrError, "Malformed OCR response: missing 'blocks' array");

    auto blocks = std::vector<OcrTextBlock> {};
    for (auto const& item: result["blocks"])
    {
        auto text = json::getString(item, "text");
        if (!text)
            return makeError(ErrorCode::OcrError, std::format("Malformed OCR block: {}", text.error().message));

        auto block = OcrTextBlock { .text = std::move(*text),
                                    .bounds = {},
                                    .confidence = json::getFloatOr(item, "confidence", 0.0f) };
        if (item.contains("bounds") && item["bounds"].is_object())
        {
            auto const& bounds = item["bounds"];
            block.bounds = Rect { .x = json::getIntOr(bounds, "x", 0),
                                  .y = json::getIntOr(bounds, "y", 0),
                                  .width = json::getIntOr(bounds, "width", 0),
                                  .height = json::getIntOr(bounds, "height", 0) };
        }
        blocks.push_back(std::move(block));
    }
    return blocks;
}

} // namespace sightline
