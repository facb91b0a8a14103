// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <rpc/RpcClient.hpp>
#include <vision/OcrEngine.hpp>

#include <chrono>
#include <memory>

namespace sightline
{

/// @brief OCR through a helper process speaking JSON-RPC over stdio.
///
/// Request: "recognize" {width, height, format: "rgba", data: base64}.
/// Response: {blocks: [{text, confidence, bounds: {x, y, width, height}}]}.
class RpcOcrEngine: public OcrEngine
{
  public:
    RpcOcrEngine(std::unique_ptr<RpcClient> client, std::chrono::milliseconds timeout);

    [[nodiscard]] auto recognize(const Image& image) -> Result<std::vector<OcrTextBlock>> override;

  private:
    std::unique_ptr<RpcClient> _client;
    std::chrono::milliseconds _timeout;
};

/// @brief Parses the result payload of a "recognize" call.
[[nodiscard]] auto parseOcrBlocks(const nlohmann::json& result) -> Result<std::vector<OcrTextBlock>>;

} // namespace sightline
