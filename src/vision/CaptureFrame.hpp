// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Time.hpp>
#include <vision/Image.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace sightline
{

/// @brief OCR result of one window.
struct WindowOcr
{
    std::string appName;
    std::string windowName;
    std::string text;
    bool focused = false;
};

/// @brief One captured screen frame with the OCR rows it produced.
struct CaptureFrame
{
    std::uint32_t monitorId = 0;
    Timestamp timestamp;
    Image image; ///< released by the writer once encoded
    std::vector<WindowOcr> windows;
};

} // namespace sightline
