// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sightline::base64
{

/// @brief Encodes binary data as standard (RFC 4648) base64 with padding.
[[nodiscard]] auto encode(std::span<const std::uint8_t> data) -> std::string;

/// @brief Decodes standard base64. Whitespace is not accepted.
/// @return The decoded bytes or an InvalidArgument error.
[[nodiscard]] auto decode(std::string_view text) -> Result<std::vector<std::uint8_t>>;

} // namespace sightline::base64
