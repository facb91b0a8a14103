// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace sightline
{

/// @brief Error codes for categorizing failures across the capture and retrieval pipeline.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    AudioError,
    DeviceError,
    VisionError,
    OcrError,
    TranscriptionError,
    TransportError,
    ProtocolError,
    PersistenceError,
    DatabaseError,
    NotFound,
    QueryError,
    TimeoutError,
    Cancelled,
};

/// @brief Returns a short, stable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::IoError: return "io";
        case ErrorCode::ConfigError: return "config";
        case ErrorCode::AudioError: return "audio";
        case ErrorCode::DeviceError: return "device";
        case ErrorCode::VisionError: return "vision";
        case ErrorCode::OcrError: return "ocr";
        case ErrorCode::TranscriptionError: return "transcription";
        case ErrorCode::TransportError: return "transport";
        case ErrorCode::ProtocolError: return "protocol";
        case ErrorCode::PersistenceError: return "persistence";
        case ErrorCode::DatabaseError: return "database";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::QueryError: return "query";
        case ErrorCode::TimeoutError: return "timeout";
        case ErrorCode::Cancelled: return "cancelled";
    }
    return "unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

/// @brief Returns true for errors that invalidate the integrity of persisted data.
///
/// These abort the current recording cycle; every other error stays local to the
/// stream or request that produced it.
[[nodiscard]] constexpr auto isPersistenceFailure(ErrorCode code) -> bool
{
    return code == ErrorCode::PersistenceError || code == ErrorCode::DatabaseError;
}

} // namespace sightline

template <>
struct std::formatter<sightline::Error>: std::formatter<std::string>
{
    auto format(const sightline::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", sightline::errorCodeName(error.code), error.message), ctx);
    }
};
