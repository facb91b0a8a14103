// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <capture/DeviceRegistry.hpp>
#include <core/Error.hpp>
#include <search/HealthMonitor.hpp>
#include <search/RetrievalService.hpp>
#include <storage/Archive.hpp>
#include <storage/Records.hpp>
#include <vision/CaptureControl.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <stop_token>
#include <string_view>

namespace sightline
{

/// @brief Parses search parameters (q, content_type, start_time, end_time, app_name,
///        window_name, limit, offset, include_frames). Numbers may be given as strings.
[[nodiscard]] auto parseSearchQuery(const nlohmann::json& params) -> Result<SearchQuery>;

/// @brief Serializes a result as {"type": "OCR"|"Audio"|"FTS", "content": {...}}.
[[nodiscard]] auto toJson(const SearchResult& result) -> nlohmann::json;

/// @brief Serializes a page as {"data": [...], "pagination": {limit, offset, total}}.
[[nodiscard]] auto toJson(const SearchPage& page) -> nlohmann::json;

[[nodiscard]] auto toJson(const HealthReport& report) -> nlohmann::json;

/// @brief JSON in / JSON out operations on a running recorder.
class ServiceApi
{
  public:
    ServiceApi(RetrievalService& retrieval,
               Archive& archive,
               DeviceRegistry& registry,
               HealthMonitor& health,
               CaptureControl& control);

    [[nodiscard]] auto search(const nlohmann::json& params) -> Result<nlohmann::json>;

    /// @return [{name, is_default}], or NotFound when no device exists.
    [[nodiscard]] auto listAudioDevices() -> Result<nlohmann::json>;

    /// @return [{id, name, width, height, is_default}].
    [[nodiscard]] auto listMonitors() -> Result<nlohmann::json>;

    /// @brief {content_type: "vision"|"audio", id, tags: [...]} -> {success: true}.
    [[nodiscard]] auto addTags(const nlohmann::json& params) -> Result<nlohmann::json>;
    [[nodiscard]] auto removeTags(const nlohmann::json& params) -> Result<nlohmann::json>;

    [[nodiscard]] auto health() -> nlohmann::json;

    [[nodiscard]] auto pauseVision() -> nlohmann::json;
    [[nodiscard]] auto resumeVision() -> nlohmann::json;

    /// @brief {device: "<name> (input|output)", state: "running"|"paused"|"stopped"}.
    [[nodiscard]] auto setDeviceState(const nlohmann::json& params) -> Result<nlohmann::json>;

    /// @brief Calls an operation by name.
    [[nodiscard]] auto dispatch(std::string_view method, const nlohmann::json& params) -> Result<nlohmann::json>;

    /// @brief Handles one JSON-RPC message.
    /// @return The response, or nothing for notifications.
    [[nodiscard]] auto handleMessage(std::string_view line) -> std::optional<nlohmann::json>;

    /// @brief Serves newline-delimited JSON-RPC on the given file descriptors until
    ///        end of input or until a stop is requested.
    [[nodiscard]] auto serve(int inputFd, int outputFd, std::stop_token stop) -> VoidResult;

  private:
    [[nodiscard]] auto changeTags(const nlohmann::json& params, bool add) -> Result<nlohmann::json>;

    RetrievalService& _retrieval;
    Archive& _archive;
    DeviceRegistry& _registry;
    HealthMonitor& _health;
    CaptureControl& _control;
};

} // namespace sightline
