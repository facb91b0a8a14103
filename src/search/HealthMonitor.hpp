// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Time.hpp>
#include <storage/Records.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sightline
{

class Archive;

enum class ModalityStatus : std::uint8_t
{
    Ok,
    Stale,
    NoData,
    Disabled,
    Loading,
};

enum class OverallStatus : std::uint8_t
{
    Healthy,
    Unhealthy,
    Loading,
};

[[nodiscard]] constexpr auto modalityStatusToString(ModalityStatus status) -> std::string_view
{
    switch (status)
    {
        case ModalityStatus::Ok: return "OK";
        case ModalityStatus::Stale: return "Stale";
        case ModalityStatus::NoData: return "No data";
        case ModalityStatus::Disabled: return "Disabled";
        case ModalityStatus::Loading: return "Loading";
    }
    return "No data";
}

[[nodiscard]] constexpr auto overallStatusToString(OverallStatus status) -> std::string_view
{
    switch (status)
    {
        case OverallStatus::Healthy: return "Healthy";
        case OverallStatus::Unhealthy: return "Unhealthy";
        case OverallStatus::Loading: return "Loading";
    }
    return "Unhealthy";
}

struct HealthConfig
{
    std::chrono::seconds freshness { 60 };
    std::chrono::seconds loadingGrace { 120 };
    bool visionEnabled = true;
    bool audioEnabled = true;
};

struct HealthReport
{
    OverallStatus status = OverallStatus::Loading;
    std::optional<Timestamp> lastFrame;
    std::optional<Timestamp> lastAudio;
    ModalityStatus frameStatus = ModalityStatus::Loading;
    ModalityStatus audioStatus = ModalityStatus::Loading;
    std::string message;
    std::optional<std::string> verboseInstructions;
};

/// @brief Derives capture liveness from the newest archived timestamps.
class HealthMonitor
{
  public:
    HealthMonitor(Archive& archive, HealthConfig config, Timestamp startedAt);

    /// @brief Checks health at the current time.
    [[nodiscard]] auto check() -> HealthReport;

    /// @brief Pure evaluation used by check().
    [[nodiscard]] static auto evaluate(const LatestTimestamps& latest,
                                       const HealthConfig& config,
                                       Timestamp startedAt,
                                       Timestamp now) -> HealthReport;

  private:
    Archive& _archive;
    HealthConfig _config;
    Timestamp _startedAt;
};

} // namespace sightline
