// SPDX-License-Identifier: Apache-2.0
#include "HealthMonitor.hpp"

#include <core/Log.hpp>
#include <storage/Archive.hpp>

#include <format>

namespace sightline
{

namespace
{

    constexpr auto TroubleshootingSteps = std::string_view {
        "If you're experiencing issues, please try the following steps:\n"
        "1. Restart sightline.\n"
        "2. Check that the X display is reachable ($DISPLAY) and that the audio devices are not in use.\n"
        "3. Check that the OCR and transcription engines are configured and start on their own.\n"
        "4. Run with --verbose and look for capture or persistence errors in the log."
    };

    auto modalityStatus(bool enabled,
                        const std::optional<Timestamp>& latest,
                        std::chrono::seconds freshness,
                        Timestamp now) -> ModalityStatus
    {
        if (!enabled)
            return ModalityStatus::Disabled;
        if (!latest)
            return ModalityStatus::NoData;
        return now - *latest < freshness ? ModalityStatus::Ok : ModalityStatus::Stale;
    }

    auto healthy(ModalityStatus status) -> bool
    {
        return status == ModalityStatus::Ok || status == ModalityStatus::Disabled;
    }

} // namespace

HealthMonitor::HealthMonitor(Archive& archive, HealthConfig config, Timestamp startedAt):
    _archive(archive), _config(config), _startedAt(startedAt)
{
}

auto HealthMonitor::check() -> HealthReport
{
    auto latest = _archive.latestTimestamps();
    if (!latest)
    {
        log::error("Failed to get latest timestamps: {}", latest.error());
        return evaluate(LatestTimestamps {}, _config, _startedAt, now());
    }
    return evaluate(*latest, _config, _startedAt, now());
}

auto HealthMonitor::evaluate(const LatestTimestamps& latest,
                             const HealthConfig& config,
                             Timestamp startedAt,
                             Timestamp now) -> HealthReport
{
    auto report = HealthReport {};
    report.lastFrame = latest.frame;
    report.lastAudio = latest.audio;

    if (now - startedAt < config.loadingGrace)
    {
        report.status = OverallStatus::Loading;
        report.frameStatus = config.visionEnabled ? ModalityStatus::Loading : ModalityStatus::Disabled;
        report.audioStatus = config.audioEnabled ? ModalityStatus::Loading : ModalityStatus::Disabled;
        report.message = "The application is still initializing. Please wait...";
        return report;
    }

    report.frameStatus = modalityStatus(config.visionEnabled, latest.frame, config.freshness, now);
    report.audioStatus = modalityStatus(config.audioEnabled, latest.audio, config.freshness, now);

    if (healthy(report.frameStatus) && healthy(report.audioStatus))
    {
        report.status = OverallStatus::Healthy;
        report.message = "All systems are functioning normally.";
        return report;
    }

    report.status = OverallStatus::Unhealthy;
    report.message = std::format("Some systems are not functioning properly. Frame status: {}, Audio status: {}",
                                 modalityStatusToString(report.frameStatus),
                                 modalityStatusToString(report.audioStatus));
    report.verboseInstructions = std::string(TroubleshootingSteps);
    return report;
}

} // namespace sightline
