// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace sightline
{

namespace
{

    auto parseProcess(const nlohmann::json& obj) -> ProcessConfig
    {
        auto process = ProcessConfig {
            .command = json::getStringOr(obj, "command", ""),
            .args = json::getStringList(obj, "args"),
            .env = {},
        };

        if (obj.contains("env") && obj["env"].is_object())
        {
            for (const auto& [key, value]: obj["env"].items())
            {
                if (value.is_string())
                    process.env[key] = value.get<std::string>();
            }
        }
        return process;
    }

    auto unknownValue(std::string_view key, std::string_view value) -> Error
    {
        return Error { .code = ErrorCode::ConfigError,
                       .message = std::format("Unknown value '{}' for '{}'", value, key) };
    }

} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/sightline";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/sightline";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto defaultDataDir() -> std::string
{
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData && *xdgData)
        return std::string(xdgData) + "/sightline";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/sightline";
    return ".";
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return makeError(ErrorCode::ConfigError,
                         std::format("Invalid config file {}: {}", path, parseResult.error().message));

    return parseConfig(*parseResult);
}

auto parseConfig(const nlohmann::json& root) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = AppConfig {};

    // Capture section
    if (root.contains("capture"))
    {
        auto const& capture = root["capture"];
        auto& c = config.capture;
        c.dataDir = json::getStringOr(capture, "dataDir", "");
        c.fps = json::getDoubleOr(capture, "fps", c.fps);
        c.videoChunkDurationSec = json::getIntOr(capture, "videoChunkDurationSec", c.videoChunkDurationSec);
        c.audioChunkDurationSec = json::getIntOr(capture, "audioChunkDurationSec", c.audioChunkDurationSec);
        c.disableAudio = json::getBoolOr(capture, "disableAudio", false);
        c.disableVision = json::getBoolOr(capture, "disableVision", false);
        c.audioDevices = json::getStringList(capture, "audioDevices");
        c.ignoredWindows = json::getStringList(capture, "ignoredWindows");
        c.includedWindows = json::getStringList(capture, "includedWindows");
        c.channelCapacity = json::getIntOr(capture, "channelCapacity", c.channelCapacity);
        c.visionFailureTimeoutSec =
            json::getIntOr(capture, "visionFailureTimeoutSec", c.visionFailureTimeoutSec);
        c.restartDelayMs = json::getIntOr(capture, "restartDelayMs", c.restartDelayMs);
        c.rescanIntervalMs = json::getIntOr(capture, "rescanIntervalMs", c.rescanIntervalMs);
        c.drainTimeoutMs = json::getIntOr(capture, "drainTimeoutMs", c.drainTimeoutMs);

        if (capture.contains("monitorIds") && capture["monitorIds"].is_array())
        {
            for (auto const& id: capture["monitorIds"])
            {
                if (!id.is_number_unsigned())
                    return makeError(ErrorCode::ConfigError, "'monitorIds' must contain non-negative integers");
                c.monitorIds.push_back(id.get<std::uint32_t>());
            }
        }

        auto const dedup = json::getStringOr(capture, "ocrDedup", "none");
        auto policy = ocrDedupPolicyFromString(dedup);
        if (!policy)
            return std::unexpected(unknownValue("capture.ocrDedup", dedup));
        c.ocrDedup = *policy;
    }

    // Audio section
    if (root.contains("audio"))
    {
        auto const& audio = root["audio"];
        auto& a = config.audio;

        auto const sensitivity = json::getStringOr(audio, "vadSensitivity", "high");
        auto parsedSensitivity = vadSensitivityFromString(sensitivity);
        if (!parsedSensitivity)
            return std::unexpected(unknownValue("audio.vadSensitivity", sensitivity));
        a.vadSensitivity = *parsedSensitivity;

        auto const engine = json::getStringOr(audio, "transcriptionEngine", "whisper");
        if (engine == "whisper")
            a.transcriptionEngine = TranscriptionEngineKind::Whisper;
        else if (engine == "process")
            a.transcriptionEngine = TranscriptionEngineKind::Process;
        else
            return std::unexpected(unknownValue("audio.transcriptionEngine", engine));

        a.silenceDurationMs = json::getIntOr(audio, "silenceDurationMs", a.silenceDurationMs);
        a.whisperModelPath = json::getStringOr(audio, "whisperModelPath", "");
        a.language = json::getStringOr(audio, "language", a.language);
        a.threads = json::getIntOr(audio, "threads", a.threads);
        a.transcriptionRetries = json::getIntOr(audio, "transcriptionRetries", a.transcriptionRetries);
        a.transcriptionBackoffMs = json::getIntOr(audio, "transcriptionBackoffMs", a.transcriptionBackoffMs);
        if (audio.contains("transcriptionProcess") && audio["transcriptionProcess"].is_object())
            a.transcriptionProcess = parseProcess(audio["transcriptionProcess"]);
    }

    // OCR helper
    if (root.contains("ocr") && root["ocr"].is_object())
        config.ocr = parseProcess(root["ocr"]);

    // Search section
    if (root.contains("search"))
    {
        auto const policyName = json::getStringOr(root["search"], "framePolicy", "omit");
        auto policy = framePolicyFromString(policyName);
        if (!policy)
            return std::unexpected(unknownValue("search.framePolicy", policyName));
        config.search.framePolicy = *policy;
    }

    // Health section
    if (root.contains("health"))
    {
        auto const& health = root["health"];
        config.health.freshnessSec = json::getIntOr(health, "freshnessSec", config.health.freshnessSec);
        config.health.loadingGraceSec = json::getIntOr(health, "loadingGraceSec", config.health.loadingGraceSec);
    }

    auto const levelName = json::getStringOr(root, "logLevel", "info");
    auto level = log::levelFromString(levelName);
    if (!level)
        return std::unexpected(unknownValue("logLevel", levelName));
    config.logLevel = *level;

    if (root.contains("watchPid") && root["watchPid"].is_number_integer())
        config.watchPid = root["watchPid"].get<int>();

    return config;
}

auto validateConfig(const AppConfig& config) -> VoidResult
{
    auto const& c = config.capture;

    if (!c.disableVision && (!std::isfinite(c.fps) || c.fps <= 0.0))
        return makeError(ErrorCode::ConfigError, std::format("fps must be a positive number, got {}", c.fps));
    if (c.videoChunkDurationSec <= 0 || c.audioChunkDurationSec <= 0)
        return makeError(ErrorCode::ConfigError, "Chunk durations must be positive");
    if (c.channelCapacity <= 0)
        return makeError(ErrorCode::ConfigError, "channelCapacity must be positive");
    if (c.visionFailureTimeoutSec <= 0)
        return makeError(ErrorCode::ConfigError, "visionFailureTimeoutSec must be positive");
    if (c.restartDelayMs < 0)
        return makeError(ErrorCode::ConfigError, "restartDelayMs must not be negative");
    if (c.rescanIntervalMs <= 0)
        return makeError(ErrorCode::ConfigError, "rescanIntervalMs must be positive");
    if (c.drainTimeoutMs < 0)
        return makeError(ErrorCode::ConfigError, "drainTimeoutMs must not be negative");
    if (c.disableAudio && c.disableVision)
        return makeError(ErrorCode::ConfigError, "Both audio and vision capture are disabled");

    auto const& a = config.audio;
    if (a.silenceDurationMs <= 0)
        return makeError(ErrorCode::ConfigError, "silenceDurationMs must be positive");
    if (a.transcriptionRetries < 0 || a.transcriptionBackoffMs < 0)
        return makeError(ErrorCode::ConfigError, "Transcription retry settings must not be negative");
    if (!c.disableAudio && a.transcriptionEngine == TranscriptionEngineKind::Process
        && a.transcriptionProcess.command.empty())
        return makeError(ErrorCode::ConfigError, "audio.transcriptionProcess.command is required for 'process'");

    if (config.health.freshnessSec <= 0 || config.health.loadingGraceSec < 0)
        return makeError(ErrorCode::ConfigError, "Health thresholds must be positive");
    if (config.watchPid && *config.watchPid <= 0)
        return makeError(ErrorCode::ConfigError, std::format("Invalid watchPid {}", *config.watchPid));

    return {};
}

} // namespace sightline
