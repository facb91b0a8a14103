// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/VoiceActivityDetector.hpp>
#include <core/Error.hpp>
#include <core/Log.hpp>
#include <nlohmann/json.hpp>
#include <rpc/StdioTransport.hpp>
#include <search/RetrievalService.hpp>
#include <vision/OcrDeduplicator.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sightline
{

/// @brief Which engine turns audio segments into text.
enum class TranscriptionEngineKind : std::uint8_t
{
    Whisper, ///< in-process whisper.cpp
    Process, ///< external helper process over JSON-RPC
};

/// @brief Capture section.
struct CaptureConfig
{
    std::string dataDir;
    double fps = 1.0;
    int videoChunkDurationSec = 60;
    int audioChunkDurationSec = 30;
    bool disableAudio = false;
    bool disableVision = false;
    std::vector<std::uint32_t> monitorIds;
    std::vector<std::string> audioDevices;
    std::vector<std::string> ignoredWindows;
    std::vector<std::string> includedWindows;
    OcrDedupPolicy ocrDedup = OcrDedupPolicy::None;
    int channelCapacity = 64;
    int visionFailureTimeoutSec = 300;
    int restartDelayMs = 1000;
    int rescanIntervalMs = 30000;
    int drainTimeoutMs = 10000;
};

/// @brief Audio section.
struct AudioConfig
{
    VadSensitivity vadSensitivity = VadSensitivity::High;
    int silenceDurationMs = 1000;
    TranscriptionEngineKind transcriptionEngine = TranscriptionEngineKind::Whisper;
    std::string whisperModelPath;
    std::string language = "en";
    int threads = 4;
    int transcriptionRetries = 2;
    int transcriptionBackoffMs = 500;
    ProcessConfig transcriptionProcess;
};

struct SearchConfig
{
    FramePolicy framePolicy = FramePolicy::OmitRow;
};

struct HealthSettings
{
    int freshnessSec = 60;
    int loadingGraceSec = 120;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    CaptureConfig capture;
    AudioConfig audio;
    ProcessConfig ocr; ///< OCR helper process; empty command disables vision OCR
    SearchConfig search;
    HealthSettings health;
    log::Level logLevel = log::Level::Info;
    std::optional<int> watchPid;
};

/// @brief Loads the configuration from the default path, or defaults when no file exists.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the configuration from a specific file path.
/// @return The configuration, or ConfigError for unreadable JSON and unknown enum values.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses a configuration from an already loaded JSON document.
[[nodiscard]] auto parseConfig(const nlohmann::json& root) -> Result<AppConfig>;

/// @brief Rejects configurations that cannot start a recording.
[[nodiscard]] auto validateConfig(const AppConfig& config) -> VoidResult;

/// @brief $XDG_CONFIG_HOME/sightline, or ~/.config/sightline.
[[nodiscard]] auto defaultConfigDir() -> std::string;

[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief $XDG_DATA_HOME/sightline, or ~/.local/share/sightline.
[[nodiscard]] auto defaultDataDir() -> std::string;

} // namespace sightline
