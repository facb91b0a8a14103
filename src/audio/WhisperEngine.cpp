// SPDX-License-Identifier: Apache-2.0
#include "WhisperEngine.hpp"

#include <core/Log.hpp>

#include <whisper.h>

#include <format>
#include <mutex>
#include <optional>
#include <string>

namespace sightline
{

namespace
{

    std::mutex whisperLogMutex;

    /// @brief Line buffer for whisper.cpp log continuation messages.
    auto whisperLineBuffer = std::string {};

    auto mapGgmlLevel(ggml_log_level level) -> std::optional<log::Level>
    {
        switch (level)
        {
            case GGML_LOG_LEVEL_ERROR: return log::Level::Error;
            case GGML_LOG_LEVEL_WARN: return log::Level::Warning;
            case GGML_LOG_LEVEL_INFO: return log::Level::Debug;
            case GGML_LOG_LEVEL_DEBUG: return log::Level::Trace;
            default: return std::nullopt;
        }
    }

    /// @brief Forwards whisper.cpp / ggml output into the log, one complete line at a time.
    void whisperLogCallback(ggml_log_level level, char const* text, void* /*userData*/)
    {
        if (level == GGML_LOG_LEVEL_NONE || text == nullptr)
            return;

        auto lock = std::lock_guard(whisperLogMutex);
        whisperLineBuffer += std::string_view { text };

        while (true)
        {
            auto const nlPos = whisperLineBuffer.find('\n');
            if (nlPos == std::string::npos)
                break;

            auto line = whisperLineBuffer.substr(0, nlPos);
            auto const end = line.find_last_not_of(" \t\r");
            if (end != std::string::npos)
                line = line.substr(0, end + 1);

            if (!line.empty() && end != std::string::npos)
            {
                auto const logLevel = mapGgmlLevel(level).value_or(log::Level::Debug);
                if (log::getLevel() >= logLevel)
                    log::write(logLevel, std::format("whisper: {}", line));
            }

            whisperLineBuffer.erase(0, nlPos + 1);
        }
    }

} // namespace

struct WhisperEngine::Impl
{
    whisper_context* ctx = nullptr;
    WhisperConfig config;
    std::mutex mutex;

    ~Impl()
    {
        if (ctx)
            whisper_free(ctx);
    }
};

WhisperEngine::WhisperEngine(): _impl(std::make_unique<Impl>())
{
}

WhisperEngine::~WhisperEngine() = default;

auto WhisperEngine::initialize(const WhisperConfig& config) -> VoidResult
{
    if (config.modelPath.empty())
        return makeError(ErrorCode::ConfigError, "No whisper model configured (audio.whisperModelPath)");

    _impl->config = config;

    whisper_log_set(whisperLogCallback, nullptr);

    auto params = whisper_context_default_params();
    _impl->ctx = whisper_init_from_file_with_params(config.modelPath.c_str(), params);

    if (!_impl->ctx)
        return makeError(ErrorCode::TranscriptionError,
                         std::format("Failed to load whisper model: {}", config.modelPath));

    log::info("Whisper model loaded: {}", config.modelPath);
    return {};
}

auto WhisperEngine::transcribe(std::span<const float> samples) -> Result<std::string>
{
    auto lock = std::lock_guard(_impl->mutex);

    if (!_impl->ctx)
        return makeError(ErrorCode::TranscriptionError, "Whisper model not loaded");

    auto params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.language = _impl->config.language.c_str();
    params.translate = _impl->config.translate;
    params.n_threads = _impl->config.threads;
    params.print_progress = false;
    params.print_special = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.no_context = true;

    auto const result = whisper_full(_impl->ctx, params, samples.data(), static_cast<int>(samples.size()));

    if (result != 0)
        return makeError(ErrorCode::TranscriptionError,
                         std::format("Whisper transcription failed with code: {}", result));

    auto const nSegments = whisper_full_n_segments(_impl->ctx);
    auto text = std::string {};

    for (auto i = 0; i < nSegments; ++i)
    {
        auto const* segmentText = whisper_full_get_segment_text(_impl->ctx, i);
        if (segmentText)
            text += segmentText;
    }

    return normalizeTranscript(std::move(text));
}

auto WhisperEngine::isLoaded() const -> bool
{
    return _impl->ctx != nullptr;
}

} // namespace sightline
