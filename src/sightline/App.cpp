// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/MiniaudioBackend.hpp>
#include <audio/RpcTranscriptionEngine.hpp>
#include <audio/VoiceActivityDetector.hpp>
#include <audio/WhisperEngine.hpp>
#include <capture/DeviceRegistry.hpp>
#include <capture/Orchestrator.hpp>
#include <capture/ProcessWatchdog.hpp>
#include <core/Log.hpp>
#include <rpc/RpcClient.hpp>
#include <rpc/StdioTransport.hpp>
#include <search/HealthMonitor.hpp>
#include <search/RetrievalService.hpp>
#include <sightline/ServiceApi.hpp>
#include <storage/Archive.hpp>
#include <storage/ChunkWriter.hpp>
#include <vision/CaptureControl.hpp>
#include <vision/RpcOcrEngine.hpp>
#include <vision/X11ScreenCapture.hpp>

#include <charconv>
#include <filesystem>
#include <format>
#include <print>
#include <thread>

#include <unistd.h>

namespace sightline
{

namespace
{

    constexpr auto OcrTimeout = std::chrono::milliseconds { 30'000 };
    constexpr auto TranscriptionTimeout = std::chrono::milliseconds { 120'000 };
    constexpr auto VideoStreamPrefix = std::string_view { "monitor_" };

    /// @brief Client of a helper process that is spawned on first use and respawned after a crash.
    auto makeHelperClient(ProcessConfig process, std::string clientName) -> std::unique_ptr<RpcClient>
    {
        auto factory = [process = std::move(process)]() -> Result<std::unique_ptr<Transport>> {
            auto transport = std::make_unique<StdioTransport>();
            if (auto started = transport->start(process); !started)
                return std::unexpected(started.error());
            return transport;
        };
        return std::make_unique<RpcClient>(std::move(factory), std::move(clientName));
    }

    auto monitorIdOfStream(std::string_view stream) -> std::optional<std::uint32_t>
    {
        if (!stream.starts_with(VideoStreamPrefix))
            return std::nullopt;
        stream.remove_prefix(VideoStreamPrefix.size());
        auto id = std::uint32_t { 0 };
        auto const [end, ec] = std::from_chars(stream.data(), stream.data() + stream.size(), id);
        if (ec != std::errc {} || end != stream.data() + stream.size())
            return std::nullopt;
        return id;
    }

    void waitForShutdown(std::stop_token stop)
    {
        while (sleepFor(std::chrono::seconds { 3600 }, stop))
            ;
    }

} // namespace

struct App::Impl
{
    AppConfig config;
    std::filesystem::path dataDir;

    std::unique_ptr<MiniaudioBackend> audio;
    std::unique_ptr<X11ScreenCapture> screen;
    std::unique_ptr<DeviceRegistry> registry;

    std::unique_ptr<Archive> archive;
    std::unique_ptr<ChunkWriter> chunks;
    std::unique_ptr<OcrEngine> ocr;
    std::unique_ptr<TranscriptionEngine> transcription;
    EnergyVad vad;
    CaptureControl control;

    std::unique_ptr<HealthMonitor> health;
    std::unique_ptr<RetrievalService> retrieval;
    std::unique_ptr<ServiceApi> api;
    std::unique_ptr<Orchestrator> orchestrator;

    explicit Impl(AppConfig cfg):
        config(std::move(cfg)),
        dataDir(config.capture.dataDir.empty() ? defaultDataDir() : config.capture.dataDir),
        vad(config.audio.vadSensitivity)
    {
    }

    auto createTranscriptionEngine() -> VoidResult
    {
        auto const& audioConfig = config.audio;
        if (audioConfig.transcriptionEngine == TranscriptionEngineKind::Process)
        {
            transcription = std::make_unique<RpcTranscriptionEngine>(
                makeHelperClient(audioConfig.transcriptionProcess, "sightline-transcription"), TranscriptionTimeout);
            return {};
        }

        auto whisper = std::make_unique<WhisperEngine>();
        auto initialized = whisper->initialize(WhisperConfig {
            .modelPath = audioConfig.whisperModelPath,
            .language = audioConfig.language,
            .threads = audioConfig.threads,
            .translate = false,
        });
        if (!initialized)
            return initialized;
        transcription = std::move(whisper);
        return {};
    }

    auto orchestratorConfig() const -> OrchestratorConfig
    {
        auto const& c = config.capture;
        return OrchestratorConfig {
            .disableAudio = c.disableAudio || !audio,
            .disableVision = c.disableVision,
            .audioDeviceIds = c.audioDevices,
            .monitorIds = c.monitorIds,
            .segmenter = SegmenterConfig {
                .chunkDuration = std::chrono::seconds { c.audioChunkDurationSec },
                .silenceDuration = std::chrono::milliseconds { config.audio.silenceDurationMs },
            },
            .vision = VisionLoopConfig {
                .fps = c.fps,
                .failureTimeout = std::chrono::seconds { c.visionFailureTimeoutSec },
                .dedup = c.ocrDedup,
            },
            .includedWindows = c.includedWindows,
            .ignoredWindows = c.ignoredWindows,
            .transcription = TranscriptionPolicy {
                .retries = config.audio.transcriptionRetries,
                .backoff = std::chrono::milliseconds { config.audio.transcriptionBackoffMs },
            },
            .channelCapacity = static_cast<size_t>(c.channelCapacity),
            .restartDelay = std::chrono::milliseconds { c.restartDelayMs },
            .rescanInterval = std::chrono::milliseconds { c.rescanIntervalMs },
            .drainTimeout = std::chrono::milliseconds { c.drainTimeoutMs },
        };
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App() = default;

auto App::initializeDevices() -> VoidResult
{
    auto const& capture = _impl->config.capture;

    if (!capture.disableAudio)
    {
        auto audio = std::make_unique<MiniaudioBackend>();
        if (auto initialized = audio->initialize(); initialized)
            _impl->audio = std::move(audio);
        else
            log::warning("Audio backend unavailable, recording without audio: {}", initialized.error());
    }

    if (!capture.disableVision)
    {
        auto screen = std::make_unique<X11ScreenCapture>();
        if (auto opened = screen->open(); !opened)
            return makeError(ErrorCode::ConfigError,
                             std::format("Cannot open the display for vision capture: {}", opened.error().message));
        _impl->screen = std::move(screen);
    }

    _impl->registry = std::make_unique<DeviceRegistry>(_impl->audio.get(), _impl->screen.get());
    return {};
}

auto App::initializeRecording() -> VoidResult
{
    auto& impl = *_impl;
    auto const& capture = impl.config.capture;

    auto ec = std::error_code {};
    std::filesystem::create_directories(impl.dataDir, ec);
    if (ec)
        return makeError(ErrorCode::ConfigError,
                         std::format("Cannot create data directory '{}': {}", impl.dataDir.string(), ec.message()));

    auto archive = Archive::open(impl.dataDir / "db.sqlite");
    if (!archive)
        return std::unexpected(archive.error());
    impl.archive = std::move(*archive);

    auto* archivePtr = impl.archive.get();
    impl.chunks = std::make_unique<ChunkWriter>(
        ChunkWriterConfig {
            .dataDir = impl.dataDir,
            .videoChunkDuration = std::chrono::seconds { capture.videoChunkDurationSec },
            .audioChunkDuration = std::chrono::seconds { capture.audioChunkDurationSec },
            .jpegQuality = 80,
        },
        [archivePtr](StreamKind kind, const std::string& stream, const std::string& path, Timestamp startedAt)
            -> VoidResult {
            if (kind == StreamKind::Audio)
            {
                auto device = parseAudioDevice(stream);
                auto id = archivePtr->registerAudioChunk(path, device ? device->name : stream, startedAt);
                if (!id)
                    return std::unexpected(id.error());
                return {};
            }

            auto monitorId = monitorIdOfStream(stream);
            if (!monitorId)
                return makeError(ErrorCode::InvalidArgument, std::format("Unknown video stream '{}'", stream));
            auto id = archivePtr->registerVideoChunk(path, *monitorId, startedAt);
            if (!id)
                return std::unexpected(id.error());
            return {};
        });
    if (auto prepared = impl.chunks->prepare(); !prepared)
        return prepared;

    if (!capture.disableVision)
    {
        if (impl.config.ocr.command.empty())
            return makeError(ErrorCode::ConfigError, "Vision capture requires an OCR helper ('ocr.command')");

        auto client = makeHelperClient(impl.config.ocr, "sightline-ocr");
        if (auto info = client->connect(); info)
            log::info("OCR engine: {} {}", info->name, info->version);
        else
            log::warning("OCR engine not reachable yet, will retry on first frame: {}", info.error());
        impl.ocr = std::make_unique<RpcOcrEngine>(std::move(client), OcrTimeout);
    }

    if (!capture.disableAudio && impl.audio)
    {
        if (auto created = impl.createTranscriptionEngine(); !created)
            return created;
    }

    impl.health = std::make_unique<HealthMonitor>(*impl.archive,
                                                  HealthConfig {
                                                      .freshness = std::chrono::seconds { impl.config.health.freshnessSec },
                                                      .loadingGrace =
                                                          std::chrono::seconds { impl.config.health.loadingGraceSec },
                                                      .visionEnabled = !capture.disableVision,
                                                      .audioEnabled = !capture.disableAudio && impl.audio != nullptr,
                                                  },
                                                  now());
    impl.retrieval = std::make_unique<RetrievalService>(*impl.archive, impl.config.search.framePolicy);
    impl.api = std::make_unique<ServiceApi>(*impl.retrieval, *impl.archive, *impl.registry, *impl.health, impl.control);
    impl.orchestrator = std::make_unique<Orchestrator>(impl.orchestratorConfig(),
                                                       CaptureServices {
                                                           .registry = *impl.registry,
                                                           .vad = impl.vad,
                                                           .ocr = impl.ocr.get(),
                                                           .transcription = impl.transcription.get(),
                                                           .chunks = *impl.chunks,
                                                           .archive = *impl.archive,
                                                           .control = impl.control,
                                                       });

    log::info("Data directory: {}", impl.dataDir.string());
    return {};
}

auto App::printAudioDevices() -> int
{
    auto devices = _impl->registry->listAudioDevices();
    if (!devices)
    {
        log::error("Cannot list audio devices: {}", devices.error());
        return 1;
    }

    std::println("Available audio devices:");
    for (auto const& info: *devices)
        std::println("  {}{}", info.device.id(), info.isDefault ? " (default)" : "");
    return 0;
}

auto App::printMonitors() -> int
{
    auto monitors = _impl->registry->listMonitors();
    if (!monitors)
    {
        log::error("Cannot list monitors: {}", monitors.error());
        return 1;
    }

    std::println("Available monitors:");
    for (auto const& monitor: *monitors)
        std::println("  {}. {} {}x{}{}",
                     monitor.id,
                     monitor.name,
                     monitor.width,
                     monitor.height,
                     monitor.isDefault ? " (default)" : "");
    return 0;
}

auto App::run(ShutdownSignal& shutdown, bool stdioApi) -> int
{
    auto& impl = *_impl;

    auto watchdog = std::unique_ptr<ProcessWatchdog> {};
    if (impl.config.watchPid)
    {
        watchdog = std::make_unique<ProcessWatchdog>(static_cast<pid_t>(*impl.config.watchPid), shutdown);
        watchdog->start();
    }

    auto recordResult = VoidResult {};
    auto recorder = std::jthread([&] {
        recordResult = impl.orchestrator->run(shutdown.token());
        if (!recordResult)
            shutdown.trigger();
    });

    if (stdioApi)
    {
        log::info("Serving the JSON-RPC API on stdin/stdout");
        if (auto served = impl.api->serve(STDIN_FILENO, STDOUT_FILENO, shutdown.token()); !served)
            log::error("API stopped: {}", served.error());
        shutdown.trigger();
    }
    else
    {
        waitForShutdown(shutdown.token());
    }

    log::info("Shutting down");
    recorder.join();
    if (watchdog)
        watchdog->stop();

    if (!recordResult)
    {
        log::error("Recording failed: {}", recordResult.error());
        return 1;
    }
    return 0;
}

} // namespace sightline
