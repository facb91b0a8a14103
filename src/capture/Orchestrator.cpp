// SPDX-License-Identifier: Apache-2.0
#include "Orchestrator.hpp"

#include <audio/AudioCaptureLoop.hpp>
#include <core/Channel.hpp>
#include <core/Log.hpp>
#include <core/Time.hpp>

#include <cmath>
#include <exception>
#include <format>
#include <map>
#include <optional>
#include <set>
#include <thread>

namespace sightline
{

namespace
{

    auto toMillis(std::chrono::steady_clock::duration d) -> long long
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    }

} // namespace

/// @brief One recording cycle: its capture streams, the two writers and their channels.
class Orchestrator::Cycle
{
  public:
    Cycle(Orchestrator& owner, std::uint64_t number, std::stop_token shutdown):
        _owner(owner),
        _config(owner._config),
        _services(owner._services),
        _number(number),
        _shutdown(shutdown),
        _forwardShutdown(shutdown, [this] { _stop.request_stop(); }),
        _frames(_config.channelCapacity),
        _segments(_config.channelCapacity)
    {
    }

    Cycle(const Cycle&) = delete;
    Cycle& operator=(const Cycle&) = delete;

    [[nodiscard]] auto run() -> CycleOutcome
    {
        _owner.setState(CycleState::Starting);
        log::info("Starting recording cycle {}", _number);

        startWriters();
        startMissingStreams();

        _owner.setState(CycleState::Running);
        log::info("Recording cycle {} running: {} capture stream(s)", _number, liveCount());

        while (sleepFor(_config.rescanInterval, _stop.get_token()))
            startMissingStreams();

        auto const shuttingDown = _shutdown.stop_requested();
        _owner.setState(shuttingDown ? CycleState::Draining : CycleState::Restarting);
        teardown();
        return shuttingDown ? CycleOutcome::Shutdown : CycleOutcome::Restart;
    }

  private:
    void requestRestart(std::string const& reason)
    {
        if (!_restartRequested.exchange(true))
            log::error("Recording cycle {} aborted: {}", _number, reason);
        _stop.request_stop();
    }

    void guarded(std::string const& what, std::function<void()> const& body)
    {
        auto const context = log::ScopedContext { what };
        try
        {
            body();
        }
        catch (const std::exception& e)
        {
            requestRestart(std::format("{} failed with an exception: {}", what, e.what()));
        }
    }

    [[nodiscard]] auto liveCount() -> size_t
    {
        auto lock = std::lock_guard(_liveMutex);
        return _live.size();
    }

    [[nodiscard]] auto isLive(std::string const& key) -> bool
    {
        auto lock = std::lock_guard(_liveMutex);
        return _live.contains(key);
    }

    /// @brief Resolves the configured sources and starts a stream for each one without a live stream.
    void startMissingStreams()
    {
        auto& registry = _services.registry;

        if (!_config.disableVision)
        {
            if (auto monitors = registry.resolveMonitors(_config.monitorIds, MissingSources::Skip); !monitors)
            {
                log::warning("Cannot list monitors: {}", monitors.error());
            }
            else
            {
                for (auto const& monitor: *monitors)
                {
                    auto key = std::format("monitor {}", monitor.id);
                    if (!isLive(key))
                        startStream(std::move(key), [this, monitor] { return captureMonitor(monitor); });
                }
            }
        }

        if (!_config.disableAudio && registry.audioBackend())
        {
            if (auto devices = registry.resolveAudioDevices(_config.audioDeviceIds, MissingSources::Skip); !devices)
            {
                log::warning("Cannot list audio devices: {}", devices.error());
            }
            else
            {
                for (auto const& device: *devices)
                {
                    // A stopped device gets a stream again once it is set back to running.
                    if (registry.deviceState(device) == DeviceState::Stopped)
                        continue;
                    auto key = std::format("audio device '{}'", device.id());
                    if (!isLive(key))
                        startStream(std::move(key), [this, device] { return captureDevice(device); });
                }
            }
        }
    }

    void startStream(std::string key, std::function<VoidResult()> body)
    {
        {
            auto lock = std::lock_guard(_liveMutex);
            _live.insert(key);
        }
        log::debug("Starting capture of {}", key);

        // Replacing a finished stream's thread joins it.
        _streams.insert_or_assign(key, std::jthread([this, key, body = std::move(body)] {
                                      auto result = VoidResult {};
                                      guarded(key, [&] { result = body(); });
                                      streamEnded(key, result);
                                  }));
    }

    void streamEnded(std::string const& key, VoidResult const& result)
    {
        auto remaining = size_t { 0 };
        {
            auto lock = std::lock_guard(_liveMutex);
            _live.erase(key);
            remaining = _live.size();
        }

        if (result || _stop.stop_requested())
        {
            log::debug("Capture of {} finished", key);
            return;
        }

        log::error("Capture of {} ended at {}: {}", key, formatTimestamp(Clock::now()), result.error());

        if (result.error().code == ErrorCode::VisionError)
            requestRestart(std::format("{} failed: {}", key, result.error().message));
        else if (remaining == 0)
            requestRestart(std::format("no capture stream left after {} failed", key));
        else
            log::info("Capture of {} is retried by the next source scan", key);
    }

    [[nodiscard]] auto captureMonitor(MonitorInfo const& monitor) -> VoidResult
    {
        auto loop = VisionCaptureLoop(
            monitor,
            *_services.registry.screenCapture(),
            *_services.ocr,
            WindowFilter(_config.includedWindows, _config.ignoredWindows),
            _services.control,
            _config.vision,
            [this](CaptureFrame frame, std::stop_token stop) { return _frames.push(std::move(frame), stop); });
        return loop.run(_stop.get_token());
    }

    [[nodiscard]] auto captureDevice(AudioDevice const& device) -> VoidResult
    {
        auto source = _services.registry.audioBackend()->open(device);
        if (!source)
            return std::unexpected(source.error());

        auto loop = AudioCaptureLoop(std::move(*source),
                                     _services.vad,
                                     _config.segmenter,
                                     _services.registry.stateProvider(device),
                                     [this](AudioSegment segment, std::stop_token stop) {
                                         return _segments.push(std::move(segment), stop);
                                     });
        return loop.run(_stop.get_token());
    }

    void startWriters()
    {
        if (!_config.disableVision)
            _videoWriter = std::jthread([this] { guarded("video writer", [this] { writeFrames(); }); });
        if (!_config.disableAudio)
            _audioWriter = std::jthread([this] { guarded("audio writer", [this] { writeSegments(); }); });
    }

    void writeFrames()
    {
        while (auto frame = _frames.pop())
        {
            if (_restartRequested.load())
            {
                ++_droppedUnits;
                continue;
            }

            auto ref = _services.chunks.appendFrame(*frame);
            if (!ref)
            {
                if (isPersistenceFailure(ref.error().code))
                    requestRestart(std::format("video chunk write failed: {}", ref.error().message));
                else
                    log::warning("Dropping frame of monitor {}: {}", frame->monitorId, ref.error());
                continue;
            }

            auto rows = std::vector<OcrRow> {};
            rows.reserve(frame->windows.size());
            for (auto& window: frame->windows)
                rows.push_back(OcrRow { .text = std::move(window.text),
                                        .appName = std::move(window.appName),
                                        .windowName = std::move(window.windowName),
                                        .focused = window.focused });

            auto ids = _services.archive.insertFrame(
                FrameRow { .chunk = *ref, .timestamp = frame->timestamp, .monitorId = frame->monitorId }, rows);
            if (!ids)
            {
                requestRestart(std::format("frame insert failed: {}", ids.error().message));
                continue;
            }
            ++_owner._framesWritten;
            log::trace("Frame {} of monitor {} stored at {}:{} ({} OCR rows)",
                       ids->frameId,
                       frame->monitorId,
                       ref->path,
                       ref->offset,
                       ids->ocrIds.size());
        }
    }

    void writeSegments()
    {
        auto* engine = _services.transcription;
        auto stage = engine ? std::optional<TranscriptionStage> { std::in_place, *engine, _config.transcription }
                            : std::nullopt;
        auto drainDeadline = std::optional<std::chrono::steady_clock::time_point> {};
        auto untranscribed = 0;

        while (auto segment = _segments.pop())
        {
            if (_restartRequested.load())
            {
                ++_droppedUnits;
                continue;
            }

            if (_shutdown.stop_requested() && !drainDeadline)
                drainDeadline = std::chrono::steady_clock::now() + _config.drainTimeout;
            auto const pastDeadline = drainDeadline && std::chrono::steady_clock::now() >= *drainDeadline;

            // Past the drain deadline the segment is stored without asking the engine.
            auto transcript = Transcript {};
            if (stage && !pastDeadline)
                transcript = stage->transcribe(*segment, _shutdown);
            else if (stage)
                ++untranscribed;

            auto ref = _services.chunks.appendAudio(*segment);
            if (!ref)
            {
                requestRestart(std::format("audio chunk write failed: {}", ref.error().message));
                continue;
            }

            auto id = _services.archive.insertAudio(AudioRow {
                .chunk = *ref,
                .start = segment->start,
                .end = segment->end,
                .transcription = std::move(transcript.text),
                .engine = engine ? engine->name() : std::string { "none" },
                .deviceName = segment->device.name,
                .isInputDevice = segment->device.direction == DeviceDirection::Input,
            });
            if (!id)
            {
                requestRestart(std::format("transcription insert failed: {}", id.error().message));
                continue;
            }
            ++_owner._segmentsWritten;
        }

        if (untranscribed > 0)
            log::warning("Stored {} audio segment(s) without transcription after the {} ms drain timeout",
                         untranscribed,
                         _config.drainTimeout.count());
    }

    void teardown()
    {
        _streams.clear();
        _frames.close();
        _segments.close();
        if (_videoWriter.joinable())
            _videoWriter.join();
        if (_audioWriter.joinable())
            _audioWriter.join();

        if (auto const lag = _frames.blockedTime(); lag > std::chrono::steady_clock::duration::zero())
            log::info("Vision capture lag in cycle {}: {} ms blocked on the writer", _number, toMillis(lag));
        if (auto const lag = _segments.blockedTime(); lag > std::chrono::steady_clock::duration::zero())
            log::info("Audio capture lag in cycle {}: {} ms blocked on the writer", _number, toMillis(lag));
        if (_droppedUnits.load() > 0)
            log::warning("Recording cycle {} dropped {} queued unit(s) after its failure", _number, _droppedUnits.load());

        if (auto finalized = _services.chunks.finalizeAll(); !finalized)
            log::error("Finalizing chunks of cycle {} failed: {}", _number, finalized.error());
    }

    Orchestrator& _owner;
    OrchestratorConfig const& _config;
    CaptureServices& _services;
    std::uint64_t _number;
    std::stop_token _shutdown;
    std::stop_source _stop;
    std::stop_callback<std::function<void()>> _forwardShutdown;
    std::atomic<bool> _restartRequested = false;
    std::atomic<std::uint64_t> _droppedUnits = 0;

    BoundedChannel<CaptureFrame> _frames;
    BoundedChannel<AudioSegment> _segments;

    std::mutex _liveMutex;
    std::set<std::string> _live;
    std::map<std::string, std::jthread> _streams; ///< touched by the cycle thread only
    std::jthread _videoWriter;
    std::jthread _audioWriter;
};

Orchestrator::Orchestrator(OrchestratorConfig config, CaptureServices services):
    _config(std::move(config)), _services(services)
{
}

void Orchestrator::setStateCallback(StateCallback callback)
{
    auto lock = std::lock_guard(_callbackMutex);
    _stateCallback = std::move(callback);
}

void Orchestrator::setState(CycleState state)
{
    _state.store(state);
    log::debug("Recording cycle state: {}", cycleStateToString(state));

    auto lock = std::lock_guard(_callbackMutex);
    if (_stateCallback)
        _stateCallback(state);
}

auto Orchestrator::validate() -> VoidResult
{
    auto& registry = _services.registry;

    if (!_config.disableVision)
    {
        if (!_services.ocr || !registry.screenCapture())
            return makeError(ErrorCode::ConfigError, "Vision capture needs a screen capturer and an OCR engine");
        if (!std::isfinite(_config.vision.fps) || _config.vision.fps <= 0.0)
            return makeError(ErrorCode::ConfigError, std::format("Invalid fps: {}", _config.vision.fps));

        auto monitors = registry.resolveMonitors(_config.monitorIds);
        if (!monitors && monitors.error().code == ErrorCode::ConfigError)
            return std::unexpected(monitors.error());
        if (!monitors)
            log::warning("Monitors are not available yet: {}", monitors.error());
        else if (monitors->empty())
            log::warning("No monitors found yet");
    }

    if (!_config.disableAudio)
    {
        if (!registry.audioBackend())
        {
            log::info("No audio backend available; recording without audio");
        }
        else
        {
            auto devices = registry.resolveAudioDevices(_config.audioDeviceIds);
            if (!devices && devices.error().code == ErrorCode::ConfigError)
                return std::unexpected(devices.error());
            if (!devices)
                log::info("Audio devices are not available yet: {}", devices.error());
            else if (devices->empty())
                log::info("No audio devices to record yet");
        }
    }

    return {};
}

auto Orchestrator::run(std::stop_token shutdown) -> VoidResult
{
    if (auto valid = validate(); !valid)
    {
        setState(CycleState::Stopped);
        return std::unexpected(valid.error());
    }

    while (!shutdown.stop_requested())
    {
        auto cycle = Cycle(*this, ++_cycles, shutdown);
        if (cycle.run() == CycleOutcome::Shutdown)
            break;

        log::info("Restarting recording in {} ms", _config.restartDelay.count());
        if (!sleepFor(_config.restartDelay, shutdown))
            break;
    }

    setState(CycleState::Stopped);
    log::info("Recording stopped after {} cycle(s): {} frames, {} audio segments",
              _cycles.load(),
              _framesWritten.load(),
              _segmentsWritten.load());
    return {};
}

} // namespace sightline
