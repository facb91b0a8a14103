// SPDX-License-Identifier: Apache-2.0
#include "Fakes.hpp"

#include <capture/DeviceRegistry.hpp>
#include <capture/Orchestrator.hpp>
#include <capture/ProcessWatchdog.hpp>
#include <storage/ChunkFile.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <set>
#include <thread>

using namespace sightline;
using namespace sightline::test;
using namespace std::chrono_literals;

namespace
{

auto const Mic = AudioDevice { .name = "Built-in Mic", .direction = DeviceDirection::Input };
auto const Speakers = AudioDevice { .name = "Speakers", .direction = DeviceDirection::Output };
auto const Headset = AudioDevice { .name = "Headset", .direction = DeviceDirection::Input };

auto knownDevices() -> std::vector<AudioDeviceInfo>
{
    return {
        AudioDeviceInfo { .device = Headset, .isDefault = false },
        AudioDeviceInfo { .device = Mic, .isDefault = true },
        AudioDeviceInfo { .device = Speakers, .isDefault = true },
    };
}

/// @brief Polls until the predicate holds or the deadline passes.
template <typename Predicate>
auto eventually(Predicate predicate, std::chrono::milliseconds timeout = 10s) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (predicate())
            return true;
        std::this_thread::sleep_for(10ms);
    }
    return predicate();
}

/// @brief Fake devices, engines and a real archive in a temp dir, wired to an orchestrator.
struct CaptureRig
{
    TempDir dir { "capture" };
    FakeAudioBackend audio;
    FakeScreenCapture screen;
    FakeOcrEngine ocr { "visible text" };
    FakeTranscriptionEngine transcription { "spoken text" };
    EnergyVad vad;
    CaptureControl control;
    DeviceRegistry registry { &audio, &screen };
    std::unique_ptr<Archive> archive = Archive::open(dir.path() / "db.sqlite").value();
    std::atomic<int> videoRegistrationFailures = 0;
    std::unique_ptr<ChunkWriter> chunks;

    CaptureRig()
    {
        audio.devices = knownDevices();
        chunks = std::make_unique<ChunkWriter>(
            ChunkWriterConfig { .dataDir = dir.path(), .videoChunkDuration = 60s, .audioChunkDuration = 60s, .jpegQuality = 70 },
            [this](StreamKind kind, const std::string& stream, const std::string& path, Timestamp startedAt) -> VoidResult {
                if (kind == StreamKind::Video && videoRegistrationFailures > 0)
                {
                    --videoRegistrationFailures;
                    return makeError(ErrorCode::DatabaseError, "database is locked");
                }
                if (kind == StreamKind::Video)
                    return archive->registerVideoChunk(path, 0, startedAt).transform([](auto) {});
                return archive->registerAudioChunk(path, stream, startedAt).transform([](auto) {});
            });
        REQUIRE(chunks->prepare().has_value());
    }

    auto config() const -> OrchestratorConfig
    {
        auto c = OrchestratorConfig {};
        c.audioDeviceIds = { Mic.id() };
        c.segmenter = SegmenterConfig { .chunkDuration = 100ms, .silenceDuration = 50ms };
        c.vision = VisionLoopConfig { .fps = 20.0, .failureTimeout = 5s };
        c.transcription = TranscriptionPolicy { .retries = 0, .backoff = 1ms };
        c.channelCapacity = 8;
        c.restartDelay = 10ms;
        c.rescanInterval = 20ms;
        c.drainTimeout = 5s;
        return c;
    }

    auto services() -> CaptureServices
    {
        return CaptureServices {
            .registry = registry,
            .vad = vad,
            .ocr = &ocr,
            .transcription = &transcription,
            .chunks = *chunks,
            .archive = *archive,
            .control = control,
        };
    }
};

} // namespace

TEST_CASE("DeviceRegistry selects the default devices when none are configured", "[registry]")
{
    auto backend = FakeAudioBackend {};
    backend.devices = knownDevices();
    auto registry = DeviceRegistry(&backend, nullptr);

    auto resolved = registry.resolveAudioDevices({});
    REQUIRE(resolved.has_value());
    CHECK(*resolved == std::vector { Mic, Speakers });
}

TEST_CASE("DeviceRegistry resolves configured device ids", "[registry]")
{
    auto backend = FakeAudioBackend {};
    backend.devices = knownDevices();
    auto registry = DeviceRegistry(&backend, nullptr);

    auto resolved = registry.resolveAudioDevices({ "Headset (input)", "Speakers (output)", "Headset (input)" });
    REQUIRE(resolved.has_value());
    CHECK(*resolved == std::vector { Headset, Speakers });

    auto unknown = registry.resolveAudioDevices({ "Headset (output)" });
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::ConfigError);

    auto malformed = registry.resolveAudioDevices({ "Headset" });
    REQUIRE(!malformed.has_value());
    CHECK(malformed.error().code == ErrorCode::ConfigError);
}

TEST_CASE("DeviceRegistry resolves monitors", "[registry]")
{
    auto screen = FakeScreenCapture {};
    screen.monitors.push_back(MonitorInfo { .id = 1, .name = "Display 1", .width = 32, .height = 32 });
    auto registry = DeviceRegistry(nullptr, &screen);

    CHECK(registry.resolveMonitors({}).value().size() == 2);
    CHECK(registry.resolveMonitors({ 1, 1 }).value().size() == 1);
    CHECK(registry.resolveMonitors({ 7 }).error().code == ErrorCode::ConfigError);
    CHECK(registry.listAudioDevices().error().code == ErrorCode::AudioError);
}

TEST_CASE("DeviceRegistry skips absent sources while recording", "[registry]")
{
    auto backend = FakeAudioBackend {};
    backend.devices = knownDevices();
    auto screen = FakeScreenCapture {};
    auto registry = DeviceRegistry(&backend, &screen);

    auto devices = registry.resolveAudioDevices({ "Headset (output)", Mic.id() }, MissingSources::Skip);
    REQUIRE(devices.has_value());
    CHECK(*devices == std::vector { Mic });

    auto malformed = registry.resolveAudioDevices({ "Headset" }, MissingSources::Skip);
    REQUIRE(!malformed.has_value());
    CHECK(malformed.error().code == ErrorCode::ConfigError);

    auto monitors = registry.resolveMonitors({ 7, 0 }, MissingSources::Skip);
    REQUIRE(monitors.has_value());
    REQUIRE(monitors->size() == 1);
    CHECK(monitors->front().id == 0);

    screen.listFailures = 1;
    CHECK(registry.resolveMonitors({}, MissingSources::Skip).error().code == ErrorCode::VisionError);
}

TEST_CASE("DeviceRegistry tracks device control state", "[registry]")
{
    auto registry = DeviceRegistry(nullptr, nullptr);
    auto const provider = registry.stateProvider(Mic);

    CHECK(provider() == DeviceState::Running);
    registry.setDeviceState(Mic, DeviceState::Paused);
    CHECK(provider() == DeviceState::Paused);
    CHECK(registry.deviceState(Speakers) == DeviceState::Running);
    CHECK(registry.deviceStates().size() == 1);
}

TEST_CASE("Orchestrator records both modalities until shutdown", "[orchestrator]")
{
    auto rig = CaptureRig {};
    auto orchestrator = Orchestrator(rig.config(), rig.services());
    auto shutdown = ShutdownSignal {};

    auto result = VoidResult {};
    auto thread = std::jthread([&] { result = orchestrator.run(shutdown.token()); });

    CHECK(eventually([&] { return orchestrator.framesWritten() >= 3 && orchestrator.segmentsWritten() >= 1; }));
    CHECK(orchestrator.state() == CycleState::Running);

    shutdown.trigger();
    thread.join();

    CHECK(result.has_value());
    CHECK(orchestrator.state() == CycleState::Stopped);
    CHECK(orchestrator.cycleCount() == 1);
    CHECK(rig.chunks->openChunkCount() == 0);

    auto screenText = rig.archive->search(SearchQuery { .text = "visible", .contentType = ContentType::Ocr, .limit = 1000 });
    REQUIRE(screenText.has_value());
    CHECK(static_cast<std::uint64_t>(screenText->size()) == orchestrator.framesWritten());

    auto speech = rig.archive->search(SearchQuery { .contentType = ContentType::Audio, .limit = 1000 });
    REQUIRE(speech.has_value());
    REQUIRE(!speech->empty());
    CHECK(std::get<AudioResult>(speech->front()).transcription == "spoken text");
    CHECK(std::get<AudioResult>(speech->front()).deviceName == Mic.name);
}

TEST_CASE("Orchestrator restarts the cycle after a persistence failure", "[orchestrator]")
{
    auto rig = CaptureRig {};
    rig.control.pauseVision();

    auto orchestrator = Orchestrator(rig.config(), rig.services());
    auto states = std::vector<CycleState> {};
    auto statesMutex = std::mutex {};
    orchestrator.setStateCallback([&](CycleState state) {
        auto lock = std::lock_guard(statesMutex);
        states.push_back(state);
    });

    auto shutdown = ShutdownSignal {};
    auto result = VoidResult {};
    auto thread = std::jthread([&] { result = orchestrator.run(shutdown.token()); });

    // Audio is stored in the first cycle before the first video chunk fails to register.
    REQUIRE(eventually([&] { return orchestrator.segmentsWritten() >= 2; }));
    rig.videoRegistrationFailures = 1;
    rig.control.resumeVision();

    CHECK(eventually([&] { return orchestrator.cycleCount() >= 2 && orchestrator.framesWritten() >= 2; }));
    auto const segmentsAfterRestart = orchestrator.segmentsWritten();
    CHECK(eventually([&] { return orchestrator.segmentsWritten() >= segmentsAfterRestart + 2; }));

    shutdown.trigger();
    thread.join();

    CHECK(result.has_value());
    CHECK(rig.audio.opened >= 2);
    {
        auto lock = std::lock_guard(statesMutex);
        CHECK(std::ranges::find(states, CycleState::Restarting) != states.end());
        CHECK(states.back() == CycleState::Stopped);
    }

    // Every stored unit, from either cycle, is searchable and reads back from its chunk.
    auto screenText = rig.archive->search(SearchQuery { .text = "visible", .contentType = ContentType::Ocr, .limit = 1000 });
    REQUIRE(screenText.has_value());
    CHECK(static_cast<std::uint64_t>(screenText->size()) == orchestrator.framesWritten());
    for (auto const& row: *screenText)
    {
        auto const& ocr = std::get<OcrResult>(row);
        CHECK(ChunkReader::readUnit(ocr.filePath, ocr.offsetIndex).has_value());
    }

    auto speech = rig.archive->search(SearchQuery { .contentType = ContentType::Audio, .limit = 1000 });
    REQUIRE(speech.has_value());
    CHECK(static_cast<std::uint64_t>(speech->size()) == orchestrator.segmentsWritten());
    auto audioChunks = std::set<std::string> {};
    for (auto const& row: *speech)
    {
        auto const& audio = std::get<AudioResult>(row);
        audioChunks.insert(audio.filePath);
        auto unit = ChunkReader::readUnit(audio.filePath, audio.offsetIndex);
        REQUIRE(unit.has_value());
        CHECK(decodePcm(unit->payload).has_value());
    }
    // Each cycle finalizes its chunks, so both cycles left an audio chunk behind.
    CHECK(audioChunks.size() >= 2);
}

TEST_CASE("Orchestrator restarts the cycle when a monitor keeps failing", "[orchestrator]")
{
    auto rig = CaptureRig {};
    rig.screen.failing = true;

    auto config = rig.config();
    config.disableAudio = true;
    config.vision.failureTimeout = 100ms;
    auto orchestrator = Orchestrator(config, rig.services());

    auto shutdown = ShutdownSignal {};
    auto result = VoidResult {};
    auto thread = std::jthread([&] { result = orchestrator.run(shutdown.token()); });

    CHECK(eventually([&] { return orchestrator.cycleCount() >= 2; }));
    CHECK(orchestrator.framesWritten() == 0);

    rig.screen.failing = false;
    CHECK(eventually([&] { return orchestrator.framesWritten() > 0; }));

    shutdown.trigger();
    thread.join();
    CHECK(result.has_value());
}

TEST_CASE("Orchestrator keeps recording the screen while an audio device is unplugged", "[orchestrator]")
{
    auto rig = CaptureRig {};
    auto orchestrator = Orchestrator(rig.config(), rig.services());

    auto shutdown = ShutdownSignal {};
    auto result = VoidResult {};
    auto thread = std::jthread([&] { result = orchestrator.run(shutdown.token()); });

    REQUIRE(eventually([&] { return orchestrator.framesWritten() >= 1 && orchestrator.segmentsWritten() >= 1; }));

    rig.audio.setUnplugged(true);
    auto const frames = orchestrator.framesWritten();
    CHECK(eventually([&] { return orchestrator.framesWritten() >= frames + 5; }));
    CHECK(orchestrator.cycleCount() == 1);
    CHECK(rig.audio.opened == 1);

    // A later scan finds the device again and records from it.
    rig.audio.setUnplugged(false);
    CHECK(eventually([&] { return rig.audio.opened >= 2; }));
    auto const segments = orchestrator.segmentsWritten();
    CHECK(eventually([&] { return orchestrator.segmentsWritten() > segments; }));
    CHECK(orchestrator.cycleCount() == 1);

    shutdown.trigger();
    thread.join();
    CHECK(result.has_value());
}

TEST_CASE("Orchestrator starts when monitors cannot be listed yet", "[orchestrator]")
{
    auto rig = CaptureRig {};
    rig.screen.listFailures = 2;

    auto orchestrator = Orchestrator(rig.config(), rig.services());
    auto shutdown = ShutdownSignal {};
    auto result = VoidResult {};
    auto thread = std::jthread([&] { result = orchestrator.run(shutdown.token()); });

    CHECK(eventually([&] { return orchestrator.framesWritten() >= 1 && orchestrator.segmentsWritten() >= 1; }));
    CHECK(orchestrator.cycleCount() == 1);
    CHECK(rig.screen.listFailures == 0);

    shutdown.trigger();
    thread.join();
    CHECK(result.has_value());
}

TEST_CASE("Orchestrator stores queued audio untranscribed once the drain timeout passes", "[orchestrator]")
{
    auto rig = CaptureRig {};
    rig.transcription.delay = 300ms;

    auto config = rig.config();
    config.disableVision = true;
    config.drainTimeout = 0ms;
    auto orchestrator = Orchestrator(config, rig.services());

    auto shutdown = ShutdownSignal {};
    auto result = VoidResult {};
    auto thread = std::jthread([&] { result = orchestrator.run(shutdown.token()); });

    // Capture outpaces the engine, so segments queue up behind it.
    REQUIRE(eventually([&] { return rig.transcription.calls >= 3; }));

    auto const stoppingAt = std::chrono::steady_clock::now();
    shutdown.trigger();
    thread.join();
    auto const drained = std::chrono::steady_clock::now() - stoppingAt;

    CHECK(result.has_value());
    CHECK(drained < 1500ms);

    auto speech = rig.archive->search(SearchQuery { .contentType = ContentType::Audio, .limit = 1000 });
    REQUIRE(speech.has_value());
    CHECK(static_cast<std::uint64_t>(speech->size()) == orchestrator.segmentsWritten());
    auto const untranscribed = std::ranges::count_if(
        *speech, [](auto const& row) { return std::get<AudioResult>(row).transcription.empty(); });
    CHECK(untranscribed >= 1);
    CHECK(untranscribed < static_cast<std::ptrdiff_t>(speech->size()));
}

TEST_CASE("Orchestrator fails fast on a configuration error", "[orchestrator]")
{
    auto rig = CaptureRig {};

    SECTION("unknown monitor")
    {
        auto config = rig.config();
        config.monitorIds = { 42 };
        auto orchestrator = Orchestrator(config, rig.services());
        auto shutdown = ShutdownSignal {};

        auto result = orchestrator.run(shutdown.token());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
        CHECK(orchestrator.cycleCount() == 0);
        CHECK(orchestrator.state() == CycleState::Stopped);
    }

    SECTION("vision without an OCR engine")
    {
        auto services = rig.services();
        services.ocr = nullptr;
        auto orchestrator = Orchestrator(rig.config(), services);
        auto shutdown = ShutdownSignal {};

        auto result = orchestrator.run(shutdown.token());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }
}

TEST_CASE("Orchestrator records audio alone while vision is paused", "[orchestrator]")
{
    auto rig = CaptureRig {};
    rig.control.pauseVision();

    auto orchestrator = Orchestrator(rig.config(), rig.services());
    auto shutdown = ShutdownSignal {};
    auto result = VoidResult {};
    auto thread = std::jthread([&] { result = orchestrator.run(shutdown.token()); });

    CHECK(eventually([&] { return orchestrator.segmentsWritten() >= 2; }));
    shutdown.trigger();
    thread.join();

    CHECK(result.has_value());
    CHECK(orchestrator.framesWritten() == 0);
    CHECK(rig.screen.captures == 0);
}

TEST_CASE("ProcessWatchdog triggers shutdown when the process is gone", "[watchdog]")
{
    auto alive = std::atomic<bool> { true };
    auto shutdown = ShutdownSignal {};
    auto watchdog = ProcessWatchdog(4242, shutdown, 5ms, [&](pid_t pid) { return pid == 4242 && alive.load(); });
    watchdog.start();

    std::this_thread::sleep_for(30ms);
    CHECK(!shutdown.triggered());

    alive = false;
    CHECK(eventually([&] { return shutdown.triggered(); }, 2s));
}

TEST_CASE("ProcessWatchdog stops without triggering shutdown", "[watchdog]")
{
    auto shutdown = ShutdownSignal {};
    auto watchdog = ProcessWatchdog(4242, shutdown, 5ms, [](pid_t) { return true; });
    watchdog.start();
    watchdog.stop();
    CHECK(!shutdown.triggered());
}

TEST_CASE("processAlive sees the current process", "[watchdog]")
{
    CHECK(ProcessWatchdog::processAlive(::getpid()));
}
