// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioSegmenter.hpp>
#include <audio/TranscriptionEngine.hpp>
#include <audio/TranscriptionStage.hpp>
#include <audio/VoiceActivityDetector.hpp>
#include <capture/DeviceRegistry.hpp>
#include <core/Error.hpp>
#include <core/Shutdown.hpp>
#include <storage/Archive.hpp>
#include <storage/ChunkWriter.hpp>
#include <vision/CaptureControl.hpp>
#include <vision/OcrEngine.hpp>
#include <vision/VisionCaptureLoop.hpp>
#include <vision/WindowFilter.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace sightline
{

/// @brief State of the recording cycle.
enum class CycleState : std::uint8_t
{
    Starting,
    Running,
    Draining,
    Restarting,
    Stopped,
};

[[nodiscard]] constexpr auto cycleStateToString(CycleState state) -> std::string_view
{
    switch (state)
    {
        case CycleState::Starting: return "starting";
        case CycleState::Running: return "running";
        case CycleState::Draining: return "draining";
        case CycleState::Restarting: return "restarting";
        case CycleState::Stopped: return "stopped";
    }
    return "stopped";
}

struct OrchestratorConfig
{
    bool disableAudio = false;
    bool disableVision = false;
    std::vector<std::string> audioDeviceIds;
    std::vector<std::uint32_t> monitorIds;
    SegmenterConfig segmenter;
    VisionLoopConfig vision;
    std::vector<std::string> includedWindows;
    std::vector<std::string> ignoredWindows;
    TranscriptionPolicy transcription;
    size_t channelCapacity = 64;
    std::chrono::milliseconds restartDelay { 1'000 };
    std::chrono::milliseconds rescanInterval { 30'000 }; ///< how often absent or ended streams are looked for
    std::chrono::milliseconds drainTimeout { 10'000 };   ///< transcription budget for queued audio at shutdown
};

/// @brief Collaborators of the orchestrator. Engines may be null when their modality is disabled.
struct CaptureServices
{
    DeviceRegistry& registry;
    VoiceActivityDetector& vad;
    OcrEngine* ocr = nullptr;
    TranscriptionEngine* transcription = nullptr;
    ChunkWriter& chunks;
    Archive& archive;
    CaptureControl& control;
};

/// @brief Runs recording cycles until shutdown.
///
/// The configured device and monitor ids are validated once, before the first cycle.
/// A cycle runs one capture thread per monitor and per audio device plus one writer
/// thread per modality, connected by bounded channels. Sources that are absent are
/// skipped, and a periodic rescan starts streams for sources that appeared or whose
/// stream ended, so audio and vision never wait on each other.
///
/// A persistence failure, a monitor exceeding its failure timeout, the last capture
/// stream ending with an error, or an exception escaping a thread aborts the cycle:
/// every loop is stopped, open chunks are finalized, and a new cycle starts after the
/// restart delay.
class Orchestrator
{
  public:
    using StateCallback = std::function<void(CycleState state)>;

    Orchestrator(OrchestratorConfig config, CaptureServices services);

    /// @brief Runs cycles until the shutdown signal fires.
    /// @return Success after a clean shutdown, or the ConfigError found while validating
    ///         the configuration (no cycle is started then).
    [[nodiscard]] auto run(std::stop_token shutdown) -> VoidResult;

    [[nodiscard]] auto state() const -> CycleState { return _state.load(); }

    /// @brief Number of cycles started so far (1 after the first start).
    [[nodiscard]] auto cycleCount() const -> std::uint64_t { return _cycles.load(); }

    /// @brief Units persisted since construction.
    [[nodiscard]] auto framesWritten() const -> std::uint64_t { return _framesWritten.load(); }
    [[nodiscard]] auto segmentsWritten() const -> std::uint64_t { return _segmentsWritten.load(); }

    /// @brief Installs a callback invoked on every state change (from the orchestrator thread).
    void setStateCallback(StateCallback callback);

  private:
    class Cycle;

    enum class CycleOutcome : std::uint8_t
    {
        Shutdown,
        Restart,
    };

    [[nodiscard]] auto validate() -> VoidResult;
    void setState(CycleState state);

    OrchestratorConfig _config;
    CaptureServices _services;
    std::atomic<CycleState> _state = CycleState::Stopped;
    std::atomic<std::uint64_t> _cycles = 0;
    std::atomic<std::uint64_t> _framesWritten = 0;
    std::atomic<std::uint64_t> _segmentsWritten = 0;
    std::mutex _callbackMutex;
    StateCallback _stateCallback;
};

} // namespace sightline
