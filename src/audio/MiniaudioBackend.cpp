// SPDX-License-Identifier: Apache-2.0
#include "MiniaudioBackend.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <format>
#include <mutex>
#include <optional>
#include <string>

namespace sightline
{

struct MiniaudioBackend::Context
{
    ma_context context {};
    bool initialized = false;

    ~Context()
    {
        if (initialized)
            ma_context_uninit(&context);
    }
};

namespace
{

    /// @brief Maximum amount of audio buffered for a slow reader (30 s).
    constexpr auto MaxBufferedSamples = size_t { SampleRate * 30 };

    constexpr auto MonitorPrefix = std::string_view { "Monitor of " };

    class MiniaudioSource final: public AudioSource
    {
      public:
        struct State
        {
            std::mutex mutex;
            std::condition_variable_any dataReady;
            std::deque<float> buffer;
            std::atomic<bool> stopping = false;
            bool failed = false;
            std::string failure;
            size_t droppedSamples = 0;
        };

        MiniaudioSource(std::shared_ptr<MiniaudioBackend::Context> context, AudioDevice device):
            _context(std::move(context)), _device(std::move(device))
        {
        }

        ~MiniaudioSource() override
        {
            if (_initialized)
            {
                _state.stopping = true;
                ma_device_uninit(&_maDevice);
            }
        }

        MiniaudioSource(const MiniaudioSource&) = delete;
        MiniaudioSource& operator=(const MiniaudioSource&) = delete;

        auto start(ma_device_type type, const ma_device_id* deviceId) -> VoidResult
        {
            auto config = ma_device_config_init(type);
            config.capture.format = ma_format_f32;
            config.capture.channels = 1;
            config.capture.pDeviceID = deviceId;
            config.sampleRate = SampleRate;
            config.periodSizeInFrames = BlockSize;
            config.dataCallback = dataCallback;
            config.notificationCallback = notificationCallback;
            config.pUserData = &_state;

            auto const initResult = ma_device_init(&_context->context, &config, &_maDevice);
            if (initResult != MA_SUCCESS)
                return makeError(ErrorCode::DeviceError,
                                 std::format("Failed to initialize audio device '{}': {}",
                                             _device.id(),
                                             ma_result_description(initResult)));
            _initialized = true;

            auto const startResult = ma_device_start(&_maDevice);
            if (startResult != MA_SUCCESS)
                return makeError(ErrorCode::DeviceError,
                                 std::format("Failed to start audio device '{}': {}",
                                             _device.id(),
                                             ma_result_description(startResult)));

            log::info("Audio capture started on '{}' (16kHz, mono, float32)", _device.id());
            return {};
        }

        [[nodiscard]] auto device() const -> const AudioDevice& override { return _device; }

        [[nodiscard]] auto read(std::stop_token stop) -> Result<AudioBlock> override
        {
            auto lock = std::unique_lock(_state.mutex);
            _state.dataReady.wait(lock, stop, [this] {
                return _state.buffer.size() >= static_cast<size_t>(BlockSize) || _state.failed;
            });

            if (_state.droppedSamples > 0)
            {
                log::warning("Audio device '{}': reader lagging, dropped {} samples",
                             _device.id(),
                             _state.droppedSamples);
                _state.droppedSamples = 0;
            }

            if (_state.buffer.size() >= static_cast<size_t>(BlockSize))
            {
                auto block = AudioBlock { .samples = {}, .capturedAt = now() };
                block.samples.assign(_state.buffer.begin(), _state.buffer.begin() + BlockSize);
                _state.buffer.erase(_state.buffer.begin(), _state.buffer.begin() + BlockSize);
                return block;
            }

            if (_state.failed)
                return makeError(ErrorCode::DeviceError,
                                 std::format("Audio device '{}' failed: {}", _device.id(), _state.failure));

            return makeError(ErrorCode::Cancelled, "Audio read cancelled");
        }

      private:
        static void dataCallback(ma_device* device, void* /*output*/, const void* input, ma_uint32 frameCount)
        {
            auto* state = static_cast<State*>(device->pUserData);
            if (!state || !input)
                return;

            auto const* samples = static_cast<const float*>(input);
            {
                auto lock = std::lock_guard(state->mutex);
                state->buffer.insert(state->buffer.end(), samples, samples + frameCount);
                if (state->buffer.size() > MaxBufferedSamples)
                {
                    auto const excess = state->buffer.size() - MaxBufferedSamples;
                    state->buffer.erase(state->buffer.begin(),
                                        state->buffer.begin() + static_cast<std::ptrdiff_t>(excess));
                    state->droppedSamples += excess;
                }
            }
            state->dataReady.notify_one();
        }

        static void notificationCallback(const ma_device_notification* notification)
        {
            auto* state = static_cast<State*>(notification->pDevice->pUserData);
            if (!state || notification->type != ma_device_notification_type_stopped || state->stopping)
                return;

            // The backend stopped the device on its own: unplugged or lost by the OS.
            {
                auto lock = std::lock_guard(state->mutex);
                state->failed = true;
                state->failure = "device stopped unexpectedly (disconnected?)";
            }
            state->dataReady.notify_all();
        }

        std::shared_ptr<MiniaudioBackend::Context> _context;
        AudioDevice _device;
        ma_device _maDevice {};
        State _state;
        bool _initialized = false;
    };

    auto toLower(std::string s) -> std::string
    {
        std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

} // namespace

MiniaudioBackend::MiniaudioBackend(): _context(std::make_shared<Context>())
{
}

MiniaudioBackend::~MiniaudioBackend() = default;

auto MiniaudioBackend::initialize() -> VoidResult
{
    if (_context->initialized)
        return {};

    auto const result = ma_context_init(nullptr, 0, nullptr, &_context->context);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize audio context: {}", ma_result_description(result)));

    _context->initialized = true;
    log::debug("Audio backend: {}", ma_get_backend_name(_context->context.backend));
    return {};
}

auto MiniaudioBackend::listDevices() -> Result<std::vector<AudioDeviceInfo>>
{
    if (!_context->initialized)
        return makeError(ErrorCode::AudioError, "Audio context not initialized");

    ma_device_info* playbackDevices = nullptr;
    ma_device_info* captureDevices = nullptr;
    auto playbackCount = ma_uint32 { 0 };
    auto captureCount = ma_uint32 { 0 };

    auto const result = ma_context_get_devices(
        &_context->context, &playbackDevices, &playbackCount, &captureDevices, &captureCount);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to enumerate audio devices: {}", ma_result_description(result)));

    auto devices = std::vector<AudioDeviceInfo> {};

    for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
    {
        auto const name = std::string(captureDevices[i].name);
        // Monitor sources are how output devices are recorded; they are listed as outputs below.
        if (toLower(name).starts_with(toLower(std::string(MonitorPrefix))))
            continue;
        devices.push_back(AudioDeviceInfo {
            .device = AudioDevice { .name = name, .direction = DeviceDirection::Input },
            .isDefault = captureDevices[i].isDefault != 0,
        });
    }

    for (auto i = ma_uint32 { 0 }; i < playbackCount; ++i)
    {
        devices.push_back(AudioDeviceInfo {
            .device = AudioDevice { .name = std::string(playbackDevices[i].name),
                                    .direction = DeviceDirection::Output },
            .isDefault = playbackDevices[i].isDefault != 0,
        });
    }

    return devices;
}

auto MiniaudioBackend::open(const AudioDevice& device) -> Result<std::unique_ptr<AudioSource>>
{
    if (!_context->initialized)
        return makeError(ErrorCode::AudioError, "Audio context not initialized");

    ma_device_info* playbackDevices = nullptr;
    ma_device_info* captureDevices = nullptr;
    auto playbackCount = ma_uint32 { 0 };
    auto captureCount = ma_uint32 { 0 };

    auto const result = ma_context_get_devices(
        &_context->context, &playbackDevices, &playbackCount, &captureDevices, &captureCount);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::DeviceError,
                         std::format("Failed to enumerate audio devices: {}", ma_result_description(result)));

    auto findById = [](ma_device_info* infos, ma_uint32 count, std::string_view name) -> std::optional<ma_device_id> {
        for (auto i = ma_uint32 { 0 }; i < count; ++i)
            if (name == infos[i].name)
                return infos[i].id;
        return std::nullopt;
    };

    auto source = std::make_unique<MiniaudioSource>(_context, device);

    if (device.direction == DeviceDirection::Input)
    {
        auto id = findById(captureDevices, captureCount, device.name);
        if (!id)
            return makeError(ErrorCode::DeviceError, std::format("Audio device '{}' not found", device.id()));

        auto started = source->start(ma_device_type_capture, &*id);
        if (!started)
            return std::unexpected(started.error());
        return source;
    }

    // Output: prefer the PulseAudio/PipeWire monitor source of the sink.
    if (auto monitorId = findById(captureDevices, captureCount, std::string(MonitorPrefix) + device.name))
    {
        auto started = source->start(ma_device_type_capture, &*monitorId);
        if (!started)
            return std::unexpected(started.error());
        return source;
    }

    auto playbackId = findById(playbackDevices, playbackCount, device.name);
    if (!playbackId)
        return makeError(ErrorCode::DeviceError, std::format("Audio device '{}' not found", device.id()));

    auto started = source->start(ma_device_type_loopback, &*playbackId);
    if (!started)
        return std::unexpected(started.error());
    return source;
}

} // namespace sightline
