// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <core/Shutdown.hpp>
#include <sightline/App.hpp>
#include <sightline/Config.hpp>

#include <CLI/CLI.hpp>

#include <csignal>
#include <format>
#include <thread>

#include <pthread.h>
#include <signal.h>

namespace
{

/// @brief Blocks SIGINT/SIGTERM in every thread; a dedicated thread turns them into a shutdown.
auto blockTerminationSignals() -> sigset_t
{
    auto set = sigset_t {};
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
    return set;
}

void watchSignals(sigset_t set, sightline::ShutdownSignal& shutdown, std::stop_token stop)
{
    auto const timeout = timespec { .tv_sec = 0, .tv_nsec = 200'000'000 };
    while (!stop.stop_requested() && !shutdown.triggered())
    {
        auto const signal = sigtimedwait(&set, nullptr, &timeout);
        if (signal == SIGINT || signal == SIGTERM)
        {
            sightline::log::info("Received signal {}, stopping", signal);
            shutdown.trigger();
        }
    }
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "sightline - continuous screen and audio capture into a searchable archive" };

    auto configPath = std::string {};
    auto dataDir = std::string {};
    auto fps = 0.0;
    auto verbose = false;
    auto listAudioDevices = false;
    auto listMonitors = false;
    auto disableAudio = false;
    auto disableVision = false;
    auto stdioApi = false;
    auto watchPid = 0;
    auto audioDevices = std::vector<std::string> {};
    auto monitorIds = std::vector<std::uint32_t> {};

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--data-dir", dataDir, "Directory for chunk files and the database");
    app.add_option("--fps", fps, "Screen captures per second");
    app.add_option("--audio-device", audioDevices, "Audio device id, e.g. \"Built-in Microphone (input)\"");
    app.add_option("--monitor-id", monitorIds, "Monitor to record (default: all)");
    app.add_option("--watch-pid", watchPid, "Stop recording when this process exits");
    app.add_flag("--disable-audio", disableAudio, "Do not record audio");
    app.add_flag("--disable-vision", disableVision, "Do not record the screen");
    app.add_flag("--list-audio-devices", listAudioDevices, "List audio devices and exit");
    app.add_flag("--list-monitors", listMonitors, "List monitors and exit");
    app.add_flag("--stdio-api", stdioApi, "Serve the JSON-RPC API on stdin/stdout");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    auto configResult = configPath.empty() ? sightline::loadConfig() : sightline::loadConfigFromFile(configPath);
    if (!configResult)
    {
        sightline::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    sightline::log::setLevel(verbose ? sightline::log::Level::Debug : config.logLevel);

    // Apply CLI overrides
    if (!dataDir.empty())
        config.capture.dataDir = dataDir;
    if (fps != 0.0)
        config.capture.fps = fps;
    if (!audioDevices.empty())
        config.capture.audioDevices = audioDevices;
    if (!monitorIds.empty())
        config.capture.monitorIds = monitorIds;
    if (watchPid != 0)
        config.watchPid = watchPid;
    if (disableAudio)
        config.capture.disableAudio = true;
    if (disableVision)
        config.capture.disableVision = true;

    if (listAudioDevices || listMonitors)
    {
        config.capture.disableAudio = !listAudioDevices;
        config.capture.disableVision = !listMonitors;
        auto lister = sightline::App(std::move(config));
        if (auto opened = lister.initializeDevices(); !opened)
        {
            sightline::log::error("{}", opened.error().message);
            return 1;
        }
        auto exitCode = 0;
        if (listAudioDevices)
            exitCode = lister.printAudioDevices();
        if (listMonitors && exitCode == 0)
            exitCode = lister.printMonitors();
        return exitCode;
    }

    if (auto valid = sightline::validateConfig(config); !valid)
    {
        sightline::log::error("Invalid configuration: {}", valid.error().message);
        return 1;
    }

    std::signal(SIGPIPE, SIG_IGN);
    auto const signals = blockTerminationSignals();
    auto shutdown = sightline::ShutdownSignal {};
    auto signalThread =
        std::jthread([&](std::stop_token stop) { watchSignals(signals, shutdown, stop); });

    auto application = sightline::App(std::move(config));
    if (auto devices = application.initializeDevices(); !devices)
    {
        sightline::log::error("Initialization failed: {}", devices.error().message);
        return 1;
    }
    if (auto recording = application.initializeRecording(); !recording)
    {
        sightline::log::error("Initialization failed: {}", recording.error().message);
        return 1;
    }

    return application.run(shutdown, stdioApi);
}
