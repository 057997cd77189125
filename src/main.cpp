#include "audio/LevelMeter.hpp"
#include "audio/PortAudioHost.hpp"
#include "capture/CaptureSession.hpp"
#include "config/EngineConfig.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

static std::atomic<bool> g_stop{false};

static void signalHandler(int) {
    g_stop = true;
}

static void setLogLevel(const std::string& level) {
    if (level == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (level == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (level == "error") spdlog::set_level(spdlog::level::err);
    else                       spdlog::set_level(spdlog::level::info);
}

static void setupLogging(const std::string& level) {
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto fileSink    = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "mixcapture.log", 1048576 * 5, 3);  // 5MB, 3 files

    auto logger = std::make_shared<spdlog::logger>(
        "mixcapture",
        spdlog::sinks_init_list{consoleSink, fileSink});
    spdlog::set_default_logger(logger);
    setLogLevel(level);
}

static void printUsage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--list] [config.json]\n"
              << "  --list    print capture devices as JSON and exit\n";
}

int main(int argc, char* argv[]) {
    loadDotEnv(".env");

    bool listOnly = false;
    std::string configPath = "config/capture.json";
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--list") == 0) {
            listOnly = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        } else {
            configPath = argv[i];
        }
    }

    // Level from the environment first so config loading is logged
    setupLogging(getEnv("MIXCAPTURE_LOG_LEVEL", "info"));

    EngineConfig config = EngineConfig::load(configPath);
    config.applyEnvironment();
    setLogLevel(config.logLevel);

    spdlog::info("mixcapture v0.1.0 starting");

    PortAudioHost host;
    if (!host.isInitialized()) {
        spdlog::error("Audio host unavailable");
        return 1;
    }

    CaptureSession session(host, config.sessionConfig());

    if (listOnly) {
        std::cout << toJson(session.listDevices()).dump(2) << std::endl;
        return 0;
    }

    std::signal(SIGINT,  signalHandler);
    std::signal(SIGTERM, signalHandler);

    // Chunks arrive on the mixer thread
    std::mutex meterMtx;
    LevelMeter meter;
    uint32_t sampleRate = 0;

    auto result = session.start(
        CaptureRequest{config.source, config.deviceId},
        [&](const PcmChunk& chunk) {
            std::lock_guard lock(meterMtx);
            meter.add(chunk);
            sampleRate = chunk.sampleRate;
        });

    if (!result.ok) {
        spdlog::error("Capture failed: {} ({})", toString(result.error), result.message);
        return 1;
    }

    spdlog::info("Capturing {}, press Ctrl+C to stop", toString(config.source));

    auto started = std::chrono::steady_clock::now();
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::seconds(1));

        {
            std::lock_guard lock(meterMtx);
            auto l = meter.current();
            spdlog::info("{} chunks, {} frames @ {}Hz, rms {:.1f} dBFS, peak {:.1f} dBFS",
                         meter.chunks(), meter.frames(), sampleRate, l.rmsDB, l.peakDB);
            if (l.clipped)
                spdlog::warn("{} of {} chunks hit full scale",
                             meter.clippedChunks(), meter.chunks());
            meter.reset();
        }

        auto elapsed = std::chrono::steady_clock::now() - started;
        if (config.captureSeconds > 0 && elapsed >= std::chrono::seconds(config.captureSeconds))
            break;
    }

    session.stop();
    spdlog::info("mixcapture exited cleanly");
    return 0;
}
