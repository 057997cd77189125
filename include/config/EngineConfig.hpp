#pragma once
#include "audio/AudioTypes.hpp"
#include "capture/CaptureSession.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Capture settings for the mixcapture executable, read from a JSON file
// (default config/capture.json) with environment overrides.
struct EngineConfig {
    static constexpr int64_t kMaxQueueCapacity = 4096;

    CaptureSource              source          = CaptureSource::Mixed;
    std::optional<std::string> deviceId;
    float                      secondaryGain   = 0.1f;
    size_t                     queueCapacity   = 64;
    int                        readyTimeoutMs  = 2000;
    int                        captureSeconds  = 10;   // 0 = until Ctrl+C
    std::string                logLevel        = "info";

    // Missing file or bad JSON → warning and defaults; never throws.
    static EngineConfig load(const std::string& path);
    static EngineConfig fromJson(const nlohmann::json& j);

    // MIXCAPTURE_SOURCE, MIXCAPTURE_DEVICE, MIXCAPTURE_LOG_LEVEL
    void applyEnvironment();

    SessionConfig sessionConfig() const;
};

// KEY=VALUE lines; existing variables are not overridden.
void loadDotEnv(const std::string& path);

std::string getEnv(const std::string& key, const std::string& defaultVal = "");

// Outer-boundary device description
nlohmann::json toJson(const AudioDevice& dev);
nlohmann::json toJson(const std::vector<AudioDevice>& devices);
