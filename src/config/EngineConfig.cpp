#include "config/EngineConfig.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <fstream>

EngineConfig EngineConfig::fromJson(const nlohmann::json& j) {
    EngineConfig cfg;
    if (!j.is_object()) return cfg;

    std::string source = j.value("source", std::string(toString(cfg.source)));
    if (auto parsed = parseCaptureSource(source))
        cfg.source = *parsed;
    else
        spdlog::warn("Config: unknown source '{}', using {}", source, toString(cfg.source));

    if (j.contains("device_id") && j["device_id"].is_string()) {
        std::string id = j["device_id"].get<std::string>();
        if (!id.empty()) cfg.deviceId = id;
    }

    cfg.secondaryGain  = std::clamp(j.value("secondary_gain", cfg.secondaryGain), 0.0f, 1.0f);
    // Signed read so a negative value cannot wrap around
    int64_t capacity   = j.value("queue_capacity", static_cast<int64_t>(cfg.queueCapacity));
    cfg.queueCapacity  = static_cast<size_t>(std::clamp<int64_t>(capacity, 1, kMaxQueueCapacity));
    cfg.readyTimeoutMs = std::max(1, j.value("ready_timeout_ms", cfg.readyTimeoutMs));
    cfg.captureSeconds = std::max(0, j.value("capture_seconds", cfg.captureSeconds));
    cfg.logLevel       = j.value("log_level", cfg.logLevel);
    return cfg;
}

EngineConfig EngineConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("Config: could not open {}, using defaults", path);
        return EngineConfig{};
    }

    try {
        nlohmann::json j;
        f >> j;
        spdlog::info("Loaded config: {}", path);
        return fromJson(j);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Config: failed to parse {}: {}", path, e.what());
        return EngineConfig{};
    }
}

void EngineConfig::applyEnvironment() {
    std::string source = getEnv("MIXCAPTURE_SOURCE");
    if (!source.empty()) {
        if (auto parsed = parseCaptureSource(source))
            this->source = *parsed;
        else
            spdlog::warn("MIXCAPTURE_SOURCE='{}' ignored", source);
    }

    std::string device = getEnv("MIXCAPTURE_DEVICE");
    if (!device.empty()) deviceId = device;

    std::string level = getEnv("MIXCAPTURE_LOG_LEVEL");
    if (!level.empty()) logLevel = level;
}

SessionConfig EngineConfig::sessionConfig() const {
    SessionConfig sc;
    sc.secondaryGain = secondaryGain;
    sc.queueCapacity = queueCapacity;
    sc.readyTimeout  = std::chrono::milliseconds(readyTimeoutMs);
    return sc;
}

std::string getEnv(const std::string& key, const std::string& defaultVal) {
    const char* val = std::getenv(key.c_str());
    return val ? val : defaultVal;
}

void loadDotEnv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        // Remove quotes
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
            val = val.substr(1, val.size() - 2);
#ifdef _WIN32
        if (!std::getenv(key.c_str()))
            _putenv_s(key.c_str(), val.c_str());
#else
        setenv(key.c_str(), val.c_str(), 0);  // don't override existing
#endif
    }
}

nlohmann::json toJson(const AudioDevice& dev) {
    return {
        {"id",          dev.id},
        {"name",        dev.displayName},
        {"kind",        toString(dev.kind)},
        {"channels",    dev.nativeChannelCount},
        {"sample_rate", dev.nativeSampleRate},
        {"host_api",    dev.hostApi},
        {"default",     dev.isDefaultInput}
    };
}

nlohmann::json toJson(const std::vector<AudioDevice>& devices) {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& d : devices) arr.push_back(toJson(d));
    return arr;
}
