#pragma once
#include "DeviceClassifier.hpp"
#include "audio/AudioTypes.hpp"
#include "audio/IAudioHost.hpp"
#include <optional>
#include <string>
#include <vector>

// Enumerates capture-capable endpoints and resolves capture targets.
// Nothing is cached: every call re-reads the host, so results follow
// hot-plugged hardware and may reorder between calls.
class DeviceCatalog {
public:
    struct Options {
        // Extra fallback tiers for hosts where loopback endpoints carry no
        // recognisable name (Windows): input+output devices, output-like
        // names, and the default output device's name.
#ifdef _WIN32
        bool extendedSystemSearch = true;
#else
        bool extendedSystemSearch = false;
#endif
    };

    explicit DeviceCatalog(const IAudioHost& host)
        : DeviceCatalog(host, Options{}) {}
    DeviceCatalog(const IAudioHost& host, Options options)
        : host_(host), options_(options) {}

    std::vector<AudioDevice> enumerate() const;

    // Exact name match when `id` is given and present, else the default input.
    std::optional<AudioDevice> resolveMicrophone(const std::optional<std::string>& id) const;

    // Best-effort search for a device carrying the system output mix.
    // `excludeId` keeps the microphone of a mixed capture out of the search.
    std::optional<AudioDevice> resolveSystemDevice(
        const std::optional<std::string>& id,
        const std::optional<std::string>& excludeId = std::nullopt) const;

    // Default input configuration, else the first supported one at its
    // highest sample rate.
    static std::optional<StreamFormat> inputConfig(const IAudioHost& host, int index);

    const DeviceClassifier& classifier() const { return classifier_; }

private:
    std::optional<AudioDevice> describe(const IAudioHost::DeviceInfo& info,
                                        std::optional<int> defaultInput) const;

    const IAudioHost& host_;
    Options           options_;
    DeviceClassifier  classifier_;
};
