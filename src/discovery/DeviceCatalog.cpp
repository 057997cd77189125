#include "discovery/DeviceCatalog.hpp"
#include <spdlog/spdlog.h>

namespace {

// Fallback tiers after the name-based loopback tiers
constexpr int kTierInputOutput = DeviceClassifier::kTierVirtual + 1;
constexpr int kTierOutputName  = DeviceClassifier::kTierVirtual + 2;
constexpr int kTierDefaultOut  = DeviceClassifier::kTierVirtual + 3;

} // namespace

std::optional<StreamFormat> DeviceCatalog::inputConfig(const IAudioHost& host, int index) {
    if (auto cfg = host.defaultInputConfig(index))
        return cfg;

    auto configs = host.supportedInputConfigs(index);
    if (configs.empty())
        return std::nullopt;

    // First supported format, at the highest rate listed for it
    StreamFormat best = configs.front();
    for (auto& c : configs) {
        if (c.format == best.format && c.channels == best.channels &&
            c.sampleRate > best.sampleRate)
            best = c;
    }
    return best;
}

std::optional<AudioDevice> DeviceCatalog::describe(const IAudioHost::DeviceInfo& info,
                                                   std::optional<int> defaultInput) const {
    auto cfg = inputConfig(host_, info.index);
    if (!cfg) {
        spdlog::debug("Skipping '{}': no input configuration", info.name);
        return std::nullopt;
    }

    AudioDevice dev;
    dev.id                 = info.name;
    dev.displayName        = info.name;
    dev.kind               = classifier_.kindOf(info.name);
    // The device's full input width; the stream we open may use fewer
    dev.nativeChannelCount = info.maxInputChannels > 0
                           ? static_cast<uint16_t>(info.maxInputChannels)
                           : cfg->channels;
    dev.nativeSampleRate   = cfg->sampleRate;
    dev.hostApi            = info.hostApi;
    dev.hostIndex          = info.index;
    dev.maxOutputChannels  = info.maxOutputChannels;
    dev.isDefaultInput     = defaultInput && *defaultInput == info.index;
    return dev;
}

std::vector<AudioDevice> DeviceCatalog::enumerate() const {
    std::vector<AudioDevice> out;
    auto defaultInput = host_.defaultInputDevice();

    for (auto& info : host_.listDevices()) {
        if (auto dev = describe(info, defaultInput))
            out.push_back(std::move(*dev));
    }

    spdlog::debug("{} enumerated {} capture devices", host_.backendName(), out.size());
    return out;
}

std::optional<AudioDevice> DeviceCatalog::resolveMicrophone(
    const std::optional<std::string>& id) const
{
    auto devices = enumerate();

    if (id && !id->empty()) {
        for (auto& dev : devices) {
            if (dev.id == *id) {
                spdlog::info("Capture mic device: {}", dev.displayName);
                return dev;
            }
        }
        spdlog::warn("Requested device '{}' not found, using default input", *id);
    }

    for (auto& dev : devices) {
        if (dev.isDefaultInput) {
            spdlog::info("Capture mic device: {} (default)", dev.displayName);
            return dev;
        }
    }

    spdlog::warn("No default input device");
    return std::nullopt;
}

std::optional<AudioDevice> DeviceCatalog::resolveSystemDevice(
    const std::optional<std::string>& id,
    const std::optional<std::string>& excludeId) const
{
    auto devices = enumerate();

    // An explicitly requested device wins if it really looks like loopback
    if (id && !id->empty()) {
        for (auto& dev : devices) {
            if (dev.id == *id && dev.kind == DeviceKind::SystemLoopback) {
                spdlog::info("Found system device: {} (requested)", dev.displayName);
                return dev;
            }
        }
    }

    std::string defaultOutputName;
    if (options_.extendedSystemSearch) {
        if (auto outIdx = host_.defaultOutputDevice()) {
            for (auto& info : host_.listDevices()) {
                if (info.index == *outIdx) defaultOutputName = info.name;
            }
        }
    }

    const AudioDevice* best = nullptr;
    int bestTier = DeviceClassifier::kTierNone;

    for (auto& dev : devices) {
        if (excludeId && dev.id == *excludeId) continue;

        int tier = classifier_.classify(dev.id).tier;

        if (tier == DeviceClassifier::kTierNone && options_.extendedSystemSearch) {
            if (classifier_.looksLikeMicrophone(dev.id)) {
                spdlog::debug("Skipping microphone: {}", dev.id);
                continue;
            }
            if (dev.maxOutputChannels > 0)
                tier = kTierInputOutput;
            else if (classifier_.looksLikeOutputDevice(dev.id))
                tier = kTierOutputName;
            else if (!defaultOutputName.empty() && dev.id == defaultOutputName)
                tier = kTierDefaultOut;
        }

        if (tier == DeviceClassifier::kTierNone) continue;

        // Strict < keeps the first device seen within a tier
        if (!best || tier < bestTier) {
            best = &dev;
            bestTier = tier;
        }
    }

    if (!best) {
        spdlog::warn("No system audio device found. Enable 'Stereo Mix' in the "
                     "recording devices, use a PulseAudio/PipeWire monitor source, "
                     "or install a virtual loopback device (VB-Audio Cable, BlackHole)");
        return std::nullopt;
    }

    spdlog::info("Found system device: {} (tier {})", best->displayName, bestTier);
    return *best;
}
