#pragma once
#include "AudioTypes.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// A running native input stream. Destroying it closes the stream.
class IInputStream {
public:
    virtual ~IInputStream() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;

    // Input overflows reported by the OS layer since start()
    virtual size_t overflowCount() const = 0;
};

// Abstract portable capture layer.
// Implementations: PortAudioHost (ALSA/PulseAudio, Core Audio, WASAPI/MME).
// Tests provide a synthetic host.
class IAudioHost {
public:
    virtual ~IAudioHost() = default;

    struct DeviceInfo {
        int         index;
        std::string name;
        std::string hostApi;
        int         maxInputChannels;
        int         maxOutputChannels;
        double      defaultSampleRate;
    };

    // Called on the OS audio thread with `frameCount` interleaved frames in
    // the negotiated format. Must not block.
    using InputCallback = std::function<void(const void* data, size_t frameCount)>;

    // Device enumeration (input and output endpoints)
    virtual std::vector<DeviceInfo> listDevices() const = 0;
    virtual std::optional<int> defaultInputDevice() const = 0;
    virtual std::optional<int> defaultOutputDevice() const = 0;

    // Input configuration queries. Empty/nullopt when the device cannot capture.
    virtual std::optional<StreamFormat> defaultInputConfig(int index) const = 0;
    virtual std::vector<StreamFormat> supportedInputConfigs(int index) const = 0;

    // Opens (but does not start) an input stream. nullptr on failure.
    virtual std::unique_ptr<IInputStream> openInput(int index,
                                                    const StreamFormat& format,
                                                    InputCallback onData) = 0;

    // Name for logging
    virtual std::string backendName() const = 0;
};
