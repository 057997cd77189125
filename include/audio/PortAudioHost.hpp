#pragma once
#include "IAudioHost.hpp"
#include <memory>
#include <string>
#include <vector>

// PortAudio-based capture host. Covers ALSA/PulseAudio (Linux), Core Audio
// (macOS) and MME/DirectSound/WASAPI (Windows). Link with -lportaudio.
//
// Audio data flows:
//   PortAudio callback (real-time thread)
//       → InputCallback (convert + non-blocking queue push)
//           → mixer thread
//
// PortAudio reports no per-device native format, so the "default" input
// configuration is the first sample format the device accepts at its default
// rate, in the order float32, int16, int32, int8, uint8.
class PortAudioHost : public IAudioHost {
public:
    PortAudioHost();
    ~PortAudioHost() override;

    PortAudioHost(const PortAudioHost&) = delete;
    PortAudioHost& operator=(const PortAudioHost&) = delete;

    bool isInitialized() const { return paInitialized_; }

    std::vector<DeviceInfo> listDevices() const override;
    std::optional<int> defaultInputDevice() const override;
    std::optional<int> defaultOutputDevice() const override;

    std::optional<StreamFormat> defaultInputConfig(int index) const override;
    std::vector<StreamFormat> supportedInputConfigs(int index) const override;

    std::unique_ptr<IInputStream> openInput(int index,
                                            const StreamFormat& format,
                                            InputCallback onData) override;

    std::string backendName() const override { return "PortAudio"; }

private:
    bool isSupported(int index, int channels, double sampleRate,
                     SampleFormat format) const;

    bool paInitialized_ = false;
};
