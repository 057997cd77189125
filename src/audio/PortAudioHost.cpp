#include "audio/PortAudioHost.hpp"
#include <spdlog/spdlog.h>
#include <portaudio.h>
#include <algorithm>
#include <atomic>
#include <utility>

namespace {

// Preference order when probing a device
constexpr SampleFormat kProbeOrder[] = {
    SampleFormat::Float32,
    SampleFormat::Int16,
    SampleFormat::Int32,
    SampleFormat::Int8,
    SampleFormat::UInt8,
};

constexpr double kStandardRates[] = {
    8000, 11025, 16000, 22050, 32000, 44100, 48000, 88200, 96000, 176400, 192000
};

PaSampleFormat toPaFormat(SampleFormat f) {
    switch (f) {
        case SampleFormat::Float32: return paFloat32;
        case SampleFormat::Int32:   return paInt32;
        case SampleFormat::Int16:   return paInt16;
        case SampleFormat::Int8:    return paInt8;
        case SampleFormat::UInt8:   return paUInt8;
        case SampleFormat::UInt16:
        case SampleFormat::Unsupported:
            break;
    }
    return 0;
}

// Default channel count for a capture stream: stereo when available
int preferredChannels(const PaDeviceInfo* info) {
    return std::min(info->maxInputChannels, 2);
}

class PortAudioInputStream : public IInputStream {
public:
    explicit PortAudioInputStream(IAudioHost::InputCallback onData)
        : onData_(std::move(onData)) {}

    ~PortAudioInputStream() override {
        stop();
        if (stream_) {
            PaError err = Pa_CloseStream(stream_);
            if (err != paNoError)
                spdlog::warn("Pa_CloseStream failed: {}", Pa_GetErrorText(err));
            stream_ = nullptr;
        }
    }

    bool start() override {
        if (!stream_) return false;
        PaError err = Pa_StartStream(stream_);
        if (err != paNoError) {
            spdlog::error("Pa_StartStream failed: {}", Pa_GetErrorText(err));
            return false;
        }
        running_ = true;
        return true;
    }

    void stop() override {
        if (!running_) return;
        running_ = false;
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError)
            spdlog::warn("Pa_StopStream failed: {}", Pa_GetErrorText(err));
        size_t overflows = overflows_.load(std::memory_order_relaxed);
        if (overflows > 0)
            spdlog::warn("Input stream reported {} overflows", overflows);
    }

    bool isRunning() const override { return running_; }

    size_t overflowCount() const override {
        return overflows_.load(std::memory_order_relaxed);
    }

    // PortAudio stream callback (static → forwards to instance)
    static int paCallback(const void* input, void* /*output*/,
                          unsigned long frameCount,
                          const PaStreamCallbackTimeInfo* /*timeInfo*/,
                          PaStreamCallbackFlags statusFlags,
                          void* userData) {
        auto* self = static_cast<PortAudioInputStream*>(userData);
        // The OS layer recovers from overflow on its own; just count it
        if (statusFlags & paInputOverflow)
            self->overflows_.fetch_add(1, std::memory_order_relaxed);
        if (input && frameCount > 0 && self->onData_)
            self->onData_(input, static_cast<size_t>(frameCount));
        return paContinue;
    }

    void attach(PaStream* stream) { stream_ = stream; }

private:
    PaStream*                 stream_ = nullptr;
    IAudioHost::InputCallback onData_;
    std::atomic<bool>         running_{false};
    std::atomic<size_t>       overflows_{0};
};

} // namespace

PortAudioHost::PortAudioHost() {
    PaError err = Pa_Initialize();
    if (err == paNoError) {
        paInitialized_ = true;
        spdlog::debug("PortAudio initialized: {}", Pa_GetVersionText());
    } else {
        spdlog::error("PortAudio init failed: {}", Pa_GetErrorText(err));
    }
}

PortAudioHost::~PortAudioHost() {
    if (paInitialized_)
        Pa_Terminate();
}

std::vector<IAudioHost::DeviceInfo> PortAudioHost::listDevices() const {
    std::vector<DeviceInfo> result;
    if (!paInitialized_) return result;

    int count = Pa_GetDeviceCount();
    if (count < 0) {
        spdlog::error("Pa_GetDeviceCount failed: {}", Pa_GetErrorText(count));
        return result;
    }

    for (int i = 0; i < count; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;

        std::string hostApi;
        if (const PaHostApiInfo* api = Pa_GetHostApiInfo(info->hostApi))
            hostApi = api->name;

        result.push_back({
            i,
            info->name ? info->name : "Unknown",
            hostApi,
            info->maxInputChannels,
            info->maxOutputChannels,
            info->defaultSampleRate
        });
    }
    return result;
}

std::optional<int> PortAudioHost::defaultInputDevice() const {
    if (!paInitialized_) return std::nullopt;
    PaDeviceIndex idx = Pa_GetDefaultInputDevice();
    if (idx == paNoDevice) return std::nullopt;
    return idx;
}

std::optional<int> PortAudioHost::defaultOutputDevice() const {
    if (!paInitialized_) return std::nullopt;
    PaDeviceIndex idx = Pa_GetDefaultOutputDevice();
    if (idx == paNoDevice) return std::nullopt;
    return idx;
}

bool PortAudioHost::isSupported(int index, int channels, double sampleRate,
                                SampleFormat format) const {
    PaStreamParameters params{};
    params.device = index;
    params.channelCount = channels;
    params.sampleFormat = toPaFormat(format);
    params.suggestedLatency = 0;
    params.hostApiSpecificStreamInfo = nullptr;
    return Pa_IsFormatSupported(&params, nullptr, sampleRate) == paFormatIsSupported;
}

std::optional<StreamFormat> PortAudioHost::defaultInputConfig(int index) const {
    if (!paInitialized_) return std::nullopt;
    const PaDeviceInfo* info = Pa_GetDeviceInfo(index);
    if (!info || info->maxInputChannels <= 0) return std::nullopt;

    int channels = preferredChannels(info);
    for (SampleFormat f : kProbeOrder) {
        if (isSupported(index, channels, info->defaultSampleRate, f)) {
            return StreamFormat{
                static_cast<uint16_t>(channels),
                static_cast<uint32_t>(info->defaultSampleRate),
                f
            };
        }
    }
    return std::nullopt;
}

std::vector<StreamFormat> PortAudioHost::supportedInputConfigs(int index) const {
    std::vector<StreamFormat> result;
    if (!paInitialized_) return result;
    const PaDeviceInfo* info = Pa_GetDeviceInfo(index);
    if (!info || info->maxInputChannels <= 0) return result;

    int channels = preferredChannels(info);
    for (SampleFormat f : kProbeOrder) {
        for (double rate : kStandardRates) {
            if (isSupported(index, channels, rate, f)) {
                result.push_back({static_cast<uint16_t>(channels),
                                  static_cast<uint32_t>(rate), f});
            }
        }
    }
    return result;
}

std::unique_ptr<IInputStream> PortAudioHost::openInput(int index,
                                                       const StreamFormat& format,
                                                       InputCallback onData) {
    if (!paInitialized_) return nullptr;

    PaSampleFormat paFormat = toPaFormat(format.format);
    if (paFormat == 0) {
        spdlog::error("PortAudio cannot open a {} stream", toString(format.format));
        return nullptr;
    }

    const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(index);
    if (!devInfo) {
        spdlog::error("Invalid audio device ID {}", index);
        return nullptr;
    }

    PaStreamParameters inputParams{};
    inputParams.device = index;
    inputParams.channelCount = format.channels;
    inputParams.sampleFormat = paFormat;  // interleaved
    inputParams.suggestedLatency = devInfo->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    auto stream = std::make_unique<PortAudioInputStream>(std::move(onData));

    PaStream* raw = nullptr;
    PaError err = Pa_OpenStream(
        &raw,
        &inputParams,
        nullptr,  // no output
        format.sampleRate,
        paFramesPerBufferUnspecified,  // chunk size follows the OS callback
        paClipOff,
        &PortAudioInputStream::paCallback,
        stream.get()
    );

    if (err != paNoError) {
        spdlog::error("Pa_OpenStream failed for '{}': {}", devInfo->name,
                      Pa_GetErrorText(err));
        return nullptr;
    }

    stream->attach(raw);
    spdlog::info("Opened audio input: device='{}', {} ch, {}Hz, {}",
                 devInfo->name, format.channels, format.sampleRate,
                 toString(format.format));
    return stream;
}
