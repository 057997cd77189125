#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Output layout of every mixed chunk.
constexpr uint16_t kOutputChannels   = 2;
constexpr uint32_t kDefaultSampleRate = 48000;

enum class DeviceKind {
    Microphone,
    SystemLoopback,
    Other
};

enum class CaptureSource {
    Mic,
    System,
    Mixed
};

// Native sample representation a device delivers
enum class SampleFormat {
    Float32,
    Int32,
    Int16,
    UInt16,
    Int8,
    UInt8,
    Unsupported
};

enum class CaptureError {
    None,
    UnsupportedSource,
    NoCaptureDevice
};

struct AudioDevice {
    std::string id;              // native name, stable for the session
    std::string displayName;
    DeviceKind  kind              = DeviceKind::Other;
    uint16_t    nativeChannelCount = 0;
    uint32_t    nativeSampleRate   = 0;

    std::string hostApi;
    int         hostIndex         = -1;   // position in the host's device list
    int         maxOutputChannels = 0;
    bool        isDefaultInput    = false;
};

struct CaptureRequest {
    CaptureSource              source = CaptureSource::Mixed;
    std::optional<std::string> deviceId;
};

struct StreamFormat {
    uint16_t     channels   = 0;
    uint32_t     sampleRate = 0;
    SampleFormat format     = SampleFormat::Unsupported;
};

// One normalized block handed from a producer to the mixer.
struct RawFrame {
    std::vector<int16_t> samples;   // interleaved
    uint16_t channels   = 0;
    uint32_t sampleRate = 0;

    size_t frameCount() const {
        return channels ? samples.size() / channels : 0;
    }
};

// The only unit crossing the engine boundary.
struct PcmChunk {
    uint32_t             sampleRate   = 0;
    uint16_t             channelCount = kOutputChannels;
    std::vector<int16_t> samples;   // interleaved

    size_t frameCount() const {
        return channelCount ? samples.size() / channelCount : 0;
    }

    // Host-native byte order.
    const uint8_t* bytes() const {
        return reinterpret_cast<const uint8_t*>(samples.data());
    }
    size_t byteSize() const { return samples.size() * sizeof(int16_t); }
};

struct CaptureResult {
    bool         ok    = true;
    CaptureError error = CaptureError::None;
    std::string  message;

    static CaptureResult success() { return {}; }
    static CaptureResult failure(CaptureError e, std::string msg) {
        return {false, e, std::move(msg)};
    }
};

inline const char* toString(DeviceKind k) {
    switch (k) {
        case DeviceKind::Microphone:     return "mic";
        case DeviceKind::SystemLoopback: return "system";
        case DeviceKind::Other:          return "other";
    }
    return "other";
}

inline const char* toString(CaptureSource s) {
    switch (s) {
        case CaptureSource::Mic:    return "mic";
        case CaptureSource::System: return "system";
        case CaptureSource::Mixed:  return "mixed";
    }
    return "mixed";
}

inline const char* toString(SampleFormat f) {
    switch (f) {
        case SampleFormat::Float32:     return "f32";
        case SampleFormat::Int32:       return "i32";
        case SampleFormat::Int16:       return "i16";
        case SampleFormat::UInt16:      return "u16";
        case SampleFormat::Int8:        return "i8";
        case SampleFormat::UInt8:       return "u8";
        case SampleFormat::Unsupported: return "unsupported";
    }
    return "unsupported";
}

inline const char* toString(CaptureError e) {
    switch (e) {
        case CaptureError::None:              return "none";
        case CaptureError::UnsupportedSource: return "UnsupportedSource";
        case CaptureError::NoCaptureDevice:   return "NoCaptureDevice";
    }
    return "none";
}

inline std::optional<CaptureSource> parseCaptureSource(const std::string& s) {
    if (s == "mic")    return CaptureSource::Mic;
    if (s == "system") return CaptureSource::System;
    if (s == "mixed")  return CaptureSource::Mixed;
    return std::nullopt;
}

inline size_t bytesPerSample(SampleFormat f) {
    switch (f) {
        case SampleFormat::Float32:
        case SampleFormat::Int32:   return 4;
        case SampleFormat::Int16:
        case SampleFormat::UInt16:  return 2;
        case SampleFormat::Int8:
        case SampleFormat::UInt8:   return 1;
        case SampleFormat::Unsupported: return 0;
    }
    return 0;
}
