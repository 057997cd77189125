#pragma once
#include "AudioTypes.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <vector>

// Native sample → 16-bit signed PCM conversion.
// Called from audio callback threads: no locks, one allocation at most
// (the output vector).
class SampleConvert {
public:
    static int16_t fromFloat(float s) {
        if (std::isnan(s)) return 0;
        float clamped = std::max(-1.0f, std::min(1.0f, s));
        // lround rounds half away from zero, so 0.5 → 16384 and -0.5 → -16384
        return static_cast<int16_t>(std::lround(clamped * 32767.0f));
    }

    static int16_t fromInt32(int32_t s)  { return static_cast<int16_t>(s >> 16); }
    static int16_t fromUInt16(uint16_t s) {
        return static_cast<int16_t>(static_cast<int32_t>(s) - 32768);
    }
    static int16_t fromInt8(int8_t s)    { return static_cast<int16_t>(s * 256); }
    static int16_t fromUInt8(uint8_t s) {
        return static_cast<int16_t>((static_cast<int32_t>(s) - 128) * 256);
    }

    static int16_t clampToInt16(int32_t v) {
        if (v > INT16_MAX) return INT16_MAX;
        if (v < INT16_MIN) return INT16_MIN;
        return static_cast<int16_t>(v);
    }

    // Convert `count` interleaved samples of `format` starting at `data`.
    // Returns false for formats with no conversion rule; `out` is left empty.
    static bool convert(const void* data, size_t count, SampleFormat format,
                        std::vector<int16_t>& out) {
        out.clear();
        if (!data || count == 0) return format != SampleFormat::Unsupported;

        switch (format) {
            case SampleFormat::Float32: {
                auto* in = static_cast<const float*>(data);
                out.resize(count);
                for (size_t i = 0; i < count; i++) out[i] = fromFloat(in[i]);
                return true;
            }
            case SampleFormat::Int16: {
                auto* in = static_cast<const int16_t*>(data);
                out.assign(in, in + count);
                return true;
            }
            case SampleFormat::UInt16: {
                auto* in = static_cast<const uint16_t*>(data);
                out.resize(count);
                for (size_t i = 0; i < count; i++) out[i] = fromUInt16(in[i]);
                return true;
            }
            case SampleFormat::Int32: {
                auto* in = static_cast<const int32_t*>(data);
                out.resize(count);
                for (size_t i = 0; i < count; i++) out[i] = fromInt32(in[i]);
                return true;
            }
            case SampleFormat::Int8: {
                auto* in = static_cast<const int8_t*>(data);
                out.resize(count);
                for (size_t i = 0; i < count; i++) out[i] = fromInt8(in[i]);
                return true;
            }
            case SampleFormat::UInt8: {
                auto* in = static_cast<const uint8_t*>(data);
                out.resize(count);
                for (size_t i = 0; i < count; i++) out[i] = fromUInt8(in[i]);
                return true;
            }
            case SampleFormat::Unsupported:
                break;
        }
        return false;
    }

    // Back to float in [-1, 1], used by metering
    static float toFloat(int16_t s) { return static_cast<float>(s) / 32767.0f; }
};
