#pragma once
#include "audio/AudioTypes.hpp"
#include "audio/SampleConvert.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

// Plain copy of the WAVEFORMATEX / WAVEFORMATEXTENSIBLE fields the loopback
// backend needs, so format interpretation does not depend on Windows headers.
struct WaveFormatInfo {
    static constexpr uint16_t kTagPcm        = 0x0001;   // WAVE_FORMAT_PCM
    static constexpr uint16_t kTagIeeeFloat  = 0x0003;   // WAVE_FORMAT_IEEE_FLOAT
    static constexpr uint16_t kTagExtensible = 0xFFFE;   // WAVE_FORMAT_EXTENSIBLE

    uint16_t formatTag        = kTagPcm;
    bool     hasExtension     = false;   // cbSize covers WAVEFORMATEXTENSIBLE
    bool     subFormatIsFloat = false;   // SubFormat == KSDATAFORMAT_SUBTYPE_IEEE_FLOAT
    uint16_t channels         = 0;
    uint32_t sampleRate       = 0;
    uint16_t bitsPerSample    = 0;
    uint16_t blockAlign       = 0;
};

// Shared-mode mix format as the loopback backend interprets it.
struct MixFormat {
    uint16_t channels   = 0;
    uint32_t sampleRate = 0;
    uint16_t bits       = 16;   // container size per sample
    bool     isFloat    = false;

    // For WAVE_FORMAT_EXTENSIBLE the sub-format decides float vs. integer.
    // wBitsPerSample is only trusted when it agrees with nBlockAlign; else the
    // container size comes from the block alignment, and 16 bits is the last
    // resort.
    static MixFormat interpret(const WaveFormatInfo& wf) {
        MixFormat mf;
        mf.channels   = wf.channels;
        mf.sampleRate = wf.sampleRate;
        mf.isFloat    = wf.formatTag == WaveFormatInfo::kTagIeeeFloat;

        if (wf.formatTag == WaveFormatInfo::kTagExtensible && wf.hasExtension)
            mf.isFloat = wf.subFormatIsFloat;

        uint16_t bits = wf.bitsPerSample;
        uint16_t fromAlign = mf.channels
            ? static_cast<uint16_t>((wf.blockAlign / mf.channels) * 8) : 0;

        if (bits == 0 || bits % 8 != 0 || (fromAlign && bits != fromAlign))
            bits = fromAlign;
        if (bits == 0 || bits % 8 != 0)
            bits = 16;

        mf.bits = bits;
        return mf;
    }

    bool isConvertible() const {
        if (channels == 0) return false;
        if (isFloat) return bits == 32;
        return bits == 16 || bits == 24 || bits == 32;
    }

    // Closest SampleFormat for reporting; packed 24-bit reports as Int32
    SampleFormat sampleFormat() const {
        if (!isConvertible()) return SampleFormat::Unsupported;
        if (isFloat) return SampleFormat::Float32;
        return bits == 16 ? SampleFormat::Int16 : SampleFormat::Int32;
    }

    // 24-bit little-endian packed PCM, sign extended, top 16 bits kept
    static int16_t from24(const uint8_t* p) {
        int32_t v = p[0] | (p[1] << 8) | (p[2] << 16);
        if (v & 0x800000) v |= ~0xFFFFFF;
        return static_cast<int16_t>(v >> 8);
    }

    // Convert one packet of `frames` interleaved frames to 16-bit PCM
    bool convert(const uint8_t* data, size_t frames, std::vector<int16_t>& out) const {
        size_t count = frames * channels;
        if (!isConvertible()) {
            out.clear();
            return false;
        }
        if (!isFloat && bits == 24) {
            out.resize(count);
            for (size_t i = 0; i < count; i++) out[i] = from24(data + i * 3);
            return true;
        }
        return SampleConvert::convert(data, count, sampleFormat(), out);
    }
};
