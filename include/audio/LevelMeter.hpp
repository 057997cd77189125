#pragma once
#include "AudioTypes.hpp"
#include "SampleConvert.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

// RMS / peak metering of mixed chunks, in linear [0, 1] and dBFS.
// Silence floors at -96 dBFS.
class LevelMeter {
public:
    struct Levels {
        float rms     = 0.0f;
        float peak    = 0.0f;
        float rmsDB   = -96.0f;
        float peakDB  = -96.0f;
        bool  clipped = false;    // some sample at full scale
    };

    static Levels measure(const PcmChunk& chunk) {
        return measure(chunk.samples);
    }

    static Levels measure(const std::vector<int16_t>& samples) {
        Levels l;
        if (samples.empty()) return l;

        double sumSq = 0.0;
        float peak = 0.0f;
        for (int16_t s : samples) {
            float v = SampleConvert::toFloat(s);
            sumSq += static_cast<double>(v) * v;
            peak = std::max(peak, std::abs(v));
            if (s == INT16_MAX || s == INT16_MIN) l.clipped = true;
        }

        l.rms    = static_cast<float>(std::sqrt(sumSq / samples.size()));
        l.peak   = std::min(peak, 1.0f);
        l.rmsDB  = toDBFS(l.rms);
        l.peakDB = toDBFS(l.peak);
        return l;
    }

    // Accumulates levels over several chunks (e.g. one report per second)
    void add(const PcmChunk& chunk) {
        Levels l = measure(chunk);
        sumSq_ += static_cast<double>(l.rms) * l.rms * chunk.samples.size();
        peak_ = std::max(peak_, l.peak);
        if (l.clipped) clippedChunks_++;
        samples_ += chunk.samples.size();
        frames_  += chunk.frameCount();
        chunks_++;
    }

    Levels current() const {
        Levels l;
        if (samples_ == 0) return l;
        l.rms    = static_cast<float>(std::sqrt(sumSq_ / samples_));
        l.peak   = peak_;
        l.rmsDB  = toDBFS(l.rms);
        l.peakDB = toDBFS(l.peak);
        l.clipped = clippedChunks_ > 0;
        return l;
    }

    size_t chunks() const { return chunks_; }
    size_t frames() const { return frames_; }
    size_t clippedChunks() const { return clippedChunks_; }

    void reset() {
        sumSq_ = 0.0;
        peak_ = 0.0f;
        samples_ = frames_ = chunks_ = clippedChunks_ = 0;
    }

    static float toDBFS(float linear) {
        if (linear < 1e-10f) return -96.0f;
        return 20.0f * std::log10(linear);
    }

private:
    double sumSq_   = 0.0;
    float  peak_    = 0.0f;
    size_t samples_ = 0;
    size_t frames_  = 0;
    size_t chunks_  = 0;
    size_t clippedChunks_ = 0;
};
