#pragma once
#include "audio/AudioTypes.hpp"
#include "audio/CancellationToken.hpp"
#include "capture/StreamAdapter.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct MixerConfig {
    uint16_t outputChannels = kOutputChannels;
    // Amplitude applied to every non-primary source before summing
    float    secondaryGain  = 0.1f;
    // Upper bound on one wait for primary data; stop is also a wakeup
    std::chrono::milliseconds waitSlice{20};
};

// Mixes N producer queues into one stereo stream. The first input is the
// primary: each of its chunks starts exactly one cycle, and its sample rate
// tags the output. Each cycle drains every secondary queue and mixes only
// the newest chunk, cut to the primary's frame count; older chunks and the
// leftover frames are dropped, so nothing is carried into later cycles.
class Mixer {
public:
    using ChunkSink = std::function<void(const PcmChunk&)>;

    struct Input {
        std::string                 name;
        std::shared_ptr<FrameQueue> queue;
        uint16_t                    channels   = 0;
        uint32_t                    sampleRate = 0;
    };

    Mixer(std::vector<Input> inputs, MixerConfig config, ChunkSink sink);

    // Blocks until `token` is cancelled. Never throws.
    void run(const CancellationToken& token);

    // One mixer cycle for an already-dequeued primary chunk. Empties every
    // secondary queue.
    PcmChunk mixCycle(const RawFrame& primary);

    uint64_t chunksEmitted() const { return emitted_.load(std::memory_order_relaxed); }

    // ── Building blocks ─────────────────────────────────────────────────

    // Remap `frames` interleaved frames from srcChannels to dstChannels and
    // add them into `dst` with saturation:
    //   (1,2) duplicate, (N,N) copy, (2,1) average, else dst % src.
    static void remapAccumulate(std::vector<int32_t>& dst, uint16_t dstChannels,
                                const int16_t* src, size_t srcLen,
                                uint16_t srcChannels, size_t frames);

    // Scale in place, rounding and clamping to the int16 range
    static void attenuate(std::vector<int16_t>& samples, float gain);

    // If the absolute peak exceeds maxValue, scale everything by
    // maxValue / peak. Returns the peak seen before scaling.
    static int32_t normalizePeak(std::vector<int32_t>& acc, int32_t maxValue = INT16_MAX);

    static std::vector<int16_t> toPcm16(const std::vector<int32_t>& acc);

    static int32_t saturatingAdd(int32_t a, int32_t b);

private:
    void emit(const PcmChunk& chunk);

    std::vector<Input>   inputs_;
    MixerConfig          config_;
    ChunkSink            sink_;
    std::atomic<uint64_t> emitted_{0};
    uint64_t             secondaryChunks_ = 0;
    uint64_t             secondaryStale_  = 0;   // older chunks skipped in a cycle
};
