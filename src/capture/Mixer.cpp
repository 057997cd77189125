#include "capture/Mixer.hpp"
#include "audio/SampleConvert.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <limits>

Mixer::Mixer(std::vector<Input> inputs, MixerConfig config, ChunkSink sink)
    : inputs_(std::move(inputs))
    , config_(config)
    , sink_(std::move(sink))
{
    if (config_.outputChannels == 0)
        config_.outputChannels = kOutputChannels;
}

int32_t Mixer::saturatingAdd(int32_t a, int32_t b) {
    int64_t sum = static_cast<int64_t>(a) + b;
    if (sum > std::numeric_limits<int32_t>::max()) return std::numeric_limits<int32_t>::max();
    if (sum < std::numeric_limits<int32_t>::min()) return std::numeric_limits<int32_t>::min();
    return static_cast<int32_t>(sum);
}

void Mixer::remapAccumulate(std::vector<int32_t>& dst, uint16_t dstChannels,
                            const int16_t* src, size_t srcLen,
                            uint16_t srcChannels, size_t frames) {
    if (!src || srcLen == 0 || dst.empty() || srcChannels == 0 || dstChannels == 0)
        return;

    frames = std::min({frames, dst.size() / dstChannels, srcLen / srcChannels});

    if (srcChannels == 1 && dstChannels == 2) {
        for (size_t i = 0; i < frames; i++) {
            dst[i * 2]     = saturatingAdd(dst[i * 2],     src[i]);
            dst[i * 2 + 1] = saturatingAdd(dst[i * 2 + 1], src[i]);
        }
    } else if (srcChannels == dstChannels) {
        size_t n = frames * srcChannels;
        for (size_t i = 0; i < n; i++)
            dst[i] = saturatingAdd(dst[i], src[i]);
    } else if (srcChannels == 2 && dstChannels == 1) {
        for (size_t i = 0; i < frames; i++) {
            int32_t avg = (static_cast<int32_t>(src[i * 2]) + src[i * 2 + 1]) / 2;
            dst[i] = saturatingAdd(dst[i], avg);
        }
    } else {
        for (size_t i = 0; i < frames; i++) {
            for (uint16_t ch = 0; ch < dstChannels; ch++) {
                size_t s = i * srcChannels + (ch % srcChannels);
                size_t d = i * dstChannels + ch;
                dst[d] = saturatingAdd(dst[d], src[s]);
            }
        }
    }
}

void Mixer::attenuate(std::vector<int16_t>& samples, float gain) {
    for (auto& s : samples) {
        double v = std::round(static_cast<double>(s) * gain);
        v = std::max(-32768.0, std::min(32767.0, v));
        s = static_cast<int16_t>(v);
    }
}

int32_t Mixer::normalizePeak(std::vector<int32_t>& acc, int32_t maxValue) {
    int64_t peak = 0;
    for (int32_t s : acc)
        peak = std::max<int64_t>(peak, std::llabs(static_cast<int64_t>(s)));

    if (peak > maxValue) {
        double gain = static_cast<double>(maxValue) / static_cast<double>(peak);
        for (auto& s : acc)
            s = static_cast<int32_t>(std::lround(static_cast<double>(s) * gain));
    }
    return static_cast<int32_t>(std::min<int64_t>(peak, INT32_MAX));
}

std::vector<int16_t> Mixer::toPcm16(const std::vector<int32_t>& acc) {
    std::vector<int16_t> out(acc.size());
    for (size_t i = 0; i < acc.size(); i++)
        out[i] = SampleConvert::clampToInt16(acc[i]);
    return out;
}

PcmChunk Mixer::mixCycle(const RawFrame& primary) {
    const uint16_t outCh = config_.outputChannels;

    uint16_t primaryCh = primary.channels ? primary.channels
                       : (inputs_.empty() ? 1 : std::max<uint16_t>(inputs_[0].channels, 1));
    size_t frames = primary.samples.size() / primaryCh;

    std::vector<int32_t> acc(frames * outCh, 0);
    remapAccumulate(acc, outCh, primary.samples.data(), primary.samples.size(),
                    primaryCh, frames);

    for (size_t idx = 1; idx < inputs_.size(); idx++) {
        if (!inputs_[idx].queue) continue;

        // Newest chunk only; anything older is stale by now
        RawFrame secondary;
        RawFrame newer;
        size_t popped = 0;
        while (inputs_[idx].queue->tryPop(newer)) {
            secondary = std::move(newer);
            popped++;
        }
        if (popped == 0) continue;
        secondaryStale_ += popped - 1;

        uint16_t ch = secondary.channels ? secondary.channels
                    : std::max<uint16_t>(inputs_[idx].channels, 1);
        attenuate(secondary.samples, config_.secondaryGain);
        size_t secFrames = std::min(secondary.samples.size() / ch, frames);
        remapAccumulate(acc, outCh, secondary.samples.data(), secondary.samples.size(),
                        ch, secFrames);
        secondaryChunks_++;
    }

    normalizePeak(acc);

    PcmChunk chunk;
    chunk.sampleRate   = primary.sampleRate ? primary.sampleRate
                       : (!inputs_.empty() && inputs_[0].sampleRate ? inputs_[0].sampleRate
                                                                    : kDefaultSampleRate);
    chunk.channelCount = outCh;
    chunk.samples      = toPcm16(acc);
    return chunk;
}

void Mixer::emit(const PcmChunk& chunk) {
    emitted_.fetch_add(1, std::memory_order_relaxed);
    if (!sink_) return;
    try {
        sink_(chunk);
    } catch (const std::exception& e) {
        spdlog::error("Chunk sink threw: {}", e.what());
    }
}

void Mixer::run(const CancellationToken& token) {
    if (inputs_.empty() || !inputs_[0].queue) {
        spdlog::warn("Mixer started without a primary input");
        return;
    }

    spdlog::debug("Mixer thread started: primary '{}', {} secondary",
                  inputs_[0].name, inputs_.size() - 1);

    auto& primaryQueue = *inputs_[0].queue;
    WakeSignal& wake = token.wake();

    while (!token.isCancelled()) {
        // Read the sequence first so a push after tryPop still wakes us
        uint64_t seen = wake.sequence();

        RawFrame primary;
        if (!primaryQueue.tryPop(primary)) {
            wake.waitFor(seen, config_.waitSlice);
            continue;
        }

        // Stop wins over data that arrived alongside it
        if (token.isCancelled()) break;

        emit(mixCycle(primary));
    }

    size_t dropped = 0;
    for (auto& in : inputs_)
        if (in.queue) dropped += in.queue->dropped();

    spdlog::debug("Mixer thread stopped: {} chunks emitted, {} secondary mixed, "
                  "{} stale secondary skipped, {} dropped on full queues",
                  chunksEmitted(), secondaryChunks_, secondaryStale_, dropped);
}
