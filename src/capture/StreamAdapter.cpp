#include "capture/StreamAdapter.hpp"
#include "audio/SampleConvert.hpp"
#include "discovery/DeviceCatalog.hpp"
#include <spdlog/spdlog.h>

StreamFormat StreamAdapter::negotiate(const IAudioHost& host, int index) {
    StreamFormat fmt;
    if (auto cfg = DeviceCatalog::inputConfig(host, index))
        fmt = *cfg;
    if (fmt.sampleRate == 0)
        fmt.sampleRate = kDefaultSampleRate;
    return fmt;
}

std::optional<Producer> StreamAdapter::open(const AudioDevice& device,
                                            const CancellationToken& token) {
    StreamFormat fmt = negotiate(host_, device.hostIndex);

    if (fmt.channels == 0) {
        spdlog::warn("No supported input config for '{}'", device.id);
        return std::nullopt;
    }
    if (fmt.format == SampleFormat::Unsupported) {
        spdlog::warn("Unsupported sample format on '{}'", device.id);
        return std::nullopt;
    }

    auto queue = std::make_shared<FrameQueue>(queueCapacity_);

    // Runs on the OS audio thread
    auto onData = [queue, token, fmt](const void* data, size_t frameCount) {
        RawFrame frame;
        frame.channels   = fmt.channels;
        frame.sampleRate = fmt.sampleRate;
        if (!SampleConvert::convert(data, frameCount * fmt.channels, fmt.format,
                                    frame.samples))
            return;
        if (queue->tryPush(std::move(frame)))
            token.wake().notify();
    };

    auto stream = host_.openInput(device.hostIndex, fmt, std::move(onData));
    if (!stream) {
        spdlog::warn("Failed to build stream for '{}'", device.id);
        return std::nullopt;
    }

    if (!stream->start()) {
        spdlog::warn("Failed to start stream for '{}'", device.id);
        return std::nullopt;
    }

    spdlog::info("Producer '{}' running: {} ch, {}Hz, {}", device.id,
                 fmt.channels, fmt.sampleRate, toString(fmt.format));

    Producer p;
    p.name   = device.id;
    p.format = fmt;
    p.queue  = std::move(queue);
    p.stream = std::move(stream);
    return p;
}
