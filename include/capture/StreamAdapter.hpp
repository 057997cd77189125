#pragma once
#include "audio/AudioTypes.hpp"
#include "audio/CancellationToken.hpp"
#include "audio/ChunkQueue.hpp"
#include "audio/IAudioHost.hpp"
#include <memory>
#include <optional>
#include <string>

using FrameQueue = ChunkQueue<RawFrame>;

// One running source feeding the mixer. `stream` is null for producers that
// own their capture thread elsewhere (the platform loopback backend).
struct Producer {
    std::string                   name;
    StreamFormat                  format;
    std::shared_ptr<FrameQueue>   queue;
    std::unique_ptr<IInputStream> stream;
};

// Opens one native capture stream per device and converts every callback
// buffer to 16-bit PCM on a bounded queue. A full queue drops the chunk; the
// OS callback never waits.
class StreamAdapter {
public:
    explicit StreamAdapter(IAudioHost& host, size_t queueCapacity = 64)
        : host_(host), queueCapacity_(queueCapacity) {}

    // Negotiate, open and start. Failures are logged and return nullopt;
    // they never affect other producers. `token.wake()` is notified on every
    // pushed chunk.
    std::optional<Producer> open(const AudioDevice& device,
                                 const CancellationToken& token);

    static StreamFormat negotiate(const IAudioHost& host, int index);

private:
    IAudioHost& host_;
    size_t      queueCapacity_;
};
