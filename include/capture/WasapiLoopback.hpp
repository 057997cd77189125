#pragma once
#include "ILoopbackBackend.hpp"
#include "audio/CancellationToken.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

// WASAPI shared-mode loopback capture of the default render endpoint.
// Windows only; link with ole32.
//
// All COM work happens on the capture thread (COM apartments are per
// thread): init → default render endpoint → activateAudioClient →
// GetMixFormat → Initialize(LOOPBACK) → Start → poll packets until
// cancelled. start() waits for that thread to report success or failure.
class WasapiLoopback : public ILoopbackBackend {
public:
    WasapiLoopback() = default;
    ~WasapiLoopback() override;

    WasapiLoopback(const WasapiLoopback&) = delete;
    WasapiLoopback& operator=(const WasapiLoopback&) = delete;

    bool start(ChunkSink sink) override;
    void stop() override;
    bool isRunning() const override { return running_; }
    std::optional<StreamFormat> format() const override;
    std::string backendName() const override { return "WASAPI loopback"; }

private:
    CancellationToken           token_;
    std::thread                 thread_;
    std::atomic<bool>           running_{false};
    mutable std::mutex          formatMtx_;
    std::optional<StreamFormat> format_;
};
