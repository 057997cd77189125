#pragma once
#include "audio/AudioTypes.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

// Native system-output capture that bypasses the portable layer.
// Implementations: WasapiLoopback (Windows). Other platforms have none and
// rely on monitor/loopback devices found through DeviceCatalog.
class ILoopbackBackend {
public:
    virtual ~ILoopbackBackend() = default;

    // Receives converted chunks on the backend's capture thread.
    using ChunkSink = std::function<void(RawFrame&&)>;

    // Starts the capture thread and blocks until it is either capturing or
    // has failed. Returns false on any initialization failure; nothing is
    // left running in that case.
    virtual bool start(ChunkSink sink) = 0;

    // Cancels and joins the capture thread. Safe to call repeatedly.
    virtual void stop() = 0;

    virtual bool isRunning() const = 0;

    // Negotiated mix format, known once start() succeeded
    virtual std::optional<StreamFormat> format() const = 0;

    // Name for logging
    virtual std::string backendName() const = 0;
};

// The loopback backend for this platform, or nullptr where there is none.
std::unique_ptr<ILoopbackBackend> createPlatformLoopback();
