#pragma once
#include "audio/AudioTypes.hpp"
#include "audio/CancellationToken.hpp"
#include "audio/IAudioHost.hpp"
#include "capture/ILoopbackBackend.hpp"
#include "capture/Mixer.hpp"
#include "capture/StreamAdapter.hpp"
#include "discovery/DeviceCatalog.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

enum class SessionState {
    Idle,
    Starting,
    Running,
    Stopping
};

inline const char* toString(SessionState s) {
    switch (s) {
        case SessionState::Idle:     return "idle";
        case SessionState::Starting: return "starting";
        case SessionState::Running:  return "running";
        case SessionState::Stopping: return "stopping";
    }
    return "idle";
}

struct SessionConfig {
    float  secondaryGain  = 0.1f;   // mixed-mode blend of non-primary sources
    size_t queueCapacity  = 64;     // chunks per producer queue
    std::chrono::milliseconds readyTimeout{2000};
    DeviceCatalog::Options catalog;
};

// Owns the single capture slot. start() always stops the previous session
// first, so at most one session (mixer thread + producers) exists at a time.
//
// Threads per session:
//   session thread: opens producers, reporting each one as it starts, then
//                   runs the mixer until cancelled and closes everything
//   OS callback threads (one per portable producer)
//   loopback capture thread (when the platform backend is in use)
// stop() cancels and joins the session thread, which joins the rest.
class CaptureSession {
public:
    using ChunkSink       = Mixer::ChunkSink;
    using LoopbackFactory = std::function<std::unique_ptr<ILoopbackBackend>()>;

    explicit CaptureSession(IAudioHost& host,
                            SessionConfig config = {},
                            LoopbackFactory loopbackFactory = createPlatformLoopback);
    ~CaptureSession();

    CaptureSession(const CaptureSession&) = delete;
    CaptureSession& operator=(const CaptureSession&) = delete;

    std::vector<AudioDevice> listDevices() const;

    CaptureResult start(const CaptureRequest& request, ChunkSink sink);

    // String form used at the outer boundary: "mic" | "system" | "mixed"
    CaptureResult start(const std::string& source,
                        const std::optional<std::string>& deviceId,
                        ChunkSink sink);

    // Idempotent. Returns once every session thread has been joined.
    void stop();

    SessionState state() const { return state_.load(); }
    bool isRunning() const { return state() == SessionState::Running; }

    // Producers of the running session, primary first (empty when idle).
    // A source still opening when start() returned shows up once it runs.
    std::vector<std::string> activeProducers() const;

    const SessionConfig& config() const { return config_; }

private:
    // What start() resolved on the caller's thread. The portable system
    // device search runs on the session thread, and only when there is no
    // loopback backend or it failed to start.
    struct Plan {
        std::optional<AudioDevice>        microphone;
        bool                              wantSystem = false;
        std::optional<std::string>        systemId;
        std::unique_ptr<ILoopbackBackend> loopback;
    };

    // Readiness handshake. The session thread appends each producer as it
    // starts and sets `settled` once every source has been tried; start()
    // waits for `settled` up to readyTimeout and succeeds if anything started.
    struct Readiness {
        std::mutex               mtx;
        std::condition_variable  cv;
        std::vector<std::string> producers;
        bool                     settled = false;

        void add(const std::string& name);
        void settle();
        std::vector<std::string> snapshot();
    };

    struct ActiveSession {
        CancellationToken          token;
        std::thread                thread;
        std::shared_ptr<Readiness> readiness;
    };

    void sessionThread(Plan plan, CancellationToken token,
                       std::shared_ptr<Readiness> readiness,
                       ChunkSink sink);

    std::optional<Producer> startLoopbackProducer(ILoopbackBackend& backend,
                                                  const CancellationToken& token);

    void stopLocked();

    SessionConfig    config_;
    LoopbackFactory  loopbackFactory_;
    DeviceCatalog    catalog_;
    StreamAdapter    adapter_;

    mutable std::mutex             mtx_;      // guards the active slot
    std::unique_ptr<ActiveSession> active_;
    std::atomic<SessionState>      state_{SessionState::Idle};
};
