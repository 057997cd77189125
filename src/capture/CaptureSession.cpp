#include "capture/CaptureSession.hpp"
#include <spdlog/spdlog.h>
#include <utility>

CaptureSession::CaptureSession(IAudioHost& host,
                               SessionConfig config,
                               LoopbackFactory loopbackFactory)
    : config_(config)
    , loopbackFactory_(std::move(loopbackFactory))
    , catalog_(host, config.catalog)
    , adapter_(host, config.queueCapacity)
{
}

CaptureSession::~CaptureSession() {
    stop();
}

std::vector<AudioDevice> CaptureSession::listDevices() const {
    return catalog_.enumerate();
}

std::vector<std::string> CaptureSession::activeProducers() const {
    std::lock_guard lock(mtx_);
    if (!active_) return {};
    return active_->readiness->snapshot();
}

// ── Readiness ────────────────────────────────────────────────────────────

void CaptureSession::Readiness::add(const std::string& name) {
    {
        std::lock_guard lock(mtx);
        producers.push_back(name);
    }
    cv.notify_all();
}

void CaptureSession::Readiness::settle() {
    {
        std::lock_guard lock(mtx);
        settled = true;
    }
    cv.notify_all();
}

std::vector<std::string> CaptureSession::Readiness::snapshot() {
    std::lock_guard lock(mtx);
    return producers;
}

CaptureResult CaptureSession::start(const std::string& source,
                                    const std::optional<std::string>& deviceId,
                                    ChunkSink sink) {
    auto parsed = parseCaptureSource(source);
    if (!parsed) {
        spdlog::error("Unknown capture source '{}'", source);
        return CaptureResult::failure(CaptureError::UnsupportedSource,
                                      "Unknown source: " + source);
    }
    return start(CaptureRequest{*parsed, deviceId}, std::move(sink));
}

CaptureResult CaptureSession::start(const CaptureRequest& request, ChunkSink sink) {
    std::lock_guard lock(mtx_);
    stopLocked();

    spdlog::info("Starting capture: source={} device={}", toString(request.source),
                 request.deviceId ? *request.deviceId : "<default>");

    Plan plan;
    switch (request.source) {
        case CaptureSource::Mic:
            plan.microphone = catalog_.resolveMicrophone(request.deviceId);
            if (!plan.microphone) {
                return CaptureResult::failure(CaptureError::NoCaptureDevice,
                                              "No capture devices available");
            }
            break;

        case CaptureSource::System:
            plan.wantSystem = true;
            plan.systemId   = request.deviceId;
            if (loopbackFactory_) plan.loopback = loopbackFactory_();
            break;

        case CaptureSource::Mixed:
            // Either half may be missing; the handshake decides
            plan.microphone = catalog_.resolveMicrophone(request.deviceId);
            plan.wantSystem = true;
            if (loopbackFactory_) plan.loopback = loopbackFactory_();
            break;
    }

    state_ = SessionState::Starting;

    auto readiness = std::make_shared<Readiness>();

    auto session = std::make_unique<ActiveSession>();
    session->readiness = readiness;
    session->thread = std::thread(&CaptureSession::sessionThread, this,
                                  std::move(plan), session->token, readiness,
                                  std::move(sink));

    std::vector<std::string> producers;
    {
        std::unique_lock lock(readiness->mtx);
        bool settled = readiness->cv.wait_for(lock, config_.readyTimeout,
                                              [&] { return readiness->settled; });
        producers = readiness->producers;
        if (!settled && !producers.empty()) {
            spdlog::warn("Not every source was ready within {} ms; continuing with {}",
                         config_.readyTimeout.count(), producers.size());
        } else if (!settled) {
            spdlog::error("No producer started within {} ms", config_.readyTimeout.count());
        }
    }

    if (producers.empty()) {
        state_ = SessionState::Stopping;
        session->token.cancel();
        if (session->thread.joinable()) session->thread.join();
        state_ = SessionState::Idle;
        spdlog::error("Failed to start audio capture");
        return CaptureResult::failure(CaptureError::NoCaptureDevice,
                                      "Failed to start audio capture");
    }

    active_ = std::move(session);
    state_ = SessionState::Running;

    spdlog::info("Capture running with {} producer(s), primary '{}'",
                 producers.size(), producers.front());
    return CaptureResult::success();
}

void CaptureSession::stop() {
    std::lock_guard lock(mtx_);
    stopLocked();
}

void CaptureSession::stopLocked() {
    if (!active_) return;

    state_ = SessionState::Stopping;
    spdlog::info("Capture stopping...");

    active_->token.cancel();
    if (active_->thread.joinable())
        active_->thread.join();
    active_.reset();

    state_ = SessionState::Idle;
    spdlog::info("Capture stopped");
}

std::optional<Producer> CaptureSession::startLoopbackProducer(ILoopbackBackend& backend,
                                                              const CancellationToken& token) {
    auto queue = std::make_shared<FrameQueue>(config_.queueCapacity);

    bool ok = backend.start([queue, token](RawFrame&& frame) {
        if (queue->tryPush(std::move(frame)))
            token.wake().notify();
    });
    if (!ok) return std::nullopt;

    Producer p;
    p.name   = backend.backendName();
    p.format = backend.format().value_or(
        StreamFormat{kOutputChannels, kDefaultSampleRate, SampleFormat::Float32});
    p.queue  = std::move(queue);
    return p;
}

// ── Session thread ───────────────────────────────────────────────────────

void CaptureSession::sessionThread(Plan plan, CancellationToken token,
                                   std::shared_ptr<Readiness> readiness,
                                   ChunkSink sink) {
    std::vector<Producer> producers;
    std::unique_ptr<ILoopbackBackend> loopback = std::move(plan.loopback);

    auto started = [&](Producer&& p) {
        readiness->add(p.name);
        producers.push_back(std::move(p));
    };

    if (plan.microphone) {
        if (auto p = adapter_.open(*plan.microphone, token))
            started(std::move(*p));
    }

    // start() may already have given up on us
    if (plan.wantSystem && !token.isCancelled()) {
        bool systemStarted = false;

        if (loopback) {
            if (auto p = startLoopbackProducer(*loopback, token)) {
                started(std::move(*p));
                systemStarted = true;
            } else {
                spdlog::warn("{} unavailable, falling back to system device search",
                             loopback->backendName());
                loopback.reset();
            }
        }

        if (!systemStarted && !token.isCancelled()) {
            std::optional<std::string> exclude;
            if (plan.microphone) exclude = plan.microphone->id;
            if (auto dev = catalog_.resolveSystemDevice(plan.systemId, exclude)) {
                if (auto p = adapter_.open(*dev, token))
                    started(std::move(*p));
            }
        }
    }

    readiness->settle();

    if (!producers.empty()) {
        std::vector<Mixer::Input> inputs;
        for (auto& p : producers)
            inputs.push_back({p.name, p.queue, p.format.channels, p.format.sampleRate});

        MixerConfig mixerConfig;
        mixerConfig.secondaryGain = config_.secondaryGain;

        Mixer mixer(std::move(inputs), mixerConfig, std::move(sink));
        mixer.run(token);
    }

    // Producers stop before the queues they feed go away
    if (loopback) {
        if (!loopback->isRunning())
            spdlog::warn("{} stopped before the session ended", loopback->backendName());
        loopback->stop();
    }
    for (auto& p : producers) {
        if (!p.stream) continue;
        if (!p.stream->isRunning())
            spdlog::warn("Producer '{}' had already stopped", p.name);
        p.stream->stop();
        if (size_t overflows = p.stream->overflowCount())
            spdlog::warn("Producer '{}' reported {} input overflows", p.name, overflows);
    }
    producers.clear();
}
