#include <gtest/gtest.h>
#include "capture/CaptureSession.hpp"
#include "FakeAudioHost.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <mutex>
#include <thread>

class CaptureSessionTest : public ::testing::Test {
protected:
    FakeAudioHost host;
    std::shared_ptr<std::atomic<int>> loopbackRunning = std::make_shared<std::atomic<int>>(0);

    std::mutex            chunksMtx;
    std::vector<PcmChunk> chunks;

    CaptureSession::ChunkSink collector() {
        return [this](const PcmChunk& c) {
            std::lock_guard lock(chunksMtx);
            chunks.push_back(c);
        };
    }

    bool waitForChunks(size_t n) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        while (std::chrono::steady_clock::now() < deadline) {
            {
                std::lock_guard lock(chunksMtx);
                if (chunks.size() >= n) return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return false;
    }

    CaptureSession::LoopbackFactory noLoopback() {
        return [] { return std::unique_ptr<ILoopbackBackend>(); };
    }

    CaptureSession::LoopbackFactory loopback(bool succeed, int16_t value = 32767) {
        auto running = loopbackRunning;
        return [succeed, value, running] {
            return std::unique_ptr<ILoopbackBackend>(
                std::make_unique<FakeLoopbackBackend>(succeed, value, running));
        };
    }

    SessionConfig config(std::chrono::milliseconds readyTimeout = std::chrono::milliseconds(2000)) {
        SessionConfig c;
        c.readyTimeout = readyTimeout;
        c.catalog.extendedSystemSearch = false;
        return c;
    }

    int addMic(const std::string& name, float level = 0.25f, bool isDefault = true) {
        FakeDevice d;
        d.name = name;
        d.level = level;
        return host.addDevice(d, isDefault);
    }
};

TEST_F(CaptureSessionTest, StopWhenIdleIsNoop) {
    CaptureSession session(host, config(), noLoopback());
    session.stop();
    session.stop();
    EXPECT_EQ(session.state(), SessionState::Idle);
    EXPECT_TRUE(session.activeProducers().empty());
}

TEST_F(CaptureSessionTest, UnknownSourceIsUnsupported) {
    addMic("USB Microphone");
    CaptureSession session(host, config(), noLoopback());

    auto r = session.start("speakers", std::nullopt, collector());
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, CaptureError::UnsupportedSource);
    EXPECT_EQ(session.state(), SessionState::Idle);
    EXPECT_EQ(host.openCalls.load(), 0);
}

TEST_F(CaptureSessionTest, MicWithoutDevicesFails) {
    CaptureSession session(host, config(), noLoopback());
    auto r = session.start("mic", std::nullopt, collector());
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, CaptureError::NoCaptureDevice);
    EXPECT_FALSE(session.isRunning());
}

TEST_F(CaptureSessionTest, MicDeliversStereoChunks) {
    addMic("USB Microphone", 0.25f);
    CaptureSession session(host, config(), noLoopback());

    auto r = session.start(CaptureRequest{CaptureSource::Mic, std::nullopt}, collector());
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_TRUE(session.isRunning());
    EXPECT_EQ(session.activeProducers(), (std::vector<std::string>{"USB Microphone"}));

    ASSERT_TRUE(waitForChunks(3));
    session.stop();

    std::lock_guard lock(chunksMtx);
    for (auto& c : chunks) {
        EXPECT_EQ(c.channelCount, 2);
        EXPECT_EQ(c.sampleRate, 48000u);
        EXPECT_EQ(c.samples.size() % 2, 0u);
        for (auto s : c.samples) EXPECT_EQ(s, 8192);
    }
}

TEST_F(CaptureSessionTest, StopJoinsEverything) {
    addMic("USB Microphone");
    CaptureSession session(host, config(), noLoopback());

    ASSERT_TRUE(session.start("mic", std::nullopt, collector()).ok);
    ASSERT_TRUE(waitForChunks(1));

    session.stop();
    EXPECT_EQ(session.state(), SessionState::Idle);
    EXPECT_EQ(host.activeStreams.load(), 0);

    // No chunk is delivered after stop() returned
    size_t count;
    {
        std::lock_guard lock(chunksMtx);
        count = chunks.size();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::lock_guard lock(chunksMtx);
    EXPECT_EQ(chunks.size(), count);

    session.stop();
}

TEST_F(CaptureSessionTest, RestartReplacesPreviousSession) {
    addMic("USB Microphone");
    CaptureSession session(host, config(), noLoopback());

    ASSERT_TRUE(session.start("mic", std::nullopt, collector()).ok);
    ASSERT_TRUE(session.start("mic", std::nullopt, collector()).ok);

    EXPECT_EQ(host.activeStreams.load(), 1);
    EXPECT_EQ(host.openCalls.load(), 2);
    EXPECT_TRUE(session.isRunning());

    session.stop();
    EXPECT_EQ(host.activeStreams.load(), 0);
}

TEST_F(CaptureSessionTest, MixedUsesMicAsPrimaryAndLoopbackAsSecondary) {
    addMic("USB Microphone", 1.0f);
    CaptureSession session(host, config(), loopback(true, 32767));

    auto r = session.start("mixed", std::nullopt, collector());
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(session.activeProducers(),
              (std::vector<std::string>{"USB Microphone", "FakeLoopback"}));
    EXPECT_EQ(loopbackRunning->load(), 1);

    ASSERT_TRUE(waitForChunks(10));
    session.stop();
    EXPECT_EQ(loopbackRunning->load(), 0);
    EXPECT_EQ(host.activeStreams.load(), 0);

    std::lock_guard lock(chunksMtx);
    for (auto& c : chunks) {
        ASSERT_EQ(c.channelCount, 2);
        for (size_t i = 0; i < c.frameCount(); i++) {
            int16_t l = c.samples[i * 2];
            int16_t r = c.samples[i * 2 + 1];
            EXPECT_EQ(l, r);
            EXPECT_LE(std::abs(static_cast<int>(l)), 32767);
        }
    }
}

TEST_F(CaptureSessionTest, SystemUsesLoopbackBackend) {
    CaptureSession session(host, config(), loopback(true, 1000));

    auto r = session.start("system", std::nullopt, collector());
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(session.activeProducers(), (std::vector<std::string>{"FakeLoopback"}));

    ASSERT_TRUE(waitForChunks(2));
    session.stop();

    std::lock_guard lock(chunksMtx);
    for (auto& c : chunks) {
        EXPECT_EQ(c.channelCount, 2);
        for (auto s : c.samples) EXPECT_EQ(s, 1000);
    }
}

TEST_F(CaptureSessionTest, LoopbackFailureFallsBackToMonitorDevice) {
    FakeDevice monitor;
    monitor.name = "Monitor of Built-in Audio";
    monitor.inputChannels = 2;
    host.addDevice(monitor);

    CaptureSession session(host, config(), loopback(false));
    auto r = session.start("system", std::nullopt, collector());
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(session.activeProducers(),
              (std::vector<std::string>{"Monitor of Built-in Audio"}));
    EXPECT_EQ(loopbackRunning->load(), 0);

    ASSERT_TRUE(waitForChunks(1));
    session.stop();
}

TEST_F(CaptureSessionTest, MixedExcludesMicrophoneFromSystemSearch) {
    // The requested "mic" is itself a monitor source; it must not be opened twice
    FakeDevice monitor;
    monitor.name = "Monitor of HDMI";
    monitor.inputChannels = 2;
    host.addDevice(monitor, true);

    CaptureSession session(host, config(), noLoopback());
    auto r = session.start("mixed", std::string("Monitor of HDMI"), collector());
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(session.activeProducers(), (std::vector<std::string>{"Monitor of HDMI"}));
    EXPECT_EQ(host.activeStreams.load(), 1);
    session.stop();
}

TEST_F(CaptureSessionTest, MixedWithOnlyMicRunsMicAlone) {
    addMic("USB Microphone");
    CaptureSession session(host, config(), noLoopback());

    auto r = session.start("mixed", std::nullopt, collector());
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(session.activeProducers(), (std::vector<std::string>{"USB Microphone"}));
    session.stop();
}

TEST_F(CaptureSessionTest, MixedWithOnlySystemRunsSystemAlone) {
    CaptureSession session(host, config(), loopback(true, 500));

    auto r = session.start("mixed", std::nullopt, collector());
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(session.activeProducers(), (std::vector<std::string>{"FakeLoopback"}));
    session.stop();
}

TEST_F(CaptureSessionTest, SystemWithNothingAvailableFails) {
    addMic("USB Microphone");
    CaptureSession session(host, config(), loopback(false));

    auto r = session.start("system", std::nullopt, collector());
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, CaptureError::NoCaptureDevice);
    EXPECT_EQ(session.state(), SessionState::Idle);
    EXPECT_EQ(host.activeStreams.load(), 0);
    EXPECT_EQ(loopbackRunning->load(), 0);
}

TEST_F(CaptureSessionTest, FailedOpenReportsNoCaptureDevice) {
    FakeDevice busy;
    busy.name = "USB Microphone";
    busy.failOpen = true;
    host.addDevice(busy, true);

    CaptureSession session(host, config(), noLoopback());
    auto r = session.start("mic", std::nullopt, collector());
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, CaptureError::NoCaptureDevice);
    EXPECT_TRUE(session.activeProducers().empty());
}

TEST_F(CaptureSessionTest, SlowDeviceTimesOutWithoutLeakingThreads) {
    FakeDevice slow;
    slow.name = "Slow Microphone";
    slow.openDelay = std::chrono::milliseconds(300);
    host.addDevice(slow, true);

    CaptureSession session(host, config(std::chrono::milliseconds(50)), noLoopback());
    auto r = session.start("mic", std::nullopt, collector());

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, CaptureError::NoCaptureDevice);
    EXPECT_EQ(session.state(), SessionState::Idle);
    // start() joined the session thread, which closed the late stream
    EXPECT_EQ(host.activeStreams.load(), 0);
}

TEST_F(CaptureSessionTest, RunningMicIsKeptWhileSystemSourceIsSlow) {
    addMic("USB Microphone");
    FakeDevice monitor;
    monitor.name = "Monitor of HDMI";
    monitor.inputChannels = 2;
    monitor.openDelay = std::chrono::milliseconds(400);
    host.addDevice(monitor);

    CaptureSession session(host, config(std::chrono::milliseconds(150)), noLoopback());
    auto r = session.start("mixed", std::nullopt, collector());

    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_TRUE(session.isRunning());
    EXPECT_EQ(session.activeProducers(), (std::vector<std::string>{"USB Microphone"}));

    // The monitor joins once it has opened, and the mix starts
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (session.activeProducers().size() < 2 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_EQ(session.activeProducers(),
              (std::vector<std::string>{"USB Microphone", "Monitor of HDMI"}));
    EXPECT_TRUE(waitForChunks(1));

    session.stop();
    EXPECT_EQ(host.activeStreams.load(), 0);
}

TEST_F(CaptureSessionTest, StreamThatDiesMidSessionStillStopsCleanly) {
    FakeDevice d;
    d.name = "USB Microphone";
    d.stopAfterBuffers = 3;
    host.addDevice(d, true);
    CaptureSession session(host, config(), noLoopback());

    ASSERT_TRUE(session.start("mic", std::nullopt, collector()).ok);
    ASSERT_TRUE(waitForChunks(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    // The session keeps its state; teardown notices the dead stream
    EXPECT_TRUE(session.isRunning());
    session.stop();
    EXPECT_EQ(session.state(), SessionState::Idle);
    EXPECT_EQ(host.activeStreams.load(), 0);
}

TEST_F(CaptureSessionTest, ListDevicesReportsKinds) {
    addMic("USB Microphone");
    FakeDevice monitor;
    monitor.name = "Monitor of HDMI";
    monitor.inputChannels = 2;
    host.addDevice(monitor);

    CaptureSession session(host, config(), noLoopback());
    auto devices = session.listDevices();
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].kind, DeviceKind::Microphone);
    EXPECT_EQ(devices[1].kind, DeviceKind::SystemLoopback);
}

TEST_F(CaptureSessionTest, DestructorStopsRunningSession) {
    addMic("USB Microphone");
    {
        CaptureSession session(host, config(), noLoopback());
        ASSERT_TRUE(session.start("mic", std::nullopt, collector()).ok);
        EXPECT_EQ(host.activeStreams.load(), 1);
    }
    EXPECT_EQ(host.activeStreams.load(), 0);
}
