#include "capture/WasapiLoopback.hpp"
#include "capture/MixFormat.hpp"
#include <spdlog/spdlog.h>

#include <windows.h>
#include <audioclient.h>
#include <mmdeviceapi.h>
#include <mmreg.h>
#include <ks.h>
#include <ksmedia.h>
#include <wrl/client.h>

#include <chrono>
#include <cstring>
#include <future>
#include <vector>

using Microsoft::WRL::ComPtr;

namespace {

constexpr auto kIdleSleep = std::chrono::milliseconds(10);

// Undoes CoInitializeEx on scope exit when it was ours to undo
class ComScope {
public:
    ComScope() {
        hr_ = CoInitializeEx(nullptr, COINIT_MULTITHREADED);
    }
    ~ComScope() {
        if (SUCCEEDED(hr_)) CoUninitialize();
    }
    // RPC_E_CHANGED_MODE means COM is already up in another apartment model
    bool ok() const { return SUCCEEDED(hr_) || hr_ == RPC_E_CHANGED_MODE; }
    HRESULT result() const { return hr_; }

private:
    HRESULT hr_;
};

struct CoTaskFormat {
    WAVEFORMATEX* ptr = nullptr;
    ~CoTaskFormat() { if (ptr) CoTaskMemFree(ptr); }
};

struct ActivateResult {
    ComPtr<IAudioClient> client;
    HRESULT              hr = E_FAIL;
};

// The one place the endpoint is asked for an IAudioClient
ActivateResult activateAudioClient(IMMDevice* endpoint) {
    ActivateResult r;
    if (!endpoint) {
        r.hr = E_POINTER;
        return r;
    }
    r.hr = endpoint->Activate(__uuidof(IAudioClient), CLSCTX_ALL, nullptr,
                              reinterpret_cast<void**>(r.client.GetAddressOf()));
    if (FAILED(r.hr)) r.client.Reset();
    return r;
}

// Copies the fields MixFormat::interpret needs out of the COM-allocated format
WaveFormatInfo readWaveFormat(const WAVEFORMATEX* wf) {
    WaveFormatInfo info;
    info.formatTag     = wf->wFormatTag;
    info.channels      = wf->nChannels;
    info.sampleRate    = wf->nSamplesPerSec;
    info.bitsPerSample = wf->wBitsPerSample;
    info.blockAlign    = wf->nBlockAlign;

    if (wf->wFormatTag == WAVE_FORMAT_EXTENSIBLE &&
        wf->cbSize >= sizeof(WAVEFORMATEXTENSIBLE) - sizeof(WAVEFORMATEX)) {
        auto* ext = reinterpret_cast<const WAVEFORMATEXTENSIBLE*>(wf);
        info.hasExtension     = true;
        info.subFormatIsFloat = IsEqualGUID(ext->SubFormat, KSDATAFORMAT_SUBTYPE_IEEE_FLOAT) != 0;
    }
    return info;
}

} // namespace

WasapiLoopback::~WasapiLoopback() {
    stop();
}

std::optional<StreamFormat> WasapiLoopback::format() const {
    std::lock_guard lock(formatMtx_);
    return format_;
}

bool WasapiLoopback::start(ChunkSink sink) {
    stop();

    token_ = CancellationToken{};
    std::promise<bool> startedPromise;
    auto started = startedPromise.get_future();

    thread_ = std::thread([this, sink = std::move(sink),
                           startedPromise = std::move(startedPromise),
                           token = token_]() mutable {
        bool reported = false;
        auto fail = [&](const char* what, HRESULT hr) {
            spdlog::error("WASAPI loopback: {} failed (hr=0x{:08x})", what,
                          static_cast<unsigned>(hr));
            if (!reported) {
                startedPromise.set_value(false);
                reported = true;
            }
        };

        ComScope com;
        if (!com.ok()) return fail("CoInitializeEx", com.result());

        ComPtr<IMMDeviceEnumerator> enumerator;
        HRESULT hr = CoCreateInstance(__uuidof(MMDeviceEnumerator), nullptr, CLSCTX_ALL,
                                      IID_PPV_ARGS(&enumerator));
        if (FAILED(hr)) return fail("MMDeviceEnumerator", hr);

        ComPtr<IMMDevice> endpoint;
        hr = enumerator->GetDefaultAudioEndpoint(eRender, eConsole, &endpoint);
        if (FAILED(hr)) return fail("GetDefaultAudioEndpoint(render)", hr);

        ActivateResult activated = activateAudioClient(endpoint.Get());
        if (FAILED(activated.hr)) return fail("Activate(IAudioClient)", activated.hr);
        ComPtr<IAudioClient> client = activated.client;

        CoTaskFormat wf;
        hr = client->GetMixFormat(&wf.ptr);
        if (FAILED(hr) || !wf.ptr) return fail("GetMixFormat", hr);

        MixFormat mf = MixFormat::interpret(readWaveFormat(wf.ptr));
        if (!mf.isConvertible()) {
            spdlog::error("WASAPI loopback: unsupported mix format ({} ch, {} bit, {})",
                          mf.channels, mf.bits, mf.isFloat ? "float" : "pcm");
            return fail("mix format", E_INVALIDARG);
        }

        // Buffer duration 0: the engine picks its own period
        hr = client->Initialize(AUDCLNT_SHAREMODE_SHARED, AUDCLNT_STREAMFLAGS_LOOPBACK,
                                0, 0, wf.ptr, nullptr);
        if (FAILED(hr)) return fail("IAudioClient::Initialize(loopback)", hr);

        ComPtr<IAudioCaptureClient> capture;
        hr = client->GetService(IID_PPV_ARGS(&capture));
        if (FAILED(hr)) return fail("GetService(IAudioCaptureClient)", hr);

        hr = client->Start();
        if (FAILED(hr)) return fail("IAudioClient::Start", hr);

        {
            std::lock_guard lock(formatMtx_);
            format_ = StreamFormat{mf.channels, mf.sampleRate, mf.sampleFormat()};
        }
        running_ = true;
        spdlog::info("WASAPI loopback started: {} ch, {}Hz, {} bit {}",
                     mf.channels, mf.sampleRate, mf.bits, mf.isFloat ? "float" : "pcm");
        startedPromise.set_value(true);
        reported = true;

        while (!token.isCancelled()) {
            UINT32 packetFrames = 0;
            hr = capture->GetNextPacketSize(&packetFrames);
            if (FAILED(hr)) {
                spdlog::error("WASAPI loopback: GetNextPacketSize failed (hr=0x{:08x})",
                              static_cast<unsigned>(hr));
                break;
            }
            if (packetFrames == 0) {
                std::this_thread::sleep_for(kIdleSleep);
                continue;
            }

            BYTE*  data   = nullptr;
            UINT32 frames = 0;
            DWORD  flags  = 0;
            hr = capture->GetBuffer(&data, &frames, &flags, nullptr, nullptr);
            if (FAILED(hr)) {
                spdlog::error("WASAPI loopback: GetBuffer failed (hr=0x{:08x})",
                              static_cast<unsigned>(hr));
                break;
            }

            RawFrame frame;
            frame.channels   = mf.channels;
            frame.sampleRate = mf.sampleRate;
            if (flags & AUDCLNT_BUFFERFLAGS_SILENT)
                frame.samples.assign(static_cast<size_t>(frames) * mf.channels, 0);
            else if (!mf.convert(data, frames, frame.samples))
                spdlog::warn("WASAPI loopback: packet of {} frames not converted", frames);

            hr = capture->ReleaseBuffer(frames);
            if (FAILED(hr)) {
                spdlog::error("WASAPI loopback: ReleaseBuffer failed (hr=0x{:08x})",
                              static_cast<unsigned>(hr));
                break;
            }

            if (!frame.samples.empty() && sink)
                sink(std::move(frame));
        }

        client->Stop();
        running_ = false;
        spdlog::info("WASAPI loopback stopped");
    });

    bool ok = started.get();
    if (!ok && thread_.joinable())
        thread_.join();
    return ok;
}

void WasapiLoopback::stop() {
    token_.cancel();
    if (thread_.joinable())
        thread_.join();
    running_ = false;
}
