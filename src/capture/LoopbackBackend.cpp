#include "capture/ILoopbackBackend.hpp"

#ifdef MIXCAPTURE_HAS_WASAPI
#include "capture/WasapiLoopback.hpp"
#endif

std::unique_ptr<ILoopbackBackend> createPlatformLoopback() {
#ifdef MIXCAPTURE_HAS_WASAPI
    return std::make_unique<WasapiLoopback>();
#else
    return nullptr;
#endif
}
