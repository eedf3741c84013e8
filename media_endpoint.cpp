#include "media_endpoint.h"
#include "bridge_errors.h"
#include "log.h"

namespace rtbridge {

MediaEndpoint::MediaEndpoint(unsigned clockRate, bool wantPlayback) : playback(false)
{
    ep.libCreate();

    pj::EpConfig ep_cfg;
    ep_cfg.logConfig.level = logging::traceEnabled ? 5 : 2;
    ep_cfg.logConfig.consoleLevel = logging::traceEnabled ? 5 : 2;
    // The null device does not provide a default clock rate, and
    // VAD on the bridge would gate the monitor port.
    ep_cfg.medConfig.sndClockRate = clockRate;
    ep_cfg.medConfig.clockRate = clockRate;
    ep_cfg.medConfig.noVad = true;
    ep.libInit(ep_cfg);

    if (wantPlayback) {
        if (ep.audDevManager().getDevCount() > 0) {
            playback = true;
        } else {
            logging::warn("Media", "no sound device found, local playback disabled");
        }
    }
    if (!playback) {
        // Run on a server or a machine without physical audio hardware.
        ep.audDevManager().setNullDev();
    }

    ep.libStart();
    logging::info("Media", std::string("endpoint started, clock ") + std::to_string(clockRate) +
                  " Hz, playback " + (playback ? "on" : "off"));
}

MediaEndpoint::~MediaEndpoint()
{
    try {
        ep.libDestroy();
    } catch (pj::Error& err) {
        logging::error("Media", "libDestroy failed: " + err.info());
    }
}

pj::AudioMedia& MediaEndpoint::playbackMedia()
{
    return ep.audDevManager().getPlaybackDevMedia();
}

void MediaEndpoint::registerThread(const char* name)
{
    pj::Endpoint& endpoint = pj::Endpoint::instance();
    if (!endpoint.libIsThreadRegistered())
        endpoint.libRegisterThread(name);
}

pj_pool_t* MediaEndpoint::createPool(const char* name, size_t initialSize, size_t increment)
{
    pj_pool_t* pool = pjsua_pool_create(name, initialSize, increment);
    if (!pool)
        throw MediaError(std::string("cannot create pool ") + name);
    return pool;
}

void MediaEndpoint::releasePool(pj_pool_t* pool)
{
    if (pool)
        pj_pool_release(pool);
}

std::string MediaEndpoint::statusText(pj_status_t status)
{
    char buf[PJ_ERR_MSG_SIZE];
    pj_str_t s = pj_strerror(status, buf, sizeof(buf));
    return std::string(s.ptr, s.slen);
}

} // namespace rtbridge
