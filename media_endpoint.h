#ifndef RTBRIDGE_MEDIA_ENDPOINT_H
#define RTBRIDGE_MEDIA_ENDPOINT_H

#include <pjsua2.hpp>
#include <string>

namespace rtbridge {

// Owns the process-wide pjsua2 endpoint. Only the media half of the
// library is used: conference bridge clock, audio devices, memory pools
// and the resampler. No SIP transport is created.
//
// Exactly one instance may exist at a time.
class MediaEndpoint
{
public:
    MediaEndpoint(unsigned clockRate, bool wantPlayback);
    ~MediaEndpoint();

    MediaEndpoint(const MediaEndpoint&) = delete;
    MediaEndpoint& operator=(const MediaEndpoint&) = delete;

    // False when playback was not requested or no sound device exists.
    bool hasPlayback() const { return playback; }
    pj::AudioMedia& playbackMedia();

    // pjlib refuses calls from threads it does not know about.
    static void registerThread(const char* name);

    static pj_pool_t* createPool(const char* name, size_t initialSize, size_t increment);
    static void releasePool(pj_pool_t* pool);

    static std::string statusText(pj_status_t status);

private:
    pj::Endpoint ep;
    bool playback;
};

} // namespace rtbridge

#endif // RTBRIDGE_MEDIA_ENDPOINT_H
