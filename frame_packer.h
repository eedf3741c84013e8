#ifndef RTBRIDGE_FRAME_PACKER_H
#define RTBRIDGE_FRAME_PACKER_H

#include "audio_codec.h"
#include "telephony_channel.h"

#include <mutex>
#include <string>

namespace rtbridge {

// Turns model audio (PCM16 at the model rate) into fixed 20 ms mu-law
// frames for the telephony side, one media message per frame.
//
// Invariant: every emitted frame is exactly FRAME_SAMPLES long; the
// buffered remainder is always shorter than one frame.
class TelephonyFramePacker
{
public:
    static const size_t FRAME_SAMPLES = TELEPHONY_RATE * PTIME / 1000;
    static const size_t FRAME_BYTES = FRAME_SAMPLES * SAMPLE_WIDTH;

    TelephonyFramePacker(TelephonyChannel& channel, std::string streamSid,
                         unsigned sourceRate = MODEL_RATE);

    // Throws AudioFormatError on an odd byte count.
    void accept(const std::string& pcm16);

    // pad=true drains the downsampler, zero-fills the remainder to one
    // frame and sends it. pad=false drops the remainder.
    void flush(bool pad);

    // Drops the unsent remainder.
    void discard();

    // Barge-in: discard(), then ask the carrier to drop audio it has
    // queued but not yet played.
    void interrupt();

    // Idempotent. Later accept()/flush() calls do nothing.
    void markClosed();

    bool closed() const;
    size_t framesSent() const;
    size_t bufferedBytes() const;

private:
    void discardLocked();
    void sendFullFrames();

    TelephonyChannel& channel;
    const std::string streamSid;
    Resampler downsampler;

    mutable std::mutex mtx;
    std::string buffer; // PCM16 at TELEPHONY_RATE
    bool isClosed;
    size_t frames;
};

} // namespace rtbridge

#endif // RTBRIDGE_FRAME_PACKER_H
