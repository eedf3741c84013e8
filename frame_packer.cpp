#include "frame_packer.h"
#include "log.h"
#include "telephony_protocol.h"

namespace rtbridge {

const size_t TelephonyFramePacker::FRAME_SAMPLES;
const size_t TelephonyFramePacker::FRAME_BYTES;

TelephonyFramePacker::TelephonyFramePacker(TelephonyChannel& channel_, std::string streamSid_,
                                           unsigned sourceRate)
    : channel(channel_),
      streamSid(std::move(streamSid_)),
      downsampler(sourceRate, TELEPHONY_RATE),
      isClosed(false),
      frames(0)
{
}

void TelephonyFramePacker::accept(const std::string& pcm16)
{
    std::lock_guard<std::mutex> lock(mtx);
    if (isClosed || pcm16.empty())
        return;
    std::string pcm8k = downsampler.convert(pcm16);
    if (pcm8k.empty())
        return;
    buffer.append(pcm8k);
    sendFullFrames();
}

void TelephonyFramePacker::flush(bool pad)
{
    std::lock_guard<std::mutex> lock(mtx);
    if (isClosed) {
        buffer.clear();
        return;
    }
    if (!pad) {
        discardLocked();
        return;
    }
    // The downsampler holds up to one block of input that has not
    // produced output yet.
    buffer.append(downsampler.drain());
    size_t remainder = buffer.size() % FRAME_BYTES;
    if (remainder)
        buffer.append(FRAME_BYTES - remainder, '\0');
    sendFullFrames();
    buffer.clear();
}

void TelephonyFramePacker::discard()
{
    std::lock_guard<std::mutex> lock(mtx);
    discardLocked();
}

void TelephonyFramePacker::interrupt()
{
    std::lock_guard<std::mutex> lock(mtx);
    if (isClosed) {
        buffer.clear();
        return;
    }
    discardLocked();
    bool sent = false;
    try {
        sent = channel.sendText(makeClearMessage(streamSid));
    } catch (std::exception const& e) {
        logging::error("Twilio", std::string("error sending clear: ") + e.what());
    }
    if (!sent) {
        logging::warn("Twilio", "media channel closed, stop sending frames for " + streamSid);
        isClosed = true;
    }
}

void TelephonyFramePacker::markClosed()
{
    std::lock_guard<std::mutex> lock(mtx);
    isClosed = true;
    buffer.clear();
}

bool TelephonyFramePacker::closed() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return isClosed;
}

size_t TelephonyFramePacker::framesSent() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return frames;
}

size_t TelephonyFramePacker::bufferedBytes() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return buffer.size();
}

// Caller holds mtx.
void TelephonyFramePacker::discardLocked()
{
    buffer.clear();
    downsampler.reset();
}

// Caller holds mtx.
void TelephonyFramePacker::sendFullFrames()
{
    size_t offset = 0;
    while (buffer.size() - offset >= FRAME_BYTES && !isClosed) {
        std::string mulaw = mulawCompress(buffer.substr(offset, FRAME_BYTES));
        offset += FRAME_BYTES;

        bool sent = false;
        try {
            sent = channel.sendText(makeMediaMessage(streamSid, mulaw));
        } catch (std::exception const& e) {
            logging::error("Twilio", std::string("error sending media frame: ") + e.what());
        }
        if (!sent) {
            logging::warn("Twilio", "media channel closed, stop sending frames for " + streamSid);
            isClosed = true;
            buffer.clear();
            return;
        }
        frames++;
    }
    buffer.erase(0, offset);
}

} // namespace rtbridge
