#ifndef RTBRIDGE_AUDIO_MONITOR_H
#define RTBRIDGE_AUDIO_MONITOR_H

#include <pjsua2.hpp>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace rtbridge {

class MediaEndpoint;

// Sample FIFO between call threads and the pjmedia clock thread.
// Bounded; the oldest samples go first when it overflows.
class AudioQueue
{
    std::deque<int16_t> buffer;
    size_t maxSamples;
    mutable std::mutex mtx;
public:
    explicit AudioQueue(size_t maxSamples);
    // Returns the number of samples dropped to make room.
    size_t push(const std::vector<int16_t>& data);
    bool pop(std::vector<int16_t>& out, size_t count);
};

// Conference bridge port that plays whatever is in its queue, or silence.
class MonitorPort : public pj::AudioMediaPort
{
public:
    AudioQueue queue;

public:
    MonitorPort(unsigned clockRate, size_t maxSamples);
    virtual void onFrameRequested(pj::MediaFrame &frame) override;
    virtual void onFrameReceived(pj::MediaFrame &frame) override;
};

// Local playback of assistant audio on the host's speaker. Process wide;
// shared by every call.
class AudioMonitor
{
public:
    AudioMonitor(MediaEndpoint& endpoint, unsigned clockRate);
    ~AudioMonitor();

    AudioMonitor(const AudioMonitor&) = delete;
    AudioMonitor& operator=(const AudioMonitor&) = delete;

    // PCM16 at clockRate. Odd trailing bytes are ignored.
    void write(const std::string& pcm16);

private:
    MonitorPort port;
    pj::AudioMedia* sink;
};

} // namespace rtbridge

#endif // RTBRIDGE_AUDIO_MONITOR_H
