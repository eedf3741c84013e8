#include "audio_monitor.h"
#include "audio_codec.h"
#include "log.h"
#include "media_endpoint.h"

#include <cstring>

namespace rtbridge {

AudioQueue::AudioQueue(size_t maxSamples_) : maxSamples(maxSamples_)
{
}

size_t AudioQueue::push(const std::vector<int16_t>& data)
{
    std::lock_guard<std::mutex> lock(mtx);
    buffer.insert(buffer.end(), data.begin(), data.end());
    size_t excess = buffer.size() > maxSamples ? buffer.size() - maxSamples : 0;
    if (excess)
        buffer.erase(buffer.begin(), buffer.begin() + excess);
    return excess;
}

bool AudioQueue::pop(std::vector<int16_t>& out, size_t count)
{
    std::lock_guard<std::mutex> lock(mtx);
    if (buffer.size() < count) return false;
    out.assign(buffer.begin(), buffer.begin() + count);
    buffer.erase(buffer.begin(), buffer.begin() + count);
    return true;
}

MonitorPort::MonitorPort(unsigned clockRate, size_t maxSamples) : pj::AudioMediaPort(), queue(maxSamples)
{
    pj::MediaFormatAudio fmt;
    fmt.init(PJMEDIA_FORMAT_PCM, clockRate, 1, PTIME * 1000, 16);
    createPort("MonitorPort", fmt);
}

void MonitorPort::onFrameRequested(pj::MediaFrame &frame)
{
    // frame.size is one ptime worth of samples; the buffer arrives empty.
    std::vector<int16_t> data;
    frame.buf.resize(frame.size);
    if (queue.pop(data, frame.size / 2))
        std::memcpy(frame.buf.data(), data.data(), frame.size);
    else
        std::memset(frame.buf.data(), 0, frame.size);
    frame.type = PJMEDIA_FRAME_TYPE_AUDIO;
}

void MonitorPort::onFrameReceived(pj::MediaFrame &)
{
    // playback only, nothing is recorded
}

AudioMonitor::AudioMonitor(MediaEndpoint& endpoint, unsigned clockRate)
    : port(clockRate, clockRate * 5), sink(&endpoint.playbackMedia())
{
    port.startTransmit(*sink);
    logging::info("Monitor", "local playback at " + std::to_string(clockRate) + " Hz");
}

AudioMonitor::~AudioMonitor()
{
    try {
        port.stopTransmit(*sink);
    } catch (pj::Error& err) {
        logging::warn("Monitor", "stopTransmit failed: " + err.info());
    }
}

void AudioMonitor::write(const std::string& pcm16)
{
    std::string whole = pcm16.substr(0, pcm16.size() - pcm16.size() % SAMPLE_WIDTH);
    if (whole.empty())
        return;
    size_t dropped = port.queue.push(pcmToSamples(whole));
    if (dropped)
        logging::debug("Monitor", "playback lagging, dropped " + std::to_string(dropped) + " samples");
}

} // namespace rtbridge
