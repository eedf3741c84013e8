#ifndef RTBRIDGE_AUDIO_CODEC_H
#define RTBRIDGE_AUDIO_CODEC_H

#include <cstdint>
#include <string>
#include <vector>

struct pj_pool_t;
struct pjmedia_resample;

namespace rtbridge {

// Audio Config
const unsigned TELEPHONY_RATE = 8000;  // Twilio media streams, G.711 mu-law
const unsigned MODEL_RATE = 24000;     // OpenAI realtime pcm16
const unsigned PTIME = 20;
const size_t SAMPLE_WIDTH = 2;         // bytes per PCM16 sample, mono

// G.711 mu-law. PCM buffers are little-endian signed 16-bit mono.
std::string mulawExpand(const std::string& mulaw);
std::string mulawCompress(const std::string& pcm16);

std::vector<int16_t> pcmToSamples(const std::string& pcm16);
std::string samplesToPcm(const std::vector<int16_t>& samples);

// Stateful PCM16 rate converter for one direction of one call.
//
// pjmedia's resampler works on fixed blocks, so input that does not
// fill a block is kept until the next convert(). The filter history is
// kept as well, which keeps chunk boundaries free of clicks.
class Resampler
{
public:
    Resampler(unsigned rateIn, unsigned rateOut, unsigned blockMs = 10);
    ~Resampler();

    Resampler(const Resampler&) = delete;
    Resampler& operator=(const Resampler&) = delete;

    // Throws AudioFormatError on an odd byte count; state is unchanged then.
    std::string convert(const std::string& pcm16);

    // Converts the input still short of a block, zero-padded, and returns
    // only the samples that correspond to it. Use at the end of a stream.
    std::string drain();

    // Drops buffered input and the filter history, e.g. after the stream
    // was interrupted. Throws MediaError if the filter cannot be rebuilt.
    void reset();

    size_t pendingSamples() const { return pending.size(); }

private:
    void open();
    void release();

    unsigned rateIn;
    unsigned rateOut;
    unsigned inBlock;
    unsigned outBlock;
    pj_pool_t* pool;
    pjmedia_resample* resample;
    std::vector<int16_t> pending;
};

} // namespace rtbridge

#endif // RTBRIDGE_AUDIO_CODEC_H
