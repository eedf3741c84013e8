#include "audio_codec.h"
#include "bridge_errors.h"
#include "media_endpoint.h"

#include <pjmedia.h>
#include <cstring>

namespace rtbridge {

static void checkSampleWidth(const std::string& pcm16, const char* what)
{
    if (pcm16.size() % SAMPLE_WIDTH != 0)
        throw AudioFormatError(std::string(what) + ": odd PCM16 byte count " + std::to_string(pcm16.size()));
}

std::vector<int16_t> pcmToSamples(const std::string& pcm16)
{
    checkSampleWidth(pcm16, "pcmToSamples");
    std::vector<int16_t> out(pcm16.size() / SAMPLE_WIDTH);
    if (!out.empty())
        std::memcpy(out.data(), pcm16.data(), pcm16.size());
    return out;
}

std::string samplesToPcm(const std::vector<int16_t>& samples)
{
    return std::string(reinterpret_cast<const char*>(samples.data()), samples.size() * SAMPLE_WIDTH);
}

std::string mulawExpand(const std::string& mulaw)
{
    std::vector<int16_t> samples(mulaw.size());
    for (size_t i = 0; i < mulaw.size(); i++) {
        unsigned char u = static_cast<unsigned char>(mulaw[i]);
        samples[i] = static_cast<int16_t>(pjmedia_ulaw2linear(u));
    }
    return samplesToPcm(samples);
}

std::string mulawCompress(const std::string& pcm16)
{
    std::vector<int16_t> samples = pcmToSamples(pcm16);
    std::string out(samples.size(), '\0');
    for (size_t i = 0; i < samples.size(); i++) {
        int s = samples[i];
        out[i] = static_cast<char>(pjmedia_linear2ulaw(s));
    }
    return out;
}

Resampler::Resampler(unsigned rateIn_, unsigned rateOut_, unsigned blockMs)
    : rateIn(rateIn_), rateOut(rateOut_), inBlock(0), outBlock(0), pool(nullptr), resample(nullptr)
{
    if (rateIn == 0 || rateOut == 0 || blockMs == 0)
        throw AudioFormatError("Resampler: zero rate or block length");

    inBlock = rateIn * blockMs / 1000;
    outBlock = rateOut * blockMs / 1000;
    if (rateIn != rateOut)
        open();
}

Resampler::~Resampler()
{
    release();
}

void Resampler::open()
{
    MediaEndpoint::registerThread("resampler");
    pool = MediaEndpoint::createPool("resample", 4000, 4000);
    pj_status_t status = pjmedia_resample_create(pool, PJ_TRUE, PJ_FALSE, 1,
                                                 rateIn, rateOut, inBlock, &resample);
    if (status != PJ_SUCCESS) {
        MediaEndpoint::releasePool(pool);
        pool = nullptr;
        resample = nullptr;
        throw MediaError("pjmedia_resample_create: " + MediaEndpoint::statusText(status));
    }
}

void Resampler::release()
{
    if (resample || pool)
        MediaEndpoint::registerThread("resampler");
    if (resample)
        pjmedia_resample_destroy(resample);
    MediaEndpoint::releasePool(pool);
    resample = nullptr;
    pool = nullptr;
}

std::string Resampler::convert(const std::string& pcm16)
{
    std::vector<int16_t> input = pcmToSamples(pcm16);
    if (!resample)
        return pcm16;

    pending.insert(pending.end(), input.begin(), input.end());

    size_t blocks = pending.size() / inBlock;
    std::vector<int16_t> out(blocks * outBlock);
    for (size_t b = 0; b < blocks; b++)
        pjmedia_resample_run(resample, &pending[b * inBlock], &out[b * outBlock]);

    pending.erase(pending.begin(), pending.begin() + blocks * inBlock);
    return samplesToPcm(out);
}

std::string Resampler::drain()
{
    if (!resample || pending.empty())
        return "";

    size_t produced = pending.size() * outBlock / inBlock;
    pending.resize(inBlock, 0);
    std::vector<int16_t> out(outBlock);
    pjmedia_resample_run(resample, pending.data(), out.data());
    pending.clear();

    out.resize(produced);
    return samplesToPcm(out);
}

void Resampler::reset()
{
    pending.clear();
    if (!resample)
        return;
    release();
    open();
}

} // namespace rtbridge
