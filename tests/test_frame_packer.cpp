/**
 * @file test_frame_packer.cpp
 * @brief Tests for packing model audio into 20 ms telephony frames
 */

#include <gtest/gtest.h>

#include <algorithm>

#include "audio_codec.h"
#include "bridge_errors.h"
#include "frame_packer.h"
#include "test_common.h"

using namespace rtbridge;
using namespace rtbridge::test;

namespace {

std::string payloadOf(const std::string& message)
{
    json j = json::parse(message);
    return base64Decode(j["media"]["payload"].get<std::string>());
}

} // namespace

// =============================================================================
// Framing
// =============================================================================

TEST(FramePackerTest, EmitsOnlyWholeFrames) {
    FakeChannel channel;
    TelephonyFramePacker packer(channel, "MZ1", TELEPHONY_RATE);

    packer.accept(sinePcm(400, TELEPHONY_RATE));

    ASSERT_EQ(channel.count("media"), 2u);
    EXPECT_EQ(packer.framesSent(), 2u);
    EXPECT_EQ(packer.bufferedBytes(), 80u * 2);
    for (const auto& m : channel.messages("media")) {
        EXPECT_EQ(payloadOf(m).size(), TelephonyFramePacker::FRAME_SAMPLES);
        EXPECT_EQ(json::parse(m)["streamSid"], "MZ1");
    }
}

TEST(FramePackerTest, ArbitraryChunkSizesProduceTheSameFrames) {
    std::string pcm = sinePcm(1600, TELEPHONY_RATE);

    FakeChannel whole;
    TelephonyFramePacker a(whole, "MZ", TELEPHONY_RATE);
    a.accept(pcm);

    FakeChannel pieces;
    TelephonyFramePacker b(pieces, "MZ", TELEPHONY_RATE);
    size_t offset = 0;
    size_t step = 2;
    while (offset < pcm.size()) {
        size_t n = std::min(step, pcm.size() - offset);
        b.accept(pcm.substr(offset, n));
        offset += n;
        step = step * 3 % 502 + 2; // even, varying
    }

    EXPECT_EQ(whole.messages(), pieces.messages());
    EXPECT_EQ(whole.count("media"), 10u);
}

TEST(FramePackerTest, DownsamplesModelRateInput) {
    FakeChannel channel;
    TelephonyFramePacker packer(channel, "MZ", MODEL_RATE);

    // 20 ms at 24 kHz is one 20 ms frame at 8 kHz
    packer.accept(sinePcm(480, MODEL_RATE));
    EXPECT_EQ(channel.count("media"), 1u);
    EXPECT_EQ(packer.bufferedBytes(), 0u);
}

TEST(FramePackerTest, OddByteCountThrows) {
    FakeChannel channel;
    TelephonyFramePacker packer(channel, "MZ", TELEPHONY_RATE);
    EXPECT_THROW(packer.accept(std::string(3, '\0')), AudioFormatError);
    EXPECT_EQ(channel.count("media"), 0u);
}

// =============================================================================
// Flush / discard
// =============================================================================

TEST(FramePackerTest, FlushPadsRemainderWithSilence) {
    FakeChannel channel;
    TelephonyFramePacker packer(channel, "MZ", TELEPHONY_RATE);

    packer.accept(sinePcm(100, TELEPHONY_RATE, 440.0, 4000.0));
    EXPECT_EQ(channel.count("media"), 0u);

    packer.flush(true);
    ASSERT_EQ(channel.count("media"), 1u);
    std::string frame = payloadOf(channel.messages("media")[0]);
    ASSERT_EQ(frame.size(), 160u);
    for (size_t i = 100; i < frame.size(); i++)
        EXPECT_EQ(static_cast<uint8_t>(frame[i]), 0xFF) << "at " << i;
    EXPECT_EQ(packer.bufferedBytes(), 0u);
}

TEST(FramePackerTest, FlushDrainsShortModelTail) {
    FakeChannel channel;
    TelephonyFramePacker packer(channel, "MZ", MODEL_RATE);

    // 5 ms at 24 kHz, less than one resampler block
    packer.accept(sinePcm(120, MODEL_RATE, 1000.0, 8000.0));
    EXPECT_EQ(channel.count("media"), 0u);

    packer.flush(true);
    ASSERT_EQ(channel.count("media"), 1u);
    std::string frame = payloadOf(channel.messages("media")[0]);
    ASSERT_EQ(frame.size(), 160u);
    size_t audible = 0;
    for (char c : frame) {
        uint8_t code = static_cast<uint8_t>(c);
        if (code != 0xFF && code != 0x7F)
            audible++;
    }
    EXPECT_GT(audible, 10u);
}

TEST(FramePackerTest, FlushDeliversEveryModelSample) {
    FakeChannel channel;
    TelephonyFramePacker packer(channel, "MZ", MODEL_RATE);

    // 1800 samples at 24 kHz are 600 at 8 kHz, 3.75 frames
    for (int i = 0; i < 3; i++)
        packer.accept(sinePcm(600, MODEL_RATE));
    EXPECT_EQ(channel.count("media"), 3u);
    packer.flush(true);
    EXPECT_EQ(channel.count("media"), 4u);
}

TEST(FramePackerTest, DiscardDropsBufferedAudioWithoutClear) {
    FakeChannel channel;
    TelephonyFramePacker packer(channel, "MZ", MODEL_RATE);

    packer.accept(sinePcm(900, MODEL_RATE)); // 240 samples out, one frame sent
    ASSERT_EQ(channel.count("media"), 1u);
    ASSERT_GT(packer.bufferedBytes(), 0u);

    packer.discard();
    EXPECT_EQ(packer.bufferedBytes(), 0u);
    packer.flush(true);
    EXPECT_EQ(channel.count("media"), 1u);
    EXPECT_EQ(channel.count("clear"), 0u);
}

TEST(FramePackerTest, FlushWithoutPaddingDropsRemainder) {
    FakeChannel channel;
    TelephonyFramePacker packer(channel, "MZ", TELEPHONY_RATE);

    packer.accept(sinePcm(100, TELEPHONY_RATE));
    packer.flush(false);
    EXPECT_EQ(channel.count("media"), 0u);
    EXPECT_EQ(packer.bufferedBytes(), 0u);
}

TEST(FramePackerTest, FlushOnEmptyBufferSendsNothing) {
    FakeChannel channel;
    TelephonyFramePacker packer(channel, "MZ", TELEPHONY_RATE);
    packer.flush(true);
    EXPECT_TRUE(channel.messages().empty());
}

TEST(FramePackerTest, InterruptDiscardsAndSendsClear) {
    FakeChannel channel;
    TelephonyFramePacker packer(channel, "MZ9", TELEPHONY_RATE);

    packer.accept(sinePcm(250, TELEPHONY_RATE));
    ASSERT_EQ(packer.bufferedBytes(), 90u * 2);

    packer.interrupt();
    EXPECT_EQ(packer.bufferedBytes(), 0u);
    ASSERT_EQ(channel.count("clear"), 1u);
    EXPECT_EQ(json::parse(channel.messages("clear")[0])["streamSid"], "MZ9");

    // the discarded remainder must not leak into the next frame
    packer.accept(sinePcm(160, TELEPHONY_RATE));
    EXPECT_EQ(channel.count("media"), 2u);
    EXPECT_EQ(packer.bufferedBytes(), 0u);
}

// =============================================================================
// Closing
// =============================================================================

TEST(FramePackerTest, MarkClosedStopsOutputAndIsIdempotent) {
    FakeChannel channel;
    TelephonyFramePacker packer(channel, "MZ", TELEPHONY_RATE);

    packer.markClosed();
    packer.markClosed();
    EXPECT_TRUE(packer.closed());

    packer.accept(sinePcm(480, TELEPHONY_RATE));
    packer.flush(true);
    packer.interrupt();
    EXPECT_TRUE(channel.messages().empty());
}

TEST(FramePackerTest, SendFailureClosesPacker) {
    FakeChannel channel;
    TelephonyFramePacker packer(channel, "MZ", TELEPHONY_RATE);

    channel.setFailSends(true);
    packer.accept(sinePcm(480, TELEPHONY_RATE));
    EXPECT_TRUE(packer.closed());
    EXPECT_EQ(packer.framesSent(), 0u);
    EXPECT_EQ(packer.bufferedBytes(), 0u);

    channel.setFailSends(false);
    packer.accept(sinePcm(480, TELEPHONY_RATE));
    EXPECT_TRUE(channel.messages().empty());
}
