// =============================================================================
// Unit tests for AudioRingBuffer / AudioReassembler (src/audio_reassembler.cpp)
// =============================================================================
#include <gtest/gtest.h>
#include <algorithm>
#include <thread>
#include <vector>
#include "audio_reassembler.hpp"
#include "stream_test_util.hpp"

using namespace c64view;
using c64view::test::audioDatagram;

namespace {

std::vector<int16_t> ramp(size_t frames, uint16_t channels, int16_t start) {
    std::vector<int16_t> v(frames * channels);
    for (size_t i = 0; i < frames; i++) {
        for (uint16_t c = 0; c < channels; c++) {
            v[i * channels + c] = static_cast<int16_t>(start + i);
        }
    }
    return v;
}

} // namespace

// ---------------------------------------------------------------------------
// AudioRingBuffer
// ---------------------------------------------------------------------------
TEST(AudioRingBufferTest, WriteThenReadInOrder) {
    StreamStats stats;
    AudioRingBuffer ring(100, 2, stats);

    auto in = ramp(30, 2, 1);
    EXPECT_EQ(ring.write(in.data(), 30), 0u);
    EXPECT_EQ(ring.available(), 30u);
    EXPECT_EQ(stats.audio_buffered_frames.load(), 30u);

    std::vector<int16_t> out;
    EXPECT_EQ(ring.read(out, 30), 30u);
    EXPECT_EQ(out, in);
    EXPECT_EQ(ring.available(), 0u);
    EXPECT_EQ(stats.audio_underruns.load(), 0u);
}

TEST(AudioRingBufferTest, WrapAround) {
    StreamStats stats;
    AudioRingBuffer ring(10, 1, stats);
    std::vector<int16_t> out;

    auto a = ramp(7, 1, 0);
    ring.write(a.data(), 7);
    ring.read(out, 5);

    auto b = ramp(6, 1, 100);
    EXPECT_EQ(ring.write(b.data(), 6), 0u);
    ASSERT_EQ(ring.read(out, 8), 8u);
    EXPECT_EQ(out[0], 5);
    EXPECT_EQ(out[1], 6);
    EXPECT_EQ(out[2], 100);
    EXPECT_EQ(out[7], 105);
}

TEST(AudioRingBufferTest, OverrunDropsOldest) {
    StreamStats stats;
    AudioRingBuffer ring(10, 1, stats);

    auto a = ramp(8, 1, 0);
    ring.write(a.data(), 8);
    auto b = ramp(5, 1, 50);
    EXPECT_EQ(ring.write(b.data(), 5), 3u);
    EXPECT_EQ(stats.audio_overruns.load(), 1u);
    EXPECT_EQ(ring.available(), 10u);

    std::vector<int16_t> out;
    ring.read(out, 10);
    EXPECT_EQ(out[0], 3);   // 0,1,2 overwritten
    EXPECT_EQ(out[4], 7);
    EXPECT_EQ(out[5], 50);
    EXPECT_EQ(out[9], 54);
}

TEST(AudioRingBufferTest, WriteLargerThanCapacityKeepsNewest) {
    StreamStats stats;
    AudioRingBuffer ring(4, 1, stats);

    auto a = ramp(10, 1, 0);
    EXPECT_EQ(ring.write(a.data(), 10), 6u);
    std::vector<int16_t> out;
    ASSERT_EQ(ring.read(out, 4), 4u);
    EXPECT_EQ(out, (std::vector<int16_t>{6, 7, 8, 9}));
}

TEST(AudioRingBufferTest, UnderrunZeroFills) {
    StreamStats stats;
    AudioRingBuffer ring(10, 2, stats);

    auto a = ramp(3, 2, 9);
    ring.write(a.data(), 3);

    std::vector<int16_t> out;
    EXPECT_EQ(ring.read(out, 5), 3u);
    ASSERT_EQ(out.size(), 10u);
    EXPECT_EQ(out[0], 9);
    EXPECT_EQ(out[5], 11);
    EXPECT_TRUE(std::all_of(out.begin() + 6, out.end(), [](int16_t s) { return s == 0; }));
    EXPECT_EQ(stats.audio_underruns.load(), 1u);
}

TEST(AudioRingBufferTest, CursorsStayOrdered) {
    StreamStats stats;
    AudioRingBuffer ring(64, 2, stats);
    std::vector<int16_t> out;
    auto block = ramp(40, 2, 0);

    for (int i = 0; i < 200; i++) {
        if (i % 3 != 2) ring.write(block.data(), 40);
        ring.read(out, (i % 5) * 13);
        EXPECT_LE(ring.readPosition(), ring.writePosition());
        EXPECT_LE(ring.writePosition() - ring.readPosition(), ring.capacity());
    }
}

TEST(AudioRingBufferTest, ClearDiscardsUnread) {
    StreamStats stats;
    AudioRingBuffer ring(10, 1, stats);
    auto a = ramp(6, 1, 1);
    ring.write(a.data(), 6);
    ring.clear();
    EXPECT_EQ(ring.available(), 0u);
    EXPECT_EQ(ring.readPosition(), ring.writePosition());
    EXPECT_EQ(stats.audio_buffered_frames.load(), 0u);
}

TEST(AudioRingBufferTest, ConcurrentProducerConsumer) {
    StreamStats stats;
    AudioRingBuffer ring(4096, 2, stats);
    auto block = ramp(192, 2, 1);

    std::thread producer([&] {
        for (int i = 0; i < 2000; i++) ring.write(block.data(), 192);
    });
    std::thread consumer([&] {
        std::vector<int16_t> out;
        for (int i = 0; i < 2000; i++) {
            ring.read(out, 100);
            EXPECT_EQ(out.size(), 200u);
        }
    });
    producer.join();
    consumer.join();

    EXPECT_LE(ring.readPosition(), ring.writePosition());
    EXPECT_LE(ring.available(), ring.capacity());
}

// ---------------------------------------------------------------------------
// AudioReassembler
// ---------------------------------------------------------------------------
TEST(AudioReassemblerTest, RingSizedFromMilliseconds) {
    StreamStats stats;
    AudioReassembler audio(200, stats);
    EXPECT_EQ(audio.ring().capacity(), 9595u);
    EXPECT_EQ(audio.sampleRate(), 47976u);
    EXPECT_EQ(audio.channels(), 2);
    EXPECT_EQ(AudioReassembler::framesForMs(1000), 47976u);
}

TEST(AudioReassemblerTest, DecodesLittleEndianSamples) {
    StreamStats stats;
    AudioReassembler audio(200, stats);
    ASSERT_TRUE(audio.submit(audioDatagram(1, -1234)));
    EXPECT_EQ(audio.available(), 192u);
    EXPECT_EQ(stats.audio_packets_received.load(), 1u);

    auto chunk = audio.read(192);
    EXPECT_EQ(chunk.frames(), 192u);
    EXPECT_EQ(chunk.silent_frames, 0u);
    EXPECT_EQ(chunk.sample_rate, 47976u);
    EXPECT_EQ(chunk.channels, 2);
    EXPECT_TRUE(std::all_of(chunk.samples.begin(), chunk.samples.end(),
                            [](int16_t s) { return s == -1234; }));
}

TEST(AudioReassemblerTest, ChunkIndexIsMonotonic) {
    StreamStats stats;
    AudioReassembler audio(50, stats);
    EXPECT_EQ(audio.read(10).index, 0u);
    EXPECT_EQ(audio.read(10).index, 1u);
    EXPECT_EQ(audio.read(10).index, 2u);
}

TEST(AudioReassemblerTest, MalformedDatagramDiscarded) {
    StreamStats stats;
    AudioReassembler audio(200, stats);

    auto short_pkt = audioDatagram(1, 5);
    short_pkt.payload.resize(500);
    EXPECT_FALSE(audio.submit(short_pkt));

    auto wrong_kind = audioDatagram(1, 5);
    wrong_kind.stream = StreamKind::Video;
    EXPECT_FALSE(audio.submit(wrong_kind));

    EXPECT_EQ(stats.packets_discarded.load(), 2u);
    EXPECT_EQ(stats.audio_packets_received.load(), 0u);
    EXPECT_EQ(audio.available(), 0u);
}

TEST(AudioReassemblerTest, SequenceGapsCountLostPackets) {
    StreamStats stats;
    AudioReassembler audio(200, stats);
    audio.submit(audioDatagram(10, 0));
    audio.submit(audioDatagram(11, 0));
    audio.submit(audioDatagram(15, 0));   // 12,13,14 lost
    EXPECT_EQ(stats.audio_packets_lost.load(), 3u);

    // Wraps from 65535 to 0 without loss
    audio.reset();
    audio.submit(audioDatagram(65535, 0));
    audio.submit(audioDatagram(0, 0));
    EXPECT_EQ(stats.audio_packets_lost.load(), 3u);
}

TEST(AudioReassemblerTest, ReorderedPacketIsNotCountedAsLoss) {
    StreamStats stats;
    AudioReassembler audio(200, stats);
    audio.submit(audioDatagram(1, 0));
    audio.submit(audioDatagram(3, 0));
    audio.submit(audioDatagram(2, 0));
    audio.submit(audioDatagram(4, 0));
    EXPECT_EQ(stats.audio_packets_lost.load(), 1u);
    EXPECT_EQ(stats.audio_packets_received.load(), 4u);
}

// ---------------------------------------------------------------------------
// Input stops for 500 ms against a 200 ms ring
// ---------------------------------------------------------------------------
TEST(AudioReassemblerTest, SilenceWhenInputStops) {
    StreamStats stats;
    AudioReassembler audio(200, stats);

    // ~100 ms buffered
    for (uint16_t seq = 0; seq < 25; seq++) {
        ASSERT_TRUE(audio.submit(audioDatagram(seq, 1000)));
    }
    EXPECT_EQ(stats.audio_overruns.load(), 0u);

    // Presentation keeps pulling 10 ms blocks for 500 ms
    const size_t block = AudioReassembler::framesForMs(10);
    uint64_t underruns_before = stats.audio_underruns.load();
    AudioChunk last;
    size_t silent_total = 0;
    for (int i = 0; i < 50; i++) {
        last = audio.read(block);
        ASSERT_EQ(last.frames(), block);
        silent_total += last.silent_frames;
    }

    EXPECT_GT(stats.audio_underruns.load(), underruns_before);
    EXPECT_EQ(last.silent_frames, block);
    EXPECT_TRUE(std::all_of(last.samples.begin(), last.samples.end(),
                            [](int16_t s) { return s == 0; }));
    EXPECT_EQ(silent_total, 50 * block - 25 * 192);
    EXPECT_EQ(audio.available(), 0u);

    // Input resumes
    audio.submit(audioDatagram(25, 7));
    auto resumed = audio.read(192);
    EXPECT_EQ(resumed.silent_frames, 0u);
    EXPECT_EQ(resumed.samples[0], 7);
}

TEST(AudioReassemblerTest, OverrunWhenNobodyReads) {
    StreamStats stats;
    AudioReassembler audio(20, stats);   // 959 frames
    for (uint16_t seq = 0; seq < 10; seq++) audio.submit(audioDatagram(seq, 1));
    EXPECT_EQ(audio.available(), audio.ring().capacity());
    EXPECT_GT(stats.audio_overruns.load(), 0u);
}
