// =============================================================================
// Unit tests for PacketReceiver (src/packet_receiver.cpp)
// Uses real UDP sockets on 127.0.0.1 with OS-assigned ports.
// =============================================================================
#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include <vector>
#include "packet_receiver.hpp"
#include "stream_test_util.hpp"

using namespace c64view;
using namespace std::chrono_literals;
using c64view::test::LoopbackSender;

namespace {

// Polls until `count` datagrams arrived or ~2 s passed.
std::vector<Datagram> collect(PacketReceiver& rx, size_t count) {
    std::vector<Datagram> all;
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (all.size() < count && std::chrono::steady_clock::now() < deadline) {
        auto batch = rx.poll(50ms);
        for (auto& d : batch) all.push_back(std::move(d));
    }
    return all;
}

PacketReceiver openLoopback(StreamKind kind, StreamStats& stats) {
    auto r = PacketReceiver::open(kind, "127.0.0.1", 0, stats);
    EXPECT_TRUE(r.is_ok()) << (r.is_err() ? r.error().message : "");
    return std::move(r).value();
}

} // namespace

TEST(PacketReceiverTest, OpenOnEphemeralPort) {
    StreamStats stats;
    auto rx = openLoopback(StreamKind::Video, stats);
    EXPECT_TRUE(rx.isOpen());
    EXPECT_NE(rx.port(), 0);
    EXPECT_EQ(rx.kind(), StreamKind::Video);
}

TEST(PacketReceiverTest, ReceivesLoopbackDatagrams) {
    StreamStats stats;
    auto rx = openLoopback(StreamKind::Video, stats);
    LoopbackSender sender;
    ASSERT_TRUE(sender.ok());

    auto g = FrameGeometry::pal();
    for (uint32_t i = 0; i < 10; i++) {
        ASSERT_TRUE(sender.send(rx.port(), test::videoDatagram(1, i, 0x33, g)));
    }

    auto got = collect(rx, 10);
    ASSERT_EQ(got.size(), 10u);
    for (const auto& d : got) {
        EXPECT_EQ(d.stream, StreamKind::Video);
        EXPECT_EQ(d.payload.size(), protocol::VIDEO_PACKET_SIZE);
        EXPECT_NE(d.arrival, Clock::time_point{});
    }
    EXPECT_EQ(stats.packets_received.load(), 10u);
    EXPECT_EQ(stats.bytes_received.load(), 10u * protocol::VIDEO_PACKET_SIZE);
    EXPECT_EQ(stats.packets_discarded.load(), 0u);
}

TEST(PacketReceiverTest, PollTimesOutWhenIdle) {
    StreamStats stats;
    auto rx = openLoopback(StreamKind::Audio, stats);
    auto start = std::chrono::steady_clock::now();
    auto got = rx.poll(30ms);
    EXPECT_TRUE(got.empty());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
}

TEST(PacketReceiverTest, OversizedDatagramDiscarded) {
    StreamStats stats;
    auto rx = openLoopback(StreamKind::Video, stats);
    LoopbackSender sender;

    std::vector<uint8_t> big(PacketReceiver::MAX_DATAGRAM_SIZE + 500, 0xEE);
    ASSERT_TRUE(sender.send(rx.port(), big.data(), big.size()));
    std::vector<uint8_t> small(protocol::AUDIO_PACKET_SIZE, 0);
    ASSERT_TRUE(sender.send(rx.port(), small.data(), small.size()));

    auto got = collect(rx, 1);
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].payload.size(), protocol::AUDIO_PACKET_SIZE);
    EXPECT_EQ(stats.packets_discarded.load(), 1u);
}

TEST(PacketReceiverTest, PollAllSeparatesStreams) {
    StreamStats stats;
    auto video = openLoopback(StreamKind::Video, stats);
    auto audio = openLoopback(StreamKind::Audio, stats);
    LoopbackSender sender;

    ASSERT_TRUE(sender.send(video.port(), test::videoDatagram(1, 0, 0, FrameGeometry::pal())));
    ASSERT_TRUE(sender.send(audio.port(), test::audioDatagram(1, 0)));

    std::vector<Datagram> all;
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (all.size() < 2 && std::chrono::steady_clock::now() < deadline) {
        for (auto& d : PacketReceiver::pollAll({&video, &audio}, 50ms)) all.push_back(std::move(d));
    }
    ASSERT_EQ(all.size(), 2u);
    int videos = 0;
    int audios = 0;
    for (const auto& d : all) {
        if (d.stream == StreamKind::Video) {
            videos++;
            EXPECT_EQ(d.payload.size(), protocol::VIDEO_PACKET_SIZE);
        } else {
            audios++;
            EXPECT_EQ(d.payload.size(), protocol::AUDIO_PACKET_SIZE);
        }
    }
    EXPECT_EQ(videos, 1);
    EXPECT_EQ(audios, 1);
}

// ---------------------------------------------------------------------------
// Bind failures are fatal and typed
// ---------------------------------------------------------------------------
TEST(PacketReceiverTest, InvalidBindAddress) {
    StreamStats stats;
    auto r = PacketReceiver::open(StreamKind::Video, "not-an-address", 0, stats);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, Error::Kind::BindFailed);
}

TEST(PacketReceiverTest, PortAlreadyInUse) {
    // Holder binds without SO_REUSEADDR, so a second bind must fail
    int holder = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    ASSERT_GE(holder, 0);
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ASSERT_EQ(::bind(holder, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)), 0);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(getsockname(holder, reinterpret_cast<struct sockaddr*>(&addr), &len), 0);
    uint16_t port = ntohs(addr.sin_port);

    StreamStats stats;
    auto r = PacketReceiver::open(StreamKind::Video, "127.0.0.1", port, stats);
    ::close(holder);

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, Error::Kind::BindFailed);
    EXPECT_NE(r.error().code, 0);
    EXPECT_NE(r.error().message.find(std::to_string(port)), std::string::npos);
}

// ---------------------------------------------------------------------------
// Ownership
// ---------------------------------------------------------------------------
TEST(PacketReceiverTest, CloseIsIdempotent) {
    StreamStats stats;
    auto rx = openLoopback(StreamKind::Video, stats);
    rx.close();
    EXPECT_FALSE(rx.isOpen());
    rx.close();
    EXPECT_TRUE(rx.poll(10ms).empty());
}

TEST(PacketReceiverTest, MoveTransfersSocket) {
    StreamStats stats;
    auto a = openLoopback(StreamKind::Video, stats);
    int fd = a.fd();
    uint16_t port = a.port();

    PacketReceiver b = std::move(a);
    EXPECT_FALSE(a.isOpen());
    EXPECT_TRUE(b.isOpen());
    EXPECT_EQ(b.fd(), fd);
    EXPECT_EQ(b.port(), port);
}
