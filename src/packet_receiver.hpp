// =============================================================================
// c64view - UDP Packet Receiver
// =============================================================================
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "result.hpp"
#include "stream_stats.hpp"
#include "stream_types.hpp"

namespace c64view {

/**
 * One bound UDP socket for one stream (video or audio).
 * - open(): bind, fatal error on failure
 * - poll(): waits up to `timeout`, then drains every queued datagram
 * - close(): idempotent, also run by the destructor
 * Move-only. Never blocks longer than the given timeout.
 */
class PacketReceiver {
public:
    // Largest datagram accepted; anything bigger is reported truncated.
    static constexpr size_t MAX_DATAGRAM_SIZE = 2048;
    // Upper bound of datagrams returned by a single poll
    static constexpr size_t MAX_BATCH = 512;

    static Result<PacketReceiver> open(StreamKind kind, const std::string& bind_address,
                                       uint16_t port, StreamStats& stats,
                                       int rcvbuf_bytes = 4 * 1024 * 1024);

    // Waits on several receivers at once; datagrams come back in socket order.
    static std::vector<Datagram> pollAll(const std::vector<PacketReceiver*>& receivers,
                                         std::chrono::milliseconds timeout);

    PacketReceiver(PacketReceiver&& o) noexcept;
    PacketReceiver& operator=(PacketReceiver&& o) noexcept;
    PacketReceiver(const PacketReceiver&) = delete;
    PacketReceiver& operator=(const PacketReceiver&) = delete;
    ~PacketReceiver();

    std::vector<Datagram> poll(std::chrono::milliseconds timeout);
    void close();

    bool isOpen() const { return fd_ >= 0; }
    uint16_t port() const { return port_; }
    StreamKind kind() const { return kind_; }
    int fd() const { return fd_; }

private:
    PacketReceiver(int fd, StreamKind kind, uint16_t port, StreamStats& stats);

    // Non-blocking recv loop until EAGAIN or MAX_BATCH.
    void drain(std::vector<Datagram>& out);

    int fd_ = -1;
    StreamKind kind_ = StreamKind::Video;
    uint16_t port_ = 0;
    StreamStats* stats_ = nullptr;
    uint64_t recv_errors_ = 0;
};

} // namespace c64view
