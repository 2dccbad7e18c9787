#include "packet_receiver.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "c64view_log.hpp"

namespace c64view {

namespace {

std::string errnoText(int err) {
    return std::string(strerror(err)) + " (errno " + std::to_string(err) + ")";
}

// poll() with EINTR retry. Returns <0 only on a real error.
int pollRetry(struct pollfd* fds, nfds_t n, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining < 0) remaining = 0;
        int rc = ::poll(fds, n, static_cast<int>(remaining));
        if (rc >= 0 || errno != EINTR) return rc;
    }
}

} // namespace

PacketReceiver::PacketReceiver(int fd, StreamKind kind, uint16_t port, StreamStats& stats)
    : fd_(fd), kind_(kind), port_(port), stats_(&stats) {}

PacketReceiver::PacketReceiver(PacketReceiver&& o) noexcept
    : fd_(o.fd_), kind_(o.kind_), port_(o.port_), stats_(o.stats_), recv_errors_(o.recv_errors_) {
    o.fd_ = -1;
}

PacketReceiver& PacketReceiver::operator=(PacketReceiver&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        kind_ = o.kind_;
        port_ = o.port_;
        stats_ = o.stats_;
        recv_errors_ = o.recv_errors_;
        o.fd_ = -1;
    }
    return *this;
}

PacketReceiver::~PacketReceiver() {
    close();
}

Result<PacketReceiver> PacketReceiver::open(StreamKind kind, const std::string& bind_address,
                                            uint16_t port, StreamStats& stats,
                                            int rcvbuf_bytes) {
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);  // port=0 means OS assigns an available port
    if (inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) != 1) {
        return Err<PacketReceiver>(Error::Kind::BindFailed,
                                   "invalid bind address: " + bind_address);
    }

    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_UDP);
    if (fd < 0) {
        int err = errno;
        return Err<PacketReceiver>(Error::Kind::SocketError,
                                   "socket() failed: " + errnoText(err), err);
    }
    // From here on the receiver owns fd and closes it on every path
    PacketReceiver rx(fd, kind, port, stats);

    int reuse = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        CVLOG_WARN("rx", "setsockopt(SO_REUSEADDR) failed: %s", errnoText(errno).c_str());
    }

    // Bounded kernel queue; overflow is dropped by the OS
    if (setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &rcvbuf_bytes, sizeof(rcvbuf_bytes)) < 0) {
        CVLOG_WARN("rx", "setsockopt(SO_RCVBUF=%d) failed: %s", rcvbuf_bytes,
                   errnoText(errno).c_str());
    }

    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        int err = errno;
        return Err<PacketReceiver>(Error::Kind::SocketError,
                                   "fcntl(O_NONBLOCK) failed: " + errnoText(err), err);
    }

    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        return Err<PacketReceiver>(Error::Kind::BindFailed,
                                   std::string("bind() failed on ") + bind_address + ":" +
                                   std::to_string(port) + " (" + streamKindName(kind) + "): " +
                                   errnoText(err), err);
    }

    struct sockaddr_in bound_addr{};
    socklen_t addr_len = sizeof(bound_addr);
    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&bound_addr), &addr_len) == 0) {
        rx.port_ = ntohs(bound_addr.sin_port);
    }

    CVLOG_INFO("rx", "Listening for %s on UDP %s:%u", streamKindName(kind),
               bind_address.c_str(), static_cast<unsigned>(rx.port_));
    return Ok(std::move(rx));
}

void PacketReceiver::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        CVLOG_DEBUG("rx", "Closed %s socket (port %u)", streamKindName(kind_),
                    static_cast<unsigned>(port_));
        fd_ = -1;
    }
}

std::vector<Datagram> PacketReceiver::poll(std::chrono::milliseconds timeout) {
    std::vector<PacketReceiver*> one{this};
    return pollAll(one, timeout);
}

std::vector<Datagram> PacketReceiver::pollAll(const std::vector<PacketReceiver*>& receivers,
                                              std::chrono::milliseconds timeout) {
    std::vector<Datagram> out;
    std::vector<struct pollfd> fds;
    std::vector<PacketReceiver*> owners;
    fds.reserve(receivers.size());
    for (auto* rx : receivers) {
        if (rx == nullptr || !rx->isOpen()) continue;
        struct pollfd p{};
        p.fd = rx->fd_;
        p.events = POLLIN;
        fds.push_back(p);
        owners.push_back(rx);
    }
    if (fds.empty()) return out;

    int rc = pollRetry(fds.data(), static_cast<nfds_t>(fds.size()), timeout);
    if (rc <= 0) {
        if (rc < 0) {
            CVLOG_WARN("rx", "poll() failed: %s", errnoText(errno).c_str());
        }
        return out;
    }

    for (size_t i = 0; i < fds.size(); i++) {
        if (fds[i].revents & (POLLIN | POLLERR)) {
            owners[i]->drain(out);
        }
    }
    return out;
}

void PacketReceiver::drain(std::vector<Datagram>& out) {
    uint8_t buf[MAX_DATAGRAM_SIZE];
    size_t taken = 0;

    while (taken < MAX_BATCH) {
        ssize_t len = ::recv(fd_, buf, sizeof(buf), MSG_DONTWAIT | MSG_TRUNC);
        if (len < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            // ICMP errors and the like: transient, never surfaced
            if (recv_errors_++ % 100 == 0) {
                CVLOG_WARN("rx", "recv error on %s socket: %s (%llu total)",
                           streamKindName(kind_), errnoText(errno).c_str(),
                           (unsigned long long)recv_errors_);
            }
            break;
        }

        taken++;
        stats_->packets_received.fetch_add(1, std::memory_order_relaxed);
        stats_->bytes_received.fetch_add(static_cast<uint64_t>(len), std::memory_order_relaxed);

        // MSG_TRUNC reports the real length even when it exceeded the buffer
        if (len == 0 || static_cast<size_t>(len) > sizeof(buf)) {
            stats_->packets_discarded.fetch_add(1, std::memory_order_relaxed);
            continue;
        }

        Datagram d;
        d.stream = kind_;
        d.arrival = Clock::now();
        d.payload.assign(buf, buf + len);
        out.push_back(std::move(d));
    }
}

} // namespace c64view
