// ============================================================================
// transport_bip.cpp — implementation for bacgate/transport/transport_bip.hpp
// ============================================================================

#include "bacgate/transport/transport_bip.hpp"

#include <arpa/inet.h>      // htonl/htons, sockaddr_in
#include <fcntl.h>          // O_NONBLOCK / O_CLOEXEC for the wake pipe
#include <netinet/in.h>
#include <poll.h>           // poll(): socket + wake pipe in one wait
#include <sys/socket.h>
#include <unistd.h>         // close, pipe2, read, write
#include <cerrno>
#include <cstring>          // strerror

#include "bacgate/log.hpp"

namespace bacgate::transport {

// ============================================================================
// BVLC framing
// ============================================================================

std::vector<uint8_t> bvlc_wrap(uint8_t function, const std::vector<uint8_t>& npdu) {
    const size_t total = BVLC_HEADER_LEN + npdu.size();
    std::vector<uint8_t> d;
    d.reserve(total);
    d.push_back(BVLC_TYPE_BIP);
    d.push_back(function);
    d.push_back(static_cast<uint8_t>(total >> 8));
    d.push_back(static_cast<uint8_t>(total));
    d.insert(d.end(), npdu.begin(), npdu.end());
    return d;
}

TransportError bvlc_unwrap(const uint8_t* data, size_t len, const BipAddress& udp_source, Frame& out) {
    if (!data || len < BVLC_HEADER_LEN) return TransportError::Foreign;
    if (data[0] != BVLC_TYPE_BIP)       return TransportError::Foreign;

    const size_t declared = (size_t(data[2]) << 8) | data[3];
    if (declared != len) return TransportError::Foreign;

    size_t start = BVLC_HEADER_LEN;
    out.source = udp_source;

    switch (data[1]) {
        case BVLC_ORIGINAL_UNICAST:
        case BVLC_ORIGINAL_BROADCAST:
            break;
        case BVLC_FORWARDED_NPDU:
            if (len < BVLC_HEADER_LEN + 6) return TransportError::Foreign;
            out.source = BipAddress::from_bip_bytes(data + BVLC_HEADER_LEN);
            start += 6;
            break;
        default:
            return TransportError::Foreign;   // BBMD management, results, ...
    }

    out.npdu.assign(data + start, data + len);
    return TransportError::None;
}

// ============================================================================
// Socket helpers
// ============================================================================

static sockaddr_in to_sockaddr(const BipAddress& a) {
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_addr.s_addr = htonl(a.ip);
    sa.sin_port = htons(a.port);
    return sa;
}

static BipAddress from_sockaddr(const sockaddr_in& sa) {
    BipAddress a;
    a.ip = ntohl(sa.sin_addr.s_addr);
    a.port = ntohs(sa.sin_port);
    return a;
}

// ============================================================================
// BipDatalink
// ============================================================================

// ---------------------------------------------------------------------------
// begin()
// socket -> SO_REUSEADDR + SO_BROADCAST -> bind -> wake pipe.
// On any failure everything opened so far is closed again.
// ---------------------------------------------------------------------------
TransportError BipDatalink::begin(const BipConfig& cfg) {
    end();
    cfg_ = cfg;

    fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
        log_error(std::string("bip: socket() failed: ") + std::strerror(errno));
        return TransportError::Socket;
    }

    int on = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0 ||
        ::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) < 0) {
        log_error(std::string("bip: setsockopt() failed: ") + std::strerror(errno));
        end();
        return TransportError::Socket;
    }

    sockaddr_in sa = to_sockaddr(cfg.bind);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) < 0) {
        log_error("bip: bind(" + cfg.bind.to_string() + ") failed: " + std::strerror(errno));
        end();
        return TransportError::Bind;
    }

    sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&bound), &blen) == 0)
        local_ = from_sockaddr(bound);
    else
        local_ = cfg.bind;

    if (::pipe2(wake_, O_NONBLOCK | O_CLOEXEC) < 0) {
        log_error(std::string("bip: pipe() failed: ") + std::strerror(errno));
        end();
        return TransportError::Socket;
    }

    log_info("bip: listening on " + local_.to_string() + ", broadcast " + cfg_.broadcast.to_string());
    return TransportError::None;
}

void BipDatalink::end() {
    if (fd_ >= 0)      { ::close(fd_);      fd_ = -1; }
    if (wake_[0] >= 0) { ::close(wake_[0]); wake_[0] = -1; }
    if (wake_[1] >= 0) { ::close(wake_[1]); wake_[1] = -1; }
}

TransportError BipDatalink::send_datagram(const std::vector<uint8_t>& datagram, const BipAddress& dest) {
    std::lock_guard<std::mutex> lock(send_mu_);
    if (fd_ < 0) return TransportError::NotOpen;

    const sockaddr_in sa = to_sockaddr(dest);
    const ssize_t n = ::sendto(fd_, datagram.data(), datagram.size(), 0,
                               reinterpret_cast<const sockaddr*>(&sa), sizeof(sa));
    if (n < 0) {
        log_warn("bip: sendto(" + dest.to_string() + ") failed: " + std::strerror(errno));
        return TransportError::Send;
    }
    if (static_cast<size_t>(n) != datagram.size()) return TransportError::Send;
    return TransportError::None;
}

TransportError BipDatalink::send_broadcast(const std::vector<uint8_t>& npdu) {
    if (npdu.size() > BIP_MAX_NPDU) return TransportError::Oversize;
    return send_datagram(bvlc_wrap(BVLC_ORIGINAL_BROADCAST, npdu), cfg_.broadcast);
}

TransportError BipDatalink::send_unicast(const std::vector<uint8_t>& npdu, const BipAddress& dest) {
    if (npdu.size() > BIP_MAX_NPDU) return TransportError::Oversize;
    return send_datagram(bvlc_wrap(BVLC_ORIGINAL_UNICAST, npdu), dest);
}

// ---------------------------------------------------------------------------
// receive_frame()
// poll() on the socket and the wake pipe. The pipe byte is never drained, so
// once interrupted every later call returns Cancelled straight away.
// ---------------------------------------------------------------------------
TransportError BipDatalink::receive_frame(Frame& out, std::chrono::milliseconds timeout) {
    if (fd_ < 0) return TransportError::NotOpen;

    pollfd fds[2];
    fds[0].fd = fd_;      fds[0].events = POLLIN; fds[0].revents = 0;
    fds[1].fd = wake_[0]; fds[1].events = POLLIN; fds[1].revents = 0;

    const long long ms = timeout.count() < 0 ? 0 : timeout.count();
    const int wait_ms = ms > 0x7FFFFFFF ? 0x7FFFFFFF : static_cast<int>(ms);

    int rc;
    do {
        rc = ::poll(fds, 2, wait_ms);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        log_warn(std::string("bip: poll() failed: ") + std::strerror(errno));
        return TransportError::Receive;
    }
    if (fds[1].revents & POLLIN) return TransportError::Cancelled;
    if (rc == 0) return TransportError::Timeout;
    if (!(fds[0].revents & POLLIN)) return TransportError::Receive;

    uint8_t buf[BVLC_HEADER_LEN + 6 + BIP_MAX_NPDU];
    sockaddr_in sender{};
    socklen_t slen = sizeof(sender);
    const ssize_t n = ::recvfrom(fd_, buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&sender), &slen);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return TransportError::Timeout;
        log_warn(std::string("bip: recvfrom() failed: ") + std::strerror(errno));
        return TransportError::Receive;
    }

    return bvlc_unwrap(buf, static_cast<size_t>(n), from_sockaddr(sender), out);
}

void BipDatalink::interrupt() {
    if (wake_[1] < 0) return;
    const uint8_t b = 1;
    if (::write(wake_[1], &b, 1) < 0 && errno != EAGAIN)
        log_warn(std::string("bip: wake write failed: ") + std::strerror(errno));
}

} // namespace bacgate::transport
