#include "icmp_probe.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>

#include "../core/logger.hpp"

namespace nlm {
namespace {
constexpr uint8_t kEchoRequestV4 = 8;
constexpr uint8_t kEchoReplyV4 = 0;
constexpr uint8_t kDestUnreachV4 = 3;
constexpr uint8_t kEchoRequestV6 = 128;
constexpr uint8_t kEchoReplyV6 = 129;
constexpr uint8_t kDestUnreachV6 = 1;
constexpr size_t kIcmpHeaderLen = 8;
constexpr size_t kIpv6HeaderLen = 40;

uint16_t csum(const uint8_t* data, size_t len) {
    uint32_t sum = 0;
    for (; len > 1; len -= 2, data += 2) sum += static_cast<uint32_t>(data[0] << 8 | data[1]);
    if (len == 1) sum += static_cast<uint32_t>(data[0] << 8);
    sum = (sum >> 16) + (sum & 0xFFFF);
    sum += (sum >> 16);
    return static_cast<uint16_t>(~sum);
}

uint16_t read_be16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] << 8 | p[1]);
}

void write_be16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v >> 8);
    p[1] = static_cast<uint8_t>(v & 0xFF);
}

int open_socket(int family, int type) {
    int proto = family == AF_INET6 ? IPPROTO_ICMPV6 : IPPROTO_ICMP;
    return ::socket(family, type | SOCK_CLOEXEC, proto);
}
}  // namespace

IcmpClient::IcmpClient(Fd fd, int family, bool raw)
    : fd_(std::move(fd)), family_(family), raw_(raw) {}

std::unique_ptr<IcmpClient> IcmpClient::create(int family, std::string& err) {
    if (family != AF_INET && family != AF_INET6) {
        err = "socket: unsupported address family";
        return nullptr;
    }
    int fd = open_socket(family, SOCK_DGRAM);
    bool raw = false;
    if (fd < 0) {
        int dgram_errno = errno;
        fd = open_socket(family, SOCK_RAW);
        raw = true;
        if (fd < 0) {
            err = std::string("socket: ") + std::strerror(dgram_errno) + " (datagram), " +
                  std::strerror(errno) + " (raw)";
            return nullptr;
        }
    }
    if (family == AF_INET && raw) {
        int ttl = 64;
        if (::setsockopt(fd, IPPROTO_IP, IP_TTL, &ttl, sizeof(ttl)) < 0)
            log(LogLevel::DEBUG, std::string("icmp: IP_TTL: ") + std::strerror(errno));
    }
    log(LogLevel::DEBUG, std::string("icmp: opened ") + (raw ? "raw" : "datagram") +
                             (family == AF_INET6 ? " ICMPv6" : " ICMP") + " socket");
    // Constructor is private, so std::make_unique cannot reach it.
    return std::unique_ptr<IcmpClient>(new IcmpClient(Fd(fd), family, raw));
}

IcmpClient::Match IcmpClient::match_reply(const uint8_t* buf, size_t len, const IpAddress& from,
                                          const IpAddress& dst, uint16_t ident,
                                          uint16_t seq) const {
    bool v6 = family_ == AF_INET6;
    if (!v6 && raw_) {
        if (len < 20) return Match::None;
        size_t ihl = static_cast<size_t>(buf[0] & 0x0F) * 4;
        if (len < ihl) return Match::None;
        buf += ihl;
        len -= ihl;
    }
    if (len < kIcmpHeaderLen) return Match::None;

    uint8_t type = buf[0];
    if (type == (v6 ? kEchoReplyV6 : kEchoReplyV4)) {
        if (from != dst) return Match::None;
        // Datagram ping sockets rewrite the identifier, the kernel already
        // demultiplexed the reply to this socket.
        if (raw_ && read_be16(buf + 4) != ident) return Match::None;
        return read_be16(buf + 6) == seq ? Match::Reply : Match::None;
    }

    if (raw_ && type == (v6 ? kDestUnreachV6 : kDestUnreachV4)) {
        const uint8_t* inner = buf + kIcmpHeaderLen;
        size_t inner_len = len - kIcmpHeaderLen;
        size_t skip = kIpv6HeaderLen;
        if (!v6) {
            if (inner_len < 20) return Match::None;
            skip = static_cast<size_t>(inner[0] & 0x0F) * 4;
        }
        if (inner_len < skip + kIcmpHeaderLen) return Match::None;
        const uint8_t* echo = inner + skip;
        if (echo[0] == (v6 ? kEchoRequestV6 : kEchoRequestV4) && read_be16(echo + 4) == ident &&
            read_be16(echo + 6) == seq)
            return Match::Unreachable;
    }
    return Match::None;
}

ProbeOutcome IcmpClient::ping(const IpAddress& dst, uint16_t ident, uint16_t seq,
                              const std::vector<uint8_t>& payload,
                              std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;
    if (!fd_) return ProbeOutcome::error("Bad file descriptor");
    if (dst.family() != family_) return ProbeOutcome::error("Invalid argument: address family");

    std::vector<uint8_t> pkt(kIcmpHeaderLen + payload.size(), 0);
    pkt[0] = family_ == AF_INET6 ? kEchoRequestV6 : kEchoRequestV4;
    pkt[1] = 0;
    write_be16(&pkt[4], ident);
    write_be16(&pkt[6], seq);
    std::copy(payload.begin(), payload.end(), pkt.begin() + kIcmpHeaderLen);
    // The kernel fills in the ICMPv6 checksum (it covers a pseudo-header).
    if (family_ == AF_INET) write_be16(&pkt[2], csum(pkt.data(), pkt.size()));

    sockaddr_storage ss{};
    socklen_t sslen = dst.to_sockaddr(ss);
    auto start = Clock::now();
    ssize_t n = ::sendto(fd_.get(), pkt.data(), pkt.size(), 0, reinterpret_cast<sockaddr*>(&ss),
                         sslen);
    if (n < 0) return ProbeOutcome::error(std::strerror(errno));

    auto deadline = start + timeout;
    uint8_t buf[1500];
    while (true) {
        auto now = Clock::now();
        if (now >= deadline) return ProbeOutcome::timeout();
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count() + 1;
        pollfd p{fd_.get(), POLLIN, 0};
        int rc = ::poll(&p, 1, static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) continue;
            return ProbeOutcome::error(std::strerror(errno));
        }
        if (rc == 0) return ProbeOutcome::timeout();
        if (p.revents & (POLLERR | POLLNVAL) && !(p.revents & POLLIN)) {
            int err = 0;
            socklen_t elen = sizeof(err);
            ::getsockopt(fd_.get(), SOL_SOCKET, SO_ERROR, &err, &elen);
            return ProbeOutcome::error(std::strerror(err ? err : EBADF));
        }

        sockaddr_storage from{};
        socklen_t flen = sizeof(from);
        ssize_t r = ::recvfrom(fd_.get(), buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&from),
                               &flen);
        auto received_at = Clock::now();
        if (r < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return ProbeOutcome::error(std::strerror(errno));
        }
        IpAddress src = IpAddress::from_sockaddr(reinterpret_cast<sockaddr*>(&from));
        Match m = match_reply(buf, static_cast<size_t>(r), src, dst, ident, seq);
        if (m == Match::None) continue;
        if (m == Match::Unreachable) return ProbeOutcome::error("Destination host unreachable");

        auto rtt = received_at - start;
        if (rtt > timeout) return ProbeOutcome::timeout();
        return ProbeOutcome::success(std::chrono::duration_cast<Latency>(rtt));
    }
}

ClientFactory icmp_client_factory() {
    return [](const IpAddress& dst, std::string& err) -> std::unique_ptr<ProbeClient> {
        return IcmpClient::create(dst.family(), err);
    };
}

bool icmp_permitted(std::string& how) {
    if (::geteuid() == 0) {
        how = "running as root";
        return true;
    }
    int fd = open_socket(AF_INET, SOCK_DGRAM);
    if (fd >= 0) {
        ::close(fd);
        how = "unprivileged ICMP (net.ipv4.ping_group_range)";
        return true;
    }
    fd = open_socket(AF_INET, SOCK_RAW);
    if (fd >= 0) {
        ::close(fd);
        how = "raw socket (CAP_NET_RAW)";
        return true;
    }
    std::ifstream in("/proc/sys/net/ipv4/ping_group_range");
    unsigned long lo = 0, hi = 0;
    if (in >> lo >> hi) {
        how = "ping_group_range " + std::to_string(lo) + "-" + std::to_string(hi) +
              " excludes gid " + std::to_string(::getegid());
    } else {
        how = "no raw socket capability";
    }
    return false;
}
}  // namespace nlm
