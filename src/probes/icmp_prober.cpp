#include "icmp_prober.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <vector>

#include "../core/time_utils.hpp"

namespace lhm {
namespace {
// poll() takes an int; longer waits just loop.
constexpr long long kMaxPollMs = 60 * 1000;

uint16_t csum(const uint8_t* data, size_t len) {
    uint32_t sum = 0;
    for (; len > 1; len -= 2, data += 2) {
        uint16_t word;
        std::memcpy(&word, data, sizeof(word));
        sum += word;
    }
    if (len == 1) sum += *data;
    sum = (sum >> 16) + (sum & 0xFFFF);
    sum += (sum >> 16);
    return static_cast<uint16_t>(~sum);
}

class IcmpSocket {
   public:
    IcmpSocket() = default;
    ~IcmpSocket() {
        if (fd_ >= 0) ::close(fd_);
    }
    IcmpSocket(const IcmpSocket&) = delete;
    IcmpSocket& operator=(const IcmpSocket&) = delete;

    bool open() {
        fd_ = ::socket(AF_INET, SOCK_RAW | SOCK_CLOEXEC, IPPROTO_ICMP);
        if (fd_ >= 0) {
            kind_ = IcmpSocketKind::RAW;
            return true;
        }
        fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_ICMP);
        if (fd_ >= 0) {
            kind_ = IcmpSocketKind::DGRAM;
            return true;
        }
        return false;
    }
    int fd() const {
        return fd_;
    }
    IcmpSocketKind kind() const {
        return kind_;
    }

   private:
    int fd_{-1};
    IcmpSocketKind kind_{IcmpSocketKind::NONE};
};

bool resolve_v4(const std::string& host, sockaddr_in& out) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_RAW;
    hints.ai_protocol = IPPROTO_ICMP;
    addrinfo* res = nullptr;
    if (::getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || !res) return false;
    std::memcpy(&out, res->ai_addr, sizeof(sockaddr_in));
    ::freeaddrinfo(res);
    return true;
}

ProbeResult fail(const std::string& category) {
    ProbeResult r;
    r.ok = false;
    r.error_category = category;
    return r;
}
}  // namespace

const char* icmp_socket_kind_name(IcmpSocketKind k) {
    switch (k) {
        case IcmpSocketKind::RAW: return "raw";
        case IcmpSocketKind::DGRAM: return "dgram";
        case IcmpSocketKind::NONE: return "none";
    }
    return "?";
}

IcmpProber::IcmpProber() : ident_(static_cast<uint16_t>(::getpid() & 0xFFFF)) {}

IcmpSocketKind IcmpProber::detect() {
    IcmpSocket s;
    if (!s.open()) return IcmpSocketKind::NONE;
    return s.kind();
}

ProbeResult IcmpProber::probe(const std::string& target, int packet_size, double timeout_s) {
    using clock = std::chrono::steady_clock;

    sockaddr_in sa{};
    if (!resolve_v4(target, sa)) return fail("resolve_failed");

    IcmpSocket sock;
    if (!sock.open()) return fail("socket_failed");

    uint16_t seq = next_seq_.fetch_add(1);
    std::vector<uint8_t> pkt(sizeof(icmphdr) + static_cast<size_t>(packet_size));
    for (size_t i = sizeof(icmphdr); i < pkt.size(); ++i) pkt[i] = static_cast<uint8_t>(i & 0xFF);
    icmphdr hdr{};
    hdr.type = ICMP_ECHO;
    hdr.code = 0;
    hdr.un.echo.id = htons(ident_);
    hdr.un.echo.sequence = htons(seq);
    hdr.checksum = 0;
    std::memcpy(pkt.data(), &hdr, sizeof(hdr));
    hdr.checksum = csum(pkt.data(), pkt.size());
    std::memcpy(pkt.data(), &hdr, sizeof(hdr));

    auto start = clock::now();
    auto deadline = start + seconds_to_duration(timeout_s);
    ssize_t n = ::sendto(sock.fd(), pkt.data(), pkt.size(), 0, reinterpret_cast<sockaddr*>(&sa),
                         sizeof(sa));
    if (n < 0) return fail("send_failed");

    std::vector<uint8_t> buf(pkt.size() + 128);
    while (true) {
        auto now = clock::now();
        if (now >= deadline) return fail("timeout");
        auto left_ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        if (left_ms < 1) left_ms = 1;
        if (left_ms > kMaxPollMs) left_ms = kMaxPollMs;
        pollfd pfd{sock.fd(), POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(left_ms));
        if (rc < 0) {
            if (errno == EINTR) continue;
            return fail("poll_failed");
        }
        if (rc == 0) continue;

        sockaddr_in from{};
        socklen_t flen = sizeof(from);
        ssize_t got = ::recvfrom(sock.fd(), buf.data(), buf.size(), 0,
                                 reinterpret_cast<sockaddr*>(&from), &flen);
        auto recv_at = clock::now();
        if (got < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return fail("recv_failed");
        }
        if (from.sin_addr.s_addr != sa.sin_addr.s_addr) continue;

        size_t off = 0;
        if (sock.kind() == IcmpSocketKind::RAW) {
            if (got < static_cast<ssize_t>(sizeof(iphdr))) continue;
            auto* ip = reinterpret_cast<const iphdr*>(buf.data());
            off = static_cast<size_t>(ip->ihl) * 4;
        }
        if (static_cast<size_t>(got) < off + sizeof(icmphdr)) continue;
        icmphdr reply{};
        std::memcpy(&reply, buf.data() + off, sizeof(reply));
        if (reply.type != ICMP_ECHOREPLY || ntohs(reply.un.echo.sequence) != seq) continue;
        // The kernel rewrites the identifier on datagram sockets.
        if (sock.kind() == IcmpSocketKind::RAW && ntohs(reply.un.echo.id) != ident_) continue;

        auto us = std::chrono::duration_cast<std::chrono::microseconds>(recv_at - start).count();
        ProbeResult r;
        r.ok = true;
        r.rtt_ms = static_cast<double>(us) / 1000.0;
        return r;
    }
}
}  // namespace lhm
