#pragma once
#include <atomic>
#include <cstdint>
#include <string>

#include "prober.hpp"

namespace lhm {
enum class IcmpSocketKind { NONE, RAW, DGRAM };

const char* icmp_socket_kind_name(IcmpSocketKind k);

// ICMP echo over IPv4. Prefers a raw socket (CAP_NET_RAW) and falls back to
// an unprivileged datagram ICMP socket (net.ipv4.ping_group_range).
class IcmpProber : public Prober {
   public:
    IcmpProber();
    ProbeResult probe(const std::string& target, int packet_size, double timeout_s) override;

    // Which socket kind this host lets us open, NONE if neither.
    static IcmpSocketKind detect();

   private:
    uint16_t ident_;
    std::atomic<uint16_t> next_seq_{1};
};
}  // namespace lhm
