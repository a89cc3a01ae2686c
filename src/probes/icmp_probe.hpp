#pragma once
#include <memory>
#include <string>
#include <vector>

#include "../core/fd.hpp"
#include "probe_client.hpp"

namespace nlm {
// ICMP / ICMPv6 echo session. Prefers an unprivileged datagram ping socket
// and falls back to a raw socket (root or CAP_NET_RAW).
class IcmpClient : public ProbeClient {
   public:
    static std::unique_ptr<IcmpClient> create(int family, std::string& err);

    ProbeOutcome ping(const IpAddress& dst, uint16_t ident, uint16_t seq,
                      const std::vector<uint8_t>& payload,
                      std::chrono::milliseconds timeout) override;

    bool raw() const {
        return raw_;
    }
    int family() const {
        return family_;
    }

   private:
    IcmpClient(Fd fd, int family, bool raw);

    enum class Match { None, Reply, Unreachable };
    Match match_reply(const uint8_t* buf, size_t len, const IpAddress& from, const IpAddress& dst,
                      uint16_t ident, uint16_t seq) const;

    Fd fd_;
    int family_;
    bool raw_;
};

ClientFactory icmp_client_factory();

// Whether ICMP echo can be sent by this process at all: root, a raw socket
// (CAP_NET_RAW) or a ping_group_range covering the effective gid.
bool icmp_permitted(std::string& how);
}  // namespace nlm
