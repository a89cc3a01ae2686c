#pragma once
#include <netinet/in.h>
#include <sys/socket.h>

#include <string>
#include <vector>

namespace nlm {
class IpAddress {
   public:
    IpAddress() = default;
    static bool parse(const std::string& text, IpAddress& out);
    static IpAddress from_sockaddr(const sockaddr* sa);

    int family() const {
        return family_;
    }
    bool is_v6() const {
        return family_ == AF_INET6;
    }
    bool valid() const {
        return family_ == AF_INET || family_ == AF_INET6;
    }
    const in_addr& v4() const {
        return v4_;
    }
    const in6_addr& v6() const {
        return v6_;
    }
    // Fills a sockaddr_in/sockaddr_in6 for sendto(); returns its length.
    socklen_t to_sockaddr(sockaddr_storage& ss) const;
    std::string to_string() const;
    bool operator==(const IpAddress& o) const;
    bool operator!=(const IpAddress& o) const {
        return !(*this == o);
    }

   private:
    int family_{AF_UNSPEC};
    in_addr v4_{};
    in6_addr v6_{};
};

struct Target {
    std::string name;
    IpAddress addr;

    std::string addr_string() const {
        return addr.to_string();
    }
};

std::vector<Target> default_targets();

// Literal addresses are taken as-is; anything else goes through getaddrinfo
// and the first result wins. The target is named after the input text.
bool resolve_target(const std::string& host, Target& out, std::string& err);
}  // namespace nlm
