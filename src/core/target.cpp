#include "target.hpp"

#include <arpa/inet.h>
#include <netdb.h>

#include <cstring>

namespace nlm {
bool IpAddress::parse(const std::string& text, IpAddress& out) {
    IpAddress a;
    if (::inet_pton(AF_INET, text.c_str(), &a.v4_) == 1) {
        a.family_ = AF_INET;
    } else if (::inet_pton(AF_INET6, text.c_str(), &a.v6_) == 1) {
        a.family_ = AF_INET6;
    } else {
        return false;
    }
    out = a;
    return true;
}

IpAddress IpAddress::from_sockaddr(const sockaddr* sa) {
    IpAddress a;
    if (sa->sa_family == AF_INET) {
        a.family_ = AF_INET;
        a.v4_ = reinterpret_cast<const sockaddr_in*>(sa)->sin_addr;
    } else if (sa->sa_family == AF_INET6) {
        a.family_ = AF_INET6;
        a.v6_ = reinterpret_cast<const sockaddr_in6*>(sa)->sin6_addr;
    }
    return a;
}

socklen_t IpAddress::to_sockaddr(sockaddr_storage& ss) const {
    std::memset(&ss, 0, sizeof(ss));
    if (family_ == AF_INET) {
        auto* sin = reinterpret_cast<sockaddr_in*>(&ss);
        sin->sin_family = AF_INET;
        sin->sin_addr = v4_;
        return sizeof(sockaddr_in);
    }
    if (family_ == AF_INET6) {
        auto* sin6 = reinterpret_cast<sockaddr_in6*>(&ss);
        sin6->sin6_family = AF_INET6;
        sin6->sin6_addr = v6_;
        return sizeof(sockaddr_in6);
    }
    return 0;
}

std::string IpAddress::to_string() const {
    char buf[INET6_ADDRSTRLEN] = {};
    if (family_ == AF_INET) {
        ::inet_ntop(AF_INET, &v4_, buf, sizeof(buf));
    } else if (family_ == AF_INET6) {
        ::inet_ntop(AF_INET6, &v6_, buf, sizeof(buf));
    } else {
        return "unknown";
    }
    return std::string(buf);
}

bool IpAddress::operator==(const IpAddress& o) const {
    if (family_ != o.family_) return false;
    if (family_ == AF_INET) return v4_.s_addr == o.v4_.s_addr;
    if (family_ == AF_INET6) return std::memcmp(&v6_, &o.v6_, sizeof(v6_)) == 0;
    return true;
}

std::vector<Target> default_targets() {
    std::vector<Target> out;
    const char* defaults[][2] = {{"Cloudflare", "1.1.1.1"}, {"Google", "8.8.8.8"},
                                 {"Quad9", "9.9.9.9"}};
    for (const auto& d : defaults) {
        Target t;
        t.name = d[0];
        IpAddress::parse(d[1], t.addr);
        out.push_back(t);
    }
    return out;
}

bool resolve_target(const std::string& host, Target& out, std::string& err) {
    Target t;
    t.name = host;
    if (IpAddress::parse(host, t.addr)) {
        out = t;
        return true;
    }
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* res = nullptr;
    int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || !res) {
        err = "cannot resolve " + host + ": " + (rc != 0 ? ::gai_strerror(rc) : "no results");
        return false;
    }
    t.addr = IpAddress::from_sockaddr(res->ai_addr);
    ::freeaddrinfo(res);
    if (!t.addr.valid()) {
        err = "cannot resolve " + host + ": unsupported address family";
        return false;
    }
    out = t;
    return true;
}
}  // namespace nlm
