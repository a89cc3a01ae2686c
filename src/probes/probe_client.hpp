#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "../core/target.hpp"
#include "../stats/probe_outcome.hpp"

namespace nlm {
// A network session able to send echo requests. Implementations report
// every failure through the returned outcome; they never throw.
class ProbeClient {
   public:
    virtual ~ProbeClient() = default;
    virtual ProbeOutcome ping(const IpAddress& dst, uint16_t ident, uint16_t seq,
                              const std::vector<uint8_t>& payload,
                              std::chrono::milliseconds timeout) = 0;
};

// Builds a session suited to the address family of `dst`; on failure
// returns null and describes the cause in `err`.
using ClientFactory =
    std::function<std::unique_ptr<ProbeClient>(const IpAddress& dst, std::string& err)>;
}  // namespace nlm
