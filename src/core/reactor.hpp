#pragma once
#include <cstdint>
#include <functional>
#include <unordered_map>

#include "fd.hpp"

namespace nlm {
using FdHandler = std::function<void(uint32_t)>;

// Single-threaded epoll loop driving the view tick and operator input.
class Reactor {
   public:
    Reactor();
    bool ok() const {
        return static_cast<bool>(epoll_fd_);
    }
    bool add_fd(int fd, uint32_t events, const FdHandler& cb);
    void del_fd(int fd);
    // Dispatches ready handlers; returns how many fired, -1 on error.
    // A signal interrupting the wait counts as zero events.
    int loop_once(int timeout_ms);

   private:
    Fd epoll_fd_;
    std::unordered_map<int, FdHandler> handlers_;
};
}  // namespace nlm
