#include "scheduler_timerfd.hpp"

#include <poll.h>
#include <sys/epoll.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

#include "logger.hpp"

namespace nlm {
namespace {
int make_timer(int interval_ms, int flags) {
    int fd = ::timerfd_create(CLOCK_MONOTONIC, flags | TFD_CLOEXEC);
    if (fd < 0) {
        log(LogLevel::ERROR, std::string("timerfd_create failed: ") + std::strerror(errno));
        return -1;
    }
    itimerspec its{};
    its.it_interval.tv_sec = interval_ms / 1000;
    its.it_interval.tv_nsec = (interval_ms % 1000) * 1000000L;
    // First expiry immediately so a fresh worker probes right away.
    its.it_value.tv_sec = 0;
    its.it_value.tv_nsec = 1;
    if (::timerfd_settime(fd, 0, &its, nullptr) < 0) {
        log(LogLevel::ERROR, std::string("timerfd_settime failed: ") + std::strerror(errno));
        ::close(fd);
        return -1;
    }
    return fd;
}
}  // namespace

TimerScheduler::~TimerScheduler() {
    stop();
}

bool TimerScheduler::start(Reactor& r, int interval_ms, const std::function<void()>& cb) {
    stop();
    cb_ = cb;
    int fd = make_timer(interval_ms, TFD_NONBLOCK);
    if (fd < 0) return false;
    tfd_.reset(fd);
    reactor_ = &r;
    return r.add_fd(fd, EPOLLIN, [this](uint32_t) {
        uint64_t expirations = 0;
        if (::read(tfd_.get(), &expirations, sizeof(expirations)) != sizeof(expirations)) return;
        if (cb_) cb_();
    });
}

void TimerScheduler::stop() {
    if (!tfd_) return;
    if (reactor_) reactor_->del_fd(tfd_.get());
    reactor_ = nullptr;
    tfd_.reset();
}

bool IntervalTicker::start(int interval_ms) {
    int fd = make_timer(interval_ms, 0);
    if (fd < 0) return false;
    tfd_.reset(fd);
    started_ = false;
    return true;
}

void IntervalTicker::stop() {
    tfd_.reset();
    started_ = false;
}

bool IntervalTicker::wait() {
    if (!tfd_) return false;
    uint64_t expirations = 0;
    if (started_) {
        pollfd p{tfd_.get(), POLLIN, 0};
        if (::poll(&p, 1, 0) > 0 && (p.revents & POLLIN) &&
            ::read(tfd_.get(), &expirations, sizeof(expirations)) ==
                static_cast<ssize_t>(sizeof(expirations)))
            skipped_ += expirations;
    }
    started_ = true;
    while (true) {
        ssize_t n = ::read(tfd_.get(), &expirations, sizeof(expirations));
        if (n == static_cast<ssize_t>(sizeof(expirations))) {
            skipped_ += expirations - 1;
            return true;
        }
        if (n < 0 && errno == EINTR) continue;
        log(LogLevel::ERROR, std::string("timerfd read failed: ") + std::strerror(errno));
        return false;
    }
}
}  // namespace nlm
