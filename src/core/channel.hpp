#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace nlm {
// Unbounded multi-producer / single-consumer queue. Order is FIFO per
// producer; interleaving between producers is whatever the lock yields.
// Once closed, send() fails and the consumer can still drain what is queued.
template <typename T>
class Channel {
   public:
    bool send(T item) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (closed_) return false;
            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    bool try_recv(T& out) {
        std::lock_guard<std::mutex> lock(mu_);
        if (queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    bool recv_for(T& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mu_);
        if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; }))
            return false;
        if (queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mu_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return queue_.size();
    }

   private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_{false};
};
}  // namespace nlm
