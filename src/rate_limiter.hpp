#pragma once
#include <deque>
#include <mutex>
#include <chrono>

namespace chime {

// Sliding-window request limiter for the HTTP channel.
class RateLimiter {
public:
    explicit RateLimiter(int requests_per_window,
                         std::chrono::seconds window = std::chrono::seconds(60))
        : limit_(requests_per_window), window_(window) {}

    bool allow() {
        return allow_at(std::chrono::steady_clock::now());
    }

    bool allow_at(std::chrono::steady_clock::time_point now) {
        if (limit_ <= 0) return true;  // 0 = unlimited

        std::lock_guard<std::mutex> lock(mutex_);
        auto cutoff = now - window_;
        while (!stamps_.empty() && stamps_.front() <= cutoff) {
            stamps_.pop_front();
        }
        if (static_cast<int>(stamps_.size()) >= limit_) return false;

        stamps_.push_back(now);
        return true;
    }

private:
    int limit_;
    std::chrono::seconds window_;
    std::mutex mutex_;
    std::deque<std::chrono::steady_clock::time_point> stamps_;
};

} // namespace chime
