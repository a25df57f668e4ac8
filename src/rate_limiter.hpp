#pragma once
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <string>

namespace convmem {

// Sliding one-minute window per client key (usually the remote address).
class RateLimiter {
public:
    explicit RateLimiter(int requests_per_minute)
        : rpm_(requests_per_minute) {}

    bool allow(const std::string& client) {
        if (rpm_ <= 0) return true;  // 0 = unlimited

        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        auto cutoff = now - std::chrono::seconds(60);

        auto& stamps = clients_[client];
        while (!stamps.empty() && stamps.front() < cutoff) {
            stamps.pop_front();
        }

        if (static_cast<int>(stamps.size()) >= rpm_) {
            return false;
        }
        stamps.push_back(now);

        // Drop idle clients so the map stays bounded by active callers.
        for (auto it = clients_.begin(); it != clients_.end();) {
            if (it->second.empty() || it->second.back() < cutoff) it = clients_.erase(it);
            else ++it;
        }
        return true;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        clients_.clear();
    }

private:
    int rpm_;
    std::mutex mutex_;
    std::map<std::string, std::deque<std::chrono::steady_clock::time_point>> clients_;
};

} // namespace convmem
