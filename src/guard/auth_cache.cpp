#include "auth_cache.hpp"

AuthCache::AuthCache(Clock clock, std::chrono::seconds interval)
    : clock_(std::move(clock)), interval_(interval) {}

void AuthCache::record_success() {
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    created_at_ = now;
}

bool AuthCache::is_valid() {
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    if (!created_at_) return false;

    // A clock that moved backwards past the record also invalidates it.
    if (now < *created_at_ || now - *created_at_ >= interval_) {
        created_at_.reset();
        return false;
    }
    return true;
}

void AuthCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    created_at_.reset();
}

std::optional<TimePoint> AuthCache::created_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_at_;
}
