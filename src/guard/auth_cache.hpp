#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <core/types.hpp>
#include <core/constants.hpp>

// Advisory record of "an authentication ceremony succeeded at time T".
// Process-local, never persisted. It does not gate the store's own
// authentication; use it for UI decisions only.
//
// Valid while now - created_at < interval. An expired entry is cleared the
// first time a query observes it.
class AuthCache {
public:
    explicit AuthCache(Clock clock = system_clock(),
                       std::chrono::seconds interval = std::chrono::seconds(AUTH_CACHE_INTERVAL_SECS));

    void record_success();
    bool is_valid();
    void clear();

    std::optional<TimePoint> created_at() const;
    std::chrono::seconds interval() const { return interval_; }

private:
    Clock clock_;
    std::chrono::seconds interval_;
    mutable std::mutex mutex_;
    std::optional<TimePoint> created_at_;
};
