#pragma once

#include "audit.hpp"
#include "clock.hpp"
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace warden
{
    enum class RateLimitType
    {
        None,
        Burst,
        Window
    };

    std::string to_string(RateLimitType type);

    struct Admission
    {
        bool allowed{true};
        RateLimitType limit{RateLimitType::None};
        std::string reason;

        explicit operator bool() const { return allowed; }
    };

    struct RateStats
    {
        std::size_t requests_in_window{0};
        std::size_t requests_in_burst_window{0};
        std::size_t window_remaining{0};
        std::size_t burst_remaining{0};
    };

    /**
     * Thread-safe per-user sliding-window rate limiter.
     * Every user has a long window (default 30 requests / 60s) and a nested
     * burst window (default 5 requests / 5s). The burst window is checked first.
     */
    class RateLimiter
    {
    public:
        struct Config
        {
            bool enabled{true};
            std::size_t max_requests{30};
            std::chrono::seconds window{60};
            std::size_t burst_limit{5};
            std::chrono::seconds burst_window{5};
            std::chrono::seconds sweep_interval{300};
        };

        RateLimiter();
        explicit RateLimiter(const Config &cfg,
                             std::shared_ptr<AuditLogger> audit = nullptr,
                             std::shared_ptr<Clock> clock = system_clock());

        /** Admit or deny one event for user_id at `now`. Denied events are not recorded. */
        Admission check(const std::string &user_id, TimePoint now, const std::string &channel = {});

        /** check() at the injected clock's current time. */
        Admission check(const std::string &user_id);

        RateStats get_stats(const std::string &user_id) const;
        RateStats get_stats(const std::string &user_id, TimePoint now) const;

        /** Drop users whose windows are empty at `now`. Returns how many were removed. */
        std::size_t sweep_idle(TimePoint now);

        std::size_t tracked_users() const;

        const Config &config() const { return cfg_; }

    private:
        struct UserWindow
        {
            std::deque<TimePoint> requests;
            std::deque<TimePoint> burst;
        };

        void prune(UserWindow &w, TimePoint now) const;
        std::size_t sweep_locked(TimePoint now);

        Config cfg_;
        std::shared_ptr<AuditLogger> audit_;
        std::shared_ptr<Clock> clock_;
        std::unordered_map<std::string, UserWindow> windows_;
        TimePoint last_sweep_{};
        mutable std::mutex mutex_;
    };
}
