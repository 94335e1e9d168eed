#include "warden/rate_limiter.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>

namespace warden
{
    namespace
    {
        std::size_t count_after(const std::deque<TimePoint> &entries, TimePoint cutoff)
        {
            return static_cast<std::size_t>(std::count_if(entries.begin(), entries.end(),
                                                          [cutoff](TimePoint t)
                                                          { return t > cutoff; }));
        }
    } // namespace

    std::string to_string(RateLimitType type)
    {
        switch (type)
        {
        case RateLimitType::None:
            return "none";
        case RateLimitType::Burst:
            return "burst";
        case RateLimitType::Window:
            return "window";
        }
        return "none";
    }

    RateLimiter::RateLimiter() : cfg_{}, clock_(system_clock()) {}

    RateLimiter::RateLimiter(const Config &cfg,
                             std::shared_ptr<AuditLogger> audit,
                             std::shared_ptr<Clock> clock)
        : cfg_(cfg), audit_(std::move(audit)), clock_(std::move(clock))
    {
    }

    void RateLimiter::prune(UserWindow &w, TimePoint now) const
    {
        const auto window_cutoff = now - cfg_.window;
        while (!w.requests.empty() && w.requests.front() <= window_cutoff)
            w.requests.pop_front();

        const auto burst_cutoff = now - cfg_.burst_window;
        while (!w.burst.empty() && w.burst.front() <= burst_cutoff)
            w.burst.pop_front();
    }

    Admission RateLimiter::check(const std::string &user_id, TimePoint now, const std::string &channel)
    {
        if (!cfg_.enabled)
            return {};

        Admission denied;
        {
            std::lock_guard lock(mutex_);

            if (last_sweep_ == TimePoint{})
                last_sweep_ = now;
            else if (now - last_sweep_ > cfg_.sweep_interval)
                sweep_locked(now);

            auto &w = windows_[user_id];
            prune(w, now);

            if (w.burst.size() >= cfg_.burst_limit)
            {
                denied = {false,
                          RateLimitType::Burst,
                          std::format("Too many requests. Please wait a few seconds. ({}/{} in {}s)",
                                      w.burst.size(), cfg_.burst_limit, cfg_.burst_window.count())};
            }
            else if (w.requests.size() >= cfg_.max_requests)
            {
                denied = {false,
                          RateLimitType::Window,
                          std::format("Rate limit exceeded. Please wait before sending more messages. ({}/{} in {}s)",
                                      w.requests.size(), cfg_.max_requests, cfg_.window.count())};
            }
            else
            {
                // keep both sequences non-decreasing even if the caller's clock steps back
                auto stamp = w.requests.empty() ? now : std::max(now, w.requests.back());
                w.requests.push_back(stamp);
                w.burst.push_back(w.burst.empty() ? stamp : std::max(stamp, w.burst.back()));
                return {};
            }
        }

        spdlog::warn("Rate limit ({}) exceeded for user {}", to_string(denied.limit), user_id);
        if (audit_)
            audit_->log_rate_limited({user_id, channel, {}}, to_string(denied.limit), denied.reason);
        return denied;
    }

    Admission RateLimiter::check(const std::string &user_id)
    {
        return check(user_id, clock_->now());
    }

    RateStats RateLimiter::get_stats(const std::string &user_id) const
    {
        return get_stats(user_id, clock_->now());
    }

    RateStats RateLimiter::get_stats(const std::string &user_id, TimePoint now) const
    {
        RateStats stats;
        std::lock_guard lock(mutex_);
        auto it = windows_.find(user_id);
        if (it != windows_.end())
        {
            stats.requests_in_window = count_after(it->second.requests, now - cfg_.window);
            stats.requests_in_burst_window = count_after(it->second.burst, now - cfg_.burst_window);
        }
        stats.window_remaining = cfg_.max_requests > stats.requests_in_window
                                     ? cfg_.max_requests - stats.requests_in_window
                                     : 0;
        stats.burst_remaining = cfg_.burst_limit > stats.requests_in_burst_window
                                    ? cfg_.burst_limit - stats.requests_in_burst_window
                                    : 0;
        return stats;
    }

    std::size_t RateLimiter::sweep_locked(TimePoint now)
    {
        std::size_t removed = 0;
        for (auto it = windows_.begin(); it != windows_.end();)
        {
            prune(it->second, now);
            if (it->second.requests.empty() && it->second.burst.empty())
            {
                it = windows_.erase(it);
                ++removed;
            }
            else
            {
                ++it;
            }
        }
        last_sweep_ = now;
        if (removed > 0)
            spdlog::debug("Rate limiter cleanup: removed {} stale entries", removed);
        return removed;
    }

    std::size_t RateLimiter::sweep_idle(TimePoint now)
    {
        std::lock_guard lock(mutex_);
        return sweep_locked(now);
    }

    std::size_t RateLimiter::tracked_users() const
    {
        std::lock_guard lock(mutex_);
        return windows_.size();
    }

} // namespace warden
