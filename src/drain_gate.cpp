#include "warden/drain_gate.hpp"

namespace warden
{

    DrainGate::DrainGate() = default;

    DrainGate::DrainGate(const Config &config)
        : config_(config)
    {
    }

    void DrainGate::close()
    {
        {
            std::lock_guard lock(drain_mutex_);
            closed_.store(true, std::memory_order_release);
        }
        drain_cv_.notify_all();
    }

    void DrainGate::reopen()
    {
        std::lock_guard lock(drain_mutex_);
        closed_.store(false, std::memory_order_release);
    }

    bool DrainGate::try_enter()
    {
        if (closed_.load(std::memory_order_acquire))
            return false;

        in_flight_.fetch_add(1, std::memory_order_acq_rel);
        // Re-check after the increment so a concurrent close() never misses us
        if (closed_.load(std::memory_order_acquire))
        {
            leave();
            return false;
        }
        return true;
    }

    void DrainGate::leave()
    {
        const uint32_t prev = in_flight_.fetch_sub(1, std::memory_order_acq_rel);
        if (prev == 1)
        {
            // Taking the lock orders this notify after a waiter's predicate check
            std::lock_guard lock(drain_mutex_);
            drain_cv_.notify_all();
        }
    }

    bool DrainGate::wait_for_drain()
    {
        std::unique_lock lock(drain_mutex_);
        return drain_cv_.wait_for(lock, config_.drain_timeout, [this]
                                  { return in_flight_.load(std::memory_order_acquire) == 0; });
    }

} // namespace warden
