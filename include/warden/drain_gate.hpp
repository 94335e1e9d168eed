#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace warden
{

    /**
     * Counts units of work in flight and lets shutdown wait, bounded, for the
     * count to reach zero. Once closed the gate admits nothing new.
     */
    class DrainGate
    {
    public:
        struct Config
        {
            std::chrono::milliseconds drain_timeout{30000};
        };

        DrainGate();
        explicit DrainGate(const Config &config);

        /** Stop admitting work. */
        void close();

        /** Admit work again after a completed drain. */
        void reopen();

        /** Enter one unit of work. Returns false once the gate is closed. */
        [[nodiscard]] bool try_enter();

        void leave();

        /**
         * Block until in-flight work reaches zero or the drain timeout elapses.
         * Returns true if drained.
         */
        [[nodiscard]] bool wait_for_drain();

        [[nodiscard]] bool is_closed() const
        {
            return closed_.load(std::memory_order_acquire);
        }

        [[nodiscard]] uint32_t in_flight() const
        {
            return in_flight_.load(std::memory_order_acquire);
        }

        const Config &config() const { return config_; }

        /** Holds one unit of work for its scope. */
        class Ticket
        {
        public:
            explicit Ticket(DrainGate &gate) : gate_(&gate), entered_(gate.try_enter()) {}
            ~Ticket()
            {
                if (entered_)
                    gate_->leave();
            }

            Ticket(const Ticket &) = delete;
            Ticket &operator=(const Ticket &) = delete;

            explicit operator bool() const { return entered_; }

        private:
            DrainGate *gate_;
            bool entered_;
        };

    private:
        Config config_;
        std::atomic<bool> closed_{false};
        std::atomic<uint32_t> in_flight_{0};
        std::mutex drain_mutex_;
        std::condition_variable drain_cv_;
    };

} // namespace warden
