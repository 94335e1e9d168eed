#pragma once

#include "audit.hpp"
#include "clock.hpp"
#include "drain_gate.hpp"
#include "integrity.hpp"
#include "rate_limiter.hpp"
#include "sanitizer.hpp"
#include "status.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace warden
{

    enum class SupervisorState
    {
        Stopped,
        Starting,
        Running,
        Draining
    };

    std::string to_string(SupervisorState state);

    struct ToolCall
    {
        std::string name;
        nlohmann::json params = nlohmann::json::object();
    };

    /** One agent turn handed over by a channel adapter. */
    struct WorkUnit
    {
        std::string user_id;
        std::string channel;
        std::string session_key;
        std::string payload;
        std::optional<ToolCall> tool_call;
    };

    enum class SubmitStatus
    {
        Completed,
        Failed,      // handler threw
        RateLimited,
        Blocked,     // sanitizer refused a tool parameter
        Rejected     // supervisor not running or draining
    };

    std::string to_string(SubmitStatus status);

    struct SubmitOutcome
    {
        SubmitStatus status{SubmitStatus::Completed};
        std::string detail;
        std::string output;
        std::vector<Finding> warnings;

        bool ok() const { return status == SubmitStatus::Completed; }
    };

    /** Business logic for a unit of work; returns the result text or throws. */
    using WorkHandler = std::function<std::string(const WorkUnit &)>;

    struct RestartOutcome
    {
        std::optional<std::string> warning; // set when the stop phase timed out
    };

    /**
     * Owns the daemon lifecycle: pid marker, boot-time integrity check,
     * heartbeat, admission of work and bounded drain on stop.
     *
     * Stopped -> Starting -> Running -> Draining -> Stopped
     */
    class DaemonSupervisor
    {
    public:
        struct Config
        {
            std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(60)};
            std::chrono::milliseconds drain_timeout{std::chrono::seconds(30)};
            bool check_on_startup{true};
            bool abort_on_violation{false};
            std::string version{WARDEN_VERSION};
        };

        struct Components
        {
            std::shared_ptr<AuditLogger> audit;
            std::shared_ptr<RateLimiter> limiter;
            std::shared_ptr<InputSanitizer> sanitizer;
            std::shared_ptr<IntegrityMonitor> integrity;
            std::shared_ptr<StatusStore> status;
            std::shared_ptr<ProcessProbe> probe = posix_process_probe();
            std::shared_ptr<Clock> clock = system_clock();
        };

        DaemonSupervisor(Config cfg, Components components);
        ~DaemonSupervisor();

        DaemonSupervisor(const DaemonSupervisor &) = delete;
        DaemonSupervisor &operator=(const DaemonSupervisor &) = delete;

        /** Acquire the pid marker, verify integrity, write status and start the heartbeat. */
        Result<void> start();

        /**
         * Run one unit of work: rate check, parameter screening, tool_call
         * audit, handler, result audit. Never throws.
         */
        SubmitOutcome submit(const WorkUnit &work, const WorkHandler &handler);

        /**
         * Refuse new work and wait, bounded, for in-flight work.
         * Returns 0 after a clean drain (pid and status removed), 1 on timeout
         * (files left for the next start to find stale).
         */
        int stop();

        /** stop() then start(); a drain timeout is reported as a warning. */
        Result<RestartOutcome> restart();

        void register_channel(const std::string &name);
        void unregister_channel(const std::string &name);

        /** Rewrite the status document now. Returns false if the write failed. */
        bool heartbeat_once();

        SupervisorState state() const;
        std::size_t in_flight() const { return gate_.in_flight(); }
        DaemonStatus snapshot() const;

        /** Block until SIGTERM/SIGINT (or request_stop()), then stop(). */
        int run_until_signal(std::chrono::milliseconds poll = std::chrono::milliseconds(200));

        /** Route SIGTERM and SIGINT to request_stop(). */
        static void install_signal_handlers();
        static void request_stop();
        static bool stop_requested();
        static void clear_stop_request();

    private:
        void heartbeat_loop();
        void stop_heartbeat();
        void set_state(SupervisorState s);

        Config cfg_;
        Components c_;
        DrainGate gate_;

        mutable std::mutex mutex_;
        SupervisorState state_{SupervisorState::Stopped};
        int pid_{0};
        TimePoint started_at_{};
        std::set<std::string> channels_;

        std::mutex heartbeat_mutex_;
        std::condition_variable heartbeat_cv_;
        bool heartbeat_stop_{false};
        std::thread heartbeat_thread_;

        // Serializes start/stop/restart
        std::mutex lifecycle_mutex_;
    };

} // namespace warden
