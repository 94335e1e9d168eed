#include "warden/supervisor.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <format>

namespace warden
{
    namespace
    {
        volatile std::sig_atomic_t g_stop_requested = 0;

        void handle_signal(int)
        {
            g_stop_requested = 1;
        }

        std::string preview(const std::string &text)
        {
            constexpr std::size_t kPreview = 200;
            return text.size() > kPreview ? text.substr(0, kPreview) : text;
        }
    } // namespace

    std::string to_string(SupervisorState state)
    {
        switch (state)
        {
        case SupervisorState::Stopped:
            return "stopped";
        case SupervisorState::Starting:
            return "starting";
        case SupervisorState::Running:
            return "running";
        case SupervisorState::Draining:
            return "draining";
        }
        return "unknown";
    }

    std::string to_string(SubmitStatus status)
    {
        switch (status)
        {
        case SubmitStatus::Completed:
            return "completed";
        case SubmitStatus::Failed:
            return "failed";
        case SubmitStatus::RateLimited:
            return "rate_limited";
        case SubmitStatus::Blocked:
            return "blocked";
        case SubmitStatus::Rejected:
            return "rejected";
        }
        return "unknown";
    }

    DaemonSupervisor::DaemonSupervisor(Config cfg, Components components)
        : cfg_(std::move(cfg)), c_(std::move(components)), gate_(DrainGate::Config{cfg_.drain_timeout})
    {
        if (!c_.status)
            throw WardenError::invalid_input("DaemonSupervisor requires a status store");
        if (!c_.limiter)
            c_.limiter = std::make_shared<RateLimiter>(RateLimiter::Config{}, c_.audit, c_.clock);
        if (!c_.sanitizer)
            c_.sanitizer = std::make_shared<InputSanitizer>();
        // Nothing is admitted until start()
        gate_.close();
    }

    DaemonSupervisor::~DaemonSupervisor()
    {
        stop_heartbeat();
    }

    void DaemonSupervisor::set_state(SupervisorState s)
    {
        std::lock_guard lock(mutex_);
        state_ = s;
    }

    SupervisorState DaemonSupervisor::state() const
    {
        std::lock_guard lock(mutex_);
        return state_;
    }

    Result<void> DaemonSupervisor::start()
    {
        std::lock_guard lifecycle(lifecycle_mutex_);
        {
            std::lock_guard lock(mutex_);
            if (state_ != SupervisorState::Stopped)
            {
                return std::unexpected(WardenError::already_running(
                    std::format("Supervisor is {}", to_string(state_))));
            }
            state_ = SupervisorState::Starting;
        }
        spdlog::info("Starting warden supervisor {}", cfg_.version);

        auto pid = c_.status->acquire_pid();
        if (!pid)
        {
            set_state(SupervisorState::Stopped);
            return std::unexpected(pid.error());
        }

        if (cfg_.check_on_startup && c_.integrity)
        {
            auto violations = c_.integrity->verify();
            if (!violations.empty())
            {
                spdlog::warn("{} integrity violation(s) found at startup", violations.size());
                if (cfg_.abort_on_violation)
                {
                    c_.status->release_pid();
                    set_state(SupervisorState::Stopped);
                    return std::unexpected(WardenError::integrity(
                        std::format("Refusing to start: {} monitored file(s) changed, first {}",
                                    violations.size(), violations.front().file)));
                }
            }
        }

        {
            std::lock_guard lock(mutex_);
            pid_ = *pid;
            started_at_ = c_.clock->now();
        }

        if (auto written = c_.status->write_status(snapshot()); !written)
        {
            c_.status->release_pid();
            set_state(SupervisorState::Stopped);
            return std::unexpected(WardenError::storage(
                std::string("Failed to write status: ") + written.error().what()));
        }

        {
            std::lock_guard lock(heartbeat_mutex_);
            heartbeat_stop_ = false;
        }
        heartbeat_thread_ = std::thread(&DaemonSupervisor::heartbeat_loop, this);

        set_state(SupervisorState::Running);
        gate_.reopen();

        if (c_.audit)
            c_.audit->log_security_event("daemon_started", {{"pid", *pid}, {"version", cfg_.version}}, "info");
        spdlog::info("Supervisor running (PID {})", *pid);
        return {};
    }

    SubmitOutcome DaemonSupervisor::submit(const WorkUnit &work, const WorkHandler &handler)
    {
        SubmitOutcome outcome;
        DrainGate::Ticket ticket(gate_);
        if (!ticket)
        {
            outcome.status = SubmitStatus::Rejected;
            outcome.detail = std::format("Daemon is {}, not accepting work", to_string(state()));
            return outcome;
        }

        const AuditActor actor{work.user_id, work.channel, work.session_key};

        auto admission = c_.limiter->check(work.user_id, c_.clock->now(), work.channel);
        if (!admission)
        {
            outcome.status = SubmitStatus::RateLimited;
            outcome.detail = admission.reason;
            return outcome;
        }

        if (work.tool_call)
        {
            const auto &call = *work.tool_call;
            auto screened = c_.sanitizer->sanitize_tool_params(call.name, call.params);
            outcome.warnings = screened.warnings;
            if (!screened.safe)
            {
                outcome.status = SubmitStatus::Blocked;
                outcome.detail = screened.blocked_reason.value_or("Input rejected");
                spdlog::warn("Blocked tool call {} for {}: {}", call.name, work.user_id, outcome.detail);
                if (c_.audit)
                {
                    c_.audit->log_security_event("input_blocked",
                                                 {{"tool", call.name}, {"reason", outcome.detail}},
                                                 "warning", actor);
                }
                return outcome;
            }
            if (c_.audit)
                c_.audit->log_tool_call(call.name, call.params, actor);
        }

        try
        {
            outcome.output = handler(work);
            outcome.status = SubmitStatus::Completed;
        }
        catch (const std::exception &e)
        {
            outcome.status = SubmitStatus::Failed;
            outcome.detail = e.what();
            spdlog::error("Work for {} failed: {}", work.user_id, e.what());
        }
        catch (...)
        {
            outcome.status = SubmitStatus::Failed;
            outcome.detail = "Handler threw a non-standard exception";
            spdlog::error("Work for {} failed: {}", work.user_id, outcome.detail);
        }

        if (work.tool_call && c_.audit)
        {
            c_.audit->log_tool_result(work.tool_call->name, actor, outcome.ok(),
                                      outcome.detail, preview(outcome.output));
        }
        return outcome;
    }

    int DaemonSupervisor::stop()
    {
        std::lock_guard lifecycle(lifecycle_mutex_);
        {
            std::lock_guard lock(mutex_);
            if (state_ != SupervisorState::Running)
            {
                spdlog::debug("stop() while {}", to_string(state_));
                return 0;
            }
            state_ = SupervisorState::Draining;
        }

        gate_.close();
        spdlog::info("Draining {} in-flight unit(s)", gate_.in_flight());
        const bool drained = gate_.wait_for_drain();

        stop_heartbeat();
        if (c_.audit)
        {
            c_.audit->log_security_event("daemon_stopped",
                                         {{"drained", drained}, {"in_flight", gate_.in_flight()}},
                                         drained ? "info" : "warning");
            if (!c_.audit->flush())
                spdlog::warn("Audit log still holds {} buffered entries at shutdown", c_.audit->buffered());
        }

        set_state(SupervisorState::Stopped);
        if (!drained)
        {
            spdlog::error("Drain timed out after {} ms with {} unit(s) in flight; leaving pid and status files",
                          cfg_.drain_timeout.count(), gate_.in_flight());
            return 1;
        }

        c_.status->cleanup();
        spdlog::info("Supervisor stopped cleanly");
        return 0;
    }

    Result<RestartOutcome> DaemonSupervisor::restart()
    {
        RestartOutcome outcome;
        if (stop() != 0)
        {
            outcome.warning = std::format("Drain timed out with {} unit(s) still in flight", gate_.in_flight());
            spdlog::warn("{}; restarting anyway", *outcome.warning);
            // Our own markers; clear them so start() does not see a live owner
            c_.status->cleanup();
        }
        if (auto started = start(); !started)
            return std::unexpected(started.error());
        return outcome;
    }

    void DaemonSupervisor::register_channel(const std::string &name)
    {
        std::lock_guard lock(mutex_);
        channels_.insert(name);
    }

    void DaemonSupervisor::unregister_channel(const std::string &name)
    {
        std::lock_guard lock(mutex_);
        channels_.erase(name);
    }

    DaemonStatus DaemonSupervisor::snapshot() const
    {
        DaemonStatus st;
        std::lock_guard lock(mutex_);
        st.pid = pid_;
        st.started_at = started_at_;
        st.last_heartbeat = c_.clock->now();
        st.version = cfg_.version;
        st.active_channels = channels_;
        st.active_sessions = gate_.in_flight();
        return st;
    }

    bool DaemonSupervisor::heartbeat_once()
    {
        auto written = c_.status->write_status(snapshot());
        if (!written)
        {
            spdlog::warn("Failed to update heartbeat: {}", written.error().what());
            return false;
        }
        return true;
    }

    void DaemonSupervisor::heartbeat_loop()
    {
        std::unique_lock lock(heartbeat_mutex_);
        while (!heartbeat_stop_)
        {
            if (heartbeat_cv_.wait_for(lock, cfg_.heartbeat_interval, [this]
                                       { return heartbeat_stop_; }))
                break;
            lock.unlock();
            heartbeat_once();
            lock.lock();
        }
    }

    void DaemonSupervisor::stop_heartbeat()
    {
        {
            std::lock_guard lock(heartbeat_mutex_);
            heartbeat_stop_ = true;
        }
        heartbeat_cv_.notify_all();
        if (heartbeat_thread_.joinable())
            heartbeat_thread_.join();
    }

    int DaemonSupervisor::run_until_signal(std::chrono::milliseconds poll)
    {
        while (!stop_requested() && state() == SupervisorState::Running)
            std::this_thread::sleep_for(poll);
        if (stop_requested())
            spdlog::info("Shutdown requested");
        return stop();
    }

    void DaemonSupervisor::install_signal_handlers()
    {
        std::signal(SIGTERM, handle_signal);
        std::signal(SIGINT, handle_signal);
    }

    void DaemonSupervisor::request_stop()
    {
        g_stop_requested = 1;
    }

    bool DaemonSupervisor::stop_requested()
    {
        return g_stop_requested != 0;
    }

    void DaemonSupervisor::clear_stop_request()
    {
        g_stop_requested = 0;
    }

} // namespace warden
