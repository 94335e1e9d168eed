#include "warden/health.hpp"
#include <format>
#include <unistd.h>

namespace warden
{

    void HealthCheck::add(HealthStatus status, std::string message, std::string details)
    {
        if (status == HealthStatus::Error)
            ++errors_;
        else if (status == HealthStatus::Warn)
            ++warnings_;
        results_.push_back({status, std::move(message), std::move(details)});
    }

    bool HealthCheck::check_config_exists(const std::filesystem::path &config_path)
    {
        std::error_code ec;
        if (std::filesystem::exists(config_path, ec))
        {
            add(HealthStatus::Ok, std::format("Config file exists ({})", config_path.string()));
            return true;
        }
        add(HealthStatus::Error, std::format("Config file missing ({})", config_path.string()));
        return false;
    }

    bool HealthCheck::check_config_valid(const std::filesystem::path &config_path)
    {
        auto cfg = ConfigLoader::load(config_path);
        if (!cfg)
        {
            add(HealthStatus::Error, "Config is invalid", cfg.error().what());
            return false;
        }
        add(HealthStatus::Ok, "Config is valid TOML");
        return true;
    }

    bool HealthCheck::check_state_dir(const std::filesystem::path &state_dir)
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(state_dir, ec))
        {
            add(HealthStatus::Error, std::format("State directory missing ({})", state_dir.string()));
            return false;
        }
        if (::access(state_dir.c_str(), W_OK) != 0)
        {
            add(HealthStatus::Error, std::format("State directory not writable ({})", state_dir.string()));
            return false;
        }
        add(HealthStatus::Ok, std::format("State directory exists ({})", state_dir.string()));
        return true;
    }

    void HealthCheck::check_workspace(const std::filesystem::path &workspace)
    {
        std::error_code ec;
        if (std::filesystem::is_directory(workspace, ec))
            add(HealthStatus::Ok, std::format("Workspace exists ({})", workspace.string()));
        else
            add(HealthStatus::Warn, std::format("Workspace missing ({})", workspace.string()));
    }

    void HealthCheck::check_daemon(const StatusStore &store, std::chrono::seconds heartbeat_interval, unsigned stale_after_missed)
    {
        auto pid = store.running_pid();
        if (!pid)
        {
            add(HealthStatus::Warn, "Daemon is not running");
            return;
        }

        auto uptime = store.uptime();
        add(HealthStatus::Ok, std::format("Daemon is running (PID {}, uptime {})",
                                          *pid, uptime ? format_uptime(*uptime) : std::string("unknown")));

        auto age = store.heartbeat_age();
        if (!age)
        {
            add(HealthStatus::Warn, "No heartbeat recorded");
            return;
        }
        if (store.is_stale(heartbeat_interval, stale_after_missed))
            add(HealthStatus::Warn, std::format("Last heartbeat: {} seconds ago (stale)", age->count()));
        else
            add(HealthStatus::Ok, std::format("Last heartbeat: {} seconds ago", age->count()));
    }

    void HealthCheck::check_integrity(IntegrityMonitor &monitor)
    {
        if (!monitor.config().enabled)
        {
            add(HealthStatus::Warn, "Integrity monitoring disabled");
            return;
        }
        if (!monitor.has_baseline())
        {
            add(HealthStatus::Warn, "No integrity baseline", "Run `warden security init-integrity`");
            return;
        }

        auto violations = monitor.verify();
        if (violations.empty())
        {
            add(HealthStatus::Ok, std::format("Integrity: {} files verified", monitor.status().tracked_files));
            return;
        }
        for (const auto &v : violations)
        {
            add(HealthStatus::Error,
                std::format("Integrity: {} {}", v.file, v.describe()),
                std::format("expected {}", v.expected_hash));
        }
    }

    void HealthCheck::check_audit_storage(const std::filesystem::path &audit_dir)
    {
        std::error_code ec;
        if (!std::filesystem::exists(audit_dir, ec))
        {
            add(HealthStatus::Ok, "Audit log directory will be created on first event");
            return;
        }
        if (!std::filesystem::is_directory(audit_dir, ec) || ::access(audit_dir.c_str(), W_OK) != 0)
        {
            add(HealthStatus::Warn, std::format("Audit log not writable ({})", audit_dir.string()),
                "Audit events will be buffered in memory");
            return;
        }
        add(HealthStatus::Ok, std::format("Audit log writable ({})", audit_dir.string()));
    }

    std::string HealthCheck::format_output(bool use_color) const
    {
        std::string out = "Warden Health Check\n===================\n\n";

        for (const auto &r : results_)
        {
            const char *icon = "";
            switch (r.status)
            {
            case HealthStatus::Ok:
                icon = use_color ? "\033[32m✓\033[0m" : "✓";
                break;
            case HealthStatus::Warn:
                icon = use_color ? "\033[33m⚠\033[0m" : "⚠";
                break;
            case HealthStatus::Error:
                icon = use_color ? "\033[31m✗\033[0m" : "✗";
                break;
            }
            out += std::format("{} {}\n", icon, r.message);
            if (!r.details.empty())
                out += std::format("    {}\n", r.details);
        }

        out += "\n";
        if (errors_ > 0)
        {
            out += std::format("Overall: Issues found ({} errors", errors_);
            if (warnings_ > 0)
                out += std::format(", {} warnings", warnings_);
            out += ")";
        }
        else if (warnings_ > 0)
        {
            out += std::format("Overall: Healthy ({} warnings)", warnings_);
        }
        else
        {
            out += "Overall: Healthy";
        }
        return out;
    }

    HealthCheck run_health_check(const WardenConfig &cfg,
                                 const std::filesystem::path &config_path,
                                 std::shared_ptr<ProcessProbe> probe,
                                 std::shared_ptr<Clock> clock)
    {
        HealthCheck checker;
        if (checker.check_config_exists(config_path))
            checker.check_config_valid(config_path);

        if (checker.check_state_dir(cfg.state_dir))
        {
            checker.check_audit_storage(cfg.audit_dir());
        }
        checker.check_workspace(cfg.workspace);

        StatusStore store(cfg.state_dir, probe, clock);
        checker.check_daemon(store, std::chrono::seconds(cfg.daemon.heartbeat_interval_seconds), cfg.daemon.stale_after_missed);

        // No audit logger: doctor reports, it does not record
        IntegrityMonitor monitor(cfg.integrity_config(), nullptr, clock);
        checker.check_integrity(monitor);
        return checker;
    }

} // namespace warden
