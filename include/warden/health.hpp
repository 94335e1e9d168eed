#pragma once

#include "clock.hpp"
#include "config.hpp"
#include "integrity.hpp"
#include "process.hpp"
#include "status.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace warden
{

    enum class HealthStatus
    {
        Ok,
        Warn,
        Error
    };

    struct HealthResult
    {
        HealthStatus status{HealthStatus::Ok};
        std::string message;
        std::string details;
    };

    /**
     * Collects installation checks for `warden doctor`. Warnings keep the
     * installation healthy; any error makes exit_code() non-zero.
     */
    class HealthCheck
    {
    public:
        void add(HealthStatus status, std::string message, std::string details = {});

        bool check_config_exists(const std::filesystem::path &config_path);
        bool check_config_valid(const std::filesystem::path &config_path);
        bool check_state_dir(const std::filesystem::path &state_dir);
        void check_workspace(const std::filesystem::path &workspace);
        void check_daemon(const StatusStore &store, std::chrono::seconds heartbeat_interval, unsigned stale_after_missed);
        void check_integrity(IntegrityMonitor &monitor);
        void check_audit_storage(const std::filesystem::path &audit_dir);

        const std::vector<HealthResult> &results() const { return results_; }
        std::size_t errors() const { return errors_; }
        std::size_t warnings() const { return warnings_; }

        std::string format_output(bool use_color = true) const;

        int exit_code() const { return errors_ > 0 ? 1 : 0; }

    private:
        std::vector<HealthResult> results_;
        std::size_t errors_{0};
        std::size_t warnings_{0};
    };

    /** Run every check against a loaded configuration. */
    HealthCheck run_health_check(const WardenConfig &cfg,
                                 const std::filesystem::path &config_path,
                                 std::shared_ptr<ProcessProbe> probe = posix_process_probe(),
                                 std::shared_ptr<Clock> clock = system_clock());

} // namespace warden
