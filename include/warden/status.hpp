#pragma once

#include "clock.hpp"
#include "process.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace warden
{

    struct DaemonStatus
    {
        int pid{0};
        TimePoint started_at{};
        TimePoint last_heartbeat{};
        std::string version;
        std::set<std::string> active_channels;
        std::size_t active_sessions{0};

        nlohmann::json to_json() const;
        static Result<DaemonStatus> from_json(const nlohmann::json &j);
    };

    /**
     * Owns the on-disk pid marker and status document of the daemon:
     * <state_dir>/daemon.pid and <state_dir>/daemon.status.json.
     * The pid marker plus a liveness probe is the authority for "running".
     */
    class StatusStore
    {
    public:
        StatusStore(std::filesystem::path state_dir,
                    std::shared_ptr<ProcessProbe> probe = posix_process_probe(),
                    std::shared_ptr<Clock> clock = system_clock());

        const std::filesystem::path &pid_file() const { return pid_file_; }
        const std::filesystem::path &status_file() const { return status_file_; }

        /**
         * Create the pid marker exclusively for the current process.
         * A marker naming another live process fails with AlreadyRunning; a
         * stale marker, or one naming the current pid, is removed and
         * acquisition retried once.
         */
        Result<int> acquire_pid();

        std::optional<int> read_pid() const;

        /** Remove the pid marker if it still names the current process. */
        void release_pid();

        /** Pid of the live daemon, if any. */
        std::optional<int> running_pid() const;

        /** Atomic replace; concurrent callers are serialized. */
        Result<void> write_status(const DaemonStatus &status);
        std::optional<DaemonStatus> read_status() const;
        void remove_status();

        /** Remove pid marker and status document. */
        void cleanup();

        /**
         * True while either file is still on disk. A daemon that drained
         * cleanly removes both before exiting.
         */
        bool files_left_behind() const;

        std::optional<std::chrono::seconds> heartbeat_age() const;
        std::optional<std::chrono::seconds> uptime() const;

        /** Heartbeat older than `missed` intervals (or no status at all). */
        bool is_stale(std::chrono::seconds interval, unsigned missed = 2) const;

    private:
        std::filesystem::path state_dir_;
        std::filesystem::path pid_file_;
        std::filesystem::path status_file_;
        std::shared_ptr<ProcessProbe> probe_;
        std::shared_ptr<Clock> clock_;
        std::mutex write_mutex_;
    };

    /** Human readable uptime, e.g. "2h 15m", "4m 10s", "9s". */
    std::string format_uptime(std::chrono::seconds uptime);

} // namespace warden
