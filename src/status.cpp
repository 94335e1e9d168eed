#include "warden/status.hpp"
#include "warden/fs_util.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <unistd.h>

namespace warden
{

    nlohmann::json DaemonStatus::to_json() const
    {
        return nlohmann::json{{"pid", pid},
                              {"started_at", format_iso8601(started_at)},
                              {"last_heartbeat", format_iso8601(last_heartbeat)},
                              {"version", version},
                              {"channels_active", active_channels},
                              {"sessions_active", active_sessions}};
    }

    Result<DaemonStatus> DaemonStatus::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
            return std::unexpected(WardenError::validation("Status document is not an object"));

        DaemonStatus st;
        st.pid = j.value("pid", 0);
        st.version = j.value("version", std::string{});
        st.active_sessions = j.value("sessions_active", std::size_t{0});

        auto started = parse_iso8601(j.value("started_at", std::string{}));
        auto heartbeat = parse_iso8601(j.value("last_heartbeat", std::string{}));
        if (!started || !heartbeat)
            return std::unexpected(WardenError::validation("Status document has invalid timestamps"));
        st.started_at = *started;
        st.last_heartbeat = *heartbeat;

        if (j.contains("channels_active") && j["channels_active"].is_array())
        {
            for (const auto &c : j["channels_active"])
            {
                if (c.is_string())
                    st.active_channels.insert(c.get<std::string>());
            }
        }
        return st;
    }

    StatusStore::StatusStore(std::filesystem::path state_dir,
                             std::shared_ptr<ProcessProbe> probe,
                             std::shared_ptr<Clock> clock)
        : state_dir_(std::move(state_dir)),
          pid_file_(state_dir_ / "daemon.pid"),
          status_file_(state_dir_ / "daemon.status.json"),
          probe_(std::move(probe)),
          clock_(std::move(clock))
    {
    }

    Result<int> StatusStore::acquire_pid()
    {
        std::error_code ec;
        std::filesystem::create_directories(state_dir_, ec);
        if (ec)
        {
            return std::unexpected(WardenError::io(
                std::format("Failed to create state directory {}: {}", state_dir_.string(), ec.message())));
        }

        const int pid = probe_->current_pid();
        for (int attempt = 0; attempt < 2; ++attempt)
        {
            int fd = ::open(pid_file_.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
            if (fd >= 0)
            {
                auto text = std::format("{}\n", pid);
                auto written = ::write(fd, text.data(), text.size());
                ::close(fd);
                if (written != static_cast<ssize_t>(text.size()))
                {
                    std::filesystem::remove(pid_file_, ec);
                    return std::unexpected(WardenError::io("Failed to write pid file " + pid_file_.string()));
                }
                spdlog::debug("Wrote PID {} to {}", pid, pid_file_.string());
                return pid;
            }
            if (errno != EEXIST)
            {
                return std::unexpected(WardenError::io(
                    std::format("Failed to create pid file {}: {}", pid_file_.string(), std::strerror(errno))));
            }

            auto existing = read_pid();
            // Our own pid in the marker is a leftover from a previous run that reused it
            if (existing && *existing != pid && probe_->is_alive(*existing))
            {
                return std::unexpected(WardenError::already_running(
                    std::format("Daemon already running (PID {})", *existing)));
            }

            spdlog::warn("Removing stale pid file {} (PID {})",
                         pid_file_.string(), existing ? std::to_string(*existing) : std::string("unreadable"));
            std::filesystem::remove(pid_file_, ec);
            if (ec)
            {
                return std::unexpected(WardenError::io("Failed to remove stale pid file: " + ec.message()));
            }
        }
        return std::unexpected(WardenError::already_running("Pid file was recreated concurrently"));
    }

    std::optional<int> StatusStore::read_pid() const
    {
        auto contents = fs::read_file(pid_file_);
        if (!contents)
            return std::nullopt;
        try
        {
            std::size_t used = 0;
            int pid = std::stoi(*contents, &used);
            if (pid <= 0)
                return std::nullopt;
            return pid;
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
    }

    void StatusStore::release_pid()
    {
        auto existing = read_pid();
        if (existing && *existing != probe_->current_pid())
        {
            spdlog::warn("Pid file names PID {}, not removing", *existing);
            return;
        }
        std::error_code ec;
        if (std::filesystem::remove(pid_file_, ec))
            spdlog::debug("Removed PID file {}", pid_file_.string());
        else if (ec)
            spdlog::warn("Failed to remove PID file: {}", ec.message());
    }

    std::optional<int> StatusStore::running_pid() const
    {
        auto pid = read_pid();
        if (pid && probe_->is_alive(*pid))
            return pid;
        return std::nullopt;
    }

    Result<void> StatusStore::write_status(const DaemonStatus &status)
    {
        std::lock_guard lock(write_mutex_);
        return fs::atomic_write_file(status_file_, status.to_json().dump(2) + "\n");
    }

    std::optional<DaemonStatus> StatusStore::read_status() const
    {
        auto contents = fs::read_file(status_file_);
        if (!contents)
            return std::nullopt;
        auto j = nlohmann::json::parse(*contents, nullptr, false);
        if (j.is_discarded())
            return std::nullopt;
        auto st = DaemonStatus::from_json(j);
        if (!st)
        {
            spdlog::debug("Ignoring unreadable status file: {}", st.error().what());
            return std::nullopt;
        }
        return *st;
    }

    void StatusStore::remove_status()
    {
        std::error_code ec;
        if (std::filesystem::remove(status_file_, ec))
            spdlog::debug("Removed status file {}", status_file_.string());
        else if (ec)
            spdlog::warn("Failed to remove status file: {}", ec.message());
    }

    void StatusStore::cleanup()
    {
        release_pid();
        remove_status();
    }

    bool StatusStore::files_left_behind() const
    {
        std::error_code ec;
        return std::filesystem::exists(pid_file_, ec) || std::filesystem::exists(status_file_, ec);
    }

    std::optional<std::chrono::seconds> StatusStore::heartbeat_age() const
    {
        auto st = read_status();
        if (!st)
            return std::nullopt;
        return std::chrono::duration_cast<std::chrono::seconds>(clock_->now() - st->last_heartbeat);
    }

    std::optional<std::chrono::seconds> StatusStore::uptime() const
    {
        auto st = read_status();
        if (!st)
            return std::nullopt;
        return std::chrono::duration_cast<std::chrono::seconds>(clock_->now() - st->started_at);
    }

    bool StatusStore::is_stale(std::chrono::seconds interval, unsigned missed) const
    {
        auto age = heartbeat_age();
        if (!age)
            return true;
        return *age > interval * static_cast<long>(missed);
    }

    std::string format_uptime(std::chrono::seconds uptime)
    {
        auto total = uptime.count();
        if (total < 0)
            total = 0;
        auto hours = total / 3600;
        auto minutes = (total % 3600) / 60;
        auto seconds = total % 60;
        if (hours > 0)
            return std::format("{}h {}m", hours, minutes);
        if (minutes > 0)
            return std::format("{}m {}s", minutes, seconds);
        return std::format("{}s", seconds);
    }

} // namespace warden
